#pragma once

#include "gitops.h"

#include <drogon/utils/coroutine.h>
#include <service/deployment.h>

namespace service {
    struct SourceCheckout {
        std::filesystem::path path;
        std::optional<git::GitRevision> revision;
        bool cloned = false;
    };

    class SourceRepository {
    public:
        virtual ~SourceRepository() = default;

        // Clones on the first deployment, otherwise fast-forwards the existing checkout to the requested branch
        virtual drogon::Task<std::tuple<std::optional<SourceCheckout>, DeployErrorInstance>>
        materialize(DeploymentRequest request, std::shared_ptr<spdlog::logger> log) = 0;

        virtual std::filesystem::path checkoutPath(const std::string &projectName, const std::string &branch) const = 0;
    };
}
