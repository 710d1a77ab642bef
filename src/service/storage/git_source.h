#pragma once

#include "source.h"

#include <config.h>
#include <service/process.h>

namespace service {
    class GitSource final : public SourceRepository {
    public:
        GitSource(ProcessRunner &runner, const config::Deploy &config);

        drogon::Task<std::tuple<std::optional<SourceCheckout>, DeployErrorInstance>>
        materialize(DeploymentRequest request, std::shared_ptr<spdlog::logger> log) override;

        std::filesystem::path checkoutPath(const std::string &projectName, const std::string &branch) const override;

        // Strictly below the configured base path
        bool isCheckoutPath(const std::filesystem::path &path) const;

    private:
        drogon::Task<DeployErrorInstance> clone(const DeploymentRequest &request, const std::filesystem::path &path,
                                                const std::shared_ptr<spdlog::logger> &log);
        drogon::Task<DeployErrorInstance> update(const DeploymentRequest &request, const std::filesystem::path &path,
                                                 const std::shared_ptr<spdlog::logger> &log);

        ProcessRunner &runner_;
        const config::Deploy &config_;
    };
}
