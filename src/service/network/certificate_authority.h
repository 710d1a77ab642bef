#pragma once

#include <drogon/utils/coroutine.h>

#include <optional>
#include <string>

namespace service {
    class CertificateAuthority {
    public:
        virtual ~CertificateAuthority() = default;

        // Returns the failure reason, nullopt on success
        virtual drogon::Task<std::optional<std::string>> issue(std::string domain) = 0;

        virtual bool exists(const std::string &domain) const = 0;

        virtual drogon::Task<bool> remove(std::string domain) = 0;
    };
}
