#pragma once

#include "certificate_authority.h"

#include <config.h>
#include <service/process.h>

namespace service {
    class Certbot final : public CertificateAuthority {
    public:
        Certbot(ProcessRunner &runner, const config::Certbot &config);

        drogon::Task<std::optional<std::string>> issue(std::string domain) override;
        bool exists(const std::string &domain) const override;
        drogon::Task<bool> remove(std::string domain) override;

    private:
        ProcessRunner &runner_;
        const config::Certbot &config_;
    };
}
