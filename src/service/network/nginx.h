#pragma once

#include "reverse_proxy.h"

#include <config.h>
#include <service/process.h>

namespace service {
    std::string renderSiteConfig(const std::string &domain, int port, const std::string &containerName);

    class NginxProxy final : public ReverseProxy {
    public:
        NginxProxy(ProcessRunner &runner, const config::Nginx &config);

        drogon::Task<Error> writeSite(std::string domain, int port, std::string containerName) override;
        drogon::Task<Error> removeSite(std::string domain) override;
        drogon::Task<Error> reload() override;

    private:
        ProcessRunner &runner_;
        const config::Nginx &config_;
    };
}
