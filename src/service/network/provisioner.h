#pragma once

#include "certificate_authority.h"
#include "dns_provider.h"
#include "reverse_proxy.h"

#include <config.h>
#include <service/deployment.h>
#include <service/health.h>
#include <spdlog/spdlog.h>

namespace service {
    class NetworkProvisioner {
    public:
        NetworkProvisioner(ReverseProxy &proxy, CertificateAuthority &certificates, DnsProvider &dns, const config::Certbot &config);

        // Proxy failures are fatal. DNS and certificate problems are recorded on the binding and never fail the call.
        drogon::Task<std::tuple<std::optional<DomainBinding>, DeployErrorInstance>>
        provision(std::string domain, int port, std::string containerName, std::shared_ptr<spdlog::logger> log,
                  std::shared_ptr<CancellationToken> token = nullptr);

        // Certificates are kept so that a quick redeploy does not trigger reissuance
        drogon::Task<Error> deprovision(std::string domain);

        drogon::Task<std::tuple<CertificateState, std::string>> renewCertificate(std::string domain);

        CertificateState certificateState(const std::string &domain) const;

    private:
        drogon::Task<DnsMethod> setupDns(const std::string &domain, const std::shared_ptr<spdlog::logger> &log);

        ReverseProxy &proxy_;
        CertificateAuthority &certificates_;
        DnsProvider &dns_;
        const config::Certbot &config_;
    };
}
