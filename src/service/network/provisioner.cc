#include "provisioner.h"

#include <log/log.h>

using namespace drogon;
using namespace logging;

namespace service {
    NetworkProvisioner::NetworkProvisioner(ReverseProxy &proxy, CertificateAuthority &certificates, DnsProvider &dns,
                                           const config::Certbot &config) :
        proxy_(proxy), certificates_(certificates), dns_(dns), config_(config) {}

    Task<DnsMethod> NetworkProvisioner::setupDns(const std::string &domain, const std::shared_ptr<spdlog::logger> &log) {
        if (!dns_.isConfigured()) {
            log->info("DNS API not configured, assuming wildcard record for {}", domain);
            co_return DnsMethod::WILDCARD;
        }

        if (const auto err = co_await dns_.ensureRecord(domain); err != Error::Ok) {
            log->warn("DNS setup failed for {}, falling back to wildcard", domain);
            co_return DnsMethod::FALLBACK;
        }
        co_return DnsMethod::API;
    }

    Task<std::tuple<std::optional<DomainBinding>, DeployErrorInstance>>
    NetworkProvisioner::provision(const std::string domain, const int port, const std::string containerName,
                                  const std::shared_ptr<spdlog::logger> log, const std::shared_ptr<CancellationToken> token) {
        DomainBinding binding{.domain = domain, .port = port, .certificate = CertificateState::PENDING};

        log->info("Setting up DNS for {}", domain);
        binding.dns = co_await setupDns(domain, log);

        log->info("Configuring reverse proxy for {}", domain);
        if (co_await proxy_.writeSite(domain, port, containerName) != Error::Ok) {
            co_return {std::nullopt, {DeployError::PROXY, "Failed to write reverse proxy configuration for " + domain}};
        }
        if (co_await proxy_.reload() != Error::Ok) {
            co_return {std::nullopt, {DeployError::PROXY, "Reverse proxy reload failed"}};
        }

        log->info("Waiting for DNS propagation of {}", domain);
        const auto loop = trantor::EventLoop::getEventLoopOfCurrentThread();
        const auto resolved = co_await waitFor(
            loop, config_.dnsInterval, config_.dnsTimeout, [this, &domain]() -> Task<bool> { co_return co_await dns_.resolves(domain); },
            token);
        if (token && token->isCancelled()) {
            co_return {std::nullopt, {DeployError::CANCELLED, token->reason()}};
        }
        if (!resolved) {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(config_.dnsTimeout).count();
            binding.certificate = CertificateState::FAILED;
            binding.certificateError = "DNS for " + domain + " did not resolve within " + std::to_string(seconds) + "s";
            log->warn("{}. Continuing over HTTP only, renew the certificate once DNS is live.", binding.certificateError);
            co_return {binding, {DeployError::OK}};
        }

        log->info("Requesting certificate for {}", domain);
        if (const auto failure = co_await certificates_.issue(domain)) {
            binding.certificate = CertificateState::FAILED;
            binding.certificateError = *failure;
            log->warn("Certificate issuance failed for {}: {}", domain, *failure);
            co_return {binding, {DeployError::OK}};
        }

        if (token && token->isCancelled()) {
            co_return {std::nullopt, {DeployError::CANCELLED, token->reason()}};
        }

        if (co_await proxy_.reload() != Error::Ok) {
            binding.certificate = CertificateState::FAILED;
            binding.certificateError = "Reverse proxy reload failed after certificate issuance";
            log->warn(binding.certificateError);
            co_return {binding, {DeployError::OK}};
        }

        binding.certificate = CertificateState::ISSUED;
        log->info("Certificate issued for {}", domain);
        co_return {binding, {DeployError::OK}};
    }

    Task<Error> NetworkProvisioner::deprovision(const std::string domain) {
        auto result = co_await proxy_.removeSite(domain);
        if (const auto reload = co_await proxy_.reload(); reload != Error::Ok) {
            result = reload;
        }

        if (dns_.isConfigured()) {
            if (const auto err = co_await dns_.deleteRecord(domain); err != Error::Ok) {
                logger.warn("Failed to delete DNS record for {}", domain);
            }
        }
        co_return result;
    }

    Task<std::tuple<CertificateState, std::string>> NetworkProvisioner::renewCertificate(const std::string domain) {
        if (const auto failure = co_await certificates_.issue(domain)) {
            logger.warn("Certificate renewal failed for {}: {}", domain, *failure);
            co_return {CertificateState::FAILED, *failure};
        }
        if (co_await proxy_.reload() != Error::Ok) {
            co_return {CertificateState::FAILED, "Reverse proxy reload failed after certificate issuance"};
        }
        co_return {CertificateState::ISSUED, ""};
    }

    CertificateState NetworkProvisioner::certificateState(const std::string &domain) const {
        return certificates_.exists(domain) ? CertificateState::ISSUED : CertificateState::NONE;
    }
}
