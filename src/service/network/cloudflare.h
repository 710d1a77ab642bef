#pragma once

#include "dns_provider.h"

#include <config.h>
#include <service/process.h>

#include <json/value.h>
#include <optional>

namespace service {
    // Root zone for a domain, e.g. app-dev.example.com -> example.com
    std::string rootDomain(const std::string &domain);

    class CloudFlare final : public DnsProvider {
    public:
        CloudFlare(ProcessRunner &runner, const config::CloudFlare &config);

        bool isConfigured() const override;
        drogon::Task<Error> ensureRecord(std::string domain) override;
        drogon::Task<Error> deleteRecord(std::string domain) override;
        drogon::Task<bool> resolves(std::string domain) override;

        drogon::Task<std::optional<std::string>> getPublicIp() const;

    private:
        drogon::Task<std::tuple<std::optional<Json::Value>, Error>> request(drogon::HttpMethod method, std::string path,
                                                                            std::optional<Json::Value> body = std::nullopt) const;
        drogon::Task<std::optional<std::string>> getZoneId(std::string domain) const;
        drogon::Task<std::optional<std::string>> getRecordId(std::string zoneId, std::string domain) const;

        ProcessRunner &runner_;
        const config::CloudFlare &config_;
    };
}
