#define CLOUDFLARE_API_URL "https://api.cloudflare.com"
#define CLOUDFLARE_API_BASE "/client/v4"
#define IPIFY_URL "https://api.ipify.org"

#include "cloudflare.h"

#include <service/util.h>

using namespace drogon;
using namespace logging;

namespace service {
    std::string rootDomain(const std::string &domain) {
        const auto last = domain.rfind('.');
        if (last == std::string::npos || last == 0) {
            return domain;
        }
        const auto secondLast = domain.rfind('.', last - 1);
        return secondLast == std::string::npos ? domain : domain.substr(secondLast + 1);
    }

    CloudFlare::CloudFlare(ProcessRunner &runner, const config::CloudFlare &config) : runner_(runner), config_(config) {}

    bool CloudFlare::isConfigured() const { return !config_.token.empty(); }

    Task<std::tuple<std::optional<Json::Value>, Error>> CloudFlare::request(const HttpMethod method, const std::string path,
                                                                          const std::optional<Json::Value> body) const {
        const auto client = createHttpClient(CLOUDFLARE_API_URL);
        const auto bodyStr = body ? serializeJsonString(*body) : "";

        const auto [data, err] = co_await sendAuthenticatedRequest(client, method, CLOUDFLARE_API_BASE + path, config_.token,
                                                                   [&bodyStr](const HttpRequestPtr &req) {
                                                                       if (!bodyStr.empty()) {
                                                                           req->setContentTypeCode(CT_APPLICATION_JSON);
                                                                           req->setBody(bodyStr);
                                                                       }
                                                                   });
        if (!data) {
            co_return {std::nullopt, err};
        }
        if (!(*data)["success"].asBool()) {
            const auto &errors = (*data)["errors"];
            logger.error("Cloudflare API error: {}", errors.isArray() && !errors.empty() ? errors[0]["message"].asString() : "unknown");
            co_return {std::nullopt, Error::ErrInternal};
        }
        co_return {(*data)["result"], Error::Ok};
    }

    Task<std::optional<std::string>> CloudFlare::getZoneId(const std::string domain) const {
        const auto root = rootDomain(domain);
        if (const auto [zones, err] = co_await request(Get, "/zones?name=" + root); zones && zones->isArray() && !zones->empty()) {
            co_return (*zones)[0]["id"].asString();
        }
        logger.error("Cloudflare zone not found for domain: {}", root);
        co_return std::nullopt;
    }

    Task<std::optional<std::string>> CloudFlare::getRecordId(const std::string zoneId, const std::string domain) const {
        if (const auto [records, err] = co_await request(Get, "/zones/" + zoneId + "/dns_records?name=" + domain);
            records && records->isArray() && !records->empty())
        {
            co_return (*records)[0]["id"].asString();
        }
        co_return std::nullopt;
    }

    Task<std::optional<std::string>> CloudFlare::getPublicIp() const {
        const auto client = createHttpClient(IPIFY_URL);
        if (const auto [data, err] = co_await sendApiRequest(client, Get, "/?format=json"); data && (*data)["ip"].isString()) {
            co_return (*data)["ip"].asString();
        }
        logger.warn("Could not query public IP, using configured fallback");
        if (config_.publicIp.empty()) {
            co_return std::nullopt;
        }
        co_return config_.publicIp;
    }

    Task<Error> CloudFlare::ensureRecord(const std::string domain) {
        if (!isConfigured()) {
            logger.info("Cloudflare API not configured, skipping DNS creation");
            co_return Error::Ok;
        }

        const auto ip = co_await getPublicIp();
        if (!ip) {
            logger.error("Could not determine public IP address");
            co_return Error::ErrInternal;
        }
        const auto zoneId = co_await getZoneId(domain);
        if (!zoneId) {
            co_return Error::ErrNotFound;
        }

        Json::Value record;
        record["type"] = "A";
        record["name"] = domain;
        record["content"] = *ip;
        record["ttl"] = 1; // Auto
        record["proxied"] = false;

        if (const auto existing = co_await getRecordId(*zoneId, domain)) {
            logger.info("Updating DNS record for {} -> {}", domain, *ip);
            const auto [res, err] = co_await request(Put, "/zones/" + *zoneId + "/dns_records/" + *existing, record);
            co_return err;
        }

        logger.info("Creating DNS record for {} -> {}", domain, *ip);
        const auto [res, err] = co_await request(Post, "/zones/" + *zoneId + "/dns_records", record);
        co_return err;
    }

    Task<Error> CloudFlare::deleteRecord(const std::string domain) {
        if (!isConfigured()) {
            co_return Error::Ok;
        }

        const auto zoneId = co_await getZoneId(domain);
        if (!zoneId) {
            co_return Error::ErrNotFound;
        }
        const auto existing = co_await getRecordId(*zoneId, domain);
        if (!existing) {
            logger.info("DNS record not found: {}", domain);
            co_return Error::Ok;
        }

        logger.info("Deleting DNS record for {}", domain);
        const auto [res, err] = co_await request(Delete, "/zones/" + *zoneId + "/dns_records/" + *existing);
        co_return err;
    }

    Task<bool> CloudFlare::resolves(const std::string domain) {
        const auto result = co_await runner_.run("dig +short " + shellQuote(domain) + " @8.8.8.8");
        co_return result.ok() && !trimCopy(result.output).empty();
    }
}
