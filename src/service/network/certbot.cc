#include "certbot.h"

#include <log/log.h>
#include <service/util.h>

#include <filesystem>

using namespace drogon;
using namespace logging;
namespace fs = std::filesystem;

namespace service {
    Certbot::Certbot(ProcessRunner &runner, const config::Certbot &config) : runner_(runner), config_(config) {}

    Task<std::optional<std::string>> Certbot::issue(const std::string domain) {
        if (exists(domain)) {
            logger.info("Certificate already exists for {}, reapplying to nginx", domain);
        }

        const auto cmd = "certbot --nginx -d " + shellQuote(domain) + " --non-interactive --agree-tos --email " + shellQuote(config_.email) +
                         " --redirect";
        const auto result = co_await runner_.run(cmd, {.timeout = std::chrono::minutes(5), .logProgram = "certbot"});
        if (!result.ok()) {
            co_return result.tail(5);
        }

        logger.info("Certificate obtained for {}", domain);
        co_return std::nullopt;
    }

    bool Certbot::exists(const std::string &domain) const {
        std::error_code ec;
        return fs::exists(fs::path(config_.liveDir) / domain / "fullchain.pem", ec);
    }

    Task<bool> Certbot::remove(const std::string domain) {
        const auto result = co_await runner_.run("certbot delete --cert-name " + shellQuote(domain) + " --non-interactive");
        if (!result.ok()) {
            logger.error("Error deleting certificate for {}: {}", domain, trimCopy(result.output));
            co_return false;
        }
        co_return true;
    }
}
