#include "nginx.h"

#include <log/log.h>
#include <service/naming.h>
#include <service/util.h>

#include <filesystem>
#include <format>
#include <fstream>

using namespace drogon;
using namespace logging;
namespace fs = std::filesystem;

namespace service {
    std::string renderSiteConfig(const std::string &domain, const int port, const std::string &containerName) {
        // clang-format off
        return std::format(
R"(# Managed by dockyard for container {2}
server {{
    listen 80;
    listen [::]:80;
    server_name {0};

    client_max_body_size 50M;

    location / {{
        proxy_pass http://127.0.0.1:{1};
        proxy_http_version 1.1;
        proxy_set_header Upgrade $http_upgrade;
        proxy_set_header Connection 'upgrade';
        proxy_set_header Host $host;
        proxy_set_header X-Real-IP $remote_addr;
        proxy_set_header X-Forwarded-For $proxy_add_x_forwarded_for;
        proxy_set_header X-Forwarded-Proto $scheme;
        proxy_cache_bypass $http_upgrade;
    }}
}}
)", domain, port, containerName);
        // clang-format on
    }

    NginxProxy::NginxProxy(ProcessRunner &runner, const config::Nginx &config) : runner_(runner), config_(config) {}

    Task<Error> NginxProxy::writeSite(const std::string domain, const int port, const std::string containerName) {
        if (!isValidDomainName(domain)) {
            logger.error("Refusing to write nginx config for invalid domain '{}'", domain);
            co_return Error::ErrBadRequest;
        }
        const auto available = fs::path(config_.sitesAvailable) / domain;
        const auto enabled = fs::path(config_.sitesEnabled) / domain;

        try {
            create_directories(available.parent_path());
            create_directories(enabled.parent_path());

            std::ofstream file(available, std::ios::trunc);
            file << renderSiteConfig(domain, port, containerName);
            file.close();
            if (!file) {
                logger.error("Failed to write nginx config for {}", domain);
                co_return Error::ErrInternal;
            }

            if (!fs::exists(fs::symlink_status(enabled))) {
                fs::create_symlink(available, enabled);
            }
        } catch (const fs::filesystem_error &e) {
            logger.error("Failed to write nginx config for {}: {}", domain, e.what());
            co_return Error::ErrInternal;
        }

        logger.info("Nginx site written for {} -> 127.0.0.1:{}", domain, port);
        co_return Error::Ok;
    }

    Task<Error> NginxProxy::removeSite(const std::string domain) {
        if (!isValidDomainName(domain)) {
            co_return Error::ErrBadRequest;
        }
        std::error_code ec;
        fs::remove(fs::path(config_.sitesEnabled) / domain, ec);
        fs::remove(fs::path(config_.sitesAvailable) / domain, ec);
        if (ec) {
            logger.error("Failed to remove nginx config for {}: {}", domain, ec.message());
            co_return Error::ErrInternal;
        }
        co_return Error::Ok;
    }

    Task<Error> NginxProxy::reload() {
        if (const auto test = co_await runner_.run("nginx -t"); !test.ok()) {
            logger.error("Nginx configuration test failed: {}", trimCopy(test.output));
            co_return Error::ErrInternal;
        }
        if (const auto result = co_await runner_.run("nginx -s reload"); !result.ok()) {
            logger.error("Nginx reload failed: {}", trimCopy(result.output));
            co_return Error::ErrInternal;
        }
        co_return Error::Ok;
    }
}
