#include "environment.h"
#include "util.h"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace service {
    std::string unquote(const std::string &value) {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    EnvironmentMap parseEnvFile(const std::string &content) {
        EnvironmentMap env;
        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            line = trimCopy(line);
            if (line.empty() || line.starts_with('#')) {
                continue;
            }
            if (line.starts_with("export ")) {
                line = trimCopy(line.substr(7));
            }

            const auto eq = line.find('=');
            if (eq == std::string::npos || eq == 0) {
                continue;
            }
            const auto key = trimCopy(line.substr(0, eq));
            const auto value = unquote(trimCopy(line.substr(eq + 1)));
            env[key] = value;
        }
        return env;
    }

    EnvironmentMap readEnvFile(const fs::path &path) {
        std::ifstream file(path);
        if (!file) {
            return {};
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parseEnvFile(buffer.str());
    }

    EnvironmentMap mergeEnvironment(const EnvironmentMap &persisted, const EnvironmentMap &sourceDefaults, const DeploymentContext &context) {
        EnvironmentMap merged = sourceDefaults;
        for (const auto &[key, value]: persisted) {
            merged[key] = value;
        }
        merged[ENV_DEPLOY_BRANCH] = context.branch;
        merged[ENV_DEPLOY_COMMIT] = context.commit;
        merged[ENV_DEPLOY_DOMAIN] = context.domain;
        return merged;
    }

    void logEnvironment(const EnvironmentMap &env, const std::shared_ptr<spdlog::logger> &logger) {
        for (const auto &[key, value]: env) {
            logger->info("  - {} = {}", key, logging::maskSecret(key, value));
        }
    }

    EnvFileGuard::EnvFileGuard(fs::path path, const EnvironmentMap &env) : path_(std::move(path)), ok_(false) {
        std::ofstream file(path_, std::ios::trunc);
        if (!file) {
            return;
        }
        // Secrets go in only once the file is owner-only
        std::error_code ec;
        fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec) {
            logging::logger.error("Failed to restrict permissions of env file {}: {}", path_.string(), ec.message());
            return;
        }
        for (const auto &[key, value]: env) {
            file << key << "=" << value << "\n";
        }
        ok_ = file.good();
    }

    EnvFileGuard::~EnvFileGuard() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            logging::logger.warn("Failed to remove env file {}: {}", path_.string(), ec.message());
        }
    }
}
