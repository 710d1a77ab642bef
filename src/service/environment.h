#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <map>
#include <string>

namespace service {
    using EnvironmentMap = std::map<std::string, std::string>;

    inline constexpr auto ENV_DEPLOY_BRANCH = "DEPLOY_BRANCH";
    inline constexpr auto ENV_DEPLOY_COMMIT = "DEPLOY_COMMIT";
    inline constexpr auto ENV_DEPLOY_DOMAIN = "DEPLOY_DOMAIN";

    struct DeploymentContext {
        std::string branch;
        std::string commit;
        std::string domain;
    };

    // Parses KEY=VALUE lines, ignoring comments, blank lines and a leading "export "
    EnvironmentMap parseEnvFile(const std::string &content);

    EnvironmentMap readEnvFile(const std::filesystem::path &path);

    // Source defaults < persisted values < deployment context
    EnvironmentMap mergeEnvironment(const EnvironmentMap &persisted, const EnvironmentMap &sourceDefaults, const DeploymentContext &context);

    void logEnvironment(const EnvironmentMap &env, const std::shared_ptr<spdlog::logger> &logger);

    // Writes the env file on construction and deletes it when going out of scope
    class EnvFileGuard {
    public:
        EnvFileGuard(std::filesystem::path path, const EnvironmentMap &env);
        ~EnvFileGuard();

        EnvFileGuard(const EnvFileGuard &) = delete;
        EnvFileGuard &operator=(const EnvFileGuard &) = delete;

        const std::filesystem::path &path() const { return path_; }
        bool ok() const { return ok_; }

    private:
        std::filesystem::path path_;
        bool ok_;
    };
}
