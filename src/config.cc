#include "config.h"

#include <drogon/drogon.h>
#include <log/log.h>
#include <schemas/schemas.h>
#include <service/util.h>

#include <ranges>

using namespace drogon;
using namespace logging;
using namespace config;

std::string envOr(const char *name, const std::string &fallback = "") {
    const char *value = std::getenv(name);
    return value == nullptr ? fallback : std::string(value);
}

int envIntOr(const char *name, const int fallback) {
    const auto value = envOr(name);
    if (value.empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception &e) {
        logger.warn("Ignoring invalid value for {}: {}", name, value);
        return fallback;
    }
}

std::set<std::string> splitBranches(const std::string &value) {
    std::set<std::string> branches;
    for (const auto part: value | std::views::split(',')) {
        if (const auto branch = trimCopy(std::string(part.begin(), part.end())); !branch.empty()) {
            branches.insert(branch);
        }
    }
    return branches;
}

void configureAppFromEnvironment() {
    Json::Value root;
    {
        Json::Value db;
        db["name"] = "default";
        db["rdbms"] = "postgresql";
        db["host"] = envOr("DB_HOST", "localhost");
        db["port"] = envIntOr("DB_PORT", 5432);
        db["dbname"] = envOr("DB_DATABASE", "dockyard");
        db["user"] = envOr("DB_USER", "postgres");
        db["passwd"] = envOr("DB_PASSWORD");
        db["is_fast"] = true;
        db["connection_number"] = 1;
        db["timeout"] = 20;

        root["db_clients"] = Json::Value(Json::arrayValue);
        root["db_clients"].append(db);
    }
    {
        Json::Value app;
        Json::Value log;
        log["use_spdlog"] = true;
        log["log_path"] = envOr("LOG_PATH");
        log["log_size_limit"] = 100000000;
        log["max_files"] = 10;
        log["log_level"] = envOr("LOG_LEVEL", "INFO");
        log["display_local_time"] = false;

        app["log"] = log;
        root["app"] = app;
    }
    app().loadConfigJson(root);
}

SystemConfig configureFromEnvironment() {
    logger.info("Loading configuration from environment");
    configureAppFromEnvironment();

    SystemConfig config;
    config.deploy.maxConcurrent = envIntOr("MAX_CONCURRENT_DEPLOYS", config.deploy.maxConcurrent);
    config.deploy.basePath = envOr("DEPLOY_BASE_PATH", config.deploy.basePath);
    config.deploy.baseDomain = envOr("BASE_DOMAIN", config.deploy.baseDomain);
    if (const auto branches = splitBranches(envOr("PRODUCTION_BRANCHES")); !branches.empty()) {
        config.deploy.productionBranches = branches;
    }
    config.deploy.defaultAppPort = envIntOr("APP_PORT", config.deploy.defaultAppPort);
    config.deploy.gitAccessToken = envOr("GITLAB_ACCESS_TOKEN");
    config.deploy.storagePath = envOr("STORAGE_PATH", config.deploy.storagePath);

    config.certbot.email = envOr("SSL_EMAIL", config.certbot.email);
    config.cloudFlare = {.token = envOr("CLOUDFLARE_API_TOKEN"), .publicIp = envOr("VPS_PUBLIC_IP")};

    config.postgres.version = envOr("POSTGRES_VERSION", config.postgres.version);
    config.postgres.dataDir = envOr("POSTGRES_DATA_DIR", config.postgres.dataDir);
    config.postgres.hostSuffix = envOr("DB_HOST_SUFFIX", config.postgres.hostSuffix);

    config.webhook.gitlabSecret = envOr("GITLAB_WEBHOOK_SECRET");
    config.sentry.dsn = envOr("SENTRY_DSN");
    config.apiKey = envOr("API_KEY");
    config.port = envIntOr("PORT", config.port);
    return config;
}

std::chrono::milliseconds millis(const Json::Value &value, const std::chrono::milliseconds fallback) {
    return value.isNull() ? fallback : std::chrono::milliseconds(value.asInt64());
}

SystemConfig config::configure() {
    if (const std::filesystem::path configPath("config.json"); !exists(configPath)) {
        return configureFromEnvironment();
    }
    app().loadConfigFile("config.json");

    Json::Value customConfig = app().getCustomConfig();

    if (const auto error = validateJson(schemas::systemConfig, customConfig)) {
        logger.error("App config validation failed at {}: {}", error->pointer.to_string(), error->msg);
        throw std::runtime_error("Invalid configuration");
    }

    SystemConfig config;

    const Json::Value &deployConfig = customConfig["deploy"];
    config.deploy.maxConcurrent = deployConfig.get("max_concurrent", config.deploy.maxConcurrent).asInt();
    config.deploy.basePath = deployConfig.get("base_path", config.deploy.basePath).asString();
    config.deploy.baseDomain = deployConfig.get("base_domain", config.deploy.baseDomain).asString();
    if (deployConfig.isMember("production_branches")) {
        config.deploy.productionBranches.clear();
        for (const auto &branch: deployConfig["production_branches"]) {
            config.deploy.productionBranches.insert(branch.asString());
        }
    }
    config.deploy.defaultAppPort = deployConfig.get("default_app_port", config.deploy.defaultAppPort).asInt();
    config.deploy.portRangeStart = deployConfig.get("port_range_start", config.deploy.portRangeStart).asInt();
    config.deploy.portRangeSpread = deployConfig.get("port_range_spread", config.deploy.portRangeSpread).asInt();
    config.deploy.portProbes = deployConfig.get("port_probes", config.deploy.portProbes).asInt();
    config.deploy.gitAccessToken = deployConfig.get("git_access_token", "").asString();
    config.deploy.storagePath = customConfig.get("storage_path", config.deploy.storagePath).asString();

    const Json::Value &healthConfig = customConfig["health"];
    config.health.interval = millis(healthConfig["interval_ms"], config.health.interval);
    config.health.maxAttempts = healthConfig.get("max_attempts", config.health.maxAttempts).asInt();
    config.health.runningThreshold = millis(healthConfig["running_threshold_ms"], config.health.runningThreshold);
    config.health.logCheckAfter = millis(healthConfig["log_check_after_ms"], config.health.logCheckAfter);
    config.health.logCheckEvery = millis(healthConfig["log_check_every_ms"], config.health.logCheckEvery);

    const Json::Value &nginxConfig = customConfig["nginx"];
    config.nginx.sitesAvailable = nginxConfig.get("sites_available", config.nginx.sitesAvailable).asString();
    config.nginx.sitesEnabled = nginxConfig.get("sites_enabled", config.nginx.sitesEnabled).asString();

    const Json::Value &certbotConfig = customConfig["certbot"];
    config.certbot.email = certbotConfig.get("email", config.certbot.email).asString();
    config.certbot.liveDir = certbotConfig.get("live_dir", config.certbot.liveDir).asString();
    config.certbot.dnsTimeout = millis(certbotConfig["dns_timeout_ms"], config.certbot.dnsTimeout);
    config.certbot.dnsInterval = millis(certbotConfig["dns_interval_ms"], config.certbot.dnsInterval);

    const Json::Value &cloudFlareConfig = customConfig["cloudflare"];
    config.cloudFlare = {.token = cloudFlareConfig.get("token", "").asString(),
                         .publicIp = cloudFlareConfig.get("public_ip", "").asString()};

    const Json::Value &postgresConfig = customConfig["postgres"];
    config.postgres.version = postgresConfig.get("version", config.postgres.version).asString();
    config.postgres.dataDir = postgresConfig.get("data_dir", config.postgres.dataDir).asString();
    config.postgres.hostSuffix = postgresConfig.get("host_suffix", config.postgres.hostSuffix).asString();
    config.postgres.portStart = postgresConfig.get("port_start", config.postgres.portStart).asInt();
    config.postgres.portProbes = postgresConfig.get("port_probes", config.postgres.portProbes).asInt();
    config.postgres.interval = millis(postgresConfig["interval_ms"], config.postgres.interval);
    config.postgres.maxAttempts = postgresConfig.get("max_attempts", config.postgres.maxAttempts).asInt();

    config.webhook.gitlabSecret = customConfig["webhook"].get("gitlab_secret", "").asString();
    config.sentry.dsn = customConfig["sentry"].get("dsn", "").asString();
    config.apiKey = customConfig.get("api_key", "").asString();
    config.port = customConfig.get("port", config.port).asInt();

    if (config.apiKey.empty()) {
        logger.warn("No API key configured, allowing public API access.");
    }

    return config;
}
