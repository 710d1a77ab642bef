#include "provisioner.h"

#include <service/crypto.h>
#include <service/naming.h>
#include <service/util.h>

#include <format>

#define POSTGRES_PORT 5432
#define PASSWORD_LENGTH 24

using namespace drogon;
using namespace logging;
namespace fs = std::filesystem;

namespace service {
    std::string formatUptime(const std::chrono::milliseconds uptime) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(uptime).count();
        const auto minutes = seconds / 60;
        const auto hours = minutes / 60;
        const auto days = hours / 24;

        if (days > 0) return std::format("{}d {}h", days, hours % 24);
        if (hours > 0) return std::format("{}h {}m", hours, minutes % 60);
        if (minutes > 0) return std::format("{}m", minutes);
        return std::format("{}s", seconds);
    }

    DatabaseProvisioner::DatabaseProvisioner(ContainerRuntime &runtime, PortAllocator &ports, const DatabaseRegistry &registry,
                                             const config::Postgres &config) :
        runtime_(runtime), ports_(ports), registry_(registry), config_(config) {}

    Task<std::tuple<std::optional<DatabaseInstance>, DatabaseErrorInstance>> DatabaseProvisioner::createInstance(const std::string name,
                                                                                                                const std::string environment) {
        if (!isValidProjectName(name) || !isValidEnvironmentName(environment)) {
            co_return {std::nullopt, {DatabaseError::INVALID_NAME, "Invalid database name or environment"}};
        }
        logger.info("Creating database: {} ({})", name, environment);

        // Keyed by container name, distinct names that sanitize alike must not provision concurrently
        const auto key = databaseContainerName(name, environment);
        {
            std::lock_guard lock(creatingMutex_);
            if (creating_.contains(key)) {
                co_return {std::nullopt, {DatabaseError::DUPLICATE_NAME, std::format("Database \"{}\" is already being created in {} environment", name, environment)}};
            }
            creating_.insert(key);
        }

        auto result = co_await provision(name, environment);

        {
            std::lock_guard lock(creatingMutex_);
            creating_.erase(key);
        }
        co_return result;
    }

    bool DatabaseProvisioner::isStoragePath(const fs::path &path) const {
        const fs::path base(config_.dataDir);
        return isSubpath(path, base) && path.lexically_normal() != base.lexically_normal();
    }

    Task<> DatabaseProvisioner::discard(const DatabaseInstance &instance) {
        logger.warn("Discarding database container {}", instance.containerName);
        co_await runtime_.remove(instance.containerName);
        if (isStoragePath(instance.storagePath)) {
            std::error_code ec;
            fs::remove_all(instance.storagePath, ec);
        }
    }

    Task<std::tuple<std::optional<DatabaseInstance>, DatabaseErrorInstance>> DatabaseProvisioner::provision(const std::string &name,
                                                                                                           const std::string &environment) {
        if (co_await registry_.findInstance(name, environment)) {
            co_return {std::nullopt, {DatabaseError::DUPLICATE_NAME, std::format("Database \"{}\" already exists in {} environment", name, environment)}};
        }

        DatabaseInstance instance{.id = "db-" + crypto::generateSecureRandomString(32),
                                  .name = name,
                                  .environment = environment,
                                  .containerName = databaseContainerName(name, environment),
                                  .username = sanitizeDatabaseName(name),
                                  .password = crypto::generatePassword(PASSWORD_LENGTH),
                                  .version = config_.version};
        if (const auto owner = co_await registry_.findInstanceByContainer(instance.containerName)) {
            co_return {std::nullopt,
                       {DatabaseError::DUPLICATE_NAME, std::format("Database \"{}\" in {} environment already uses container {}", owner->name,
                                                                   owner->environment, instance.containerName)}};
        }
        instance.host = instance.containerName + ".db." + config_.hostSuffix;
        instance.databaseName = instance.username;
        instance.storagePath = (fs::path(config_.dataDir) / instance.containerName).string();
        if (!isStoragePath(instance.storagePath)) {
            co_return {std::nullopt, {DatabaseError::INVALID_NAME, "Invalid database name or environment"}};
        }

        // No registered instance owns the container, so it is the leftover of a failed attempt
        if (const auto state = co_await runtime_.inspect(instance.containerName); state && state->exists) {
            logger.warn("Container {} already exists, removing it and its data", instance.containerName);
            co_await discard(instance);
        }

        const auto port = co_await ports_.allocate(config_.portStart, config_.portProbes);
        if (!port) {
            co_return {std::nullopt, {DatabaseError::NO_PORT, "No available ports"}};
        }
        instance.port = *port;

        std::error_code ec;
        fs::create_directories(instance.storagePath, ec);
        if (ec) {
            co_await ports_.release(*port);
            co_return {std::nullopt, {DatabaseError::START, "Failed to create storage directory: " + ec.message()}};
        }

        logger.info("Starting PostgreSQL container: {}", instance.containerName);
        const auto run = co_await runtime_.run({.name = instance.containerName,
                                                .image = "postgres:" + config_.version,
                                                .hostPort = instance.port,
                                                .containerPort = POSTGRES_PORT,
                                                .env = {{"POSTGRES_USER", instance.username},
                                                        {"POSTGRES_PASSWORD", instance.password},
                                                        {"POSTGRES_DB", instance.databaseName}},
                                                .volumes = {{instance.storagePath, "/var/lib/postgresql"}}},
                                               nullptr);
        if (!run.ok()) {
            co_await ports_.release(*port);
            co_await discard(instance);
            co_return {std::nullopt, {DatabaseError::START, "Database container failed to start:\n" + run.tail()}};
        }

        const auto ready = co_await waitForDatabase(instance.containerName, instance.username);
        co_await ports_.release(*port);
        if (ready.error != DatabaseError::OK) {
            co_await discard(instance);
            co_return {std::nullopt, ready};
        }

        instance.status = InstanceStatus::ACTIVE;
        instance.createdAt = nowIsoString();
        if (const auto err = co_await registry_.insertInstance(instance); err != Error::Ok) {
            // Nobody received the credentials of this container
            co_await discard(instance);
            co_return {std::nullopt, {DatabaseError::REGISTRY, "Failed to register database instance"}};
        }

        logger.info("Database created successfully: {}", instance.containerName);
        co_return {instance, {DatabaseError::OK}};
    }

    Task<DatabaseErrorInstance> DatabaseProvisioner::waitForDatabase(const std::string &containerName, const std::string &username) const {
        logger.info("Waiting for database {} to be ready...", containerName);

        std::string lastLogs;
        const auto outcome = co_await pollUntilReady(
            trantor::EventLoop::getEventLoopOfCurrentThread(), {config_.interval, config_.maxAttempts},
            [&](const int attempt) -> Task<ProbeState> {
                const auto state = co_await runtime_.inspect(containerName);
                if (state && (!state->exists || !state->running)) {
                    lastLogs = co_await runtime_.logs(containerName, 20);
                    logger.error("Container {} not running. Logs:\n{}", containerName, lastLogs);
                    co_return ProbeState::DEAD;
                }

                if (const auto check = co_await runtime_.exec(containerName, {"pg_isready", "-U", username});
                    contains(check.output, "accepting connections"))
                {
                    logger.info("Database {} is ready", containerName);
                    co_return ProbeState::READY;
                }

                if (attempt % 10 == 0) {
                    logger.info("Still waiting for database {}... ({}/{})", containerName, attempt, config_.maxAttempts);
                }
                co_return ProbeState::PENDING;
            });

        switch (outcome) {
            case PollOutcome::READY:
                co_return {DatabaseError::OK};
            case PollOutcome::DEAD:
                co_return {DatabaseError::CONTAINER_EXITED, "Container " + containerName + " failed to start:\n" + lastLogs};
            default: {
                const auto logs = co_await runtime_.logs(containerName, 50);
                logger.error("Database {} failed to start after {} attempts. Logs:\n{}", containerName, config_.maxAttempts, logs);
                co_return {DatabaseError::HEALTH_TIMEOUT, std::format("Database failed to start after {} attempts", config_.maxAttempts)};
            }
        }
    }

    Task<std::vector<DatabaseInstance>> DatabaseProvisioner::listInstances() const { co_return co_await registry_.getInstances(); }

    Task<std::optional<std::string>> DatabaseProvisioner::query(const DatabaseInstance &instance, const std::string &sql) const {
        const auto result = co_await runtime_.exec(instance.containerName, {"psql", "-U", instance.username, "-d", instance.databaseName, "-t", "-c", sql});
        if (!result.ok()) {
            logger.warn("Query on {} failed: {}", instance.containerName, trimCopy(result.output));
            co_return std::nullopt;
        }
        co_return trimCopy(result.output);
    }

    Task<std::tuple<std::optional<DatabaseStats>, DatabaseErrorInstance>> DatabaseProvisioner::stats(const std::string id) const {
        const auto instance = co_await registry_.getInstance(id);
        if (!instance) {
            co_return {std::nullopt, {DatabaseError::NOT_FOUND, "Database not found"}};
        }

        const auto state = co_await runtime_.inspect(instance->containerName);
        if (!state) {
            co_return {std::nullopt, {DatabaseError::RUNTIME, "Failed to inspect container " + instance->containerName}};
        }
        if (!state->running) {
            co_return {DatabaseStats{.status = "stopped", .size = "N/A", .connections = 0, .uptime = "N/A"}, {DatabaseError::OK}};
        }

        DatabaseStats stats{.status = "running"};
        stats.size = (co_await query(*instance, "SELECT pg_size_pretty(pg_database_size(current_database()))")).value_or("N/A");
        if (const auto connections = co_await query(*instance, "SELECT count(*) FROM pg_stat_activity WHERE state = 'active'")) {
            try {
                stats.connections = std::stoi(*connections);
            } catch (const std::exception &) {
                stats.connections = 0;
            }
        }
        if (const auto usage = co_await runtime_.stats(instance->containerName)) {
            stats.cpu = usage->cpu;
            stats.memory = usage->memory;
        }
        if (const auto startedAt = parseIsoTimestamp(state->startedAt)) {
            stats.uptime = formatUptime(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - *startedAt));
        } else {
            stats.uptime = "N/A";
        }
        co_return {stats, {DatabaseError::OK}};
    }

    Task<DatabaseErrorInstance> DatabaseProvisioner::start(const std::string id) {
        const auto instance = co_await registry_.getInstance(id);
        if (!instance) {
            co_return {DatabaseError::NOT_FOUND, "Database not found"};
        }
        if (const auto result = co_await runtime_.start(instance->containerName); !result.ok()) {
            co_return {DatabaseError::RUNTIME, trimCopy(result.output)};
        }
        if (co_await registry_.updateInstanceStatus(id, InstanceStatus::ACTIVE) != Error::Ok) {
            logger.warn("Failed to update status of database {}", id);
        }
        logger.info("Database started: {}", instance->containerName);
        co_return {DatabaseError::OK};
    }

    Task<DatabaseErrorInstance> DatabaseProvisioner::stop(const std::string id) {
        const auto instance = co_await registry_.getInstance(id);
        if (!instance) {
            co_return {DatabaseError::NOT_FOUND, "Database not found"};
        }
        if (const auto result = co_await runtime_.stop(instance->containerName); !result.ok()) {
            co_return {DatabaseError::RUNTIME, trimCopy(result.output)};
        }
        if (co_await registry_.updateInstanceStatus(id, InstanceStatus::STOPPED) != Error::Ok) {
            logger.warn("Failed to update status of database {}", id);
        }
        logger.info("Database stopped: {}", instance->containerName);
        co_return {DatabaseError::OK};
    }

    Task<DatabaseErrorInstance> DatabaseProvisioner::restart(const std::string id) {
        const auto instance = co_await registry_.getInstance(id);
        if (!instance) {
            co_return {DatabaseError::NOT_FOUND, "Database not found"};
        }
        if (const auto result = co_await runtime_.restart(instance->containerName); !result.ok()) {
            co_return {DatabaseError::RUNTIME, trimCopy(result.output)};
        }
        if (co_await registry_.updateInstanceStatus(id, InstanceStatus::ACTIVE) != Error::Ok) {
            logger.warn("Failed to update status of database {}", id);
        }
        logger.info("Database restarted: {}", instance->containerName);
        co_return {DatabaseError::OK};
    }

    Task<DatabaseErrorInstance> DatabaseProvisioner::remove(const std::string id, const bool purgeStorage) {
        const auto instance = co_await registry_.getInstance(id);
        if (!instance) {
            co_return {DatabaseError::NOT_FOUND, "Database not found"};
        }

        logger.info("Deleting database: {}", instance->containerName);
        co_await runtime_.remove(instance->containerName);

        if (const auto err = co_await registry_.deleteInstance(id); err != Error::Ok) {
            co_return {DatabaseError::REGISTRY, "Failed to deregister database instance"};
        }

        if (purgeStorage && isStoragePath(instance->storagePath)) {
            std::error_code ec;
            fs::remove_all(instance->storagePath, ec);
            if (ec) {
                logger.warn("Failed to remove storage of {}: {}", instance->containerName, ec.message());
            }
        }

        logger.info("Database deleted: {}", instance->containerName);
        co_return {DatabaseError::OK};
    }
}
