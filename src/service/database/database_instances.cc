#include "database.h"

using namespace logging;
using namespace drogon;
using namespace drogon::orm;

namespace service {
    DatabaseInstance readInstance(const Row &row) {
        return DatabaseInstance{.id = row["id"].as<std::string>(),
                                .name = row["name"].as<std::string>(),
                                .environment = row["environment"].as<std::string>(),
                                .containerName = row["container_name"].as<std::string>(),
                                .host = row["host"].as<std::string>(),
                                .port = row["port"].as<int>(),
                                .username = row["username"].as<std::string>(),
                                .password = row["password"].as<std::string>(),
                                .databaseName = row["database"].as<std::string>(),
                                .storagePath = row["storage_path"].as<std::string>(),
                                .sslMode = row["ssl_mode"].as<std::string>(),
                                .version = row["version"].as<std::string>(),
                                .status = parseInstanceStatus(row["status"].as<std::string>()),
                                .createdAt = row["created_at"].as<std::string>()};
    }

    Task<Error> Database::insertInstance(const DatabaseInstance instance) const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([&instance](const DbClientPtr &client) -> Task<Error> {
            // language=postgresql
            co_await client->execSqlCoro(
                "INSERT INTO database_instance (id, name, environment, container_name, host, port, username, password, database, \
                                                storage_path, ssl_mode, version, status, created_at) \
                 VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14)",
                instance.id, instance.name, instance.environment, instance.containerName, instance.host, instance.port, instance.username,
                instance.password, instance.databaseName, instance.storagePath, instance.sslMode, instance.version,
                enumToStr(instance.status), instance.createdAt);
            co_return Error::Ok;
        });
        co_return res.value_or(err);
    }

    Task<std::optional<DatabaseInstance>> Database::getInstance(const std::string id) const {
        const auto [res, err] = co_await handleDatabaseOperation<DatabaseInstance>([&id](const DbClientPtr &client) -> Task<DatabaseInstance> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro("SELECT * FROM database_instance WHERE id = $1", id);
            if (result.empty()) {
                throw UnexpectedRows("0 rows found");
            }
            co_return readInstance(result[0]);
        });
        co_return res;
    }

    Task<std::optional<DatabaseInstance>> Database::findInstance(const std::string name, const std::string environment) const {
        const auto [res, err] =
            co_await handleDatabaseOperation<DatabaseInstance>([&name, &environment](const DbClientPtr &client) -> Task<DatabaseInstance> {
                // language=postgresql
                const auto result =
                    co_await client->execSqlCoro("SELECT * FROM database_instance WHERE name = $1 AND environment = $2", name, environment);
                if (result.empty()) {
                    throw UnexpectedRows("0 rows found");
                }
                co_return readInstance(result[0]);
            });
        co_return res;
    }

    Task<std::optional<DatabaseInstance>> Database::findInstanceByContainer(const std::string containerName) const {
        const auto [res, err] =
            co_await handleDatabaseOperation<DatabaseInstance>([&containerName](const DbClientPtr &client) -> Task<DatabaseInstance> {
                // language=postgresql
                const auto result = co_await client->execSqlCoro("SELECT * FROM database_instance WHERE container_name = $1", containerName);
                if (result.empty()) {
                    throw UnexpectedRows("0 rows found");
                }
                co_return readInstance(result[0]);
            });
        co_return res;
    }

    Task<std::vector<DatabaseInstance>> Database::getInstances() const {
        const auto [res, err] =
            co_await handleDatabaseOperation<std::vector<DatabaseInstance>>([](const DbClientPtr &client) -> Task<std::vector<DatabaseInstance>> {
                // language=postgresql
                const auto result = co_await client->execSqlCoro("SELECT * FROM database_instance ORDER BY created_at DESC");
                std::vector<DatabaseInstance> instances;
                for (const auto &row: result) {
                    instances.push_back(readInstance(row));
                }
                co_return instances;
            });
        co_return res.value_or(std::vector<DatabaseInstance>{});
    }

    Task<Error> Database::updateInstanceStatus(const std::string id, const InstanceStatus status) const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([&id, status](const DbClientPtr &client) -> Task<Error> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro("UPDATE database_instance SET status = $1 WHERE id = $2", enumToStr(status), id);
            co_return result.affectedRows() > 0 ? Error::Ok : Error::ErrNotFound;
        });
        co_return res.value_or(err);
    }

    Task<Error> Database::deleteInstance(const std::string id) const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([&id](const DbClientPtr &client) -> Task<Error> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro("DELETE FROM database_instance WHERE id = $1", id);
            co_return result.affectedRows() > 0 ? Error::Ok : Error::ErrNotFound;
        });
        if (res && *res == Error::Ok) {
            logger.info("Deleted database instance {}", id);
        }
        co_return res.value_or(err);
    }
}
