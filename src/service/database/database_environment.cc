#include "database.h"

using namespace logging;
using namespace drogon;
using namespace drogon::orm;

namespace service {
    Task<EnvironmentMap> Database::getVariables(const std::string projectName, const std::string branch) const {
        const auto [res, err] = co_await handleDatabaseOperation<EnvironmentMap>([&](const DbClientPtr &client) -> Task<EnvironmentMap> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro(
                "SELECT key, value FROM environment_variable WHERE project_name = $1 AND branch = $2 ORDER BY key", projectName, branch);

            EnvironmentMap variables;
            for (const auto &row: result) {
                variables[row["key"].as<std::string>()] = row["value"].as<std::string>();
            }
            co_return variables;
        });
        if (!res) {
            logger.error("Failed to load environment variables for {}/{}", projectName, branch);
        }
        co_return res.value_or(EnvironmentMap{});
    }

    Task<Error> Database::setVariable(const std::string projectName, const std::string branch, const std::string key,
                                      const std::string value) const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([&](const DbClientPtr &client) -> Task<Error> {
            // language=postgresql
            co_await client->execSqlCoro("INSERT INTO environment_variable (project_name, branch, key, value) VALUES ($1, $2, $3, $4) \
                                          ON CONFLICT (project_name, branch, key) DO UPDATE SET value = excluded.value, updated_at = now()",
                                         projectName, branch, key, value);
            co_return Error::Ok;
        });
        co_return res.value_or(err);
    }

    Task<Error> Database::deleteVariable(const std::string projectName, const std::string branch, const std::string key) const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([&](const DbClientPtr &client) -> Task<Error> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro(
                "DELETE FROM environment_variable WHERE project_name = $1 AND branch = $2 AND key = $3", projectName, branch, key);
            co_return result.affectedRows() > 0 ? Error::Ok : Error::ErrNotFound;
        });
        co_return res.value_or(err);
    }
}
