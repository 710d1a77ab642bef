#include "database.h"

#include <array>

using namespace logging;
using namespace drogon;
using namespace drogon::orm;

namespace service {
    DbClientPtr DatabaseBase::getDbClientPtr() const { return app().getFastDbClient(); }

    Database::Database() = default;

    Database::Database(const DbClientPtr &client) : clientPtr_(client) {}

    DbClientPtr Database::getDbClientPtr() const { return clientPtr_ ? clientPtr_ : app().getFastDbClient(); }

    Task<Error> Database::migrate() const {
        // language=postgresql
        static constexpr std::array statements{
            "CREATE TABLE IF NOT EXISTS environment_variable ( \
                 project_name TEXT NOT NULL, \
                 branch       TEXT NOT NULL, \
                 key          TEXT NOT NULL, \
                 value        TEXT NOT NULL, \
                 updated_at   TIMESTAMP NOT NULL DEFAULT now(), \
                 PRIMARY KEY (project_name, branch, key) \
             )",
            "CREATE TABLE IF NOT EXISTS deployment ( \
                 id                TEXT PRIMARY KEY, \
                 project_name      TEXT NOT NULL, \
                 repo_url          TEXT NOT NULL, \
                 branch            TEXT NOT NULL, \
                 commit_hash       TEXT NOT NULL, \
                 commit_message    TEXT NOT NULL DEFAULT '', \
                 author            TEXT NOT NULL DEFAULT '', \
                 status            TEXT NOT NULL, \
                 port              INTEGER, \
                 container_name    TEXT NOT NULL, \
                 domain            TEXT NOT NULL, \
                 error_code        TEXT NOT NULL DEFAULT 'ok', \
                 error             TEXT NOT NULL DEFAULT '', \
                 certificate       TEXT NOT NULL DEFAULT 'none', \
                 certificate_error TEXT NOT NULL DEFAULT '', \
                 queued_at         TEXT NOT NULL, \
                 deployed_at       TEXT NOT NULL DEFAULT '', \
                 failed_at         TEXT NOT NULL DEFAULT '' \
             )",
            "CREATE INDEX IF NOT EXISTS deployment_project_branch_idx ON deployment (project_name, branch)",
            "CREATE TABLE IF NOT EXISTS database_instance ( \
                 id             TEXT PRIMARY KEY, \
                 name           TEXT NOT NULL, \
                 environment    TEXT NOT NULL, \
                 container_name TEXT NOT NULL UNIQUE, \
                 host           TEXT NOT NULL, \
                 port           INTEGER NOT NULL, \
                 username       TEXT NOT NULL, \
                 password       TEXT NOT NULL, \
                 database       TEXT NOT NULL, \
                 storage_path   TEXT NOT NULL, \
                 ssl_mode       TEXT NOT NULL, \
                 version        TEXT NOT NULL, \
                 status         TEXT NOT NULL, \
                 created_at     TEXT NOT NULL, \
                 UNIQUE (name, environment) \
             )"};

        const auto [res, err] = co_await handleDatabaseOperation<Error>([](const DbClientPtr &client) -> Task<Error> {
            for (const auto &statement: statements) {
                co_await client->execSqlCoro(statement);
            }
            co_return Error::Ok;
        });
        co_return res.value_or(err);
    }
}
