#include "database.h"

#include <service/util.h>

using namespace logging;
using namespace drogon;
using namespace drogon::orm;

namespace service {
    DeploymentRecord readDeployment(const Row &row) {
        DeploymentRecord record;
        record.request.id = row["id"].as<std::string>();
        record.request.projectName = row["project_name"].as<std::string>();
        record.request.repoUrl = row["repo_url"].as<std::string>();
        record.request.branch = row["branch"].as<std::string>();
        record.request.commit = row["commit_hash"].as<std::string>();
        record.request.commitMessage = row["commit_message"].as<std::string>();
        record.request.author = row["author"].as<std::string>();
        record.request.requestedAt = row["queued_at"].as<std::string>();
        record.status = parseDeploymentStatus(row["status"].as<std::string>());
        if (!row["port"].isNull()) {
            record.port = row["port"].as<int>();
        }
        record.containerName = row["container_name"].as<std::string>();
        record.domain = row["domain"].as<std::string>();
        record.errorCode = parseDeployError(row["error_code"].as<std::string>());
        record.error = row["error"].as<std::string>();
        record.certificate = parseCertificateState(row["certificate"].as<std::string>());
        record.certificateError = row["certificate_error"].as<std::string>();
        record.queuedAt = row["queued_at"].as<std::string>();
        record.deployedAt = row["deployed_at"].as<std::string>();
        record.failedAt = row["failed_at"].as<std::string>();
        return record;
    }

    Task<Error> Database::saveDeployment(const DeploymentRecord record) const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([&record](const DbClientPtr &client) -> Task<Error> {
            const std::optional<int> port = record.port;
            // language=postgresql
            co_await client->execSqlCoro(
                "INSERT INTO deployment (id, project_name, repo_url, branch, commit_hash, commit_message, author, status, port, \
                                         container_name, domain, error_code, error, certificate, certificate_error, queued_at, \
                                         deployed_at, failed_at) \
                 VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18) \
                 ON CONFLICT (id) DO UPDATE SET commit_hash = excluded.commit_hash, commit_message = excluded.commit_message, \
                                                author = excluded.author, status = excluded.status, port = excluded.port, \
                                                error_code = excluded.error_code, error = excluded.error, \
                                                certificate = excluded.certificate, certificate_error = excluded.certificate_error, \
                                                deployed_at = excluded.deployed_at, failed_at = excluded.failed_at",
                record.request.id, record.request.projectName, record.request.repoUrl, record.request.branch, record.request.commit,
                record.request.commitMessage, record.request.author, enumToStr(record.status), port, record.containerName, record.domain,
                enumToStr(record.errorCode), record.error, enumToStr(record.certificate), record.certificateError, record.queuedAt,
                record.deployedAt, record.failedAt);
            co_return Error::Ok;
        });
        co_return res.value_or(err);
    }

    Task<std::optional<DeploymentRecord>> Database::getDeployment(const std::string id) const {
        const auto [res, err] = co_await handleDatabaseOperation<DeploymentRecord>([&id](const DbClientPtr &client) -> Task<DeploymentRecord> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro("SELECT * FROM deployment WHERE id = $1", id);
            if (result.empty()) {
                throw UnexpectedRows("0 rows found");
            }
            co_return readDeployment(result[0]);
        });
        co_return res;
    }

    Task<std::vector<DeploymentRecord>> Database::getRecentDeployments(const int limit) const {
        const auto [res, err] = co_await handleDatabaseOperation<std::vector<DeploymentRecord>>(
            [limit](const DbClientPtr &client) -> Task<std::vector<DeploymentRecord>> {
                // language=postgresql
                const auto result = co_await client->execSqlCoro("SELECT * FROM deployment ORDER BY queued_at DESC LIMIT $1", limit);
                std::vector<DeploymentRecord> records;
                for (const auto &row: result) {
                    records.push_back(readDeployment(row));
                }
                co_return records;
            });
        co_return res.value_or(std::vector<DeploymentRecord>{});
    }

    Task<Error> Database::failInterruptedDeployments() const {
        const auto [res, err] = co_await handleDatabaseOperation<Error>([](const DbClientPtr &client) -> Task<Error> {
            // language=postgresql
            const auto result = co_await client->execSqlCoro(
                "UPDATE deployment SET status = $1, error_code = $2, error = 'Interrupted by service restart', failed_at = $3 \
                 WHERE status IN ($4, $5)",
                enumToStr(DeploymentStatus::FAILED), enumToStr(DeployError::CANCELLED), nowIsoString(), enumToStr(DeploymentStatus::QUEUED),
                enumToStr(DeploymentStatus::BUILDING));
            if (result.affectedRows() > 0) {
                logger.warn("Marked {} interrupted deployments as failed", result.affectedRows());
            }
            co_return Error::Ok;
        });
        co_return res.value_or(err);
    }
}
