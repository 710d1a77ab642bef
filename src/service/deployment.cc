#include "deployment.h"
#include "crypto.h"
#include "util.h"

#include <algorithm>
#include <chrono>

namespace service {
    // clang-format off
    ENUM_FROM_TO_STR(DeploymentStatus,
        {DeploymentStatus::QUEUED, "queued"},
        {DeploymentStatus::BUILDING, "building"},
        {DeploymentStatus::SUCCESS, "success"},
        {DeploymentStatus::FAILED, "failed"}
    )

    ENUM_FROM_TO_STR(CertificateState,
        {CertificateState::NONE, "none"},
        {CertificateState::PENDING, "pending"},
        {CertificateState::ISSUED, "issued"},
        {CertificateState::FAILED, "failed"}
    )

    ENUM_TO_STR(DnsMethod,
        {DnsMethod::API, "api"},
        {DnsMethod::WILDCARD, "wildcard"},
        {DnsMethod::FALLBACK, "fallback"}
    )
    // clang-format on

    std::string generateDeploymentId() {
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
        return "deploy_" + std::to_string(millis) + "_" + crypto::generateSecureRandomString(9);
    }

    bool isValidDeploymentId(const std::string &id) {
        static const std::string prefix = "deploy_";
        if (!id.starts_with(prefix)) {
            return false;
        }
        const auto separator = id.find('_', prefix.size());
        if (separator == std::string::npos || separator == prefix.size() || separator + 1 == id.size()) {
            return false;
        }
        const auto millis = std::string_view(id).substr(prefix.size(), separator - prefix.size());
        const auto random = std::string_view(id).substr(separator + 1);
        return std::ranges::all_of(millis, [](const unsigned char c) { return std::isdigit(c); }) &&
               std::ranges::all_of(random, [](const unsigned char c) { return std::isxdigit(c); });
    }

    void to_json(nlohmann::json &j, const DeploymentRequest &request) {
        j = nlohmann::json{{"id", request.id},
                           {"project_name", request.projectName},
                           {"repo_url", request.repoUrl},
                           {"branch", request.branch},
                           {"commit", request.commit},
                           {"commit_message", request.commitMessage},
                           {"author", request.author},
                           {"requested_at", request.requestedAt}};
    }

    void to_json(nlohmann::json &j, const DeploymentRecord &record) {
        j = nlohmann::json{{"id", record.request.id},
                           {"project_name", record.request.projectName},
                           {"branch", record.request.branch},
                           {"commit", record.request.commit},
                           {"commit_message", record.request.commitMessage},
                           {"author", record.request.author},
                           {"status", enumToStr(record.status)},
                           {"container_name", record.containerName},
                           {"domain", record.domain},
                           {"certificate", enumToStr(record.certificate)},
                           {"queued_at", record.queuedAt}};
        j["port"] = record.port ? nlohmann::json(*record.port) : nlohmann::json(nullptr);
        if (record.status == DeploymentStatus::FAILED) {
            j["error"] = record.error;
            j["error_code"] = enumToStr(record.errorCode);
            j["failed_at"] = record.failedAt;
        }
        if (!record.certificateError.empty()) {
            j["certificate_error"] = record.certificateError;
        }
        if (!record.deployedAt.empty()) {
            j["deployed_at"] = record.deployedAt;
        }
    }
}
