#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "error.h"

namespace service {
    enum class DeploymentStatus { UNKNOWN, QUEUED, BUILDING, SUCCESS, FAILED };
    std::string enumToStr(DeploymentStatus status);
    DeploymentStatus parseDeploymentStatus(const std::string &str);

    enum class CertificateState { UNKNOWN, NONE, PENDING, ISSUED, FAILED };
    std::string enumToStr(CertificateState state);
    CertificateState parseCertificateState(const std::string &str);

    enum class DnsMethod { API, WILDCARD, FALLBACK };
    std::string enumToStr(DnsMethod method);

    struct DeploymentRequest {
        std::string id;
        std::string projectName;
        std::string repoUrl;
        std::string branch;
        std::string commit;
        std::string commitMessage;
        std::string author;
        std::string requestedAt;
    };

    struct DomainBinding {
        std::string domain;
        int port = 0;
        DnsMethod dns = DnsMethod::WILDCARD;
        CertificateState certificate = CertificateState::NONE;
        std::string certificateError;
    };

    struct DeploymentRecord {
        DeploymentRequest request;
        DeploymentStatus status = DeploymentStatus::QUEUED;
        std::optional<int> port;
        std::string containerName;
        std::string domain;
        DeployError errorCode = DeployError::OK;
        std::string error;
        CertificateState certificate = CertificateState::NONE;
        std::string certificateError;
        std::string queuedAt;
        std::string deployedAt;
        std::string failedAt;

        bool isTerminal() const { return status == DeploymentStatus::SUCCESS || status == DeploymentStatus::FAILED; }
    };

    // deploy_<epoch millis>_<random>
    std::string generateDeploymentId();

    // Ids reach file names, anything not shaped like a generated id is rejected
    bool isValidDeploymentId(const std::string &id);

    void to_json(nlohmann::json &j, const DeploymentRequest &request);
    void to_json(nlohmann::json &j, const DeploymentRecord &record);
}
