#pragma once

#include <nlohmann/json.hpp>
#include <service/error.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>

namespace git {
    struct GitRevision {
        std::string hash;
        std::string fullHash;
        std::string message;
        std::string authorName;
        std::string authorEmail;
        std::string date;

        NLOHMANN_DEFINE_TYPE_INTRUSIVE(GitRevision, hash, fullHash, message, authorName, authorEmail, date)
    };

    // https://host/repo.git -> https://oauth2:<token>@host/repo.git. Other URLs are returned unchanged.
    std::string authenticatedUrl(const std::string &url, const std::string &token);

    // Removes credentials from a URL before it is logged
    std::string redactUrl(const std::string &url);

    service::DeployErrorInstance classifyCloneFailure(const std::string &output);

    // Forces the working tree and the local branch to origin/<branch>
    service::Error resetToRemoteBranch(const std::filesystem::path &path, const std::string &branch,
                                       const std::shared_ptr<spdlog::logger> &logger);

    std::optional<GitRevision> getLatestRevision(const std::filesystem::path &path);
}
