#include "gitops.h"

#include <git2.h>
#include <log/log.h>
#include <service/util.h>

#include <iomanip>
#include <sstream>

using namespace logging;
using namespace service;
namespace fs = std::filesystem;

namespace git {
    std::string authenticatedUrl(const std::string &url, const std::string &token) {
        static const std::string scheme = "https://";
        if (token.empty() || !url.starts_with(scheme)) {
            return url;
        }
        const auto rest = url.substr(scheme.size());
        // Already carries credentials
        if (const auto at = rest.find('@'); at != std::string::npos && at < rest.find('/')) {
            return url;
        }
        return scheme + "oauth2:" + token + "@" + rest;
    }

    std::string redactUrl(const std::string &url) {
        const auto schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) {
            return url;
        }
        const auto at = url.find('@', schemeEnd);
        if (at == std::string::npos || at > url.find('/', schemeEnd + 3)) {
            return url;
        }
        return url.substr(0, schemeEnd + 3) + "***@" + url.substr(at + 1);
    }

    DeployErrorInstance classifyCloneFailure(const std::string &output) {
        // Invalid URL / private repo
        if (contains(output, "Repository not found") || contains(output, "does not appear to be a git repository")) {
            return {DeployError::SOURCE, "Repository not found."};
        }

        // Authentication
        if (contains(output, "Authentication failed") || contains(output, "could not read Username") || contains(output, "HTTP 401") ||
            contains(output, "HTTP 403") || contains(output, "terminal prompts disabled"))
        {
            return {DeployError::SOURCE, "Authentication required."};
        }

        // Branch
        if (contains(output, "Remote branch") || contains(output, "pathspec") || contains(output, "not found in upstream")) {
            return {DeployError::SOURCE, "Requested branch not found."};
        }

        // Network
        if (contains(output, "Could not resolve host") || contains(output, "RPC failed") || contains(output, "early EOF") ||
            contains(output, "Connection timed out"))
        {
            return {DeployError::SOURCE, "Repository clone failed (network)."};
        }

        auto message = trimCopy(output);
        std::ranges::replace(message, '\n', ' ');
        return {DeployError::SOURCE, "Failed to fetch source: " + message};
    }

    std::string formatISOTime(const git_time_t &time) {
        const std::time_t utc_time = time;
        const std::tm *tm_ptr = std::gmtime(&utc_time);

        std::ostringstream oss;
        oss << std::put_time(tm_ptr, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string lastGitError() {
        const git_error *err = git_error_last();
        return err && err->message ? err->message : "unknown error";
    }

    Error resetToRemoteBranch(const fs::path &path, const std::string &branch, const std::shared_ptr<spdlog::logger> &logger) {
        git_repository *repo = nullptr;
        if (git_repository_open(&repo, absolute(path).c_str()) != 0) {
            logger->error("Failed to open repository {}: {}", path.string(), lastGitError());
            return Error::ErrInternal;
        }

        const auto remoteRef = "refs/remotes/origin/" + branch;
        git_object *target = nullptr;
        if (git_revparse_single(&target, repo, remoteRef.c_str()) != 0) {
            logger->error("Remote branch '{}' not found", branch);
            git_repository_free(repo);
            return Error::ErrNotFound;
        }

        git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
        opts.checkout_strategy = GIT_CHECKOUT_FORCE | GIT_CHECKOUT_REMOVE_UNTRACKED;

        auto result = Error::Ok;
        git_commit *commit = nullptr;
        git_reference *localBranch = nullptr;
        const auto localRef = "refs/heads/" + branch;

        // Detach first so the local branch can be force-moved even when it is checked out
        if (git_checkout_tree(repo, target, &opts) != 0 || git_repository_set_head_detached(repo, git_object_id(target)) != 0) {
            logger->error("Failed to checkout '{}': {}", remoteRef, lastGitError());
            result = Error::ErrInternal;
        } else if (git_commit_lookup(&commit, repo, git_object_id(target)) != 0 ||
                   git_branch_create(&localBranch, repo, branch.c_str(), commit, 1) != 0 ||
                   git_repository_set_head(repo, localRef.c_str()) != 0)
        {
            logger->error("Failed to move branch '{}': {}", branch, lastGitError());
            result = Error::ErrInternal;
        } else if (git_reset(repo, target, GIT_RESET_HARD, &opts) != 0) {
            logger->error("Failed to reset '{}': {}", branch, lastGitError());
            result = Error::ErrInternal;
        }

        git_reference_free(localBranch);
        git_commit_free(commit);
        git_object_free(target);
        git_repository_free(repo);
        return result;
    }

    std::optional<GitRevision> getLatestRevision(const fs::path &path) {
        git_repository *repo = nullptr;
        if (git_repository_open(&repo, absolute(path).c_str()) != 0) {
            logger.error("Failed to open repository: {}", path.string());
            return std::nullopt;
        }

        git_oid oid;
        git_commit *commit = nullptr;
        if (git_reference_name_to_id(&oid, repo, "HEAD") != 0 || git_commit_lookup(&commit, repo, &oid) != 0) {
            logger.error("Failed to lookup HEAD commit in {}", path.string());
            git_repository_free(repo);
            return std::nullopt;
        }

        char full_hash[GIT_OID_HEXSZ + 1] = {};
        git_oid_fmt(full_hash, &oid);

        char short_hash[8] = {};
        git_oid_tostr(short_hash, sizeof(short_hash), &oid);

        const char *message = git_commit_summary(commit);
        const git_signature *author = git_commit_author(commit);

        GitRevision revision{.hash = short_hash,
                             .fullHash = full_hash,
                             .message = message ? message : "",
                             .authorName = author->name,
                             .authorEmail = author->email,
                             .date = formatISOTime(git_commit_time(commit))};

        git_commit_free(commit);
        git_repository_free(repo);
        return revision;
    }
}
