#include "git_source.h"

#include <service/naming.h>
#include <service/util.h>

using namespace drogon;
namespace fs = std::filesystem;

namespace service {
    GitSource::GitSource(ProcessRunner &runner, const config::Deploy &config) : runner_(runner), config_(config) {}

    fs::path GitSource::checkoutPath(const std::string &projectName, const std::string &branch) const {
        return fs::path(config_.basePath) / containerName(projectName, branch);
    }

    bool GitSource::isCheckoutPath(const fs::path &path) const {
        const fs::path base(config_.basePath);
        return isSubpath(path, base) && path.lexically_normal() != base.lexically_normal();
    }

    Task<DeployErrorInstance> GitSource::clone(const DeploymentRequest &request, const fs::path &path,
                                               const std::shared_ptr<spdlog::logger> &log) {
        log->info("Cloning repository {} to {}", git::redactUrl(request.repoUrl), path.string());

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);

        const auto url = git::authenticatedUrl(request.repoUrl, config_.gitAccessToken);
        const auto cmd = "git clone --progress --branch " + shellQuote(request.branch) + " " + shellQuote(url) + " " + shellQuote(path.string());
        const auto result = co_await runner_.run(cmd, {.timeout = std::chrono::minutes(10), .logger = log, .logProgram = "git"});
        if (result.ok()) {
            co_return {DeployError::OK};
        }

        // Leave no half-cloned tree behind, the next attempt would mistake it for a checkout
        if (isCheckoutPath(path)) {
            fs::remove_all(path, ec);
        }

        auto error = git::classifyCloneFailure(result.output);
        error.message = git::redactUrl(error.message);
        co_return error;
    }

    Task<DeployErrorInstance> GitSource::update(const DeploymentRequest &request, const fs::path &path,
                                                const std::shared_ptr<spdlog::logger> &log) {
        log->info("Fetching latest changes in {}", path.string());

        if (!config_.gitAccessToken.empty()) {
            const auto url = git::authenticatedUrl(request.repoUrl, config_.gitAccessToken);
            if (const auto result = co_await runner_.run("git remote set-url origin " + shellQuote(url), {.workingDir = path}); !result.ok()) {
                log->warn("Failed to refresh remote credentials");
            }
        }

        const auto fetch = co_await runner_.run("git fetch --progress origin", {.workingDir = path,
                                                                                .timeout = std::chrono::minutes(10),
                                                                                .logger = log,
                                                                                .logProgram = "git"});
        if (!fetch.ok()) {
            auto error = git::classifyCloneFailure(fetch.output);
            error.message = git::redactUrl(error.message);
            co_return error;
        }

        if (const auto err = git::resetToRemoteBranch(path, request.branch, log); err != Error::Ok) {
            co_return {DeployError::SOURCE,
                       err == Error::ErrNotFound ? "Requested branch not found." : "Failed to reset working tree to origin/" + request.branch};
        }
        co_return {DeployError::OK};
    }

    Task<std::tuple<std::optional<SourceCheckout>, DeployErrorInstance>> GitSource::materialize(const DeploymentRequest request,
                                                                                                const std::shared_ptr<spdlog::logger> log) {
        const auto path = checkoutPath(request.projectName, request.branch);
        if (!isValidProjectName(request.projectName) || !isValidBranchName(request.branch) || !isCheckoutPath(path)) {
            log->error("Refusing to use checkout path {} outside of {}", path.string(), config_.basePath);
            co_return {std::nullopt, {DeployError::SOURCE, "Invalid project or branch name"}};
        }
        const bool cloned = !fs::exists(path / ".git");

        const auto error = cloned ? co_await clone(request, path, log) : co_await update(request, path, log);
        if (error.error != DeployError::OK) {
            co_return {std::nullopt, error};
        }

        SourceCheckout checkout{.path = path, .revision = git::getLatestRevision(path), .cloned = cloned};
        if (checkout.revision) {
            log->info("Checked out {} ({})", checkout.revision->hash, checkout.revision->message);
        }
        co_return {checkout, {DeployError::OK}};
    }
}
