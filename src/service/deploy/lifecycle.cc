#include "lifecycle.h"

#include <service/naming.h>
#include <service/util.h>

#include <fstream>
#include <random>
#include <regex>
#include <sstream>

using namespace drogon;
using namespace logging;
namespace fs = std::filesystem;

#define BUILD_FILE "Dockerfile"
#define SOURCE_ENV_FILE ".env"

namespace service {
    std::optional<int> detectExposedPort(const std::string &dockerfile) {
        static const std::regex pattern(R"(EXPOSE\s+(\d+))", std::regex::icase);
        if (std::smatch match; std::regex_search(dockerfile, match, pattern)) {
            return parsePort(match[1].str());
        }
        return std::nullopt;
    }

    bool logsIndicateStarted(const std::string &logs) {
        static const std::regex pattern("server running|listening|started|ready", std::regex::icase);
        return std::regex_search(logs, pattern);
    }

    std::string readFile(const fs::path &path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    ContainerLifecycleManager::ContainerLifecycleManager(ContainerRuntime &runtime, SourceRepository &source, PortAllocator &ports,
                                                         const EnvironmentStore &env, const config::Deploy &deployConfig,
                                                         const config::Health &healthConfig) :
        runtime_(runtime), source_(source), ports_(ports), env_(env), deployConfig_(deployConfig), healthConfig_(healthConfig) {}

    Task<std::optional<int>> ContainerLifecycleManager::allocatePort() {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution offset(0, std::max(0, deployConfig_.portRangeSpread - 1));

        co_return co_await ports_.allocate(deployConfig_.portRangeStart + offset(rng), deployConfig_.portProbes);
    }

    Task<PollOutcome> ContainerLifecycleManager::waitForReady(const std::string &name, const std::shared_ptr<spdlog::logger> &log,
                                                              const std::shared_ptr<CancellationToken> &token, std::string &lastLogs) {
        const auto interval = healthConfig_.interval.count() > 0 ? healthConfig_.interval : std::chrono::milliseconds(1);
        const auto runningThreshold = healthConfig_.runningThreshold / interval;
        const auto logCheckAfter = healthConfig_.logCheckAfter / interval;
        const auto logCheckEvery = std::max<long long>(1, healthConfig_.logCheckEvery / interval);

        log->info("Waiting for container {} to start (max {} attempts)", name, healthConfig_.maxAttempts);

        const auto probe = [&](const int attempt) -> Task<ProbeState> {
            const auto elapsed = attempt - 1;
            const auto state = co_await runtime_.inspect(name);
            if (!state) {
                log->warn("Error checking container status (attempt {}/{})", attempt, healthConfig_.maxAttempts);
                co_return ProbeState::PENDING;
            }
            if (!state->exists) {
                lastLogs = "Container no longer exists";
                co_return ProbeState::DEAD;
            }
            if (state->health == "healthy") {
                log->info("Container {} is healthy", name);
                co_return ProbeState::READY;
            }
            if (!state->running) {
                lastLogs = co_await runtime_.logs(name, 50);
                log->error("Container {} stopped (exit code {}). Last logs:\n{}", name, state->exitCode, lastLogs);
                co_return ProbeState::DEAD;
            }
            if (elapsed >= runningThreshold) {
                log->info("Container {} has been running for {} attempts, marking as healthy", name, elapsed);
                co_return ProbeState::READY;
            }
            if (elapsed >= logCheckAfter && elapsed % logCheckEvery == 0) {
                if (logsIndicateStarted(co_await runtime_.logs(name, 20))) {
                    log->info("Container {} logs show server started, marking as healthy", name);
                    co_return ProbeState::READY;
                }
            }
            co_return ProbeState::PENDING;
        };

        co_return co_await pollUntilReady(trantor::EventLoop::getEventLoopOfCurrentThread(), {interval, healthConfig_.maxAttempts}, probe,
                                          token);
    }

    Task<std::tuple<std::optional<DeployedContainer>, DeployErrorInstance>>
    ContainerLifecycleManager::deployContainer(const DeploymentRequest request, const std::string domain,
                                               const std::shared_ptr<spdlog::logger> log, const std::shared_ptr<CancellationToken> token) {
        const auto cancelled = [&token]() -> std::optional<DeployErrorInstance> {
            if (token && token->isCancelled()) {
                return DeployErrorInstance{DeployError::CANCELLED, token->reason()};
            }
            return std::nullopt;
        };

        const auto name = containerName(request.projectName, request.branch);
        const auto image = imageName(request.projectName, request.branch);

        // 1. Source
        const auto [checkout, sourceError] = co_await source_.materialize(request, log);
        if (!checkout) {
            co_return {std::nullopt, sourceError};
        }
        if (const auto err = cancelled()) {
            co_return {std::nullopt, *err};
        }

        // 2. Build descriptor
        const auto buildFile = checkout->path / BUILD_FILE;
        if (!fs::exists(buildFile)) {
            co_return {std::nullopt, {DeployError::MISSING_BUILD_FILE, "No " BUILD_FILE " found in repository"}};
        }

        // 3. Internal port
        int containerPort = deployConfig_.defaultAppPort;
        if (const auto exposed = detectExposedPort(readFile(buildFile))) {
            containerPort = *exposed;
            log->info("Detected EXPOSE port from " BUILD_FILE ": {}", containerPort);
        } else {
            log->warn("No EXPOSE directive found in " BUILD_FILE ", using default: {}", containerPort);
        }

        // 4. Destructive replace
        log->info("Cleaning up old resources for {}", name);
        co_await runtime_.remove(name);
        co_await runtime_.removeImage(image);

        // 5. Build
        log->info("Building image {}", image);
        if (const auto build = co_await runtime_.build(image, checkout->path, log); !build.ok()) {
            co_return {std::nullopt, {DeployError::BUILD, "Image build failed:\n" + build.tail()}};
        }
        if (const auto err = cancelled()) {
            co_return {std::nullopt, *err};
        }

        // 6. Host port
        const auto port = co_await allocatePort();
        if (!port) {
            co_return {std::nullopt, {DeployError::NO_PORT, "No available ports found"}};
        }

        // 7-9. Environment and start
        const auto persisted = co_await env_.getVariables(request.projectName, request.branch);
        log->info("Fetched {} environment variables for {}/{}", persisted.size(), request.projectName, request.branch);
        logEnvironment(persisted, log);

        const auto merged = mergeEnvironment(persisted, readEnvFile(checkout->path / SOURCE_ENV_FILE),
                                             {.branch = request.branch, .commit = request.commit, .domain = domain});
        {
            const EnvFileGuard envFile(fs::temp_directory_path() / (name + "-" + request.id + ".env"), merged);
            if (!envFile.ok()) {
                co_await ports_.release(*port);
                co_return {std::nullopt, {DeployError::START, "Failed to write environment file"}};
            }
            log->info("Created environment file with {} variables", merged.size());

            log->info("Starting container {} on port {}", name, *port);
            const auto run = co_await runtime_.run(
                {.name = name, .image = image, .hostPort = *port, .containerPort = containerPort, .envFile = envFile.path()}, log);
            if (!run.ok()) {
                co_await ports_.release(*port);
                co_return {std::nullopt, {DeployError::START, "Container failed to start:\n" + run.tail()}};
            }
        }

        // 10. Readiness
        std::string lastLogs;
        const auto outcome = co_await waitForReady(name, log, token, lastLogs);
        co_await ports_.release(*port);

        switch (outcome) {
            case PollOutcome::READY:
                break;
            case PollOutcome::DEAD:
                co_return {std::nullopt, {DeployError::CONTAINER_EXITED, "Container stopped unexpectedly. Last logs:\n" + lastLogs}};
            case PollOutcome::TIMEOUT:
                co_return {std::nullopt, {DeployError::HEALTH_TIMEOUT, "Container failed to start properly, timed out waiting for health check"}};
            case PollOutcome::CANCELLED:
                co_return {std::nullopt, *cancelled()};
        }

        co_return {DeployedContainer{.containerName = name,
                                     .image = image,
                                     .port = *port,
                                     .containerPort = containerPort,
                                     .revision = checkout->revision},
                   {DeployError::OK}};
    }

    Task<> ContainerLifecycleManager::removeContainer(const std::string projectName, const std::string branch) {
        co_await runtime_.remove(containerName(projectName, branch));
        co_await runtime_.removeImage(imageName(projectName, branch));
    }

    Task<std::vector<ContainerSummary>> ContainerLifecycleManager::listDeployments() {
        auto containers = co_await runtime_.list();
        std::erase_if(containers, [](const ContainerSummary &container) { return container.name.ends_with("-postgres"); });
        co_return containers;
    }

    Task<Error> ContainerLifecycleManager::pruneImages() {
        if (const auto result = co_await runtime_.pruneImages(); !result.ok()) {
            logger.error("Image prune failed: {}", trimCopy(result.output));
            co_return Error::ErrInternal;
        }
        co_return Error::Ok;
    }
}
