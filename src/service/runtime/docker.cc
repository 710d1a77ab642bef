#include "docker.h"

#include <log/log.h>
#include <service/util.h>

#include <regex>
#include <sstream>

using namespace drogon;
using namespace logging;

namespace service {
    std::optional<ContainerState> parseContainerState(const ProcessResult &result) {
        if (!result.ok()) {
            if (contains(result.output, "No such object") || contains(result.output, "No such container")) {
                return ContainerState{.exists = false};
            }
            return std::nullopt;
        }

        const auto json = tryParseJson(trimCopy(result.output));
        if (!json || !json->is_object()) {
            return std::nullopt;
        }

        ContainerState state{.exists = true};
        state.running = json->value("Running", false);
        state.status = json->value("Status", "");
        state.startedAt = json->value("StartedAt", "");
        state.exitCode = json->value("ExitCode", 0);
        if (json->contains("Health") && (*json)["Health"].is_object()) {
            state.health = (*json)["Health"].value("Status", "");
        }
        return state;
    }

    std::optional<ContainerStats> parseContainerStats(const std::string &output) {
        const auto json = tryParseJson(trimCopy(output));
        if (!json || !json->is_object()) {
            return std::nullopt;
        }
        return ContainerStats{.cpu = json->value("CPUPerc", ""), .memory = json->value("MemUsage", "")};
    }

    std::optional<int> parseHostPort(const std::string &ports) {
        // 0.0.0.0:3412->3000/tcp, :::3412->3000/tcp
        static const std::regex pattern(R"(:(\d+)->)");
        if (std::smatch match; std::regex_search(ports, match, pattern)) {
            return parsePort(match[1].str());
        }
        return std::nullopt;
    }

    std::vector<ContainerSummary> parseContainerList(const std::string &output) {
        std::vector<ContainerSummary> containers;
        std::istringstream stream(output);
        std::string line;
        while (std::getline(stream, line)) {
            if (trimCopy(line).empty()) {
                continue;
            }
            const auto json = tryParseJson(line);
            if (!json || !json->is_object()) {
                continue;
            }
            ContainerSummary summary{.id = json->value("ID", ""),
                                     .name = json->value("Names", ""),
                                     .image = json->value("Image", ""),
                                     .status = json->value("Status", ""),
                                     .ports = json->value("Ports", "")};
            summary.hostPort = parseHostPort(summary.ports);
            containers.push_back(summary);
        }
        return containers;
    }

    DockerRuntime::DockerRuntime(ProcessRunner &runner, const std::chrono::seconds buildTimeout) :
        runner_(runner), buildTimeout_(buildTimeout) {}

    Task<ProcessResult> DockerRuntime::build(const std::string image, const std::filesystem::path context,
                                             const std::shared_ptr<spdlog::logger> log) {
        co_return co_await runner_.run("docker build --no-cache -t " + shellQuote(image) + " .",
                                       {.workingDir = context, .timeout = buildTimeout_, .logger = log, .logProgram = "docker"});
    }

    Task<ProcessResult> DockerRuntime::run(const RunSpec spec, const std::shared_ptr<spdlog::logger> log) {
        std::string cmd = "docker run -d --name " + shellQuote(spec.name);
        if (!spec.restartPolicy.empty()) {
            cmd += " --restart " + spec.restartPolicy;
        }
        if (spec.hostPort) {
            cmd += " -p " + std::to_string(*spec.hostPort) + ":" + std::to_string(spec.containerPort);
        }
        if (!spec.envFile.empty()) {
            cmd += " --env-file " + shellQuote(spec.envFile.string());
        }
        for (const auto &[key, value]: spec.env) {
            cmd += " -e " + shellQuote(key + "=" + value);
        }
        for (const auto &[host, target]: spec.volumes) {
            cmd += " -v " + shellQuote(host + ":" + target);
        }
        cmd += " " + shellQuote(spec.image);

        co_return co_await runner_.run(cmd, {.logger = log, .logProgram = "docker"});
    }

    Task<> DockerRuntime::remove(const std::string name) {
        if (const auto result = co_await runner_.run("docker stop " + shellQuote(name)); !result.ok()) {
            logger.trace("docker stop {}: {}", name, trimCopy(result.output));
        }
        if (const auto result = co_await runner_.run("docker rm -f " + shellQuote(name)); !result.ok()) {
            logger.trace("docker rm {}: {}", name, trimCopy(result.output));
        }
    }

    Task<> DockerRuntime::removeImage(const std::string image) {
        if (const auto result = co_await runner_.run("docker rmi " + shellQuote(image)); !result.ok()) {
            logger.trace("docker rmi {}: {}", image, trimCopy(result.output));
        }
    }

    Task<std::optional<ContainerState>> DockerRuntime::inspect(const std::string name) {
        const auto result = co_await runner_.run("docker inspect --format '{{json .State}}' " + shellQuote(name));
        co_return parseContainerState(result);
    }

    Task<ProcessResult> DockerRuntime::start(const std::string name) { co_return co_await runner_.run("docker start " + shellQuote(name)); }

    Task<ProcessResult> DockerRuntime::stop(const std::string name) { co_return co_await runner_.run("docker stop " + shellQuote(name)); }

    Task<ProcessResult> DockerRuntime::restart(const std::string name) {
        co_return co_await runner_.run("docker restart " + shellQuote(name));
    }

    Task<std::string> DockerRuntime::logs(const std::string name, const int tail) {
        const auto result = co_await runner_.run("docker logs --tail " + std::to_string(tail) + " " + shellQuote(name));
        co_return result.output;
    }

    Task<ProcessResult> DockerRuntime::exec(const std::string name, const std::vector<std::string> args) {
        std::string cmd = "docker exec " + shellQuote(name);
        for (const auto &arg: args) {
            cmd += " " + shellQuote(arg);
        }
        co_return co_await runner_.run(cmd);
    }

    Task<std::optional<ContainerStats>> DockerRuntime::stats(const std::string name) {
        const auto result = co_await runner_.run("docker stats --no-stream --format '{{json .}}' " + shellQuote(name));
        if (!result.ok()) {
            co_return std::nullopt;
        }
        co_return parseContainerStats(result.output);
    }

    Task<std::vector<ContainerSummary>> DockerRuntime::list() {
        const auto result = co_await runner_.run("docker ps --format '{{json .}}'");
        if (!result.ok()) {
            logger.error("Failed to list containers: {}", trimCopy(result.output));
            co_return std::vector<ContainerSummary>{};
        }
        co_return parseContainerList(result.output);
    }

    Task<ProcessResult> DockerRuntime::pruneImages() { co_return co_await runner_.run("docker image prune -a -f"); }
}
