#pragma once

#include <drogon/utils/coroutine.h>
#include <service/environment.h>
#include <service/process.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace service {
    struct ContainerState {
        bool exists = false;
        bool running = false;
        std::string status;
        // Empty when the image declares no health check
        std::string health;
        std::string startedAt;
        int exitCode = 0;
    };

    struct RunSpec {
        std::string name;
        std::string image;
        std::optional<int> hostPort;
        int containerPort = 0;
        std::filesystem::path envFile;
        EnvironmentMap env;
        std::vector<std::pair<std::string, std::string>> volumes;
        std::string restartPolicy = "unless-stopped";
    };

    struct ContainerStats {
        std::string cpu;
        std::string memory;
    };

    struct ContainerSummary {
        std::string id;
        std::string name;
        std::string image;
        std::string status;
        std::string ports;
        std::optional<int> hostPort;
    };

    class ContainerRuntime {
    public:
        virtual ~ContainerRuntime() = default;

        virtual drogon::Task<ProcessResult> build(std::string image, std::filesystem::path context, std::shared_ptr<spdlog::logger> log) = 0;

        virtual drogon::Task<ProcessResult> run(RunSpec spec, std::shared_ptr<spdlog::logger> log) = 0;

        // Stops and removes the container, ignoring a missing one
        virtual drogon::Task<> remove(std::string name) = 0;

        virtual drogon::Task<> removeImage(std::string image) = 0;

        // nullopt when the runtime could not be queried
        virtual drogon::Task<std::optional<ContainerState>> inspect(std::string name) = 0;

        virtual drogon::Task<ProcessResult> start(std::string name) = 0;
        virtual drogon::Task<ProcessResult> stop(std::string name) = 0;
        virtual drogon::Task<ProcessResult> restart(std::string name) = 0;

        virtual drogon::Task<std::string> logs(std::string name, int tail) = 0;

        virtual drogon::Task<ProcessResult> exec(std::string name, std::vector<std::string> args) = 0;

        virtual drogon::Task<std::optional<ContainerStats>> stats(std::string name) = 0;

        virtual drogon::Task<std::vector<ContainerSummary>> list() = 0;

        virtual drogon::Task<ProcessResult> pruneImages() = 0;
    };
}
