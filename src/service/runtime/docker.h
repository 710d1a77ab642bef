#pragma once

#include "container_runtime.h"

namespace service {
    std::optional<ContainerState> parseContainerState(const ProcessResult &result);

    std::optional<ContainerStats> parseContainerStats(const std::string &output);

    std::vector<ContainerSummary> parseContainerList(const std::string &output);

    std::optional<int> parseHostPort(const std::string &ports);

    class DockerRuntime final : public ContainerRuntime {
    public:
        explicit DockerRuntime(ProcessRunner &runner, std::chrono::seconds buildTimeout = std::chrono::minutes(30));

        drogon::Task<ProcessResult> build(std::string image, std::filesystem::path context, std::shared_ptr<spdlog::logger> log) override;
        drogon::Task<ProcessResult> run(RunSpec spec, std::shared_ptr<spdlog::logger> log) override;
        drogon::Task<> remove(std::string name) override;
        drogon::Task<> removeImage(std::string image) override;
        drogon::Task<std::optional<ContainerState>> inspect(std::string name) override;
        drogon::Task<ProcessResult> start(std::string name) override;
        drogon::Task<ProcessResult> stop(std::string name) override;
        drogon::Task<ProcessResult> restart(std::string name) override;
        drogon::Task<std::string> logs(std::string name, int tail) override;
        drogon::Task<ProcessResult> exec(std::string name, std::vector<std::string> args) override;
        drogon::Task<std::optional<ContainerStats>> stats(std::string name) override;
        drogon::Task<std::vector<ContainerSummary>> list() override;
        drogon::Task<ProcessResult> pruneImages() override;

    private:
        ProcessRunner &runner_;
        std::chrono::seconds buildTimeout_;
    };
}
