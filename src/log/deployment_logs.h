#pragma once

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace logging {
    using SinkFactory = std::function<spdlog::sink_ptr(const std::string &deploymentId)>;

    // Per-deployment loggers. Every deployment logs to the console, its own file and an in-memory ring
    // which stays readable for a while after the deployment finished.
    class DeploymentLogs {
    public:
        explicit DeploymentLogs(std::optional<std::filesystem::path> directory, size_t capacity = 500,
                                std::chrono::minutes retention = std::chrono::minutes(30));

        void addSinkFactory(SinkFactory factory);

        std::shared_ptr<spdlog::logger> open(const std::string &deploymentId);

        void close(const std::string &deploymentId);

        std::vector<std::string> lines(const std::string &deploymentId) const;

    private:
        struct Entry {
            std::shared_ptr<spdlog::logger> logger;
            std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> ring;
            std::optional<std::chrono::steady_clock::time_point> closedAt;
        };

        void expire();

        std::optional<std::filesystem::path> directory_;
        size_t capacity_;
        std::chrono::minutes retention_;
        std::vector<SinkFactory> sinkFactories_;
        spdlog::sink_ptr console_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };
}
