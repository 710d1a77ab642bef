#include "deployment_logs.h"
#include "log.h"

#include <service/deployment.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <deque>
#include <fstream>

#define LOG_PATTERN "[%^%L%$] [%Y-%m-%d %T] [%n] %v"

namespace fs = std::filesystem;

namespace logging {
    DeploymentLogs::DeploymentLogs(std::optional<fs::path> directory, const size_t capacity, const std::chrono::minutes retention) :
        directory_(std::move(directory)), capacity_(capacity), retention_(retention),
        console_(std::make_shared<spdlog::sinks::stdout_color_sink_mt>()) {
        if (directory_) {
            std::error_code ec;
            fs::create_directories(*directory_, ec);
            if (ec) {
                logger.error("Failed to create deployment log directory {}: {}", directory_->string(), ec.message());
            }
        }
    }

    void DeploymentLogs::addSinkFactory(SinkFactory factory) {
        std::lock_guard lock(mutex_);
        sinkFactories_.push_back(std::move(factory));
    }

    std::shared_ptr<spdlog::logger> DeploymentLogs::open(const std::string &deploymentId) {
        std::lock_guard lock(mutex_);
        expire();

        if (const auto it = entries_.find(deploymentId); it != entries_.end() && !it->second.closedAt) {
            return it->second.logger;
        }

        const auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity_);
        std::vector<spdlog::sink_ptr> sinks{console_, ring};
        if (directory_ && service::isValidDeploymentId(deploymentId)) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>((*directory_ / (deploymentId + ".log")).string()));
            } catch (const spdlog::spdlog_ex &e) {
                logger.error("Failed to open log file for deployment {}: {}", deploymentId, e.what());
            }
        }
        for (const auto &factory: sinkFactories_) {
            if (auto sink = factory(deploymentId)) {
                sinks.push_back(std::move(sink));
            }
        }

        const auto deploymentLogger = std::make_shared<spdlog::logger>(deploymentId, sinks.begin(), sinks.end());
        deploymentLogger->set_pattern(LOG_PATTERN);
        deploymentLogger->set_level(spdlog::level::trace);
        deploymentLogger->flush_on(spdlog::level::info);

        entries_[deploymentId] = Entry{.logger = deploymentLogger, .ring = ring};
        return deploymentLogger;
    }

    void DeploymentLogs::close(const std::string &deploymentId) {
        std::lock_guard lock(mutex_);
        if (const auto it = entries_.find(deploymentId); it != entries_.end()) {
            it->second.logger->flush();
            it->second.closedAt = std::chrono::steady_clock::now();
        }
    }

    std::vector<std::string> DeploymentLogs::lines(const std::string &deploymentId) const {
        {
            std::lock_guard lock(mutex_);
            if (const auto it = entries_.find(deploymentId); it != entries_.end()) {
                return it->second.ring->last_formatted();
            }
        }

        // Fall back to the tail of the log file for deployments that left memory
        if (!directory_ || !service::isValidDeploymentId(deploymentId)) {
            return {};
        }
        std::ifstream file(*directory_ / (deploymentId + ".log"));
        if (!file) {
            return {};
        }
        std::deque<std::string> tail;
        std::string line;
        while (std::getline(file, line)) {
            tail.push_back(line + "\n");
            if (tail.size() > capacity_) {
                tail.pop_front();
            }
        }
        return {tail.begin(), tail.end()};
    }

    void DeploymentLogs::expire() {
        const auto now = std::chrono::steady_clock::now();
        std::erase_if(entries_, [&](const auto &entry) {
            return entry.second.closedAt && now - *entry.second.closedAt > retention_;
        });
    }
}
