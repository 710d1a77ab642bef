#include "connections.h"

#include <spdlog/sinks/base_sink.h>

using namespace drogon;
using namespace service;

namespace realtime {
    class FormattedCallbackSink final : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit FormattedCallbackSink(const std::function<void(const std::string &msg)> &callback) : callback_(callback) {}

    protected:
        void sink_it_(const spdlog::details::log_msg &msg) override {
            spdlog::memory_buf_t formatted;
            formatter_->format(msg, formatted);
            auto line = fmt::to_string(formatted);
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
            callback_(line);
        }
        void flush_() override {}

    private:
        const std::function<void(const std::string &msg)> callback_;
    };

    std::string statusMessage(const DeploymentRecord &record) {
        nlohmann::json data;
        data["id"] = record.request.id;
        data["project_name"] = record.request.projectName;
        data["branch"] = record.request.branch;
        data["status"] = enumToStr(record.status);
        data["domain"] = record.domain;
        data["port"] = record.port ? nlohmann::json(*record.port) : nlohmann::json(nullptr);
        data["error"] = record.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(record.error);
        data["certificate"] = enumToStr(record.certificate);

        nlohmann::json message;
        message["type"] = "deployment:status";
        message["data"] = data;
        return message.dump();
    }

    std::string logMessage(const std::string &deploymentId, const std::string &line) {
        nlohmann::json message;
        message["type"] = "deployment:log";
        message["data"] = {{"id", deploymentId}, {"line", line}};
        return message.dump();
    }

    std::shared_ptr<spdlog::sinks::sink> ConnectionManager::createBroadcastSink(const std::string &deploymentId) {
        const auto sink = std::make_shared<FormattedCallbackSink>(
            [this, deploymentId](const std::string &msg) { broadcast(deploymentId, logMessage(deploymentId, msg)); });
        sink->set_pattern("[%^%L%$] [%Y-%m-%d %T] [%n] %v");
        return sink;
    }

    void ConnectionManager::connect(const WebSocketConnectionPtr &connection, const std::optional<std::string> &deploymentId) {
        if (!connection || !connection->connected()) {
            return;
        }

        std::unique_lock lock(mutex_);
        connections_[connection] = deploymentId.value_or("");
    }

    void ConnectionManager::disconnect(const WebSocketConnectionPtr &connection) {
        std::unique_lock lock(mutex_);
        connections_.erase(connection);
    }

    void ConnectionManager::onDeploymentUpdate(const DeploymentRecord &record) { broadcast(record.request.id, statusMessage(record)); }

    void ConnectionManager::broadcast(const std::string &deploymentId, const std::string &message) {
        std::shared_lock lock(mutex_);

        for (const auto &[conn, filter]: connections_) {
            if ((filter.empty() || filter == deploymentId) && conn->connected()) {
                conn->send(message);
            }
        }
    }

    size_t ConnectionManager::size() const {
        std::shared_lock lock(mutex_);
        return connections_.size();
    }
}
