#pragma once

#include <drogon/WebSocketConnection.h>
#include <service/deploy/scheduler.h>
#include <spdlog/sinks/sink.h>

#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace realtime {
    // Fans deployment status and log events out to websocket subscribers. A subscriber either follows every
    // deployment or a single one.
    class ConnectionManager final : public service::DeploymentListener {
    public:
        void connect(const drogon::WebSocketConnectionPtr &connection, const std::optional<std::string> &deploymentId);

        void disconnect(const drogon::WebSocketConnectionPtr &connection);

        void onDeploymentUpdate(const service::DeploymentRecord &record) override;

        std::shared_ptr<spdlog::sinks::sink> createBroadcastSink(const std::string &deploymentId);

        size_t size() const;

    private:
        void broadcast(const std::string &deploymentId, const std::string &message);

        mutable std::shared_mutex mutex_;
        // Empty filter means all deployments
        std::unordered_map<drogon::WebSocketConnectionPtr, std::string> connections_;
    };

    std::string statusMessage(const service::DeploymentRecord &record);

    std::string logMessage(const std::string &deploymentId, const std::string &line);
}
