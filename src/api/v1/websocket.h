#pragma once

#include <drogon/WebSocketController.h>

namespace api::v1 {
    class DeploymentWebSocketController final : public drogon::WebSocketController<DeploymentWebSocketController, false> {
    public:
        void handleNewMessage(const drogon::WebSocketConnectionPtr &, std::string &&, const drogon::WebSocketMessageType &) override;
        void handleNewConnection(const drogon::HttpRequestPtr &, const drogon::WebSocketConnectionPtr &) override;
        void handleConnectionClosed(const drogon::WebSocketConnectionPtr &) override;

        WS_PATH_LIST_BEGIN
        WS_PATH_ADD("/ws/api/v1/deployments", "ApiKeyFilter");
        WS_PATH_LIST_END
    };
}
