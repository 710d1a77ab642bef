#include "websocket.h"

#include <global.h>
#include <log/log.h>
#include <service/deployment.h>

using namespace std;
using namespace drogon;
using namespace logging;

namespace api::v1 {
    void DeploymentWebSocketController::handleNewMessage(const WebSocketConnectionPtr &wsConnPtr, std::string &&message,
                                                         const WebSocketMessageType &type) {
        if (type == WebSocketMessageType::Ping) {
            wsConnPtr->send("", WebSocketMessageType::Pong);
        }
    }

    void DeploymentWebSocketController::handleNewConnection(const HttpRequestPtr &req, const WebSocketConnectionPtr &wsConnPtr) {
        // Optional filter on a single deployment
        const auto deploymentId = req->getOptionalParameter<std::string>("deployment");
        if (deploymentId && !service::isValidDeploymentId(*deploymentId)) {
            wsConnPtr->shutdown(CloseCode::kViolation, "Invalid deployment id");
            return;
        }
        global::connections->connect(wsConnPtr, deploymentId);

        // Replay what has been logged so far
        if (deploymentId) {
            for (const auto &line: global::deploymentLogs->lines(*deploymentId)) {
                wsConnPtr->send(realtime::logMessage(*deploymentId, line));
            }
        }
        logger.debug("Websocket subscriber connected ({} total)", global::connections->size());
    }

    void DeploymentWebSocketController::handleConnectionClosed(const WebSocketConnectionPtr &wsConnPtr) {
        global::connections->disconnect(wsConnPtr);
    }
}
