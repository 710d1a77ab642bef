#pragma once

#include "base.h"

#include <service/deployment.h>

namespace api::v1 {
    // Builds a deployment request from a GitLab push event payload. Returns nothing for refs that are not branches.
    std::optional<service::DeploymentRequest> parseGitlabPush(const nlohmann::json &payload);

    class WebhookController final : public drogon::HttpController<WebhookController, false> {
    public:
        explicit WebhookController(std::string secret);

        METHOD_LIST_BEGIN
        ADD_METHOD_TO(WebhookController::gitlab, "/webhook/gitlab", drogon::Post);
        ADD_METHOD_TO(WebhookController::health, "/webhook/health", drogon::Get);
        METHOD_LIST_END

        drogon::Task<> gitlab(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> health(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;

    private:
        const std::string secret_;
    };
}
