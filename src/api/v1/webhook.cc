#include "webhook.h"
#include "error.h"

#include <global.h>
#include <log/log.h>
#include <schemas/schemas.h>
#include <service/util.h>

using namespace std;
using namespace drogon;
using namespace service;
using namespace logging;

namespace api::v1 {
    std::optional<DeploymentRequest> parseGitlabPush(const nlohmann::json &payload) {
        static const std::string branchPrefix = "refs/heads/";

        const auto ref = payload["ref"].get<std::string>();
        if (!ref.starts_with(branchPrefix)) {
            return std::nullopt;
        }

        const auto &project = payload["project"];
        DeploymentRequest request{.projectName = project["name"].get<std::string>(),
                                  .repoUrl = project.value("git_http_url", project.value("git_ssh_url", std::string{})),
                                  .branch = ref.substr(branchPrefix.size()),
                                  .commit = "unknown"};

        if (const auto commits = payload.find("commits"); commits != payload.end() && commits->is_array() && !commits->empty()) {
            const auto &commit = commits->front();
            request.commit = commit.value("id", std::string{"unknown"});
            request.commitMessage = commit.value("message", std::string{});
            if (const auto author = commit.find("author"); author != commit.end() && author->is_object()) {
                request.author = author->value("name", std::string{});
            }
        }
        return request;
    }

    WebhookController::WebhookController(std::string secret) : secret_(std::move(secret)) {}

    Task<> WebhookController::gitlab(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        if (!secret_.empty() && req->getHeader("X-Gitlab-Token") != secret_) {
            logger.warn("Rejected GitLab webhook with invalid token from {}", req->peerAddr().toIp());
            throw ApiException(Error::ErrUnauthorized, "Invalid webhook token");
        }

        if (const auto event = req->getHeader("X-Gitlab-Event"); event != "Push Hook") {
            logger.debug("Ignoring GitLab event '{}'", event);
            callback(simpleResponse("Event ignored"));
            co_return;
        }

        const auto payload(validatedBody(req, schemas::gitlabPush));
        const auto request = parseGitlabPush(payload);
        if (!request) {
            callback(simpleResponse("Ref ignored"));
            co_return;
        }
        if (request->repoUrl.empty()) {
            throw ApiException(Error::ErrBadRequest, "Missing repository URL");
        }

        const auto [id, error] = global::scheduler->enqueue(*request);
        if (!id) {
            callback(simpleResponse("Ref ignored: " + error.message));
            co_return;
        }
        logger.info("Webhook queued deployment {} for {}/{} at {}", *id, request->projectName, request->branch, request->commit);

        nlohmann::json root;
        root["deployment_id"] = *id;
        root["status"] = enumToStr(DeploymentStatus::QUEUED);
        const auto resp = jsonResponse(root);
        resp->setStatusCode(k202Accepted);
        callback(resp);
    }

    Task<> WebhookController::health(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        const auto queue = global::scheduler->status();

        nlohmann::json root;
        root["status"] = "ok";
        root["timestamp"] = nowIsoString();
        root["queue"] = {{"pending", queue.pending.size()}, {"building", queue.activeCount}, {"capacity", queue.capacity}};
        callback(jsonResponse(root));
        co_return;
    }
}
