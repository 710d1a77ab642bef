#include "deployments.h"
#include "error.h"

#include <global.h>
#include <log/log.h>
#include <schemas/schemas.h>
#include <service/deployment.h>
#include <service/naming.h>
#include <service/util.h>

using namespace std;
using namespace drogon;
using namespace service;
using namespace logging;

namespace api::v1 {
    DeploymentRequest parseDeploymentRequest(const nlohmann::json &json) {
        return DeploymentRequest{.projectName = json["project_name"].get<std::string>(),
                                 .repoUrl = json["repo_url"].get<std::string>(),
                                 .branch = json["branch"].get<std::string>(),
                                 .commit = json.value("commit", std::string{"unknown"}),
                                 .commitMessage = json.value("commit_message", std::string{}),
                                 .author = json.value("author", std::string{})};
    }

    Task<> DeploymentsController::createDeployment(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        const auto json(validatedBody(req, schemas::createDeployment));
        const auto request(parseDeploymentRequest(json));

        const auto [id, error] = global::scheduler->enqueue(request);
        if (!id) {
            throw ApiException(Error::ErrBadRequest, error.message);
        }
        logger.info("Queued deployment {} for {}/{}", *id, request.projectName, request.branch);

        nlohmann::json root;
        root["deployment_id"] = *id;
        root["status"] = enumToStr(DeploymentStatus::QUEUED);
        const auto resp = jsonResponse(root);
        resp->setStatusCode(k202Accepted);
        callback(resp);
        co_return;
    }

    Task<> DeploymentsController::getQueue(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        callback(jsonResponse(global::scheduler->status()));
        co_return;
    }

    Task<> DeploymentsController::listContainers(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        const auto containers(co_await global::lifecycle->listDeployments());

        nlohmann::json root(nlohmann::json::value_t::array);
        for (const auto &container: containers) {
            nlohmann::json entry;
            entry["id"] = container.id;
            entry["name"] = container.name;
            entry["image"] = container.image;
            entry["status"] = container.status;
            entry["port"] = container.hostPort ? nlohmann::json(*container.hostPort) : nlohmann::json(nullptr);
            root.push_back(entry);
        }
        callback(jsonResponse(root));
    }

    Task<> DeploymentsController::pruneImages(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        if (const auto error = co_await global::lifecycle->pruneImages(); error != Error::Ok) {
            throw ApiException(error, "Failed to prune images");
        }
        callback(simpleResponse("Images pruned"));
    }

    Task<> DeploymentsController::renewCertificate(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                                   const std::string domain) const {
        assertNonEmptyParam(domain);
        if (!isValidDomainName(domain)) {
            throw ApiException(Error::ErrBadRequest, "Invalid domain");
        }

        const auto [state, error] = co_await global::network->renewCertificate(domain);

        nlohmann::json root;
        root["domain"] = domain;
        root["certificate"] = enumToStr(state);
        root["error"] = error.empty() ? nlohmann::json(nullptr) : nlohmann::json(error);
        callback(jsonResponse(root));
    }

    Task<> DeploymentsController::getDeployment(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                                const std::string id) const {
        const auto deployment(co_await global::scheduler->getDeployment(id));
        assertFound(deployment);
        callback(jsonResponse(*deployment));
    }

    Task<> DeploymentsController::getDeploymentLogs(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                                    const std::string id) const {
        if (!service::isValidDeploymentId(id)) {
            throw ApiException(Error::ErrNotFound, "Deployment not found");
        }
        const auto lines = global::deploymentLogs->lines(id);
        if (lines.empty()) {
            const auto deployment(co_await global::scheduler->getDeployment(id));
            assertFound(deployment);
        }

        nlohmann::json root;
        root["id"] = id;
        root["lines"] = lines;
        callback(jsonResponse(root));
    }

    Task<> DeploymentsController::removeDeployment(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                                   const std::string project, const std::string branch) const {
        assertNonEmptyParam(project);
        assertNonEmptyParam(branch);

        if (const auto error = co_await global::scheduler->removeDeployment(project, branch); error != Error::Ok) {
            throw ApiException(error, "Failed to remove deployment");
        }
        callback(simpleResponse("Deployment removed"));
    }

    Task<> DeploymentsController::getVariables(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                               const std::string project, const std::string branch) const {
        const auto variables(co_await global::database->getVariables(project, branch));

        nlohmann::json root(nlohmann::json::value_t::object);
        for (const auto &[key, value]: variables) {
            root[key] = maskSecret(key, value);
        }
        callback(jsonResponse(root));
    }

    Task<> DeploymentsController::setVariable(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                              const std::string project, const std::string branch, const std::string key) const {
        assertNonEmptyParam(key);
        const auto json(validatedBody(req, schemas::setVariable));

        if (const auto error = co_await global::database->setVariable(project, branch, key, json["value"].get<std::string>());
            error != Error::Ok)
        {
            throw ApiException(error, "Failed to save variable");
        }
        callback(statusResponse(k204NoContent));
    }

    Task<> DeploymentsController::deleteVariable(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                                 const std::string project, const std::string branch, const std::string key) const {
        if (const auto error = co_await global::database->deleteVariable(project, branch, key); error != Error::Ok) {
            throw ApiException(error, "Failed to delete variable");
        }
        callback(statusResponse(k204NoContent));
    }
}
