#pragma once

#include "base.h"

namespace api::v1 {
    class DeploymentsController final : public drogon::HttpController<DeploymentsController, false> {
    public:
        METHOD_LIST_BEGIN
        ADD_METHOD_TO(DeploymentsController::createDeployment, "/api/v1/deployments", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::getQueue, "/api/v1/deployments/queue", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::listContainers, "/api/v1/deployments/containers", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::pruneImages, "/api/v1/deployments/images/prune", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::renewCertificate, "/api/v1/deployments/certificates/{1:domain}/renew", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::getDeployment, "/api/v1/deployments/{1:id}", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::getDeploymentLogs, "/api/v1/deployments/{1:id}/logs", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::removeDeployment, "/api/v1/deployments/{1:project}/{2:branch}", drogon::Delete, API_AUTH);
        // Environment
        ADD_METHOD_TO(DeploymentsController::getVariables, "/api/v1/environments/{1:project}/{2:branch}", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::setVariable, "/api/v1/environments/{1:project}/{2:branch}/{3:key}", drogon::Put, API_AUTH);
        ADD_METHOD_TO(DeploymentsController::deleteVariable, "/api/v1/environments/{1:project}/{2:branch}/{3:key}", drogon::Delete,
                      API_AUTH);
        METHOD_LIST_END

        drogon::Task<> createDeployment(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> getQueue(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> listContainers(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> pruneImages(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> renewCertificate(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                        std::string domain) const;
        drogon::Task<> getDeployment(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                     std::string id) const;
        drogon::Task<> getDeploymentLogs(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                         std::string id) const;
        drogon::Task<> removeDeployment(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                        std::string project, std::string branch) const;

        drogon::Task<> getVariables(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                    std::string project, std::string branch) const;
        drogon::Task<> setVariable(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                   std::string project, std::string branch, std::string key) const;
        drogon::Task<> deleteVariable(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                      std::string project, std::string branch, std::string key) const;
    };

    service::DeploymentRequest parseDeploymentRequest(const nlohmann::json &json);
}
