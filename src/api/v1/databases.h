#pragma once

#include "base.h"

namespace api::v1 {
    class DatabasesController final : public drogon::HttpController<DatabasesController, false> {
    public:
        METHOD_LIST_BEGIN
        ADD_METHOD_TO(DatabasesController::listDatabases, "/api/v1/databases", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DatabasesController::createDatabase, "/api/v1/databases", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DatabasesController::getStats, "/api/v1/databases/{1:id}/stats", drogon::Get, API_AUTH);
        ADD_METHOD_TO(DatabasesController::startDatabase, "/api/v1/databases/{1:id}/start", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DatabasesController::stopDatabase, "/api/v1/databases/{1:id}/stop", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DatabasesController::restartDatabase, "/api/v1/databases/{1:id}/restart", drogon::Post, API_AUTH);
        ADD_METHOD_TO(DatabasesController::deleteDatabase, "/api/v1/databases/{1:id}", drogon::Delete, API_AUTH);
        METHOD_LIST_END

        drogon::Task<> listDatabases(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> createDatabase(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback) const;
        drogon::Task<> getStats(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                std::string id) const;
        drogon::Task<> startDatabase(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                     std::string id) const;
        drogon::Task<> stopDatabase(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                    std::string id) const;
        drogon::Task<> restartDatabase(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                       std::string id) const;
        drogon::Task<> deleteDatabase(drogon::HttpRequestPtr req, std::function<void(const drogon::HttpResponsePtr &)> callback,
                                      std::string id) const;
    };
}
