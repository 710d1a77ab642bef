#include "databases.h"
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
    void throwDatabaseError(const DatabaseErrorInstance &error) {
        if (error.error != DatabaseError::OK) {
            throw ApiException(mapDatabaseError(error.error), error.message,
                               [&error](Json::Value &root) { root["code"] = enumToStr(error.error); });
        }
    }

    Task<> DatabasesController::listDatabases(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        const auto instances(co_await global::databases->listInstances());
        callback(jsonResponse(instances));
    }

    Task<> DatabasesController::createDatabase(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback) const {
        const auto json(validatedBody(req, schemas::createDatabase));
        const auto name = json["name"].get<std::string>();
        const auto environment = json["environment"].get<std::string>();

        const auto [instance, error] = co_await global::databases->createInstance(name, environment);
        throwDatabaseError(error);
        if (!instance) {
            throw ApiException(Error::ErrInternal, "Database creation failed");
        }

        const auto resp = jsonResponse(credentialsJson(*instance));
        resp->setStatusCode(k201Created);
        callback(resp);
    }

    Task<> DatabasesController::getStats(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                         const std::string id) const {
        const auto [stats, error] = co_await global::databases->stats(id);
        throwDatabaseError(error);
        assertFound(stats);
        callback(jsonResponse(*stats));
    }

    Task<> DatabasesController::startDatabase(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                              const std::string id) const {
        throwDatabaseError(co_await global::databases->start(id));
        callback(simpleResponse("Database started"));
    }

    Task<> DatabasesController::stopDatabase(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                             const std::string id) const {
        throwDatabaseError(co_await global::databases->stop(id));
        callback(simpleResponse("Database stopped"));
    }

    Task<> DatabasesController::restartDatabase(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                                const std::string id) const {
        throwDatabaseError(co_await global::databases->restart(id));
        callback(simpleResponse("Database restarted"));
    }

    Task<> DatabasesController::deleteDatabase(const HttpRequestPtr req, const std::function<void(const HttpResponsePtr &)> callback,
                                               const std::string id) const {
        const auto purge = req->getOptionalParameter<std::string>("purge").value_or("false") == "true";
        throwDatabaseError(co_await global::databases->remove(id, purge));
        callback(simpleResponse("Database deleted"));
    }
}
