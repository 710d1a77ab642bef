#include "base.h"

#include <service/util.h>

using namespace drogon;
using namespace service;

namespace api::v1 {
    void assertNonEmptyParam(const std::string &str) {
        if (str.empty()) {
            throw ApiException(Error::ErrBadRequest, "Insufficient parameters");
        }
    }

    void notFound(const std::string &msg) { throw ApiException(Error::ErrNotFound, msg); }

    nlohmann::json jsonBody(const HttpRequestPtr &req) {
        const auto json(req->getJsonObject());
        if (!json) {
            throw ApiException(Error::ErrBadRequest, req->getJsonError());
        }
        return parkourJson(*json);
    }

    nlohmann::json validatedBody(const HttpRequestPtr &req, const nlohmann::json &schema) {
        const auto json(jsonBody(req));
        if (const auto error = validateJson(schema, json)) {
            throw ApiException(Error::ErrBadRequest, error->msg);
        }
        return json;
    }
}
