#pragma once

#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>

#define API_AUTH "ApiKeyFilter"

namespace api::v1 {
    void assertNonEmptyParam(const std::string &str);

    void notFound(const std::string &msg = "not_found");

    template<typename T>
    void assertFound(T &&t, const std::string &&msg = "not_found") {
        if (!t) {
            notFound(std::move(msg));
        }
    }

    nlohmann::json jsonBody(const drogon::HttpRequestPtr &req);

    nlohmann::json validatedBody(const drogon::HttpRequestPtr &req, const nlohmann::json &schema);
}
