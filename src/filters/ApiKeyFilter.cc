#include "ApiKeyFilter.h"

#include <drogon/drogon.h>

using namespace drogon;

ApiKeyFilter::ApiKeyFilter(std::string apiKey) : apiKey_(std::move(apiKey)) {}

Task<HttpResponsePtr> ApiKeyFilter::doFilter(const HttpRequestPtr &req) {
    if (apiKey_.empty()) {
        co_return nullptr;
    }

    static const std::string bearer = "Bearer ";
    const auto header = req->getHeader("Authorization");
    if (header.starts_with(bearer) && header.substr(bearer.size()) == apiKey_) {
        co_return nullptr;
    }
    // Browsers cannot set headers on websocket upgrades
    if (const auto token = req->getOptionalParameter<std::string>("token"); token && *token == apiKey_) {
        co_return nullptr;
    }

    const auto res = HttpResponse::newHttpResponse();
    res->setStatusCode(k401Unauthorized);
    co_return res;
}
