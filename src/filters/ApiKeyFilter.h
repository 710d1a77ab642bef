#pragma once

#include <drogon/HttpFilter.h>

using namespace drogon;

class ApiKeyFilter : public HttpCoroFilter<ApiKeyFilter, false> {
public:
    explicit ApiKeyFilter(std::string apiKey);

    Task<HttpResponsePtr> doFilter(const HttpRequestPtr &req) override;

private:
    const std::string apiKey_;
};
