#include "util.h"
#include <api/v1/error.h>
#include <log/log.h>

#include <ctime>
#include <iomanip>
#include <ranges>
#include <sstream>

using namespace drogon;
using namespace logging;
using namespace service;

HttpResponsePtr jsonResponse(const nlohmann::json &json) {
    const auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(k200OK);
    resp->setContentTypeCode(CT_APPLICATION_JSON);
    resp->setBody(json.dump());
    return resp;
}

HttpResponsePtr simpleResponse(const std::string &msg) {
    Json::Value root;
    root["message"] = msg;
    const auto resp = HttpResponse::newHttpJsonResponse(root);
    resp->setStatusCode(k200OK);
    return resp;
}

HttpResponsePtr statusResponse(const HttpStatusCode code) {
    const auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(code);
    return resp;
}

bool contains(const std::string &haystack, const std::string &needle) { return haystack.find(needle) != std::string::npos; }

bool isSubpath(const std::filesystem::path &path, const std::filesystem::path &base) {
    const auto normalPath = path.lexically_normal();
    auto normalBase = base.lexically_normal();
    if (!normalBase.has_filename()) {
        normalBase = normalBase.parent_path();
    }
    const auto [fst, snd] = std::mismatch(normalPath.begin(), normalPath.end(), normalBase.begin(), normalBase.end());
    return snd == normalBase.end();
}

void ltrim(std::string &s) {
    s.erase(s.begin(), std::ranges::find_if(s, [](const unsigned char ch) { return !std::isspace(ch); }));
}

void rtrim(std::string &s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
}

std::string trimCopy(std::string s) {
    ltrim(s);
    rtrim(s);
    return s;
}

std::string strToLower(std::string copy) {
    std::ranges::transform(copy, copy.begin(), [](const unsigned char c) { return std::tolower(c); });
    return copy;
}

std::string shellQuote(const std::string &value) {
    std::string quoted = "'";
    for (const char c: value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::optional<int> parsePort(const std::string &value) {
    try {
        size_t end = 0;
        const auto port = std::stol(value, &end);
        if (end != value.size() || port < 1 || port > 65535) {
            return std::nullopt;
        }
        return static_cast<int>(port);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::string nowIsoString() { return trantor::Date::now().toCustomFormattedString("%Y-%m-%dT%H:%M:%SZ"); }

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string &str) {
    // Docker reports nanosecond precision, e.g. 2024-05-01T10:00:00.123456789Z
    if (str.size() < 19) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss(str.substr(0, 19));
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string JsonValidationError::format() const {
    auto field = pointer.to_string();
    if (field.starts_with("/")) field = field.substr(1);
    return field + ": " + msg + "\n> " + value.dump(2);
}

std::string serializeJsonString(const Json::Value &value) {
    Json::FastWriter fastWriter;
    fastWriter.omitEndingLineFeed();
    return fastWriter.write(value);
}

HttpClientPtr createHttpClient(const std::string &url) {
    const auto currentLoop = trantor::EventLoop::getEventLoopOfCurrentThread();
    return HttpClient::newHttpClient(url, currentLoop);
}

Task<std::tuple<std::optional<Json::Value>, Error>> sendAuthenticatedRequest(const HttpClientPtr client, const HttpMethod method,
                                                                             const std::string path, const std::string token,
                                                                             const std::function<void(HttpRequestPtr &)> callback) {
    co_return co_await sendApiRequest(client, method, path, [&](HttpRequestPtr &req) {
        req->addHeader("Authorization", "Bearer " + token);
        callback(req);
    });
}

Task<std::tuple<std::optional<Json::Value>, Error>> sendApiRequest(const HttpClientPtr client, const HttpMethod method,
                                                                   const std::string path,
                                                                   const std::function<void(HttpRequestPtr &)> callback) {
    try {
        auto httpReq = HttpRequest::newHttpRequest();
        httpReq->setMethod(method);
        httpReq->setPath(path);
        httpReq->addHeader("Accept", "application/json");
        callback(httpReq);

        logger.trace("=> Request to {}", path);
        const auto response = co_await client->sendRequestCoro(httpReq, 30);
        const auto status = response->getStatusCode();
        if (status == k200OK || status == k201Created || status == k202Accepted) {
            if (const auto jsonResp = response->getJsonObject()) {
                logger.trace("<= Response ({}) from {}", std::to_string(status), path);
                co_return {*jsonResp, Error::Ok};
            }
        }

        logger.trace("Unexpected api response: ({}) {}", std::to_string(status), response->getBody());
        co_return {std::nullopt, api::v1::mapStatusCode(status)};
    } catch (std::exception &e) {
        logger.error("Error sending HTTP request: {}", e.what());
        co_return {std::nullopt, Error::ErrInternal};
    }
}

nlohmann::json parkourJson(const Json::Value &json) {
    // Jump from one json library to the other. Parkour!
    const auto ser = serializeJsonString(json);
    return nlohmann::json::parse(ser);
}

std::optional<JsonValidationError> validateJson(const nlohmann::json &schema, const Json::Value &json) {
    const auto newJson = parkourJson(json);
    return validateJson(schema, newJson);
}

std::optional<JsonValidationError> validateJson(const nlohmann::json &schema, const nlohmann::json &json) {
    class CustomJsonErrorHandler : public nlohmann::json_schema::basic_error_handler {
    public:
        void error(const nlohmann::json_pointer<std::basic_string<char>> &pointer, const nlohmann::json &json1,
                   const std::string &string1) override {
            error_ = std::make_unique<JsonValidationError>(json1, pointer, string1);
        }

        const std::unique_ptr<JsonValidationError> &getError() { return error_; }

    private:
        std::unique_ptr<JsonValidationError> error_;
    };

    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    try {
        CustomJsonErrorHandler err;
        validator.validate(json, err);
        if (const auto &error = err.getError()) {
            return *error;
        }
        return std::nullopt;
    } catch ([[maybe_unused]] const std::exception &e) {
        return JsonValidationError{nlohmann::json(), nlohmann::json::json_pointer{"/"}, e.what()};
    }
}
