#pragma once

#include <drogon/HttpClient.h>
#include <drogon/HttpTypes.h>
#include <log/log.h>
#include <nlohmann/json-schema.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "error.h"

template<typename K, typename V>
static std::unordered_map<V, K> reverse_map(const std::unordered_map<K, V> &m) {
    std::unordered_map<V, K> r;
    for (const auto &kv: m)
        r[kv.second] = kv.first;
    return r;
}

#define ENUM_TO_STR(name, ...)                                                                                                             \
    std::string enumToStr(const name value) {                                                                                              \
        const static std::unordered_map<name, std::string> map{__VA_ARGS__};                                                               \
        const auto val = map.find(value);                                                                                                  \
        return val == map.end() ? "unknown" : val->second;                                                                                 \
    }

#define ENUM_FROM_TO_STR(name, ...)                                                                                                        \
    const static std::unordered_map<name, std::string> _##name##_map{__VA_ARGS__};                                                         \
    const static std::unordered_map _##name##_map_rev{reverse_map(_##name##_map)};                                                         \
    std::string enumToStr(const name value) {                                                                                              \
        const auto str = _##name##_map.find(value);                                                                                        \
        return str == _##name##_map.end() ? "unknown" : str->second;                                                                       \
    }                                                                                                                                      \
    name parse##name(const std::string &str) {                                                                                             \
        const auto value = _##name##_map_rev.find(str);                                                                                    \
        return value == _##name##_map_rev.end() ? name::UNKNOWN : value->second;                                                           \
    }

drogon::HttpResponsePtr jsonResponse(const nlohmann::json &json);

drogon::HttpResponsePtr simpleResponse(const std::string &msg);

drogon::HttpResponsePtr statusResponse(drogon::HttpStatusCode code);

struct ApiException final : std::runtime_error {
    using std::runtime_error::runtime_error;

    service::Error error;
    Json::Value data;

    ApiException(const service::Error err, const std::string &message, const std::function<void(Json::Value &)> &jsonBuilder = nullptr) :
        std::runtime_error(message), error(err) {
        data["error"] = message;
        if (jsonBuilder) {
            jsonBuilder(data);
        }
    }
};

struct JsonValidationError {
    const nlohmann::json value;
    const nlohmann::json_pointer<std::basic_string<char>> pointer;
    const std::string msg;

    std::string format() const;
};

std::string serializeJsonString(const Json::Value &value);

bool contains(const std::string &haystack, const std::string &needle);

// Compares lexically normalized paths, so ".." segments cannot escape the base
bool isSubpath(const std::filesystem::path &path, const std::filesystem::path &base);

void ltrim(std::string &s);

void rtrim(std::string &s);

std::string trimCopy(std::string s);

std::string strToLower(std::string copy);

// Single-quotes a value for /bin/sh
std::string shellQuote(const std::string &value);

// TCP port in [1, 65535]
std::optional<int> parsePort(const std::string &value);

std::string nowIsoString();

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string &str);

drogon::HttpClientPtr createHttpClient(const std::string &url);

drogon::Task<std::tuple<std::optional<Json::Value>, service::Error>> sendAuthenticatedRequest(
    drogon::HttpClientPtr client, drogon::HttpMethod method, std::string path, std::string token,
    std::function<void(drogon::HttpRequestPtr &)> callback = [](drogon::HttpRequestPtr &) {});

drogon::Task<std::tuple<std::optional<Json::Value>, service::Error>> sendApiRequest(
    drogon::HttpClientPtr client, drogon::HttpMethod method, std::string path,
    std::function<void(drogon::HttpRequestPtr &)> callback = [](drogon::HttpRequestPtr &) {});

template<class T = nlohmann::json>
std::optional<T> tryParseJson(const std::string_view json) {
    try {
        return T::parse(json);
    } catch (const nlohmann::json::parse_error &e) {
        logging::logger.error("JSON parse error: {}", e.what());
        return std::nullopt;
    }
}

nlohmann::json parkourJson(const Json::Value &json);

std::optional<JsonValidationError> validateJson(const nlohmann::json &schema, const Json::Value &json);

std::optional<JsonValidationError> validateJson(const nlohmann::json &schema, const nlohmann::json &json);
