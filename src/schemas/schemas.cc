//ReSharper disable CppUseAuto
#include <schemas/schemas.h>

#include <nlohmann/json.hpp>

nlohmann::json schemas::systemConfig = R"(@SYSTEM_CONFIG_SCHEMA@)"_json;

nlohmann::json schemas::createDeployment = R"(
{
    "$schema": "https://json-schema.org/draft/2020-12/schema",
    "title": "Deployment request",
    "type": "object",
    "properties": {
        "project_name": { "type": "string", "minLength": 1, "maxLength": 63, "pattern": "^[A-Za-z0-9][A-Za-z0-9 ._-]*$" },
        "repo_url": { "type": "string", "minLength": 1 },
        "branch": { "type": "string", "minLength": 1, "maxLength": 63, "pattern": "^[A-Za-z0-9][A-Za-z0-9._-]*$" },
        "commit": { "type": "string" },
        "commit_message": { "type": "string" },
        "author": { "type": "string" }
    },
    "required": ["project_name", "repo_url", "branch"]
}
)"_json;

nlohmann::json schemas::createDatabase = R"(
{
    "$schema": "https://json-schema.org/draft/2020-12/schema",
    "title": "Managed database",
    "type": "object",
    "properties": {
        "name": { "type": "string", "minLength": 1 },
        "environment": { "type": "string", "minLength": 1, "maxLength": 63, "pattern": "^[A-Za-z0-9][A-Za-z0-9._-]*$" },
        "version": { "type": "string" }
    },
    "required": ["name", "environment"]
}
)"_json;

nlohmann::json schemas::setVariable = R"(
{
    "$schema": "https://json-schema.org/draft/2020-12/schema",
    "title": "Environment variable",
    "type": "object",
    "properties": {
        "value": { "type": "string" }
    },
    "required": ["value"]
}
)"_json;

nlohmann::json schemas::gitlabPush = R"(
{
    "$schema": "https://json-schema.org/draft/2020-12/schema",
    "title": "GitLab push event",
    "type": "object",
    "properties": {
        "ref": { "type": "string" },
        "project": {
            "type": "object",
            "properties": {
                "name": { "type": "string" },
                "git_http_url": { "type": "string" },
                "git_ssh_url": { "type": "string" }
            },
            "required": ["name"]
        },
        "commits": { "type": "array" }
    },
    "required": ["ref", "project"]
}
)"_json;
