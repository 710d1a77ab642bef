#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace service {
    enum class InstanceStatus { UNKNOWN, ACTIVE, STOPPED };
    std::string enumToStr(InstanceStatus status);
    InstanceStatus parseInstanceStatus(const std::string &str);

    struct DatabaseInstance {
        std::string id;
        std::string name;
        std::string environment;
        std::string containerName;
        std::string host;
        int port = 0;
        std::string username;
        std::string password;
        std::string databaseName;
        std::string storagePath;
        std::string sslMode = "prefer";
        std::string version;
        InstanceStatus status = InstanceStatus::ACTIVE;
        std::string createdAt;
    };

    struct DatabaseStats {
        std::string status;
        std::string size;
        int connections = 0;
        std::string cpu;
        std::string memory;
        std::string uptime;
    };

    // Never includes the password
    void to_json(nlohmann::json &j, const DatabaseInstance &instance);

    nlohmann::json credentialsJson(const DatabaseInstance &instance);

    void to_json(nlohmann::json &j, const DatabaseStats &stats);
}
