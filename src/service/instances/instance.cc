#include "instance.h"

#include <service/util.h>

#include <format>

namespace service {
    // clang-format off
    ENUM_FROM_TO_STR(InstanceStatus,
        {InstanceStatus::ACTIVE, "active"},
        {InstanceStatus::STOPPED, "stopped"}
    )
    // clang-format on

    void to_json(nlohmann::json &j, const DatabaseInstance &instance) {
        j = nlohmann::json{{"id", instance.id},
                           {"name", instance.name},
                           {"environment", instance.environment},
                           {"container_name", instance.containerName},
                           {"host", instance.host},
                           {"port", instance.port},
                           {"username", instance.username},
                           {"database", instance.databaseName},
                           {"ssl_mode", instance.sslMode},
                           {"version", instance.version},
                           {"status", enumToStr(instance.status)},
                           {"created_at", instance.createdAt}};
    }

    nlohmann::json credentialsJson(const DatabaseInstance &instance) {
        nlohmann::json j = instance;
        j["password"] = instance.password;
        j["connection_string"] = std::format("postgresql://{}:{}@{}:{}/{}?sslmode={}", instance.username, instance.password, instance.host,
                                             instance.port, instance.databaseName, instance.sslMode);
        return j;
    }

    void to_json(nlohmann::json &j, const DatabaseStats &stats) {
        j = nlohmann::json{{"status", stats.status},       {"size", stats.size},     {"connections", stats.connections},
                           {"cpu", stats.cpu},             {"memory", stats.memory}, {"uptime", stats.uptime}};
    }
}
