#pragma once

#include <nlohmann/json_fwd.hpp>

namespace schemas {
    extern nlohmann::json systemConfig;

    extern nlohmann::json createDeployment;
    extern nlohmann::json createDatabase;
    extern nlohmann::json setVariable;
    extern nlohmann::json gitlabPush;
}
