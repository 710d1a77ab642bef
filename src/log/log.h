#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace logging {
    extern spdlog::logger &logger;

    void configureLoggingLevel();

    // Values of keys that look like credentials are replaced before being logged
    std::string maskSecret(const std::string &key, const std::string &value);
}
