#pragma once

#include <string>

namespace service {
    enum class Error { Ok = 0, ErrInternal = 500, ErrNotFound = 404, ErrBadRequest = 400, ErrUnauthorized = 401, ErrConflict = 409 };

    // clang-format off
    enum class DeployError {
        OK,
        SOURCE, MISSING_BUILD_FILE, BUILD, START,
        HEALTH_TIMEOUT, CONTAINER_EXITED,
        NO_PORT, PROXY, CANCELLED, INVALID_REQUEST,
        UNKNOWN
    };
    // clang-format on
    std::string enumToStr(DeployError error);
    DeployError parseDeployError(const std::string &str);

    struct DeployErrorInstance {
        DeployError error;
        std::string message;
    };

    enum class DatabaseError { OK, INVALID_NAME, DUPLICATE_NAME, NOT_FOUND, NO_PORT, START, HEALTH_TIMEOUT, CONTAINER_EXITED, RUNTIME, REGISTRY, UNKNOWN };
    std::string enumToStr(DatabaseError error);

    struct DatabaseErrorInstance {
        DatabaseError error;
        std::string message;
    };
}
