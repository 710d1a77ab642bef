#include "error.h"
#include "util.h"

namespace service {
    // clang-format off
    ENUM_FROM_TO_STR(DeployError,
        {DeployError::OK, "ok"},
        {DeployError::SOURCE, "source"},
        {DeployError::MISSING_BUILD_FILE, "missing_build_file"},
        {DeployError::BUILD, "build"},
        {DeployError::START, "start"},
        {DeployError::HEALTH_TIMEOUT, "health_timeout"},
        {DeployError::CONTAINER_EXITED, "container_exited"},
        {DeployError::NO_PORT, "no_port"},
        {DeployError::PROXY, "proxy"},
        {DeployError::CANCELLED, "cancelled"},
        {DeployError::INVALID_REQUEST, "invalid_request"},
        {DeployError::UNKNOWN, "unknown"}
    )

    ENUM_TO_STR(DatabaseError,
        {DatabaseError::OK, "ok"},
        {DatabaseError::INVALID_NAME, "invalid_name"},
        {DatabaseError::DUPLICATE_NAME, "duplicate_name"},
        {DatabaseError::NOT_FOUND, "not_found"},
        {DatabaseError::NO_PORT, "no_port"},
        {DatabaseError::START, "start"},
        {DatabaseError::HEALTH_TIMEOUT, "health_timeout"},
        {DatabaseError::CONTAINER_EXITED, "container_exited"},
        {DatabaseError::RUNTIME, "runtime"},
        {DatabaseError::REGISTRY, "registry"},
        {DatabaseError::UNKNOWN, "unknown"}
    )
    // clang-format on
}
