#pragma once

#include <drogon/utils/coroutine.h>

#include "deployment.h"
#include "environment.h"
#include "error.h"
#include "instances/instance.h"

#include <optional>
#include <vector>

namespace service {
    class EnvironmentStore {
    public:
        virtual ~EnvironmentStore() = default;

        virtual drogon::Task<EnvironmentMap> getVariables(std::string projectName, std::string branch) const = 0;
    };

    class DeploymentHistory {
    public:
        virtual ~DeploymentHistory() = default;

        virtual drogon::Task<Error> saveDeployment(DeploymentRecord record) const = 0;

        virtual drogon::Task<std::optional<DeploymentRecord>> getDeployment(std::string id) const = 0;

        virtual drogon::Task<std::vector<DeploymentRecord>> getRecentDeployments(int limit) const = 0;

        // Records left queued or building by a previous process can never finish
        virtual drogon::Task<Error> failInterruptedDeployments() const = 0;
    };

    class DatabaseRegistry {
    public:
        virtual ~DatabaseRegistry() = default;

        virtual drogon::Task<Error> insertInstance(DatabaseInstance instance) const = 0;

        virtual drogon::Task<std::optional<DatabaseInstance>> getInstance(std::string id) const = 0;

        virtual drogon::Task<std::optional<DatabaseInstance>> findInstance(std::string name, std::string environment) const = 0;

        // Distinct names can sanitize to the same container name
        virtual drogon::Task<std::optional<DatabaseInstance>> findInstanceByContainer(std::string containerName) const = 0;

        virtual drogon::Task<std::vector<DatabaseInstance>> getInstances() const = 0;

        virtual drogon::Task<Error> updateInstanceStatus(std::string id, InstanceStatus status) const = 0;

        virtual drogon::Task<Error> deleteInstance(std::string id) const = 0;
    };
}
