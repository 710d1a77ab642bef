#pragma once

#include "database_base.h"

#include <service/stores.h>

namespace service {
    class Database final : public DatabaseBase, public EnvironmentStore, public DeploymentHistory, public DatabaseRegistry {
    public:
        Database();
        explicit Database(const drogon::orm::DbClientPtr &client);

        drogon::Task<Error> migrate() const;

        // Environment variables
        drogon::Task<EnvironmentMap> getVariables(std::string projectName, std::string branch) const override;
        drogon::Task<Error> setVariable(std::string projectName, std::string branch, std::string key, std::string value) const;
        drogon::Task<Error> deleteVariable(std::string projectName, std::string branch, std::string key) const;

        // Deployments
        drogon::Task<Error> saveDeployment(DeploymentRecord record) const override;
        drogon::Task<std::optional<DeploymentRecord>> getDeployment(std::string id) const override;
        drogon::Task<std::vector<DeploymentRecord>> getRecentDeployments(int limit) const override;
        drogon::Task<Error> failInterruptedDeployments() const override;

        // Managed database instances
        drogon::Task<Error> insertInstance(DatabaseInstance instance) const override;
        drogon::Task<std::optional<DatabaseInstance>> getInstance(std::string id) const override;
        drogon::Task<std::optional<DatabaseInstance>> findInstance(std::string name, std::string environment) const override;
        drogon::Task<std::optional<DatabaseInstance>> findInstanceByContainer(std::string containerName) const override;
        drogon::Task<std::vector<DatabaseInstance>> getInstances() const override;
        drogon::Task<Error> updateInstanceStatus(std::string id, InstanceStatus status) const override;
        drogon::Task<Error> deleteInstance(std::string id) const override;

    protected:
        drogon::orm::DbClientPtr getDbClientPtr() const override;

    private:
        drogon::orm::DbClientPtr clientPtr_;
    };
}
