#pragma once

#include "instance.h"

#include <config.h>
#include <service/health.h>
#include <service/ports.h>
#include <service/runtime/container_runtime.h>
#include <service/stores.h>

#include <mutex>
#include <set>

namespace service {
    // "2d 3h", "5h 12m", "7m" or "42s"
    std::string formatUptime(std::chrono::milliseconds uptime);

    class DatabaseProvisioner {
    public:
        DatabaseProvisioner(ContainerRuntime &runtime, PortAllocator &ports, const DatabaseRegistry &registry, const config::Postgres &config);

        // The returned instance is the only place the generated password is ever exposed
        drogon::Task<std::tuple<std::optional<DatabaseInstance>, DatabaseErrorInstance>> createInstance(std::string name,
                                                                                                        std::string environment);

        drogon::Task<std::vector<DatabaseInstance>> listInstances() const;

        drogon::Task<std::tuple<std::optional<DatabaseStats>, DatabaseErrorInstance>> stats(std::string id) const;

        drogon::Task<DatabaseErrorInstance> start(std::string id);
        drogon::Task<DatabaseErrorInstance> stop(std::string id);
        drogon::Task<DatabaseErrorInstance> restart(std::string id);

        // Storage is left on disk unless purgeStorage is set
        drogon::Task<DatabaseErrorInstance> remove(std::string id, bool purgeStorage = false);

    private:
        drogon::Task<std::tuple<std::optional<DatabaseInstance>, DatabaseErrorInstance>> provision(const std::string &name,
                                                                                                   const std::string &environment);
        drogon::Task<DatabaseErrorInstance> waitForDatabase(const std::string &containerName, const std::string &username) const;
        // Removes the container and its storage after a failed creation
        drogon::Task<> discard(const DatabaseInstance &instance);
        bool isStoragePath(const std::filesystem::path &path) const;
        drogon::Task<std::optional<std::string>> query(const DatabaseInstance &instance, const std::string &sql) const;

        ContainerRuntime &runtime_;
        PortAllocator &ports_;
        const DatabaseRegistry &registry_;
        const config::Postgres &config_;

        std::mutex creatingMutex_;
        std::set<std::string> creating_;
    };
}
