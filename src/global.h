#pragma once

#include <memory>

#include <config.h>
#include <service/database/database.h>
#include <service/deploy/scheduler.h>
#include <service/instances/provisioner.h>
#include <service/realtime/connections.h>

namespace global {
    extern config::SystemConfig config;

    extern std::shared_ptr<service::Database> database;
    extern std::shared_ptr<service::ContainerLifecycleManager> lifecycle;
    extern std::shared_ptr<service::NetworkProvisioner> network;
    extern std::shared_ptr<service::DeploymentScheduler> scheduler;
    extern std::shared_ptr<service::DatabaseProvisioner> databases;
    extern std::shared_ptr<logging::DeploymentLogs> deploymentLogs;
    extern std::shared_ptr<realtime::ConnectionManager> connections;
}
