#include "global.h"

namespace global {
    config::SystemConfig config;

    std::shared_ptr<service::Database> database;
    std::shared_ptr<service::ContainerLifecycleManager> lifecycle;
    std::shared_ptr<service::NetworkProvisioner> network;
    std::shared_ptr<service::DeploymentScheduler> scheduler;
    std::shared_ptr<service::DatabaseProvisioner> databases;
    std::shared_ptr<logging::DeploymentLogs> deploymentLogs;
    std::shared_ptr<realtime::ConnectionManager> connections;
}
