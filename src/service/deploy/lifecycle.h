#pragma once

#include <config.h>
#include <service/deployment.h>
#include <service/health.h>
#include <service/ports.h>
#include <service/runtime/container_runtime.h>
#include <service/storage/source.h>
#include <service/stores.h>

namespace service {
    struct DeployedContainer {
        std::string containerName;
        std::string image;
        int port;
        int containerPort;
        std::optional<git::GitRevision> revision;
    };

    // Port declared by the first EXPOSE directive of a Dockerfile
    std::optional<int> detectExposedPort(const std::string &dockerfile);

    bool logsIndicateStarted(const std::string &logs);

    class ContainerLifecycleManager {
    public:
        ContainerLifecycleManager(ContainerRuntime &runtime, SourceRepository &source, PortAllocator &ports, const EnvironmentStore &env,
                                  const config::Deploy &deployConfig, const config::Health &healthConfig);

        // Destructive replace: any container and image under the derived name are removed before the new build
        drogon::Task<std::tuple<std::optional<DeployedContainer>, DeployErrorInstance>>
        deployContainer(DeploymentRequest request, std::string domain, std::shared_ptr<spdlog::logger> log,
                        std::shared_ptr<CancellationToken> token = nullptr);

        drogon::Task<> removeContainer(std::string projectName, std::string branch);

        // Running application containers, database containers excluded
        drogon::Task<std::vector<ContainerSummary>> listDeployments();

        drogon::Task<Error> pruneImages();

    private:
        drogon::Task<PollOutcome> waitForReady(const std::string &name, const std::shared_ptr<spdlog::logger> &log,
                                               const std::shared_ptr<CancellationToken> &token, std::string &lastLogs);

        drogon::Task<std::optional<int>> allocatePort();

        ContainerRuntime &runtime_;
        SourceRepository &source_;
        PortAllocator &ports_;
        const EnvironmentStore &env_;
        const config::Deploy &deployConfig_;
        const config::Health &healthConfig_;
    };
}
