#pragma once

#include "lifecycle.h"

#include <log/deployment_logs.h>
#include <service/network/provisioner.h>

#include <deque>
#include <list>
#include <mutex>
#include <set>

namespace service {
    struct QueueStatus {
        std::vector<DeploymentRecord> pending;
        std::vector<DeploymentRecord> building;
        int activeCount;
        int capacity;
    };

    void to_json(nlohmann::json &j, const QueueStatus &status);

    class DeploymentListener {
    public:
        virtual ~DeploymentListener() = default;

        // Invoked on every status transition, outside of scheduler locks
        virtual void onDeploymentUpdate(const DeploymentRecord &record) = 0;
    };

    class DeploymentScheduler {
    public:
        DeploymentScheduler(trantor::EventLoop *loop, ContainerLifecycleManager &lifecycle, NetworkProvisioner &network,
                            const DeploymentHistory &history, logging::DeploymentLogs &logs, const config::Deploy &config);

        // Non-blocking. A request for a (project, branch) pair that is currently building cancels the running
        // deployment, and waits in the queue until it has reached a terminal state.
        // Requests whose project or branch name is not a valid identifier are rejected.
        std::tuple<std::optional<std::string>, DeployErrorInstance> enqueue(DeploymentRequest request);

        QueueStatus status() const;

        void subscribe(std::shared_ptr<DeploymentListener> listener);

        drogon::Task<std::optional<DeploymentRecord>> getDeployment(std::string id) const;

        // Waits for a building deployment of the pair to observe its cancellation before tearing down
        drogon::Task<Error> removeDeployment(std::string projectName, std::string branch);

        // Cancels every running deployment. Queued requests stay persisted as queued.
        void shutdown();

    private:
        struct Running {
            DeploymentRecord record;
            std::shared_ptr<CancellationToken> token;
        };

        void schedule();
        drogon::Task<> execute(DeploymentRecord record, std::shared_ptr<CancellationToken> token);
        drogon::Task<> finish(DeploymentRecord record);
        void publish(const DeploymentRecord &record);
        void persist(const DeploymentRecord &record);

        bool isBuilding(const std::string &projectName, const std::string &branch) const;
        bool isBusy(const std::string &projectName, const std::string &branch) const;

        trantor::EventLoop *loop_;
        ContainerLifecycleManager &lifecycle_;
        NetworkProvisioner &network_;
        const DeploymentHistory &history_;
        logging::DeploymentLogs &logs_;
        const config::Deploy &config_;

        mutable std::mutex mutex_;
        std::deque<DeploymentRecord> pending_;
        std::unordered_map<std::string, Running> building_;
        std::list<DeploymentRecord> recent_;
        std::set<std::pair<std::string, std::string>> removing_;
        bool stopping_ = false;

        std::mutex listenersMutex_;
        std::vector<std::shared_ptr<DeploymentListener>> listeners_;
    };
}
