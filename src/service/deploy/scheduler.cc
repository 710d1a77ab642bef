#include "scheduler.h"

#include <monitor.h>
#include <service/naming.h>
#include <service/util.h>

#include <ranges>

#define RECENT_DEPLOYMENTS 100
#define REMOVAL_POLL_INTERVAL std::chrono::milliseconds(100)

using namespace drogon;
using namespace logging;

namespace service {
    void to_json(nlohmann::json &j, const QueueStatus &status) {
        j = nlohmann::json{{"pending", status.pending},
                           {"building", status.building},
                           {"active_count", status.activeCount},
                           {"capacity", status.capacity},
                           {"queue_length", status.pending.size()}};
    }

    DeploymentScheduler::DeploymentScheduler(trantor::EventLoop *loop, ContainerLifecycleManager &lifecycle, NetworkProvisioner &network,
                                             const DeploymentHistory &history, logging::DeploymentLogs &logs,
                                             const config::Deploy &config) :
        loop_(loop), lifecycle_(lifecycle), network_(network), history_(history), logs_(logs), config_(config) {}

    bool DeploymentScheduler::isBuilding(const std::string &projectName, const std::string &branch) const {
        return std::ranges::any_of(building_, [&](const auto &entry) {
            return entry.second.record.request.projectName == projectName && entry.second.record.request.branch == branch;
        });
    }

    bool DeploymentScheduler::isBusy(const std::string &projectName, const std::string &branch) const {
        return isBuilding(projectName, branch) || removing_.contains({projectName, branch});
    }

    std::tuple<std::optional<std::string>, DeployErrorInstance> DeploymentScheduler::enqueue(DeploymentRequest request) {
        if (!isValidProjectName(request.projectName) || !isValidBranchName(request.branch)) {
            logger.warn("Rejected deployment request with invalid project '{}' or branch '{}'", request.projectName, request.branch);
            return {std::nullopt, {DeployError::INVALID_REQUEST, "Invalid project or branch name"}};
        }
        if (!isValidDeploymentId(request.id)) {
            request.id = generateDeploymentId();
        }
        if (request.requestedAt.empty()) {
            request.requestedAt = nowIsoString();
        }
        if (request.commit.empty()) {
            request.commit = "unknown";
        }

        DeploymentRecord record{.request = request, .status = DeploymentStatus::QUEUED};
        record.containerName = containerName(request.projectName, request.branch);
        record.domain = domainFor(request.projectName, request.branch, config_.baseDomain, config_.productionBranches);
        record.queuedAt = record.request.requestedAt;

        {
            std::lock_guard lock(mutex_);
            for (const auto &running: building_ | std::views::values) {
                if (running.record.request.projectName == request.projectName && running.record.request.branch == request.branch) {
                    logger.info("Deployment {} supersedes in-flight deployment {}", request.id, running.record.request.id);
                    running.token->cancel("Superseded by " + request.id);
                }
            }
            pending_.push_back(record);
        }

        logger.info("Queued deployment {} for {}/{} ({})", request.id, request.projectName, request.branch, request.commit);
        persist(record);
        publish(record);
        schedule();

        return {request.id, {DeployError::OK}};
    }

    QueueStatus DeploymentScheduler::status() const {
        std::lock_guard lock(mutex_);

        QueueStatus status{.pending = {pending_.begin(), pending_.end()},
                           .activeCount = static_cast<int>(building_.size()),
                           .capacity = config_.maxConcurrent};
        for (const auto &running: building_ | std::views::values) {
            status.building.push_back(running.record);
        }
        return status;
    }

    void DeploymentScheduler::subscribe(std::shared_ptr<DeploymentListener> listener) {
        std::lock_guard lock(listenersMutex_);
        listeners_.push_back(std::move(listener));
    }

    void DeploymentScheduler::publish(const DeploymentRecord &record) {
        std::vector<std::shared_ptr<DeploymentListener>> listeners;
        {
            std::lock_guard lock(listenersMutex_);
            listeners = listeners_;
        }
        for (const auto &listener: listeners) {
            listener->onDeploymentUpdate(record);
        }
    }

    void DeploymentScheduler::persist(const DeploymentRecord &record) {
        loop_->queueInLoop(async_func([this, record]() -> Task<> {
            if (const auto err = co_await history_.saveDeployment(record); err != Error::Ok) {
                logger.error("Failed to persist deployment {}", record.request.id);
            }
        }));
    }

    void DeploymentScheduler::schedule() {
        std::vector<Running> dispatched;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }

            while (static_cast<int>(building_.size()) < config_.maxConcurrent) {
                // FIFO, except that a pair which is still building or being removed keeps its followers waiting
                const auto next = std::ranges::find_if(
                    pending_, [this](const DeploymentRecord &record) { return !isBusy(record.request.projectName, record.request.branch); });
                if (next == pending_.end()) {
                    break;
                }

                Running running{.record = *next, .token = std::make_shared<CancellationToken>()};
                pending_.erase(next);

                running.record.status = DeploymentStatus::BUILDING;
                building_.emplace(running.record.request.id, running);
                dispatched.push_back(running);
            }
        }

        for (const auto &running: dispatched) {
            logger.info("Dispatching deployment {} ({}/{} slots in use)", running.record.request.id, status().activeCount,
                        config_.maxConcurrent);
            persist(running.record);
            publish(running.record);
            loop_->queueInLoop(async_func([this, running]() -> Task<> { co_await execute(running.record, running.token); }));
        }
    }

    Task<> DeploymentScheduler::execute(DeploymentRecord record, const std::shared_ptr<CancellationToken> token) {
        const auto log = logs_.open(record.request.id);
        const auto fail = [&record](const DeployErrorInstance &error) {
            record.status = DeploymentStatus::FAILED;
            record.errorCode = error.error;
            record.error = error.message;
            record.failedAt = nowIsoString();
        };

        try {
            log->info("Starting deployment {} of {}/{}", record.request.id, record.request.projectName, record.request.branch);

            const auto [container, deployError] = co_await lifecycle_.deployContainer(record.request, record.domain, log, token);
            if (!container) {
                fail(deployError);
            } else {
                record.port = container->port;
                record.containerName = container->containerName;
                if (container->revision && record.request.commit == "unknown") {
                    record.request.commit = container->revision->hash;
                    record.request.commitMessage = container->revision->message;
                    record.request.author = container->revision->authorName;
                }

                const auto [binding, networkError] = co_await network_.provision(record.domain, container->port, container->containerName, log, token);
                if (!binding) {
                    fail(networkError);
                } else if (token->isCancelled()) {
                    fail({DeployError::CANCELLED, token->reason()});
                } else {
                    record.status = DeploymentStatus::SUCCESS;
                    record.certificate = binding->certificate;
                    record.certificateError = binding->certificateError;
                    record.deployedAt = nowIsoString();
                }
            }
        } catch (const std::exception &e) {
            logger.error("Unexpected error during deployment {}: {}", record.request.id, e.what());
            monitor::sendToSentry(e);
            fail({DeployError::UNKNOWN, e.what()});
        }

        if (record.status == DeploymentStatus::SUCCESS) {
            log->info("Deployment successful: http{}://{}", record.certificate == CertificateState::ISSUED ? "s" : "", record.domain);
        } else {
            log->error("Deployment failed ({}): {}", enumToStr(record.errorCode), record.error);
        }

        co_await finish(std::move(record));
    }

    Task<> DeploymentScheduler::finish(DeploymentRecord record) {
        {
            std::lock_guard lock(mutex_);
            building_.erase(record.request.id);
            recent_.push_front(record);
            if (recent_.size() > RECENT_DEPLOYMENTS) {
                recent_.pop_back();
            }
        }

        if (const auto err = co_await history_.saveDeployment(record); err != Error::Ok) {
            logger.error("Failed to persist deployment {}", record.request.id);
        }
        publish(record);
        logs_.close(record.request.id);

        schedule();
    }

    Task<std::optional<DeploymentRecord>> DeploymentScheduler::getDeployment(const std::string id) const {
        {
            std::lock_guard lock(mutex_);
            if (const auto it = std::ranges::find_if(pending_, [&id](const auto &record) { return record.request.id == id; });
                it != pending_.end())
            {
                co_return *it;
            }
            if (const auto it = building_.find(id); it != building_.end()) {
                co_return it->second.record;
            }
            if (const auto it = std::ranges::find_if(recent_, [&id](const auto &record) { return record.request.id == id; }); it != recent_.end())
            {
                co_return *it;
            }
        }
        co_return co_await history_.getDeployment(id);
    }

    Task<Error> DeploymentScheduler::removeDeployment(const std::string projectName, const std::string branch) {
        if (!isValidProjectName(projectName) || !isValidBranchName(branch)) {
            co_return Error::ErrBadRequest;
        }

        const auto pair = std::make_pair(projectName, branch);
        std::vector<DeploymentRecord> dropped;
        {
            std::lock_guard lock(mutex_);
            removing_.insert(pair);
            for (const auto &running: building_ | std::views::values) {
                if (running.record.request.projectName == projectName && running.record.request.branch == branch) {
                    running.token->cancel("Deployment removed");
                }
            }
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->request.projectName == projectName && it->request.branch == branch) {
                    dropped.push_back(*it);
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto &record: dropped) {
            record.status = DeploymentStatus::FAILED;
            record.errorCode = DeployError::CANCELLED;
            record.error = "Deployment removed";
            record.failedAt = nowIsoString();
            persist(record);
            publish(record);
        }

        // A cancelled deployment only stops between steps, its container and proxy writes must land before teardown
        while (true) {
            {
                std::lock_guard lock(mutex_);
                if (!isBuilding(projectName, branch)) {
                    break;
                }
            }
            co_await sleepCoro(loop_, REMOVAL_POLL_INTERVAL);
        }

        logger.info("Removing deployment {}/{}", projectName, branch);
        co_await lifecycle_.removeContainer(projectName, branch);
        const auto result = co_await network_.deprovision(domainFor(projectName, branch, config_.baseDomain, config_.productionBranches));

        {
            std::lock_guard lock(mutex_);
            removing_.erase(pair);
        }
        schedule();
        co_return result;
    }

    void DeploymentScheduler::shutdown() {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        for (const auto &running: building_ | std::views::values) {
            running.token->cancel("Service shutting down");
        }
    }
}
