#pragma once

#include <drogon/utils/coroutine.h>
#include <service/network/certificate_authority.h>
#include <service/network/dns_provider.h>
#include <service/network/reverse_proxy.h>
#include <service/runtime/container_runtime.h>
#include <service/storage/source.h>
#include <service/stores.h>
#include <trantor/net/EventLoopThread.h>

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <future>
#include <map>
#include <random>
#include <ranges>
#include <set>

// Test doubles for the process, container, network and persistence seams
namespace fakes {
    namespace fs = std::filesystem;

    // Owns an event loop thread and runs coroutines on it, blocking the test thread until they complete
    class TestLoop {
    public:
        TestLoop() : thread_("test-loop") { thread_.run(); }

        trantor::EventLoop *loop() { return thread_.getLoop(); }

        template<typename T>
        T run(std::function<drogon::Task<T>()> task) {
            std::promise<T> promise;
            auto future = promise.get_future();
            loop()->queueInLoop(drogon::async_func([&]() -> drogon::Task<> {
                try {
                    promise.set_value(co_await task());
                } catch (...) {
                    promise.set_exception(std::current_exception());
                }
            }));
            return future.get();
        }

        void run(std::function<drogon::Task<>()> task) {
            run<bool>([&]() -> drogon::Task<bool> {
                co_await task();
                co_return true;
            });
        }

    private:
        trantor::EventLoopThread thread_;
    };

    class TempDir {
    public:
        TempDir() {
            static std::mt19937_64 rng{std::random_device{}()};
            path_ = fs::temp_directory_path() / ("dockyard-test-" + std::to_string(rng()));
            fs::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        const fs::path &path() const { return path_; }

    private:
        fs::path path_;
    };

    class FakeProcessRunner final : public service::ProcessRunner {
    public:
        using service::ProcessRunner::run;

        drogon::Task<service::ProcessResult> run(std::string command, service::ProcessOptions options) override {
            std::lock_guard lock(mutex_);
            commands.push_back(command);
            for (const auto &[pattern, result]: responses) {
                if (command.find(pattern) != std::string::npos) {
                    co_return result;
                }
            }
            co_return service::ProcessResult{0, ""};
        }

        // First matching substring wins
        std::vector<std::pair<std::string, service::ProcessResult>> responses;
        std::vector<std::string> commands;

    private:
        std::mutex mutex_;
    };

    class FakeContainerRuntime final : public service::ContainerRuntime {
    public:
        drogon::Task<service::ProcessResult> build(std::string image, fs::path context, std::shared_ptr<spdlog::logger> log) override {
            const auto active = ++activeBuilds;
            {
                std::lock_guard lock(mutex_);
                maxActiveBuilds = std::max(maxActiveBuilds, active);
                builds.push_back(image);
            }
            if (buildDelay.count() > 0) {
                co_await drogon::sleepCoro(trantor::EventLoop::getEventLoopOfCurrentThread(), buildDelay);
            }
            --activeBuilds;
            co_return buildResult;
        }

        drogon::Task<service::ProcessResult> run(service::RunSpec spec, std::shared_ptr<spdlog::logger> log) override {
            std::lock_guard lock(mutex_);
            runs.push_back(spec);
            if (runResult.ok()) {
                containers[spec.name] = service::ContainerState{.exists = true, .running = true, .status = "running", .startedAt = startedAt};
            }
            co_return runResult;
        }

        drogon::Task<> remove(std::string name) override {
            std::lock_guard lock(mutex_);
            removed.push_back(name);
            containers.erase(name);
            co_return;
        }

        drogon::Task<> removeImage(std::string image) override {
            std::lock_guard lock(mutex_);
            removedImages.push_back(image);
            co_return;
        }

        drogon::Task<std::optional<service::ContainerState>> inspect(std::string name) override {
            std::lock_guard lock(mutex_);
            ++inspections;
            if (stateOverride) {
                co_return stateOverride(name, inspections);
            }
            if (const auto it = containers.find(name); it != containers.end()) {
                co_return it->second;
            }
            co_return service::ContainerState{.exists = false};
        }

        drogon::Task<service::ProcessResult> start(std::string name) override { co_return setRunning(name, true); }
        drogon::Task<service::ProcessResult> stop(std::string name) override { co_return setRunning(name, false); }
        drogon::Task<service::ProcessResult> restart(std::string name) override { co_return setRunning(name, true); }

        drogon::Task<std::string> logs(std::string name, int tail) override { co_return containerLogs; }

        drogon::Task<service::ProcessResult> exec(std::string name, std::vector<std::string> args) override {
            std::lock_guard lock(mutex_);
            execs.push_back(args);
            if (!args.empty() && args.front() == "pg_isready") {
                co_return service::ProcessResult{0, "/var/run/postgresql:5432 - accepting connections"};
            }
            if (!args.empty() && args.front() == "psql") {
                co_return service::ProcessResult{0, queryOutput};
            }
            co_return service::ProcessResult{0, ""};
        }

        drogon::Task<std::optional<service::ContainerStats>> stats(std::string name) override {
            co_return service::ContainerStats{.cpu = "0.50%", .memory = "24MiB / 1GiB"};
        }

        drogon::Task<std::vector<service::ContainerSummary>> list() override { co_return summaries; }

        drogon::Task<service::ProcessResult> pruneImages() override { co_return service::ProcessResult{0, ""}; }

        service::ProcessResult buildResult{0, "Successfully built"};
        service::ProcessResult runResult{0, "container-id"};
        std::chrono::milliseconds buildDelay{0};
        std::string containerLogs;
        std::string queryOutput = "1";
        std::string startedAt;
        std::function<std::optional<service::ContainerState>(const std::string &, int)> stateOverride;
        std::vector<service::ContainerSummary> summaries;

        std::atomic<int> activeBuilds{0};
        int maxActiveBuilds = 0;
        int inspections = 0;
        std::vector<std::string> builds;
        std::vector<service::RunSpec> runs;
        std::vector<std::string> removed;
        std::vector<std::string> removedImages;
        std::vector<std::vector<std::string>> execs;
        std::map<std::string, service::ContainerState> containers;

    private:
        service::ProcessResult setRunning(const std::string &name, const bool running) {
            std::lock_guard lock(mutex_);
            const auto it = containers.find(name);
            if (it == containers.end()) {
                return {1, "Error: No such container: " + name};
            }
            it->second.running = running;
            return {0, name};
        }

        std::mutex mutex_;
    };

    // Materializes a checkout directory containing the configured Dockerfile
    class FakeSource final : public service::SourceRepository {
    public:
        explicit FakeSource(fs::path root) : root_(std::move(root)) {}

        drogon::Task<std::tuple<std::optional<service::SourceCheckout>, service::DeployErrorInstance>>
        materialize(service::DeploymentRequest request, std::shared_ptr<spdlog::logger> log) override {
            if (failure) {
                co_return {std::nullopt, *failure};
            }
            const auto path = checkoutPath(request.projectName, request.branch);
            fs::create_directories(path);
            if (dockerfile) {
                std::ofstream(path / "Dockerfile") << *dockerfile;
            } else {
                fs::remove(path / "Dockerfile");
            }
            co_return {service::SourceCheckout{.path = path, .revision = revision, .cloned = true}, {service::DeployError::OK}};
        }

        fs::path checkoutPath(const std::string &projectName, const std::string &branch) const override {
            return root_ / (projectName + "-" + branch);
        }

        std::optional<std::string> dockerfile = "FROM node:20\nEXPOSE 8080\nCMD [\"node\", \"server.js\"]\n";
        std::optional<service::DeployErrorInstance> failure;
        std::optional<git::GitRevision> revision;

    private:
        fs::path root_;
    };

    class FakeReverseProxy final : public service::ReverseProxy {
    public:
        drogon::Task<service::Error> writeSite(std::string domain, int port, std::string containerName) override {
            std::lock_guard lock(mutex_);
            if (failWrite) {
                co_return service::Error::ErrInternal;
            }
            sites[domain] = port;
            co_return service::Error::Ok;
        }

        drogon::Task<service::Error> removeSite(std::string domain) override {
            std::lock_guard lock(mutex_);
            sites.erase(domain);
            co_return service::Error::Ok;
        }

        drogon::Task<service::Error> reload() override {
            ++reloads;
            co_return service::Error::Ok;
        }

        bool failWrite = false;
        std::atomic<int> reloads{0};
        std::map<std::string, int> sites;

    private:
        std::mutex mutex_;
    };

    class FakeCertificateAuthority final : public service::CertificateAuthority {
    public:
        drogon::Task<std::optional<std::string>> issue(std::string domain) override {
            std::lock_guard lock(mutex_);
            ++attempts;
            if (failure) {
                co_return failure;
            }
            issued.insert(domain);
            co_return std::nullopt;
        }

        bool exists(const std::string &domain) const override {
            std::lock_guard lock(mutex_);
            return issued.contains(domain);
        }

        drogon::Task<bool> remove(std::string domain) override {
            std::lock_guard lock(mutex_);
            co_return issued.erase(domain) > 0;
        }

        std::optional<std::string> failure;
        int attempts = 0;
        std::set<std::string> issued;

    private:
        mutable std::mutex mutex_;
    };

    class FakeDnsProvider final : public service::DnsProvider {
    public:
        bool isConfigured() const override { return configured; }

        drogon::Task<service::Error> ensureRecord(std::string domain) override {
            if (!failRecord) {
                records.insert(domain);
            }
            co_return failRecord ? service::Error::ErrInternal : service::Error::Ok;
        }

        drogon::Task<service::Error> deleteRecord(std::string domain) override {
            records.erase(domain);
            co_return service::Error::Ok;
        }

        drogon::Task<bool> resolves(std::string domain) override { co_return resolving; }

        bool configured = false;
        bool failRecord = false;
        bool resolving = true;
        std::set<std::string> records;
    };

    // In-memory persistence
    class MemoryStore final : public service::EnvironmentStore, public service::DeploymentHistory, public service::DatabaseRegistry {
    public:
        drogon::Task<service::EnvironmentMap> getVariables(std::string projectName, std::string branch) const override {
            std::lock_guard lock(mutex_);
            const auto it = variables.find({projectName, branch});
            co_return it == variables.end() ? service::EnvironmentMap{} : it->second;
        }

        drogon::Task<service::Error> saveDeployment(service::DeploymentRecord record) const override {
            std::lock_guard lock(mutex_);
            deployments[record.request.id] = record;
            co_return service::Error::Ok;
        }

        drogon::Task<std::optional<service::DeploymentRecord>> getDeployment(std::string id) const override {
            std::lock_guard lock(mutex_);
            const auto it = deployments.find(id);
            co_return it == deployments.end() ? std::nullopt : std::optional(it->second);
        }

        drogon::Task<std::vector<service::DeploymentRecord>> getRecentDeployments(int limit) const override {
            std::lock_guard lock(mutex_);
            std::vector<service::DeploymentRecord> records;
            for (const auto &record: deployments | std::views::values) {
                if (static_cast<int>(records.size()) >= limit) break;
                records.push_back(record);
            }
            co_return records;
        }

        drogon::Task<service::Error> failInterruptedDeployments() const override {
            std::lock_guard lock(mutex_);
            for (auto &record: deployments | std::views::values) {
                if (!record.isTerminal()) {
                    record.status = service::DeploymentStatus::FAILED;
                    record.errorCode = service::DeployError::CANCELLED;
                }
            }
            co_return service::Error::Ok;
        }

        drogon::Task<service::Error> insertInstance(service::DatabaseInstance instance) const override {
            std::lock_guard lock(mutex_);
            ++registryWrites;
            if (failInsert) {
                co_return service::Error::ErrInternal;
            }
            instances[instance.id] = instance;
            co_return service::Error::Ok;
        }

        drogon::Task<std::optional<service::DatabaseInstance>> getInstance(std::string id) const override {
            std::lock_guard lock(mutex_);
            const auto it = instances.find(id);
            co_return it == instances.end() ? std::nullopt : std::optional(it->second);
        }

        drogon::Task<std::optional<service::DatabaseInstance>> findInstance(std::string name, std::string environment) const override {
            std::lock_guard lock(mutex_);
            for (const auto &instance: instances | std::views::values) {
                if (instance.name == name && instance.environment == environment) {
                    co_return instance;
                }
            }
            co_return std::nullopt;
        }

        drogon::Task<std::optional<service::DatabaseInstance>> findInstanceByContainer(std::string containerName) const override {
            std::lock_guard lock(mutex_);
            for (const auto &instance: instances | std::views::values) {
                if (instance.containerName == containerName) {
                    co_return instance;
                }
            }
            co_return std::nullopt;
        }

        drogon::Task<std::vector<service::DatabaseInstance>> getInstances() const override {
            std::lock_guard lock(mutex_);
            std::vector<service::DatabaseInstance> result;
            for (const auto &instance: instances | std::views::values) {
                result.push_back(instance);
            }
            co_return result;
        }

        drogon::Task<service::Error> updateInstanceStatus(std::string id, service::InstanceStatus status) const override {
            std::lock_guard lock(mutex_);
            ++registryWrites;
            const auto it = instances.find(id);
            if (it == instances.end()) {
                co_return service::Error::ErrNotFound;
            }
            it->second.status = status;
            co_return service::Error::Ok;
        }

        drogon::Task<service::Error> deleteInstance(std::string id) const override {
            std::lock_guard lock(mutex_);
            ++registryWrites;
            co_return instances.erase(id) > 0 ? service::Error::Ok : service::Error::ErrNotFound;
        }

        std::map<std::pair<std::string, std::string>, service::EnvironmentMap> variables;
        mutable std::map<std::string, service::DeploymentRecord> deployments;
        mutable std::map<std::string, service::DatabaseInstance> instances;
        mutable int registryWrites = 0;
        bool failInsert = false;

    private:
        mutable std::mutex mutex_;
    };
}
