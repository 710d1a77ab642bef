#include <service/instances/provisioner.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

using namespace drogon;
using namespace service;
using namespace std::chrono_literals;

namespace {
    using CreateResult = std::tuple<std::optional<DatabaseInstance>, DatabaseErrorInstance>;
    using StatsResult = std::tuple<std::optional<DatabaseStats>, DatabaseErrorInstance>;

    struct ProvisionerFixture {
        fakes::TestLoop loop;
        fakes::TempDir dir;
        fakes::FakeContainerRuntime runtime;
        fakes::MemoryStore registry;
        PortAllocator ports{[](int) { return true; }};
        config::Postgres postgresConfig{.version = "16", .dataDir = dir.path().string(), .hostSuffix = "example.com",
                                        .portStart = 5432, .portProbes = 10, .interval = 1ms, .maxAttempts = 5};
        DatabaseProvisioner provisioner{runtime, ports, registry, postgresConfig};

        CreateResult create(const std::string &name, const std::string &environment) {
            return loop.run<CreateResult>([&]() -> Task<CreateResult> { co_return co_await provisioner.createInstance(name, environment); });
        }

        StatsResult stats(const std::string &id) {
            return loop.run<StatsResult>([&]() -> Task<StatsResult> { co_return co_await provisioner.stats(id); });
        }
    };
}

TEST_CASE("uptime formatting") {
    CHECK(formatUptime(42s) == "42s");
    CHECK(formatUptime(7min + 30s) == "7m");
    CHECK(formatUptime(5h + 12min) == "5h 12m");
    CHECK(formatUptime(51h + 10min) == "2d 3h");
}

TEST_CASE_FIXTURE(ProvisionerFixture, "create starts a postgres container and registers it") {
    const auto [instance, error] = create("Orders DB", "staging");

    REQUIRE(instance.has_value());
    CHECK(error.error == DatabaseError::OK);
    CHECK(instance->id.starts_with("db-"));
    CHECK(instance->containerName == "orders-db-staging-postgres");
    CHECK(instance->host == "orders-db-staging-postgres.db.example.com");
    CHECK(instance->username == "orders-db");
    CHECK(instance->databaseName == "orders-db");
    CHECK(instance->password.size() == 24);
    CHECK(instance->port == 5432);
    CHECK(instance->status == InstanceStatus::ACTIVE);
    CHECK(std::filesystem::is_directory(instance->storagePath));
    CHECK_FALSE(ports.isReserved(5432));

    REQUIRE(runtime.runs.size() == 1);
    CHECK(runtime.runs[0].image == "postgres:16");
    CHECK(runtime.runs[0].containerPort == 5432);
    CHECK(registry.instances.contains(instance->id));

    const auto credentials = credentialsJson(*instance);
    CHECK(credentials["password"] == instance->password);
    CHECK(credentials["port"] == 5432);

    // Passwords never leak through the regular representation
    const nlohmann::json listed = *instance;
    CHECK_FALSE(listed.contains("password"));
}

TEST_CASE_FIXTURE(ProvisionerFixture, "duplicate name in the same environment is rejected without side effects") {
    const auto [first, firstError] = create("orders", "production");
    REQUIRE(first.has_value());
    const auto writes = registry.registryWrites;
    const auto runs = runtime.runs.size();

    const auto [second, error] = create("orders", "production");

    CHECK_FALSE(second.has_value());
    CHECK(error.error == DatabaseError::DUPLICATE_NAME);
    CHECK(registry.registryWrites == writes);
    CHECK(runtime.runs.size() == runs);

    // Other environments are independent
    const auto [staging, stagingError] = create("orders", "staging");
    CHECK(staging.has_value());
}

TEST_CASE_FIXTURE(ProvisionerFixture, "leftover container of a failed attempt is replaced") {
    runtime.containers["orders-staging-postgres"] = ContainerState{.exists = true, .running = false, .status = "exited"};

    const auto [instance, error] = create("orders", "staging");

    REQUIRE(instance.has_value());
    CHECK(std::ranges::find(runtime.removed, "orders-staging-postgres") != runtime.removed.end());
}

TEST_CASE_FIXTURE(ProvisionerFixture, "container that exits during startup fails creation") {
    runtime.stateOverride = [](const std::string &, int) {
        return ContainerState{.exists = true, .running = false, .status = "exited"};
    };
    runtime.containerLogs = "FATAL: data directory has wrong ownership";

    const auto [instance, error] = create("orders", "staging");

    CHECK_FALSE(instance.has_value());
    CHECK(error.error == DatabaseError::CONTAINER_EXITED);
    CHECK(error.message.find("wrong ownership") != std::string::npos);
    CHECK(registry.instances.empty());
    CHECK(std::ranges::find(runtime.removed, "orders-staging-postgres") != runtime.removed.end());
    CHECK_FALSE(std::filesystem::exists(dir.path() / "orders-staging-postgres"));
}

TEST_CASE_FIXTURE(ProvisionerFixture, "names that sanitize to an existing container are rejected without side effects") {
    const auto [first, firstError] = create("Orders DB", "staging");
    REQUIRE(first.has_value());
    const auto runs = runtime.runs.size();
    const auto writes = registry.registryWrites;

    const auto [second, error] = create("orders-db", "staging");

    CHECK_FALSE(second.has_value());
    CHECK(error.error == DatabaseError::DUPLICATE_NAME);
    CHECK(runtime.runs.size() == runs);
    CHECK(runtime.removed.empty());
    CHECK(registry.registryWrites == writes);
    CHECK(std::filesystem::is_directory(first->storagePath));
    CHECK(registry.instances.contains(first->id));
}

TEST_CASE_FIXTURE(ProvisionerFixture, "failed registration removes the started container") {
    registry.failInsert = true;

    const auto [instance, error] = create("orders", "staging");

    CHECK_FALSE(instance.has_value());
    CHECK(error.error == DatabaseError::REGISTRY);
    REQUIRE(runtime.runs.size() == 1);
    CHECK(std::ranges::find(runtime.removed, "orders-staging-postgres") != runtime.removed.end());
    CHECK_FALSE(std::filesystem::exists(dir.path() / "orders-staging-postgres"));
    CHECK(registry.instances.empty());
}

TEST_CASE_FIXTURE(ProvisionerFixture, "environment names that could escape the data directory are rejected") {
    const auto [instance, error] = create("orders", "../../etc");

    CHECK_FALSE(instance.has_value());
    CHECK(error.error == DatabaseError::INVALID_NAME);
    CHECK(runtime.runs.empty());
    CHECK(registry.registryWrites == 0);
}

TEST_CASE_FIXTURE(ProvisionerFixture, "stats reflect the container state") {
    const auto [instance, error] = create("orders", "staging");
    REQUIRE(instance.has_value());

    runtime.queryOutput = " 3\n";
    const auto [running, runningError] = stats(instance->id);
    REQUIRE(running.has_value());
    CHECK(running->status == "running");
    CHECK(running->connections == 3);
    CHECK(running->cpu == "0.50%");

    const auto stopError = loop.run<DatabaseErrorInstance>([&]() -> Task<DatabaseErrorInstance> { co_return co_await provisioner.stop(instance->id); });
    CHECK(stopError.error == DatabaseError::OK);
    CHECK(registry.instances[instance->id].status == InstanceStatus::STOPPED);

    const auto [stopped, stoppedError] = stats(instance->id);
    REQUIRE(stopped.has_value());
    CHECK(stopped->status == "stopped");
    CHECK(stopped->size == "N/A");
    CHECK(stopped->uptime == "N/A");
}

TEST_CASE_FIXTURE(ProvisionerFixture, "removed database is no longer found") {
    const auto [instance, error] = create("orders", "staging");
    REQUIRE(instance.has_value());

    const auto removeError = loop.run<DatabaseErrorInstance>(
        [&]() -> Task<DatabaseErrorInstance> { co_return co_await provisioner.remove(instance->id, true); });
    CHECK(removeError.error == DatabaseError::OK);
    CHECK_FALSE(std::filesystem::exists(instance->storagePath));

    const auto [missing, missingError] = stats(instance->id);
    CHECK_FALSE(missing.has_value());
    CHECK(missingError.error == DatabaseError::NOT_FOUND);
}

TEST_CASE_FIXTURE(ProvisionerFixture, "removing keeps storage unless purged") {
    const auto [instance, error] = create("orders", "staging");
    REQUIRE(instance.has_value());

    const auto removeError = loop.run<DatabaseErrorInstance>(
        [&]() -> Task<DatabaseErrorInstance> { co_return co_await provisioner.remove(instance->id); });
    CHECK(removeError.error == DatabaseError::OK);
    CHECK(std::filesystem::exists(instance->storagePath));
    CHECK(registry.instances.empty());
}
