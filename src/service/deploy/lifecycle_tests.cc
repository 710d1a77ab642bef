#include <service/deploy/lifecycle.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

using namespace drogon;
using namespace service;
using namespace std::chrono_literals;

namespace {
    using DeployResult = std::tuple<std::optional<DeployedContainer>, DeployErrorInstance>;

    struct LifecycleFixture {
        fakes::TestLoop loop;
        fakes::TempDir dir;
        fakes::FakeContainerRuntime runtime;
        fakes::FakeSource source{dir.path()};
        fakes::MemoryStore store;
        PortAllocator ports{[](int) { return true; }};
        config::Deploy deployConfig{.portRangeStart = 3000, .portRangeSpread = 1, .portProbes = 10};
        config::Health healthConfig{.interval = 1ms, .maxAttempts = 20, .runningThreshold = 5ms, .logCheckAfter = 2ms, .logCheckEvery = 1ms};
        ContainerLifecycleManager lifecycle{runtime, source, ports, store, deployConfig, healthConfig};
        std::shared_ptr<spdlog::logger> log = std::make_shared<spdlog::logger>("lifecycle-test");

        DeployResult deploy(const std::string &project, const std::string &branch, std::shared_ptr<CancellationToken> token = nullptr) {
            const DeploymentRequest request{.id = "deploy_1", .projectName = project, .repoUrl = "https://example.com/x.git", .branch = branch,
                                            .commit = "abc1234"};
            return loop.run<DeployResult>([&]() -> Task<DeployResult> {
                co_return co_await lifecycle.deployContainer(request, "shop-dev.example.com", log, token);
            });
        }
    };
}

TEST_CASE("exposed port detection") {
    CHECK(detectExposedPort("FROM node\nEXPOSE 8080\n") == 8080);
    CHECK(detectExposedPort("FROM node\nexpose 5000/tcp\n") == 5000);
    CHECK_FALSE(detectExposedPort("FROM node\nCMD node app.js\n").has_value());
}

TEST_CASE("exposed port outside the tcp range is ignored") {
    CHECK_FALSE(detectExposedPort("FROM node\nEXPOSE 99999999999\n").has_value());
    CHECK_FALSE(detectExposedPort("FROM node\nEXPOSE 70000\n").has_value());
    CHECK_FALSE(detectExposedPort("FROM node\nEXPOSE 0\n").has_value());
    CHECK(detectExposedPort("FROM node\nEXPOSE 65535\n") == 65535);
}

TEST_CASE("startup log markers") {
    CHECK(logsIndicateStarted("Server running at http://0.0.0.0:3000"));
    CHECK(logsIndicateStarted("Listening on port 8080"));
    CHECK_FALSE(logsIndicateStarted("Compiling sources..."));
}

TEST_CASE_FIXTURE(LifecycleFixture, "healthy container deploys with merged environment") {
    store.variables[{"Shop", "dev"}] = {{"API_URL", "https://api.example.com"}};
    runtime.stateOverride = [](const std::string &, int) {
        return ContainerState{.exists = true, .running = true, .status = "running", .health = "healthy"};
    };

    const auto [container, error] = deploy("Shop", "dev");

    REQUIRE(container.has_value());
    CHECK(error.error == DeployError::OK);
    CHECK(container->containerName == "shop-dev");
    CHECK(container->image == "shop:dev");
    CHECK(container->containerPort == 8080);
    CHECK(container->port == 3000);
    CHECK_FALSE(ports.isReserved(3000));

    REQUIRE(runtime.runs.size() == 1);
    CHECK(runtime.runs[0].hostPort == 3000);
    CHECK(runtime.runs[0].containerPort == 8080);
    // Destructive replace happens before the build
    CHECK(runtime.removed == std::vector<std::string>{"shop-dev"});
    CHECK(runtime.removedImages == std::vector<std::string>{"shop:dev"});
    // Env file is cleaned up once the container has started
    CHECK_FALSE(std::filesystem::exists(runtime.runs[0].envFile));
}

TEST_CASE_FIXTURE(LifecycleFixture, "container running past the threshold is considered ready") {
    const auto [container, error] = deploy("Shop", "dev");

    REQUIRE(container.has_value());
    CHECK(runtime.inspections >= 5);
}

TEST_CASE_FIXTURE(LifecycleFixture, "early exit fails fast with the container logs") {
    runtime.containerLogs = "Error: Cannot find module 'express'";
    runtime.stateOverride = [](const std::string &, int) {
        return ContainerState{.exists = true, .running = false, .status = "exited", .exitCode = 1};
    };

    const auto [container, error] = deploy("Shop", "dev");

    CHECK_FALSE(container.has_value());
    CHECK(error.error == DeployError::CONTAINER_EXITED);
    CHECK(error.message.find("Cannot find module 'express'") != std::string::npos);
    CHECK(runtime.inspections == 1);
}

TEST_CASE_FIXTURE(LifecycleFixture, "missing Dockerfile fails before any build") {
    source.dockerfile.reset();

    const auto [container, error] = deploy("Shop", "dev");

    CHECK_FALSE(container.has_value());
    CHECK(error.error == DeployError::MISSING_BUILD_FILE);
    CHECK(runtime.builds.empty());
}

TEST_CASE_FIXTURE(LifecycleFixture, "build failure reports the build output") {
    runtime.buildResult = {1, "Step 3/5 : RUN npm ci\nnpm ERR! missing package-lock.json"};

    const auto [container, error] = deploy("Shop", "dev");

    CHECK_FALSE(container.has_value());
    CHECK(error.error == DeployError::BUILD);
    CHECK(error.message.find("missing package-lock.json") != std::string::npos);
    CHECK(runtime.runs.empty());
}

TEST_CASE_FIXTURE(LifecycleFixture, "source failure is passed through") {
    source.failure = DeployErrorInstance{DeployError::SOURCE, "Repository not found."};

    const auto [container, error] = deploy("Shop", "dev");

    CHECK_FALSE(container.has_value());
    CHECK(error.error == DeployError::SOURCE);
    CHECK(error.message == "Repository not found.");
}

TEST_CASE_FIXTURE(LifecycleFixture, "no free port fails before starting") {
    PortAllocator busy{[](int) { return false; }};
    ContainerLifecycleManager blocked{runtime, source, busy, store, deployConfig, healthConfig};
    const DeploymentRequest request{.id = "deploy_2", .projectName = "Shop", .branch = "dev"};

    const auto [container, error] = loop.run<DeployResult>(
        [&]() -> Task<DeployResult> { co_return co_await blocked.deployContainer(request, "shop-dev.example.com", log); });

    CHECK_FALSE(container.has_value());
    CHECK(error.error == DeployError::NO_PORT);
    CHECK(runtime.runs.empty());
}

TEST_CASE_FIXTURE(LifecycleFixture, "default port is used without an EXPOSE directive") {
    source.dockerfile = "FROM node:20\nCMD [\"node\", \"index.js\"]\n";

    const auto [container, error] = deploy("Shop", "dev");

    REQUIRE(container.has_value());
    CHECK(container->containerPort == 3000);
}

TEST_CASE_FIXTURE(LifecycleFixture, "cancellation during readiness releases the port") {
    const auto token = std::make_shared<CancellationToken>();
    runtime.stateOverride = [token](const std::string &, const int attempt) {
        if (attempt == 2) {
            token->cancel("Superseded by deploy_2");
        }
        return ContainerState{.exists = true, .running = true, .status = "running"};
    };

    const auto [container, error] = deploy("Shop", "dev", token);

    CHECK_FALSE(container.has_value());
    CHECK(error.error == DeployError::CANCELLED);
    CHECK(error.message == "Superseded by deploy_2");
    CHECK_FALSE(ports.isReserved(3000));
}

TEST_CASE_FIXTURE(LifecycleFixture, "database containers are excluded from deployment listings") {
    runtime.summaries = {{.id = "1", .name = "shop-dev"}, {.id = "2", .name = "orders-prod-postgres"}};

    const auto containers =
        loop.run<std::vector<ContainerSummary>>([&]() -> Task<std::vector<ContainerSummary>> { co_return co_await lifecycle.listDeployments(); });

    REQUIRE(containers.size() == 1);
    CHECK(containers[0].name == "shop-dev");
}
