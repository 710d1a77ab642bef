#include <log/deployment_logs.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace logging;

TEST_CASE("deployment log lines stay readable after close") {
    DeploymentLogs logs(std::nullopt, 3);

    const auto log = logs.open("deploy_1");
    for (int i = 1; i <= 5; i++) {
        log->info("step {}", i);
    }
    logs.close("deploy_1");

    const auto lines = logs.lines("deploy_1");
    REQUIRE(lines.size() == 3);
    CHECK(lines.front().find("step 3") != std::string::npos);
    CHECK(lines.back().find("step 5") != std::string::npos);
    CHECK(lines.back().find("[deploy_1]") != std::string::npos);

    CHECK(logs.lines("deploy_2").empty());
}

TEST_CASE("deployment logs fall back to the log file") {
    fakes::TempDir dir;
    const std::string id = "deploy_1700000000000_0a1b2c3d4";
    {
        DeploymentLogs logs(dir.path());
        const auto log = logs.open(id);
        log->info("Cloning repository");
        log->warn("No EXPOSE directive found");
        logs.close(id);
    }

    const DeploymentLogs restarted(dir.path());
    const auto lines = restarted.lines(id);
    REQUIRE(lines.size() == 2);
    CHECK(lines[1].find("No EXPOSE directive found") != std::string::npos);
}

TEST_CASE("log files are only read and written for generated deployment ids") {
    fakes::TempDir dir;
    const auto logs = dir.path() / "logs";
    fs::create_directories(logs);
    {
        std::ofstream outside(dir.path() / "secret.log");
        outside << "do not serve this" << std::endl;
    }

    DeploymentLogs deploymentLogs(logs);
    CHECK(deploymentLogs.lines("../secret").empty());
    CHECK(deploymentLogs.lines("deploy_1700000000000_../../secret").empty());

    const auto log = deploymentLogs.open("../escaped");
    log->info("Cloning repository");
    deploymentLogs.close("../escaped");
    CHECK_FALSE(fs::exists(dir.path() / "escaped.log"));
    CHECK(std::distance(fs::directory_iterator(logs), fs::directory_iterator{}) == 0);
}

TEST_CASE("sink factories receive every deployment line") {
    DeploymentLogs logs(std::nullopt);
    logs.addSinkFactory([&](const std::string &deploymentId) -> spdlog::sink_ptr {
        if (deploymentId != "deploy_1") {
            return nullptr;
        }
        return std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(10);
    });

    const auto log = logs.open("deploy_1");
    log->info("Building image");
    CHECK(log->sinks().size() == 3);

    const auto other = logs.open("deploy_2");
    CHECK(other->sinks().size() == 2);
}
