#include <service/storage/git_source.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

#include <fstream>

using namespace drogon;
using namespace service;
namespace fs = std::filesystem;

namespace {
    using CheckoutResult = std::tuple<std::optional<SourceCheckout>, DeployErrorInstance>;

    struct GitSourceFixture {
        fakes::TestLoop loop;
        fakes::TempDir dir;
        fakes::FakeProcessRunner runner;
        config::Deploy deployConfig{.basePath = (dir.path() / "apps").string()};
        GitSource source{runner, deployConfig};
        std::shared_ptr<spdlog::logger> log = std::make_shared<spdlog::logger>("git-source-test");

        CheckoutResult materialize(const std::string &project, const std::string &branch) {
            const DeploymentRequest request{.projectName = project, .repoUrl = "https://gitlab.com/team/shop.git", .branch = branch};
            return loop.run<CheckoutResult>([&]() -> Task<CheckoutResult> { co_return co_await source.materialize(request, log); });
        }
    };
}

TEST_CASE_FIXTURE(GitSourceFixture, "checkout paths stay below the base path") {
    CHECK(source.isCheckoutPath(source.checkoutPath("shop", "dev")));
    CHECK_FALSE(source.isCheckoutPath(dir.path() / "apps"));
    CHECK_FALSE(source.isCheckoutPath(dir.path() / "apps" / ".." / "victim"));
}

TEST_CASE_FIXTURE(GitSourceFixture, "branch that escapes the base path is never cloned or deleted") {
    const auto victim = dir.path() / "victim";
    fs::create_directories(victim);
    std::ofstream(victim / "data.txt") << "keep";
    runner.responses = {{"git clone", ProcessResult{128, "fatal: Remote branch not found in upstream origin"}}};

    const auto [checkout, error] = materialize("shop", "/../../victim");

    CHECK_FALSE(checkout.has_value());
    CHECK(error.error == DeployError::SOURCE);
    CHECK(runner.commands.empty());
    CHECK(fs::exists(victim / "data.txt"));
}

TEST_CASE_FIXTURE(GitSourceFixture, "failed clone leaves no partial checkout") {
    runner.responses = {{"git clone", ProcessResult{128, "fatal: Remote branch feature not found in upstream origin"}}};
    fs::create_directories(source.checkoutPath("shop", "feature") / "partial");

    const auto [checkout, error] = materialize("shop", "feature");

    CHECK_FALSE(checkout.has_value());
    CHECK(error.error != DeployError::OK);
    REQUIRE(runner.commands.size() == 1);
    CHECK_FALSE(fs::exists(source.checkoutPath("shop", "feature")));
    CHECK(fs::is_directory(dir.path() / "apps"));
}
