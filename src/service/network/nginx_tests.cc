#include <service/network/cloudflare.h>
#include <service/network/nginx.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

#include <fstream>

using namespace drogon;
using namespace service;

TEST_CASE("site config proxies the domain to the local port") {
    const auto config = renderSiteConfig("shop-dev.example.com", 3412, "shop-dev");

    CHECK(config.find("server_name shop-dev.example.com;") != std::string::npos);
    CHECK(config.find("proxy_pass http://127.0.0.1:3412;") != std::string::npos);
    CHECK(config.find("shop-dev") != std::string::npos);
}

TEST_CASE("writing a site enables it and reload validates first") {
    fakes::TestLoop loop;
    fakes::TempDir dir;
    fakes::FakeProcessRunner runner;
    const config::Nginx config{.sitesAvailable = (dir.path() / "available").string(), .sitesEnabled = (dir.path() / "enabled").string()};
    NginxProxy nginx{runner, config};

    const auto written = loop.run<Error>([&]() -> Task<Error> { co_return co_await nginx.writeSite("shop.example.com", 3000, "shop-main"); });
    REQUIRE(written == Error::Ok);
    CHECK(std::filesystem::exists(dir.path() / "available" / "shop.example.com"));
    CHECK(std::filesystem::exists(std::filesystem::symlink_status(dir.path() / "enabled" / "shop.example.com")));

    const auto reloaded = loop.run<Error>([&]() -> Task<Error> { co_return co_await nginx.reload(); });
    CHECK(reloaded == Error::Ok);
    REQUIRE(runner.commands.size() == 2);
    CHECK(runner.commands[0] == "nginx -t");
    CHECK(runner.commands[1] == "nginx -s reload");

    const auto removed = loop.run<Error>([&]() -> Task<Error> { co_return co_await nginx.removeSite("shop.example.com"); });
    CHECK(removed == Error::Ok);
    CHECK_FALSE(std::filesystem::exists(dir.path() / "available" / "shop.example.com"));
}

TEST_CASE("site files are never written or removed outside the sites directories") {
    fakes::TestLoop loop;
    fakes::TempDir dir;
    fakes::FakeProcessRunner runner;
    const config::Nginx config{.sitesAvailable = (dir.path() / "available").string(), .sitesEnabled = (dir.path() / "enabled").string()};
    NginxProxy nginx{runner, config};
    std::ofstream(dir.path() / "keep.conf") << "server {}";

    const auto written = loop.run<Error>([&]() -> Task<Error> { co_return co_await nginx.writeSite("../escaped", 3000, "shop-main"); });
    CHECK(written == Error::ErrBadRequest);
    CHECK_FALSE(std::filesystem::exists(dir.path() / "escaped"));

    const auto removed = loop.run<Error>([&]() -> Task<Error> { co_return co_await nginx.removeSite("../keep.conf"); });
    CHECK(removed == Error::ErrBadRequest);
    CHECK(std::filesystem::exists(dir.path() / "keep.conf"));
}

TEST_CASE("invalid proxy configuration is not reloaded") {
    fakes::TestLoop loop;
    fakes::FakeProcessRunner runner;
    runner.responses.emplace_back("nginx -t", ProcessResult{1, "nginx: configuration file test failed"});
    const config::Nginx config;
    NginxProxy nginx{runner, config};

    const auto reloaded = loop.run<Error>([&]() -> Task<Error> { co_return co_await nginx.reload(); });
    CHECK(reloaded != Error::Ok);
    CHECK(runner.commands.size() == 1);
}

TEST_CASE("root domain of a subdomain") {
    CHECK(rootDomain("shop-dev.example.com") == "example.com");
    CHECK(rootDomain("example.com") == "example.com");
    CHECK(rootDomain("localhost") == "localhost");
}
