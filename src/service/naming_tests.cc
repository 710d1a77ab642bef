#include <config.h>
#include <service/naming.h>

#include <doctest/doctest.h>

using namespace service;

namespace {
    const std::set<std::string> production = config::Deploy{}.productionBranches;
}

TEST_CASE("project slug collapses whitespace and lowercases") {
    CHECK(projectSlug("My App") == "my-app");
    CHECK(projectSlug("My   Cool\tApp") == "my-cool-app");
    CHECK(projectSlug("api") == "api");
}

TEST_CASE("container and image names derive from project and branch") {
    CHECK(containerName("My App", "dev") == "my-app-dev");
    CHECK(imageName("My App", "dev") == "my-app:dev");
}

TEST_CASE("production branches get the bare domain") {
    CHECK(domainFor("My App", "main", "example.com", production) == "my-app.example.com");
    CHECK(domainFor("My App", "master", "example.com", production) == "my-app.example.com");
}

TEST_CASE("production branch keeps its own domain next to main") {
    CHECK(domainFor("api", "production", "example.com", production) == "api-production.example.com");
    CHECK(domainFor("api", "production", "example.com", production) != domainFor("api", "main", "example.com", production));
}

TEST_CASE("other branches get a branch suffix") {
    CHECK(domainFor("My App", "dev", "example.com", production) == "my-app-dev.example.com");
    CHECK(domainFor("api", "feature-x", "apps.local", production) == "api-feature-x.apps.local");
}

TEST_CASE("database names are sanitized for container use") {
    CHECK(sanitizeDatabaseName("Orders_DB") == "orders-db");
    CHECK(sanitizeDatabaseName("user.data") == "user-data");
    CHECK(databaseContainerName("Orders_DB", "staging") == "orders-db-staging-postgres");
}

TEST_CASE("names that could escape a path or a domain label are rejected") {
    CHECK(isValidBranchName("main"));
    CHECK(isValidBranchName("feature-x.2_final"));
    CHECK_FALSE(isValidBranchName(""));
    CHECK_FALSE(isValidBranchName("/../../../../etc"));
    CHECK_FALSE(isValidBranchName(".."));
    CHECK_FALSE(isValidBranchName("feature/cart"));
    CHECK_FALSE(isValidBranchName("-rf"));
    CHECK_FALSE(isValidBranchName("a..b"));

    CHECK(isValidProjectName("My App"));
    CHECK_FALSE(isValidProjectName("../app"));
    CHECK_FALSE(isValidProjectName("app\n"));

    CHECK(isValidEnvironmentName("staging"));
    CHECK_FALSE(isValidEnvironmentName("../prod"));

    CHECK(isValidDomainName("shop-dev.example.com"));
    CHECK_FALSE(isValidDomainName("../../etc/passwd"));
    CHECK_FALSE(isValidDomainName(""));
}
