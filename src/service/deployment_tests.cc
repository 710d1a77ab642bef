#include <service/deployment.h>

#include <doctest/doctest.h>

using namespace service;

TEST_CASE("generated deployment ids are accepted") {
    for (int i = 0; i < 5; i++) {
        CHECK(isValidDeploymentId(generateDeploymentId()));
    }
    CHECK(isValidDeploymentId("deploy_1700000000000_0a1b2c3d4"));
}

TEST_CASE("deployment ids that could name another file are rejected") {
    CHECK_FALSE(isValidDeploymentId(""));
    CHECK_FALSE(isValidDeploymentId("deploy_1"));
    CHECK_FALSE(isValidDeploymentId("deploy__abc"));
    CHECK_FALSE(isValidDeploymentId("../../etc/passwd"));
    CHECK_FALSE(isValidDeploymentId("deploy_1700000000000_../../x"));
    CHECK_FALSE(isValidDeploymentId("deploy_17000x_abc"));
    CHECK_FALSE(isValidDeploymentId("deploy_1700000000000_abc/def"));
}
