#include "api/v1/databases.h"
#include "api/v1/deployments.h"
#include "api/v1/webhook.h"
#include "api/v1/websocket.h"
#include "filters/ApiKeyFilter.h"

#include <service/network/certbot.h>
#include <service/network/cloudflare.h>
#include <service/network/nginx.h>
#include <service/runtime/docker.h>
#include <service/storage/git_source.h>
#include "config.h"
#include "global.h"
#include "monitor.h"
#include "version.h"

#include <api/v1/error.h>
#include <git2.h>
#include <log/log.h>
#include <service/util.h>

using namespace drogon;
using namespace logging;
using namespace service;

namespace service {
    trantor::EventLoopThreadPool processThreadPool{4, "process"};
}

void globalExceptionHandler(const std::exception &e, const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback) {
    if (const auto cast = dynamic_cast<const ApiException *>(&e); cast != nullptr) {
        const auto resp = HttpResponse::newHttpJsonResponse(cast->data);
        resp->setStatusCode(api::v1::mapError(cast->error));

        callback(resp);
        return;
    }

    logger.error("Unhandled exception: {}", e.what());
    monitor::sendToSentry(e);
    callback(statusResponse(k500InternalServerError));
}

Task<> runStartupTasks() {
    if (const auto error = co_await global::database->migrate(); error != Error::Ok) {
        logger.critical("Database migration failed, persistence is unavailable");
        co_return;
    }
    if (const auto error = co_await global::database->failInterruptedDeployments(); error != Error::Ok) {
        logger.error("Failed to clean up interrupted deployments");
    }
}

int main() {
    try {
        global::config = config::configure();
        const auto &cfg = global::config;

        logger.info("Starting dockyard version {} ({}) on port {}", PROJECT_VERSION, PROJECT_GIT_HASH, cfg.port);

        const auto level = trantor::Logger::logLevel();
        app().setLogLevel(level).addListener("0.0.0.0", cfg.port).setThreadNum(8);
        configureLoggingLevel();

        if (!cfg.sentry.dsn.empty()) {
            monitor::initSentry(cfg.sentry.dsn);
        }

        processThreadPool.start();
        git_libgit2_init();

        ShellProcessRunner runner{processThreadPool};
        DockerRuntime docker{runner};
        GitSource source{runner, cfg.deploy};
        PortAllocator ports;
        NginxProxy nginx{runner, cfg.nginx};
        Certbot certbot{runner, cfg.certbot};
        CloudFlare cloudFlare{runner, cfg.cloudFlare};

        global::database = std::make_shared<Database>();
        global::connections = std::make_shared<realtime::ConnectionManager>();
        global::deploymentLogs = std::make_shared<logging::DeploymentLogs>(std::filesystem::path(cfg.deploy.storagePath) / "deployments");
        global::deploymentLogs->addSinkFactory([](const std::string &id) { return global::connections->createBroadcastSink(id); });

        global::lifecycle = std::make_shared<ContainerLifecycleManager>(docker, source, ports, *global::database, cfg.deploy, cfg.health);
        global::network = std::make_shared<NetworkProvisioner>(nginx, certbot, cloudFlare, cfg.certbot);
        global::scheduler = std::make_shared<DeploymentScheduler>(app().getLoop(), *global::lifecycle, *global::network, *global::database,
                                                                  *global::deploymentLogs, cfg.deploy);
        global::scheduler->subscribe(global::connections);
        global::databases = std::make_shared<DatabaseProvisioner>(docker, ports, *global::database, cfg.postgres);

        app().registerFilter(std::make_shared<ApiKeyFilter>(cfg.apiKey));
        app().registerController(std::make_shared<api::v1::DeploymentsController>());
        app().registerController(std::make_shared<api::v1::DatabasesController>());
        app().registerController(std::make_shared<api::v1::WebhookController>(cfg.webhook.gitlabSecret));
        app().registerController(std::make_shared<api::v1::DeploymentWebSocketController>());
        app().setExceptionHandler(globalExceptionHandler);

        app().getLoop()->queueInLoop(async_func([]() -> Task<> { co_await runStartupTasks(); }));

        app().run();

        global::scheduler->shutdown();
        git_libgit2_shutdown();
        for (auto &loop: processThreadPool.getLoops()) {
            loop->quit();
        }
        processThreadPool.wait();

        if (!cfg.sentry.dsn.empty()) {
            monitor::closeSentry();
        }
    } catch (const std::exception &e) {
        logger.critical("Error running app: {}", e.what());
        return 1;
    }

    return 0;
}
