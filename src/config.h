#pragma once

#include <chrono>
#include <set>
#include <string>

namespace config {
    struct Deploy {
        int maxConcurrent = 3;
        std::string basePath = "/var/www/apps";
        std::string baseDomain = "localhost";
        std::set<std::string> productionBranches{"main", "master"};
        int defaultAppPort = 3000;
        int portRangeStart = 3000;
        // Allocation starts at a random offset in [0, portRangeSpread) above portRangeStart
        int portRangeSpread = 1000;
        int portProbes = 100;
        std::string gitAccessToken;
        std::string storagePath = "storage";
    };

    struct Health {
        std::chrono::milliseconds interval{1000};
        int maxAttempts = 60;
        std::chrono::milliseconds runningThreshold{30000};
        std::chrono::milliseconds logCheckAfter{15000};
        std::chrono::milliseconds logCheckEvery{5000};
    };

    struct Nginx {
        std::string sitesAvailable = "/etc/nginx/sites-available";
        std::string sitesEnabled = "/etc/nginx/sites-enabled";
    };

    struct Certbot {
        std::string email = "admin@example.com";
        std::string liveDir = "/etc/letsencrypt/live";
        std::chrono::milliseconds dnsTimeout{30000};
        std::chrono::milliseconds dnsInterval{1000};
    };

    struct CloudFlare {
        std::string token;
        std::string publicIp;
    };

    struct Postgres {
        std::string version = "16";
        std::string dataDir = "/var/lib/dockyard/postgres";
        std::string hostSuffix = "localhost";
        int portStart = 5432;
        int portProbes = 1000;
        std::chrono::milliseconds interval{2000};
        int maxAttempts = 60;
    };

    struct Webhook {
        std::string gitlabSecret;
    };

    struct Sentry {
        std::string dsn;
    };

    struct SystemConfig {
        Deploy deploy;
        Health health;
        Nginx nginx;
        Certbot certbot;
        CloudFlare cloudFlare;
        Postgres postgres;
        Webhook webhook;
        Sentry sentry;

        std::string apiKey;
        int port = 8080;
    };

    SystemConfig configure();
}
