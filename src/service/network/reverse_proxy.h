#pragma once

#include <drogon/utils/coroutine.h>
#include <service/error.h>

#include <string>

namespace service {
    class ReverseProxy {
    public:
        virtual ~ReverseProxy() = default;

        // Writes or overwrites the site routing domain to the local port
        virtual drogon::Task<Error> writeSite(std::string domain, int port, std::string containerName) = 0;

        virtual drogon::Task<Error> removeSite(std::string domain) = 0;

        virtual drogon::Task<Error> reload() = 0;
    };
}
