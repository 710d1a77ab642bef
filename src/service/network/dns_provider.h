#pragma once

#include <drogon/utils/coroutine.h>
#include <service/error.h>

#include <string>

namespace service {
    class DnsProvider {
    public:
        virtual ~DnsProvider() = default;

        // False means an operator-provisioned wildcard record is assumed
        virtual bool isConfigured() const = 0;

        // Creates or updates an A record pointing at this host
        virtual drogon::Task<Error> ensureRecord(std::string domain) = 0;

        virtual drogon::Task<Error> deleteRecord(std::string domain) = 0;

        virtual drogon::Task<bool> resolves(std::string domain) = 0;
    };
}
