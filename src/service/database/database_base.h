#pragma once

#include <drogon/HttpAppFramework.h>
#include <drogon/orm/DbClient.h>
#include <drogon/utils/coroutine.h>
#include <log/log.h>
#include <service/error.h>

namespace service {
    class DatabaseBase {
    protected:
        virtual drogon::orm::DbClientPtr getDbClientPtr() const;

        template<typename Ret>
        drogon::Task<std::tuple<std::optional<Ret>, Error>>
        handleDatabaseOperation(const std::function<drogon::Task<Ret>(const drogon::orm::DbClientPtr &client)> &func) const {
            try {
                const auto clientPtr = getDbClientPtr();
                if (!clientPtr) {
                    co_return {std::nullopt, Error::ErrInternal};
                }

                const Ret result = co_await func(clientPtr);
                co_return {result, Error::Ok};
            } catch (const drogon::orm::Failure &e) {
                logging::logger.error("Error querying database: {}", e.what());
                co_return {std::nullopt, Error::ErrInternal};
            } catch ([[maybe_unused]] const drogon::orm::DrogonDbException &e) {
                co_return {std::nullopt, Error::ErrNotFound};
            }
        }

    public:
        virtual ~DatabaseBase() = default;
    };
}
