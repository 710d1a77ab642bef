#pragma once

#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

#include "service/error.h"

namespace api::v1 {
    drogon::HttpStatusCode mapError(const service::Error &);
    service::Error mapStatusCode(const drogon::HttpStatusCode &);

    service::Error mapDatabaseError(const service::DatabaseError &);
}
