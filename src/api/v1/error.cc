#include <unordered_map>

#include "error.h"

using namespace std;
using namespace drogon;
using namespace service;

namespace {
    const unordered_map<Error, HttpStatusCode> errorMap = {{Error::Ok, k200OK},
                                                           {Error::ErrNotFound, k404NotFound},
                                                           {Error::ErrBadRequest, k400BadRequest},
                                                           {Error::ErrUnauthorized, k401Unauthorized},
                                                           {Error::ErrConflict, k409Conflict}};
}

namespace api::v1 {
    HttpStatusCode mapError(const Error &err) {
        if (const auto cit(errorMap.find(err)); cit != errorMap.cend()) {
            return cit->second;
        }
        return k500InternalServerError;
    }

    Error mapStatusCode(const HttpStatusCode &code) {
        for (const auto &[error, status]: errorMap) {
            if (status == code) {
                return error;
            }
        }
        return Error::ErrInternal;
    }

    Error mapDatabaseError(const DatabaseError &err) {
        switch (err) {
            case DatabaseError::OK:
                return Error::Ok;
            case DatabaseError::INVALID_NAME:
                return Error::ErrBadRequest;
            case DatabaseError::DUPLICATE_NAME:
                return Error::ErrConflict;
            case DatabaseError::NOT_FOUND:
                return Error::ErrNotFound;
            default:
                return Error::ErrInternal;
        }
    }
}
