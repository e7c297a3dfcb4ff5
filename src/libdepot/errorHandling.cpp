/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <ios>
#include <stdexcept>
#include <system_error>

namespace libdepot {

std::string getExceptionTypeString(const std::exception& e) {
    auto ret = std::string("generic exception");
    if (dynamic_cast<const std::logic_error*>(&e)) {
        ret = std::string("logic error");
    }
    else if (dynamic_cast<const std::system_error*>(&e)) {
        ret = std::string("system error");
    }
    else if (dynamic_cast<const std::runtime_error*>(&e)) {
        ret = std::string("runtime error");
    }
    else if (dynamic_cast<const std::ios_base::failure*>(&e)) {
        ret = std::string("ios_base failure");
    }
    return ret;
}

std::string getErrorCodeString(ErrorCode code) {
    switch(code) {
        case ErrorCode::Generic:             return "generic";
        case ErrorCode::NotFound:            return "not found";
        case ErrorCode::NameUnknown:         return "repository name unknown";
        case ErrorCode::ManifestUnknown:     return "manifest unknown";
        case ErrorCode::BlobUnknown:         return "blob unknown";
        case ErrorCode::DigestMismatch:      return "digest mismatch";
        case ErrorCode::DigestInvalid:       return "digest invalid";
        case ErrorCode::OffsetMismatch:      return "offset mismatch";
        case ErrorCode::RangeInvalid:        return "range invalid";
        case ErrorCode::PaginationInvalid:   return "pagination parameter invalid";
        case ErrorCode::RepositoryInvalid:   return "repository name invalid";
        case ErrorCode::TagInvalid:          return "tag invalid";
        case ErrorCode::ManifestInvalid:     return "manifest invalid";
        case ErrorCode::ManifestBlobUnknown: return "manifest references unknown blob";
        case ErrorCode::SessionNotFound:     return "upload session not found";
        case ErrorCode::Conflict:            return "conflict";
        case ErrorCode::StoreUnavailable:    return "store unavailable";
        case ErrorCode::Unauthorized:        return "unauthorized";
        case ErrorCode::Denied:              return "denied";
        case ErrorCode::Unsupported:         return "unsupported";
    }
    return "unknown";
}

/**
 * Errors caused by the client request are expected during normal operation:
 * they are thrown with INFO level so that the logger doesn't report them as failures.
 */
LogLevel getDefaultLogLevel(ErrorCode code) {
    switch(code) {
        case ErrorCode::Generic:
        case ErrorCode::StoreUnavailable:
        case ErrorCode::Conflict:
            return LogLevel::ERROR;
        default:
            return LogLevel::INFO;
    }
}

bool isNotFound(ErrorCode code) {
    return code == ErrorCode::NotFound
        || code == ErrorCode::NameUnknown
        || code == ErrorCode::ManifestUnknown
        || code == ErrorCode::BlobUnknown
        || code == ErrorCode::SessionNotFound;
}

}
