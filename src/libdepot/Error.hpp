/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libdepot_Error_hpp
#define libdepot_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>
#include <cassert>

#include <boost/filesystem.hpp>

#include "libdepot/LogLevel.hpp"

namespace libdepot {

/**
 * Classifies an error for the consumers that need to react to its kind,
 * e.g. the protocol handler that maps errors to HTTP status codes.
 * Errors created without an explicit code are Generic.
 */
enum class ErrorCode {
    Generic,
    NotFound,
    NameUnknown,
    ManifestUnknown,
    BlobUnknown,
    DigestMismatch,
    DigestInvalid,
    OffsetMismatch,
    RangeInvalid,
    PaginationInvalid,
    RepositoryInvalid,
    TagInvalid,
    ManifestInvalid,
    ManifestBlobUnknown,
    SessionNotFound,
    Conflict,
    StoreUnavailable,
    Unauthorized,
    Denied,
    Unsupported
};

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macros DEPOT_THROW_ERROR or DEPOT_THROW_ERROR_CODE.
 * Additional error trace entries are created by the macro DEPOT_RETHROW_ERROR.
 * The error code is set when the error is first thrown and survives any rethrow,
 * unless a component refines a Generic error into a more specific code.
 *
 * Note: this class should be instantiated and thrown through the DEPOT_THROW_ERROR macros.
 * Caught instances of this class should be rethrown through the DEPOT_RETHROW_ERROR macro.
 * The user is not supposed to instantiate and throw this class "manually".
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry, ErrorCode errorCode = ErrorCode::Generic)
        : logLevel{ logLevel }
        , errorCode{ errorCode }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

    ErrorCode getErrorCode() const {
        return errorCode;
    }

    void setErrorCode(ErrorCode value) {
        errorCode = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    ErrorCode errorCode = ErrorCode::Generic;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);
std::string getErrorCodeString(ErrorCode code);
LogLevel getDefaultLogLevel(ErrorCode code);
bool isNotFound(ErrorCode code);

}


// DEPOT_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define DEPOT_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define DEPOT_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libdepot::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libdepot::Error{logLevel, stackTraceEntry}; \
}

#define DEPOT_THROW_ERROR_1(errorMessage) DEPOT_THROW_ERROR_2(errorMessage, libdepot::LogLevel::ERROR)

#define DEPOT_THROW_ERROR(...) DEPOT_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, DEPOT_THROW_ERROR_2, DEPOT_THROW_ERROR_1)(__VA_ARGS__)


// DEPOT_THROW_ERROR_CODE macro
#define DEPOT_THROW_ERROR_CODE(errorCode, errorMessage) { \
    auto stackTraceEntry = libdepot::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libdepot::Error{libdepot::getDefaultLogLevel(errorCode), stackTraceEntry, errorCode}; \
}


// DEPOT_RETHROW_ERROR macros
#define DEPOT_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define DEPOT_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libdepot::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libdepot::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libdepot::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libdepot::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libdepot::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libdepot::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                        libdepot::getExceptionTypeString(exception)}; \
        auto error = libdepot::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define DEPOT_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libdepot::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libdepot::Error */ \
        DEPOT_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        DEPOT_RETHROW_ERROR_3(exception, errorMessage, libdepot::LogLevel::ERROR) \
    } \
}

#define DEPOT_RETHROW_ERROR(...) DEPOT_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, DEPOT_RETHROW_ERROR_3, DEPOT_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
