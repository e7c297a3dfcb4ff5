/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include <exception>
#include <stdexcept>

#include "aux/unitTestMain.hpp"
#include "libdepot/Error.hpp"


namespace libdepot {
namespace test {

TEST_GROUP(ErrorTestGroup) {
};

static int throwLine = 0;
static int rethrowLine = 0;

void functionThatThrows() {
    throwLine = __LINE__; DEPOT_THROW_ERROR("first error message");
}

void functionThatRethrows() {
    try {
        functionThatThrows();
    }
    catch(libdepot::Error& error) {
        rethrowLine = __LINE__; DEPOT_RETHROW_ERROR(error, "second error message");
    }
}

void functionThatThrowsFromStdException() {
    auto stdException = std::runtime_error("first error message");
    const auto& ref = stdException;
    rethrowLine = __LINE__; DEPOT_RETHROW_ERROR(ref, "second error message");
}

void functionThatThrowsWithLogLevelDebug() {
    throwLine = __LINE__; DEPOT_THROW_ERROR("first error message", libdepot::LogLevel::DEBUG);
}

void functionThatThrowsWithCode() {
    throwLine = __LINE__; DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestMismatch, "digests differ");
}

void functionThatRethrowsWithCode() {
    try {
        functionThatThrowsWithCode();
    }
    catch(libdepot::Error& error) {
        rethrowLine = __LINE__; DEPOT_RETHROW_ERROR(error, "failed to complete upload");
    }
}

TEST(ErrorTestGroup, oneStackTraceEntry) {
    try {
        functionThatThrows();
        FAIL("expected exception");
    }
    catch(const libdepot::Error& error) {
        auto expectedFirstEntry = libdepot::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", throwLine, "functionThatThrows"};

        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getLogLevel() == libdepot::LogLevel::ERROR);
        CHECK(error.getErrorCode() == libdepot::ErrorCode::Generic);
        STRCMP_EQUAL("first error message", error.what());
    }
}

TEST(ErrorTestGroup, twoStackTraceEntries) {
    try {
        functionThatRethrows();
        FAIL("expected exception");
    }
    catch (const libdepot::Error& error) {
        auto expectedFirstEntry = libdepot::Error::ErrorTraceEntry{"first error message", "test_Error.cpp", throwLine, "functionThatThrows"};
        auto expectedSecondEntry = libdepot::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", rethrowLine, "functionThatRethrows"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getLogLevel() == libdepot::LogLevel::ERROR);
    }
}

TEST(ErrorTestGroup, fromStdException) {
    try {
        functionThatThrowsFromStdException();
        FAIL("expected exception");
    }
    catch(const libdepot::Error& error) {
        auto expectedFirstEntry = libdepot::Error::ErrorTraceEntry{"first error message", "unspecified location", -1, "runtime error"};
        auto expectedSecondEntry = libdepot::Error::ErrorTraceEntry{"second error message", "test_Error.cpp", rethrowLine, "functionThatThrowsFromStdException"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        CHECK(error.getErrorTrace()[1] == expectedSecondEntry);
        CHECK(error.getErrorCode() == libdepot::ErrorCode::Generic);
    }
}

TEST(ErrorTestGroup, throwWithLogLevelDebug) {
    try {
        functionThatThrowsWithLogLevelDebug();
        FAIL("expected exception");
    }
    catch(const libdepot::Error& error) {
        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK_EQUAL(error.getErrorTrace()[0].fileLine, throwLine);
        CHECK(error.getLogLevel() == libdepot::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, errorCodeSurvivesRethrow) {
    try {
        functionThatRethrowsWithCode();
        FAIL("expected exception");
    }
    catch(const libdepot::Error& error) {
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK_EQUAL(error.getErrorTrace()[0].fileLine, throwLine);
        CHECK_EQUAL(error.getErrorTrace()[1].fileLine, rethrowLine);
        CHECK(error.getErrorCode() == libdepot::ErrorCode::DigestMismatch);
        // client errors are not reported as failures of the daemon
        CHECK(error.getLogLevel() == libdepot::LogLevel::INFO);
    }
}

TEST(ErrorTestGroup, defaultLogLevels) {
    CHECK(libdepot::getDefaultLogLevel(libdepot::ErrorCode::Generic) == libdepot::LogLevel::ERROR);
    CHECK(libdepot::getDefaultLogLevel(libdepot::ErrorCode::StoreUnavailable) == libdepot::LogLevel::ERROR);
    CHECK(libdepot::getDefaultLogLevel(libdepot::ErrorCode::BlobUnknown) == libdepot::LogLevel::INFO);
    CHECK(libdepot::getDefaultLogLevel(libdepot::ErrorCode::OffsetMismatch) == libdepot::LogLevel::INFO);
}

TEST(ErrorTestGroup, notFoundRefinements) {
    CHECK(libdepot::isNotFound(libdepot::ErrorCode::NotFound));
    CHECK(libdepot::isNotFound(libdepot::ErrorCode::NameUnknown));
    CHECK(libdepot::isNotFound(libdepot::ErrorCode::ManifestUnknown));
    CHECK(libdepot::isNotFound(libdepot::ErrorCode::BlobUnknown));
    CHECK(libdepot::isNotFound(libdepot::ErrorCode::SessionNotFound));
    CHECK_FALSE(libdepot::isNotFound(libdepot::ErrorCode::StoreUnavailable));
    CHECK_FALSE(libdepot::isNotFound(libdepot::ErrorCode::DigestMismatch));
}

}}

DEPOT_UNITTEST_MAIN_FUNCTION();
