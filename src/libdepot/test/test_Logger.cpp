/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include <sstream>
#include <string>

#include <boost/regex.hpp>

#include "aux/unitTestMain.hpp"
#include "libdepot/Logger.hpp"


namespace libdepot {
namespace test {

TEST_GROUP(LoggerTestGroup) {
    void teardown() {
        libdepot::Logger::getInstance().setLevel(libdepot::LogLevel::WARN);
    }
};

class LoggerChecker {
public:
    LoggerChecker& log(libdepot::LogLevel logLevel, const std::string& message) {
        auto& logger = libdepot::Logger::getInstance();
        logger.log(message, "subsystem", logLevel, stdoutStream, stderrStream);
        return *this;
    }

    LoggerChecker& expectGeneralMessageInStdout(const std::string& message) {
        expectedPatternInStdout += message + "\n";
        return *this;
    }

    LoggerChecker& expectMessageInStdout(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStdout);
    }

    LoggerChecker& expectMessageInStderr(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStderr);
    }

    ~LoggerChecker() {
        check(stdoutStream, expectedPatternInStdout);
        check(stderrStream, expectedPatternInStderr);
    }

private:
    LoggerChecker& expectMessage(const std::string& logLevel, const std::string& message, std::string& expectedPattern) {
        expectedPattern += "\\[[0-9]+\\.[0-9]{9}\\] \\[[^ ]+-[0-9]+\\] \\[subsystem\\] \\[" + logLevel + "\\] " + message + "\n";
        return *this;
    }

    void check(const std::ostringstream& stream, const std::string& expectedPattern) const {
        auto regex = boost::regex(expectedPattern);
        CHECK(boost::regex_match(stream.str(), regex));
    }

private:
    std::ostringstream stdoutStream;
    std::ostringstream stderrStream;

    std::string expectedPatternInStdout;
    std::string expectedPatternInStderr;
};

static LoggerChecker& logAllLevels(LoggerChecker& checker) {
    return checker
        .log(libdepot::LogLevel::GENERAL, "GENERAL message")
        .log(libdepot::LogLevel::DEBUG, "DEBUG message")
        .log(libdepot::LogLevel::INFO, "INFO message")
        .log(libdepot::LogLevel::WARN, "WARN message")
        .log(libdepot::LogLevel::ERROR, "ERROR message");
}

TEST(LoggerTestGroup, debugLevel) {
    libdepot::Logger::getInstance().setLevel(libdepot::LogLevel::DEBUG);
    LoggerChecker checker;
    logAllLevels(checker)
        .expectGeneralMessageInStdout("GENERAL message")
        .expectMessageInStdout("DEBUG", "DEBUG message")
        .expectMessageInStdout("INFO", "INFO message")
        .expectMessageInStderr("WARN", "WARN message")
        .expectMessageInStderr("ERROR", "ERROR message");
}

TEST(LoggerTestGroup, infoLevel) {
    libdepot::Logger::getInstance().setLevel(libdepot::LogLevel::INFO);
    LoggerChecker checker;
    logAllLevels(checker)
        .expectGeneralMessageInStdout("GENERAL message")
        .expectMessageInStdout("INFO", "INFO message")
        .expectMessageInStderr("WARN", "WARN message")
        .expectMessageInStderr("ERROR", "ERROR message");
}

TEST(LoggerTestGroup, errorLevel) {
    libdepot::Logger::getInstance().setLevel(libdepot::LogLevel::ERROR);
    LoggerChecker checker;
    logAllLevels(checker)
        .expectGeneralMessageInStdout("GENERAL message")
        .expectMessageInStderr("ERROR", "ERROR message");
}

TEST(LoggerTestGroup, errorTraceIsPrintedMostNestedLast) {
    libdepot::Logger::getInstance().setLevel(libdepot::LogLevel::INFO);
    auto error = libdepot::Error{libdepot::LogLevel::ERROR,
                                 libdepot::Error::ErrorTraceEntry{"inner", "inner.cpp", 1, "inner"}};
    error.appendErrorTraceEntry(libdepot::Error::ErrorTraceEntry{"outer", "outer.cpp", 2, "outer"});

    std::ostringstream errStream;
    libdepot::Logger::getInstance().logErrorTrace(error, "subsystem", errStream);

    auto output = errStream.str();
    auto outerPosition = output.find("outer at outer.cpp:2");
    auto innerPosition = output.find("inner at inner.cpp:1");
    CHECK(outerPosition != std::string::npos);
    CHECK(innerPosition != std::string::npos);
    CHECK(outerPosition < innerPosition);
}

TEST(LoggerTestGroup, parseLogLevel) {
    CHECK(libdepot::parseLogLevel("debug") == libdepot::LogLevel::DEBUG);
    CHECK(libdepot::parseLogLevel("INFO") == libdepot::LogLevel::INFO);
    CHECK(libdepot::parseLogLevel("warning") == libdepot::LogLevel::WARN);
    CHECK(libdepot::parseLogLevel("error") == libdepot::LogLevel::ERROR);
    CHECK_THROWS(libdepot::Error, libdepot::parseLogLevel("verbose"));
}

}}

DEPOT_UNITTEST_MAIN_FUNCTION();
