/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libdepot/Logger.hpp"

#include <string>
#include <fstream>
#include <iostream>
#include <cerrno>

#include <time.h>
#include <sys/types.h>
#include <unistd.h>
#include <limits.h>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/utility/process.hpp"

namespace libdepot {

    Logger& Logger::getInstance() {
        static Logger logger;
        return logger;
    }

    Logger::Logger()
        : level{ libdepot::LogLevel::WARN }
    {}

    void Logger::log(const std::string& message, const std::string& systemName, const libdepot::LogLevel& logLevel,
            std::ostream& out_stream, std::ostream& err_stream) {
        if(logLevel < level) {
            return;
        }

        auto fullLogMessage = makeSubmessageWithTimestamp(logLevel)
            + makeSubmessageWithDepotInstanceID(logLevel)
            + makeSubmessageWithSystemName(logLevel, systemName)
            + makeSubmessageWithLogLevel(logLevel)
            + message;

        std::lock_guard<std::mutex> lock{outputMutex};

        // WARNING and ERROR messages go to stderr
        if ( logLevel == libdepot::LogLevel::WARN || logLevel == libdepot::LogLevel::ERROR ) {
            err_stream << fullLogMessage << std::endl;
        }
        // rest goes to stdout
        else {
            out_stream << fullLogMessage << std::endl;
        }
    }

    void Logger::log(const boost::format& message, const std::string& systemName, const libdepot::LogLevel& logLevel,
            std::ostream& out_stream, std::ostream& err_stream) {
        log(message.str(), systemName, logLevel, out_stream, err_stream);
    }

    void Logger::logErrorTrace( const libdepot::Error& error, const std::string& systemName, std::ostream& errStream) {
        if(error.getLogLevel() < level) {
            return;
        }

        log("Error trace (most nested error last):", systemName, LogLevel::ERROR, std::cout, errStream);

        std::lock_guard<std::mutex> lock{outputMutex};
        const auto& trace = error.getErrorTrace();
        for(size_t i=0; i!=trace.size(); ++i) {
            const auto& entry = trace[trace.size()-i-1];
            auto line = boost::format("#%-3.3s %s at %s:%s %s\n")
                % i % entry.functionName % entry.fileName % (entry.fileLine != -1 ? std::to_string(entry.fileLine) : "")
                % entry.errorMessage;
            errStream << line;
        }
    }

    std::string Logger::makeSubmessageWithTimestamp(libdepot::LogLevel logLevel) const {
        if(logLevel == libdepot::LogLevel::GENERAL) {
            return "";
        }

        auto tp = timespec{};
        if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
            auto message = boost::format("logger failed to retrieve UNIX epoch time (%s)") % strerror(errno);
            DEPOT_THROW_ERROR(message.str());
        }

        auto timestamp = boost::format("[%d.%09d] ") % tp.tv_sec % tp.tv_nsec;
        return timestamp.str();
    }

    std::string Logger::makeSubmessageWithDepotInstanceID(libdepot::LogLevel logLevel) const {
        if(logLevel == libdepot::LogLevel::GENERAL) {
            return "";
        }

        auto id = boost::format("[%s-%d] ") % libdepot::process::getHostname() % getpid();
        return id.str();
    }

    std::string Logger::makeSubmessageWithSystemName(libdepot::LogLevel logLevel, const std::string& systemName) const {
        if(logLevel == libdepot::LogLevel::GENERAL) {
            return "";
        }

        return "[" + systemName + "] ";
    }

    std::string Logger::makeSubmessageWithLogLevel(libdepot::LogLevel logLevel) const {
        switch(logLevel) {
            case libdepot::LogLevel::DEBUG:   return "[DEBUG] ";
            case libdepot::LogLevel::INFO :   return "[INFO] ";
            case libdepot::LogLevel::WARN :   return "[WARN] ";
            case libdepot::LogLevel::ERROR:   return "[ERROR] ";
            case libdepot::LogLevel::GENERAL: return "";
        }
        DEPOT_THROW_ERROR("logger failed to convert unknown log level to string");
    }

    LogLevel parseLogLevel(const std::string& value) {
        auto lowercase = boost::algorithm::to_lower_copy(value);
        if(lowercase == "debug") {
            return LogLevel::DEBUG;
        }
        if(lowercase == "info") {
            return LogLevel::INFO;
        }
        if(lowercase == "warn" || lowercase == "warning") {
            return LogLevel::WARN;
        }
        if(lowercase == "error") {
            return LogLevel::ERROR;
        }
        auto message = boost::format("Failed to parse log level '%s'."
                                     " Expected one of: debug, info, warn, error") % value;
        DEPOT_THROW_ERROR(message.str());
    }

}
