/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libdepot_Logger_hpp
#define libdepot_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libdepot/LogLevel.hpp"
#include "libdepot/Error.hpp"

namespace libdepot {

class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libdepot::LogLevel& logLevel,
            std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libdepot::LogLevel& logLevel,
            std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libdepot::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libdepot::LogLevel logLevel) { level = logLevel; };
    libdepot::LogLevel getLevel() { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(libdepot::LogLevel logLevel) const;
    std::string makeSubmessageWithDepotInstanceID(libdepot::LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(   libdepot::LogLevel logLevel,
                                                const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(libdepot::LogLevel logLevel) const;

private:
    libdepot::LogLevel level;
    std::mutex outputMutex; // serializes lines written by concurrent request workers
};

LogLevel parseLogLevel(const std::string& value);

}

#endif
