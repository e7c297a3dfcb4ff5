/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_cache_RedisSharedCache_hpp
#define depot_cache_RedisSharedCache_hpp

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "cache/SharedCache.hpp"


namespace depot {
namespace cache {

/**
 * Shared cache tier on a Redis server, spoken to in RESP over a single TCP
 * connection. Every command is bounded by the configured timeout.
 *
 * Any I/O or protocol failure drops the connection, logs a warning and
 * turns the tier into a no-op until the retry interval has elapsed.
 */
class RedisSharedCache : public SharedCache {
public:
    RedisSharedCache(const common::Config::Redis& config);

    boost::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    bool isConnected() const override;

private:
    using Clock = std::chrono::steady_clock;

private:
    bool ensureConnected();
    void connect();
    void disconnect(const std::string& operation, const std::exception& error);
    boost::optional<std::string> execute(const std::vector<std::string>& command);
    std::string readLine();
    void readExactly(std::size_t size);
    void awaitCompletion(const boost::system::error_code& error);
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "RedisSharedCache";
    std::string host;
    std::uint16_t port;
    std::chrono::milliseconds timeout;
    std::chrono::seconds retryInterval;

    mutable std::mutex mutex;
    boost::asio::io_context io;
    boost::beast::tcp_stream stream;
    boost::asio::streambuf buffer;
    bool connected = false;
    Clock::time_point nextConnectionAttempt;
};

}
}

#endif
