/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "cache/RedisSharedCache.hpp"

#include <istream>
#include <stdexcept>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"


namespace depot {
namespace cache {

namespace {

struct CompletionHandler {
    boost::system::error_code* error;

    template<class Result>
    void operator()(const boost::system::error_code& ec, const Result&) {
        *error = ec;
    }
};

std::string encodeCommand(const std::vector<std::string>& command) {
    auto request = "*" + std::to_string(command.size()) + "\r\n";
    for(const auto& argument : command) {
        request += "$" + std::to_string(argument.size()) + "\r\n" + argument + "\r\n";
    }
    return request;
}

}

RedisSharedCache::RedisSharedCache(const common::Config::Redis& config)
    : host{config.host}
    , port{config.port}
    , timeout{config.timeout}
    , retryInterval{config.retryInterval}
    , stream{io}
{
    std::lock_guard<std::mutex> lock{mutex};
    ensureConnected();
}

boost::optional<std::string> RedisSharedCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock{mutex};
    if(!ensureConnected()) {
        return boost::none;
    }
    try {
        return execute({"GET", key});
    }
    catch(const std::exception& e) {
        disconnect("GET", e);
        return boost::none;
    }
}

void RedisSharedCache::set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock{mutex};
    if(!ensureConnected()) {
        return;
    }
    try {
        execute({"SET", key, value, "PX", std::to_string(ttl.count())});
    }
    catch(const std::exception& e) {
        disconnect("SET", e);
    }
}

void RedisSharedCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock{mutex};
    if(!ensureConnected()) {
        return;
    }
    try {
        execute({"DEL", key});
    }
    catch(const std::exception& e) {
        disconnect("DEL", e);
    }
}

bool RedisSharedCache::isConnected() const {
    std::lock_guard<std::mutex> lock{mutex};
    return connected;
}

bool RedisSharedCache::ensureConnected() {
    if(connected) {
        return true;
    }
    if(Clock::now() < nextConnectionAttempt) {
        return false;
    }

    try {
        connect();
    }
    catch(const std::exception& e) {
        disconnect("connect", e);
        return false;
    }

    connected = true;
    printLog(boost::format("Connected to Redis at %s:%d") % host % port, libdepot::LogLevel::INFO);
    return true;
}

void RedisSharedCache::connect() {
    stream.close();
    buffer.consume(buffer.size());

    auto resolver = boost::asio::ip::tcp::resolver{io};
    auto endpoints = resolver.resolve(host, std::to_string(port));

    auto error = boost::system::error_code{};
    stream.expires_after(timeout);
    stream.async_connect(endpoints, CompletionHandler{&error});
    awaitCompletion(error);

    auto reply = execute({"PING"});
    if(!reply || *reply != "PONG") {
        DEPOT_THROW_ERROR("Redis server didn't answer PING with PONG");
    }
}

void RedisSharedCache::disconnect(const std::string& operation, const std::exception& error) {
    stream.close();
    buffer.consume(buffer.size());
    connected = false;
    nextConnectionAttempt = Clock::now() + retryInterval;

    printLog(boost::format("Shared cache at %s:%d is unavailable (%s failed: %s)."
                           " Using the memory cache only, next connection attempt in %d seconds")
                % host % port % operation % error.what() % retryInterval.count(),
             libdepot::LogLevel::WARN);
}

/**
 * Sends the command and returns the value of a simple string, integer or bulk
 * string reply. A null bulk string, i.e. a missing key, is returned as none.
 */
boost::optional<std::string> RedisSharedCache::execute(const std::vector<std::string>& command) {
    auto request = encodeCommand(command);
    auto error = boost::system::error_code{};
    stream.expires_after(timeout);
    boost::asio::async_write(stream, boost::asio::buffer(request), CompletionHandler{&error});
    awaitCompletion(error);

    auto line = readLine();
    if(line.empty()) {
        DEPOT_THROW_ERROR("Redis server sent an empty reply");
    }

    switch(line[0]) {
        case '+':
        case ':':
            return line.substr(1);
        case '-': {
            auto message = boost::format("Redis server replied to %s with error: %s") % command.front() % line.substr(1);
            DEPOT_THROW_ERROR(message.str());
        }
        case '$': {
            auto length = std::stol(line.substr(1));
            if(length < 0) {
                return boost::none;
            }
            auto size = static_cast<std::size_t>(length);
            readExactly(size + 2);
            auto begin = boost::asio::buffers_begin(buffer.data());
            auto value = std::string(begin, begin + size);
            buffer.consume(size + 2);
            return value;
        }
    }

    auto message = boost::format("Redis server sent an unexpected reply to %s: %s") % command.front() % line;
    DEPOT_THROW_ERROR(message.str());
}

std::string RedisSharedCache::readLine() {
    auto error = boost::system::error_code{};
    stream.expires_after(timeout);
    boost::asio::async_read_until(stream, buffer, "\r\n", CompletionHandler{&error});
    awaitCompletion(error);

    std::istream is{&buffer};
    auto line = std::string{};
    std::getline(is, line);
    if(!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void RedisSharedCache::readExactly(std::size_t size) {
    if(buffer.size() >= size) {
        return;
    }
    auto error = boost::system::error_code{};
    stream.expires_after(timeout);
    boost::asio::async_read(stream, buffer, boost::asio::transfer_exactly(size - buffer.size()), CompletionHandler{&error});
    awaitCompletion(error);
}

void RedisSharedCache::awaitCompletion(const boost::system::error_code& error) {
    io.restart();
    io.run();
    if(error) {
        throw boost::system::system_error{error};
    }
}

void RedisSharedCache::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                                std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
