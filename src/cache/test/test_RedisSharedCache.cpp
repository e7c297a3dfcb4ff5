/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <chrono>
#include <istream>
#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/buffers_iterator.hpp>

#include "common/Config.hpp"
#include "cache/RedisSharedCache.hpp"
#include "test_utility/unittest_main_function.hpp"

using boost::asio::ip::tcp;

namespace depot {
namespace cache {
namespace test {

namespace {

/**
 * Serves a single client connection, answering PING, GET, SET and DEL from
 * an in-memory map. The connection is closed after maxCommands commands.
 */
class FakeRedisServer {
public:
    FakeRedisServer(std::size_t maxCommands = 1000)
        : acceptor{io, tcp::endpoint{boost::asio::ip::address_v4::loopback(), 0}}
        , maxCommands{maxCommands}
        , thread{[this]() { serve(); }}
    {}

    ~FakeRedisServer() {
        thread.join();
    }

    std::uint16_t getPort() const {
        return acceptor.local_endpoint().port();
    }

    std::vector<std::vector<std::string>> getCommands() const {
        std::lock_guard<std::mutex> lock{mutex};
        return commands;
    }

private:
    void serve() {
        tcp::socket socket{io};
        acceptor.accept(socket);

        boost::asio::streambuf buffer;
        boost::system::error_code ec;
        for(std::size_t i=0; i<maxCommands; ++i) {
            auto command = std::vector<std::string>{};
            auto arguments = std::stoul(readLine(socket, buffer, ec).substr(1));
            for(std::size_t j=0; !ec && j<arguments; ++j) {
                auto length = std::stoul(readLine(socket, buffer, ec).substr(1));
                if(buffer.size() < length + 2) {
                    boost::asio::read(socket, buffer, boost::asio::transfer_exactly(length + 2 - buffer.size()), ec);
                }
                auto begin = boost::asio::buffers_begin(buffer.data());
                command.emplace_back(begin, begin + length);
                buffer.consume(length + 2);
            }
            if(ec) {
                return;
            }
            boost::asio::write(socket, boost::asio::buffer(answer(command)), ec);
        }
    }

    std::string readLine(tcp::socket& socket, boost::asio::streambuf& buffer, boost::system::error_code& ec) {
        boost::asio::read_until(socket, buffer, "\r\n", ec);
        if(ec) {
            return "*0";
        }
        std::istream is{&buffer};
        auto line = std::string{};
        std::getline(is, line);
        line.pop_back();
        return line;
    }

    std::string answer(const std::vector<std::string>& command) {
        std::lock_guard<std::mutex> lock{mutex};
        commands.push_back(command);

        if(command[0] == "PING") {
            return "+PONG\r\n";
        }
        if(command[0] == "SET") {
            values[command[1]] = command[2];
            return "+OK\r\n";
        }
        if(command[0] == "GET") {
            auto value = values.find(command[1]);
            if(value == values.cend()) {
                return "$-1\r\n";
            }
            return "$" + std::to_string(value->second.size()) + "\r\n" + value->second + "\r\n";
        }
        if(command[0] == "DEL") {
            return ":" + std::to_string(values.erase(command[1])) + "\r\n";
        }
        return "-ERR unknown command\r\n";
    }

private:
    boost::asio::io_context io;
    tcp::acceptor acceptor;
    std::size_t maxCommands;
    mutable std::mutex mutex;
    std::map<std::string, std::string> values;
    std::vector<std::vector<std::string>> commands;
    std::thread thread;
};

common::Config::Redis makeRedisConfig(std::uint16_t port) {
    auto config = common::Config::Redis{};
    config.host = "127.0.0.1";
    config.port = port;
    config.timeout = std::chrono::milliseconds{500};
    config.retryInterval = std::chrono::seconds{30};
    return config;
}

// A port nobody listens on
std::uint16_t getClosedPort() {
    boost::asio::io_context io;
    tcp::acceptor acceptor{io, tcp::endpoint{boost::asio::ip::address_v4::loopback(), 0}};
    return acceptor.local_endpoint().port();
}

}

TEST_GROUP(RedisSharedCacheTestGroup) {
};

TEST(RedisSharedCacheTestGroup, setGetRemove) {
    FakeRedisServer server;
    RedisSharedCache cache{makeRedisConfig(server.getPort())};
    CHECK(cache.isConnected());

    CHECK(cache.get("manifest:sha256:abc") == boost::none);
    cache.set("manifest:sha256:abc", std::string("binary\r\n\0content", 17), std::chrono::milliseconds{60000});
    auto value = cache.get("manifest:sha256:abc");
    CHECK(value != boost::none);
    CHECK_EQUAL(value->size(), 17);
    CHECK(*value == std::string("binary\r\n\0content", 17));

    cache.remove("manifest:sha256:abc");
    CHECK(cache.get("manifest:sha256:abc") == boost::none);

    auto commands = server.getCommands();
    CHECK_EQUAL(commands[0][0], std::string("PING"));
    CHECK_EQUAL(commands[2].size(), 5);
    CHECK_EQUAL(commands[2][0], std::string("SET"));
    CHECK_EQUAL(commands[2][3], std::string("PX"));
    CHECK_EQUAL(commands[2][4], std::string("60000"));
}

TEST(RedisSharedCacheTestGroup, unreachableServer) {
    RedisSharedCache cache{makeRedisConfig(getClosedPort())};
    CHECK_FALSE(cache.isConnected());

    // degrades to a no-op
    cache.set("key", "value", std::chrono::milliseconds{1000});
    CHECK(cache.get("key") == boost::none);
    cache.remove("key");
    CHECK_FALSE(cache.isConnected());
}

TEST(RedisSharedCacheTestGroup, connectionLost) {
    FakeRedisServer server{2};
    RedisSharedCache cache{makeRedisConfig(server.getPort())};
    CHECK(cache.isConnected());

    cache.set("key", "value", std::chrono::milliseconds{1000});
    CHECK(cache.get("key") == boost::none);
    CHECK_FALSE(cache.isConnected());

    // no reconnection before the retry interval has elapsed
    CHECK(cache.get("key") == boost::none);
    CHECK_EQUAL(server.getCommands().size(), 2);
}

}}}

DEPOT_UNITTEST_MAIN_FUNCTION();
