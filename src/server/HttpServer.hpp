/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_server_HttpServer_hpp
#define depot_server_HttpServer_hpp

#include <string>
#include <memory>
#include <vector>
#include <queue>
#include <set>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <iostream>

#include <boost/format.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "registry/RegistryService.hpp"
#include "protocol/HttpMessage.hpp"
#include "protocol/ProtocolHandler.hpp"


namespace depot {
namespace server {

/**
 * Blocking HTTP/1.1 server in front of the protocol handler.
 *
 * The acceptor runs on the calling thread of run() and queues the accepted
 * connections. A fixed pool of workers drains the queue, each serving one
 * connection at a time (keep-alive included) with synchronous reads and
 * writes. A reaper thread periodically reclaims expired upload sessions.
 * SIGINT and SIGTERM stop the server.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const common::Config> config,
               std::shared_ptr<protocol::ProtocolHandler> handler,
               std::shared_ptr<registry::RegistryService> service);
    ~HttpServer();

    void run();
    void stop();
    std::uint16_t getPort() const;

private:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

private:
    void startAccept();
    void startWorkers();
    void joinThreads();
    void workerLoop();
    void reaperLoop();
    void serve(boost::asio::ip::tcp::socket& socket);
    protocol::HttpRequest makeRequest(const Request& request) const;
    Response makeResponse(const protocol::HttpResponse& response, unsigned version, bool keepAlive) const;
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "HttpServer";
    const std::chrono::seconds idleTimeout{30};

    std::shared_ptr<protocol::ProtocolHandler> handler;
    std::shared_ptr<registry::RegistryService> service;
    std::size_t numberOfWorkers;
    std::size_t maxBodySizeBytes;
    std::chrono::seconds reapInterval;
    std::uint16_t port;

    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    boost::asio::signal_set signals{io};

    std::atomic<bool> stopping{false};
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::queue<std::unique_ptr<boost::asio::ip::tcp::socket>> connections;
    std::set<int> activeConnections;

    std::mutex reaperMutex;
    std::condition_variable reaperCondition;

    std::vector<std::thread> workers;
    std::thread reaper;
};

}
}

#endif
