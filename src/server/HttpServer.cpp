/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "server/HttpServer.hpp"

#include <csignal>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"


namespace depot {
namespace server {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

std::string toString(boost::beast::string_view view) {
    return std::string(view.data(), view.size());
}

}

HttpServer::HttpServer(std::shared_ptr<const common::Config> config,
                       std::shared_ptr<protocol::ProtocolHandler> handler,
                       std::shared_ptr<registry::RegistryService> service)
    : handler{std::move(handler)}
    , service{std::move(service)}
    , numberOfWorkers{config->server.threads > 0 ? config->server.threads : 1}
    , maxBodySizeBytes{config->server.maxBodySizeBytes}
    , reapInterval{config->uploads.reapInterval}
{
    try {
        auto address = boost::asio::ip::make_address(config->server.bindAddress);
        auto endpoint = tcp::endpoint{address, config->server.port};
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to listen on %s:%d")
            % config->server.bindAddress % config->server.port;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
    printLog(boost::format("Listening on %s:%d") % config->server.bindAddress % getPort(),
             libdepot::LogLevel::INFO);
}

HttpServer::~HttpServer() {
    stop();
    joinThreads();
}

void HttpServer::run() {
    signals.add(SIGINT);
    signals.add(SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal) {
        if(!ec) {
            printLog(boost::format("Received signal %d, shutting down") % signal, libdepot::LogLevel::INFO);
            stop();
        }
    });

    startWorkers();
    reaper = std::thread{&HttpServer::reaperLoop, this};
    startAccept();

    io.run();

    joinThreads();
    printLog(boost::format("Stopped"), libdepot::LogLevel::INFO);
}

void HttpServer::stop() {
    if(stopping.exchange(true)) {
        return;
    }
    io.stop();
    {
        std::lock_guard<std::mutex> lock{queueMutex};
        // interrupt the workers blocked on idle keep-alive connections
        for(auto fd : activeConnections) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    queueCondition.notify_all();
    {
        std::lock_guard<std::mutex> lock{reaperMutex};
    }
    reaperCondition.notify_all();
}

std::uint16_t HttpServer::getPort() const {
    return port;
}

void HttpServer::startAccept() {
    auto socket = std::make_shared<tcp::socket>(io);
    acceptor.async_accept(*socket, [this, socket](const boost::system::error_code& ec) {
        if(stopping) {
            return;
        }
        if(ec) {
            printLog(boost::format("Failed to accept connection: %s") % ec.message(), libdepot::LogLevel::WARN);
        }
        else {
            std::lock_guard<std::mutex> lock{queueMutex};
            connections.push(std::unique_ptr<tcp::socket>{new tcp::socket{std::move(*socket)}});
            queueCondition.notify_one();
        }
        startAccept();
    });
}

void HttpServer::startWorkers() {
    for(std::size_t i=0; i<numberOfWorkers; ++i) {
        workers.emplace_back(&HttpServer::workerLoop, this);
    }
}

void HttpServer::joinThreads() {
    for(auto& worker : workers) {
        if(worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
    if(reaper.joinable()) {
        reaper.join();
    }
}

void HttpServer::workerLoop() {
    while(true) {
        auto socket = std::unique_ptr<tcp::socket>{};
        {
            std::unique_lock<std::mutex> lock{queueMutex};
            queueCondition.wait(lock, [this]() { return stopping || !connections.empty(); });
            if(stopping) {
                return;
            }
            socket = std::move(connections.front());
            connections.pop();
            activeConnections.insert(socket->native_handle());
        }

        serve(*socket);

        {
            std::lock_guard<std::mutex> lock{queueMutex};
            activeConnections.erase(socket->native_handle());
        }
        auto ec = boost::system::error_code{};
        socket->close(ec);
    }
}

void HttpServer::reaperLoop() {
    std::unique_lock<std::mutex> lock{reaperMutex};
    while(!stopping) {
        reaperCondition.wait_for(lock, reapInterval, [this]() -> bool { return stopping; });
        if(stopping) {
            return;
        }
        try {
            auto reclaimed = service->reclaimExpiredUploads();
            if(reclaimed > 0) {
                printLog(boost::format("Reclaimed %d expired upload sessions") % reclaimed, libdepot::LogLevel::INFO);
            }
        }
        catch(const libdepot::Error& e) {
            printLog(boost::format("Failed to reclaim expired upload sessions"), libdepot::LogLevel::ERROR);
            libdepot::Logger::getInstance().logErrorTrace(e, sysname);
        }
        catch(const std::exception& e) {
            printLog(boost::format("Failed to reclaim expired upload sessions: %s") % e.what(),
                     libdepot::LogLevel::ERROR);
        }
    }
}

void HttpServer::serve(tcp::socket& socket) {
    auto timeout = timeval{};
    timeout.tv_sec = idleTimeout.count();
    if(::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
        printLog(boost::format("Failed to set idle timeout of connection: %s") % strerror(errno),
                 libdepot::LogLevel::WARN);
    }

    boost::beast::flat_buffer buffer;
    auto ec = boost::system::error_code{};

    while(!stopping) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(maxBodySizeBytes);
        http::read(socket, buffer, parser, ec);

        if(ec == http::error::end_of_stream) {
            break;
        }
        if(ec == http::error::body_limit) {
            auto error = protocol::HttpResponse{};
            error.status = 413;
            auto response = makeResponse(error, parser.get().version(), false);
            http::write(socket, response, ec);
            break;
        }
        if(ec) {
            printLog(boost::format("Closing connection: %s") % ec.message(), libdepot::LogLevel::DEBUG);
            break;
        }

        auto request = parser.release();
        auto keepAlive = request.keep_alive();
        auto response = makeResponse(handler->handle(makeRequest(request)), request.version(), keepAlive);
        http::write(socket, response, ec);
        if(ec) {
            printLog(boost::format("Failed to write response: %s") % ec.message(), libdepot::LogLevel::DEBUG);
            break;
        }
        if(!keepAlive) {
            break;
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

protocol::HttpRequest HttpServer::makeRequest(const Request& request) const {
    auto method = protocol::parseHttpMethod(toString(request.method_string()));
    auto result = protocol::HttpRequest{method, toString(request.target()), request.body()};
    for(const auto& field : request) {
        result.setHeader(toString(field.name_string()), toString(field.value()));
    }
    return result;
}

HttpServer::Response HttpServer::makeResponse(const protocol::HttpResponse& response,
                                              unsigned version, bool keepAlive) const {
    auto result = Response{static_cast<http::status>(response.status), version};
    result.set(http::field::server, "depot");
    for(const auto& header : response.headers) {
        result.set(header.first, header.second);
    }
    result.keep_alive(keepAlive);
    result.body() = response.body;
    if(response.contentLength) {
        result.content_length(*response.contentLength);
    }
    else {
        result.prepare_payload();
    }
    return result;
}

void HttpServer::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                          std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
