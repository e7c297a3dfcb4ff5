/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_protocol_ProtocolHandler_hpp
#define depot_protocol_ProtocolHandler_hpp

#include <string>
#include <memory>
#include <cstddef>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "registry/RegistryService.hpp"
#include "protocol/HttpMessage.hpp"
#include "protocol/Router.hpp"
#include "protocol/Authorizer.hpp"
#include "protocol/Responses.hpp"


namespace depot {
namespace protocol {

/**
 * Maps the registry HTTP API V2 to the operations of the registry service.
 *
 * Every request is routed, authorized and dispatched to the service. The
 * outcome (or the error) is turned into a typed response, rendered to HTTP
 * at the end. Errors never escape: they are rendered in the distribution
 * error format, and the error trace of server-side failures is logged.
 */
class ProtocolHandler {
public:
    ProtocolHandler(std::shared_ptr<const common::Config> config,
                    std::shared_ptr<registry::RegistryService> service,
                    std::shared_ptr<const Authorizer> authorizer);

    HttpResponse handle(const HttpRequest& request);

private:
    Response dispatch(const HttpRequest& request);
    Response handleCatalog(const HttpRequest& request);
    Response handleTagList(const HttpRequest& request, const Route& route);
    Response handleManifest(const HttpRequest& request, const Route& route);
    Response handleBlob(const HttpRequest& request, const Route& route);
    Response handleUploadStart(const HttpRequest& request, const Route& route);
    Response handleUpload(const HttpRequest& request, const Route& route);
    registry::Pagination parsePagination(const HttpRequest& request) const;
    boost::optional<std::size_t> parseContentRange(const HttpRequest& request) const;
    common::Digest parseDigestParameter(const HttpRequest& request, const std::string& name) const;
    Response makeErrorResponse(const HttpRequest& request, const libdepot::Error& error) const;
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ProtocolHandler";
    std::shared_ptr<registry::RegistryService> service;
    std::shared_ptr<const Authorizer> authorizer;
    Router router;
    std::size_t defaultPageSize;
};

}
}

#endif
