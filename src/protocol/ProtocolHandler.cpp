/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "protocol/ProtocolHandler.hpp"

#include <stdexcept>

#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"


namespace depot {
namespace protocol {

namespace {

const std::string apiVersionHeader = "Docker-Distribution-API-Version";
const std::string apiVersion = "registry/2.0";

void throwUnsupportedMethod(const HttpRequest& request, Endpoint endpoint) {
    auto message = boost::format("Method %s is not supported by the %s endpoint")
        % getHttpMethodString(request.getMethod()) % getEndpointString(endpoint);
    DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::Unsupported, message.str());
}

bool isRead(HttpMethod method) {
    return method == HttpMethod::Get || method == HttpMethod::Head;
}

std::size_t parseCount(const std::string& value) {
    if(value.empty() || !boost::algorithm::all(value, boost::algorithm::is_digit())) {
        auto message = boost::format("Invalid count '%s': expected a non-negative integer") % value;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::PaginationInvalid, message.str());
    }
    try {
        return boost::lexical_cast<std::size_t>(value);
    }
    catch(const boost::bad_lexical_cast&) {
        auto message = boost::format("Invalid count '%s': value out of range") % value;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::PaginationInvalid, message.str());
    }
}

}

ProtocolHandler::ProtocolHandler(std::shared_ptr<const common::Config> config,
                                 std::shared_ptr<registry::RegistryService> service,
                                 std::shared_ptr<const Authorizer> authorizer)
    : service{std::move(service)}
    , authorizer{std::move(authorizer)}
    , defaultPageSize{config->registry.defaultPageSize}
{}

HttpResponse ProtocolHandler::handle(const HttpRequest& request) {
    printLog(boost::format("%s %s") % getHttpMethodString(request.getMethod()) % request.getPath(),
             libdepot::LogLevel::DEBUG);

    auto response = Response{};
    try {
        response = dispatch(request);
    }
    catch(const libdepot::Error& e) {
        response = makeErrorResponse(request, e);
    }
    catch(const std::exception& e) {
        printLog(boost::format("%s %s failed: %s") % getHttpMethodString(request.getMethod())
                 % request.getPath() % e.what(), libdepot::LogLevel::ERROR);
        response = ErrorResponse{libdepot::ErrorCode::Generic, e.what()};
    }

    auto renderer = ResponseRenderer{};
    auto http = boost::apply_visitor(renderer, response);
    http.setHeader(apiVersionHeader, apiVersion);
    if(http.status == 401) {
        http.setHeader("WWW-Authenticate", "Basic realm=\"" + authorizer->getRealm() + "\"");
    }
    if(request.getMethod() == HttpMethod::Head) {
        if(!http.contentLength) {
            http.contentLength = http.body.size();
        }
        http.body.clear();
    }
    return http;
}

Response ProtocolHandler::dispatch(const HttpRequest& request) {
    auto route = router.match(request.getPath());
    if(!route) {
        auto message = boost::format("Unknown path %s") % request.getPath();
        return ErrorResponse{libdepot::ErrorCode::NotFound, message.str()};
    }

    switch(route->endpoint) {
        case Endpoint::ApiVersion:
            if(!isRead(request.getMethod())) {
                throwUnsupportedMethod(request, route->endpoint);
            }
            authorizer->authorize(request, "", Access::Read);
            return ApiVersionResponse{};
        case Endpoint::Health:
            if(!isRead(request.getMethod())) {
                throwUnsupportedMethod(request, route->endpoint);
            }
            service->ping();
            return HealthResponse{};
        case Endpoint::CacheHealth:
            if(!isRead(request.getMethod())) {
                throwUnsupportedMethod(request, route->endpoint);
            }
            return CacheStatsResponse{service->getCacheStats()};
        case Endpoint::Catalog:
            return handleCatalog(request);
        case Endpoint::TagList:
            return handleTagList(request, *route);
        case Endpoint::Manifest:
            return handleManifest(request, *route);
        case Endpoint::Blob:
            return handleBlob(request, *route);
        case Endpoint::UploadStart:
            return handleUploadStart(request, *route);
        case Endpoint::Upload:
            return handleUpload(request, *route);
    }

    DEPOT_THROW_ERROR("Failed to dispatch request: unknown endpoint");
}

/**
 * The catalog is paginated by default. Users scoped to some repositories
 * only see those in the listing.
 */
Response ProtocolHandler::handleCatalog(const HttpRequest& request) {
    if(!isRead(request.getMethod())) {
        throwUnsupportedMethod(request, Endpoint::Catalog);
    }
    authorizer->authorize(request, "", Access::Read);

    auto pagination = parsePagination(request);
    auto pageSize = pagination.n ? *pagination.n : defaultPageSize;
    pagination.n = pageSize;

    auto page = service->listRepositories(pagination);
    auto visible = std::vector<std::string>{};
    for(const auto& repository : page.entries) {
        if(authorizer->decide(request, repository, Access::Read) == Decision::Granted) {
            visible.push_back(repository);
        }
    }
    page.entries.swap(visible);
    return CatalogResponse{page, pageSize};
}

Response ProtocolHandler::handleTagList(const HttpRequest& request, const Route& route) {
    if(!isRead(request.getMethod())) {
        throwUnsupportedMethod(request, route.endpoint);
    }
    authorizer->authorize(request, route.repository, Access::Read);

    auto pagination = parsePagination(request);
    auto page = service->listTags(route.repository, pagination);
    return TagListResponse{route.repository, page, pagination.n};
}

Response ProtocolHandler::handleManifest(const HttpRequest& request, const Route& route) {
    switch(request.getMethod()) {
        case HttpMethod::Get:
        case HttpMethod::Head:
            authorizer->authorize(request, route.repository, Access::Read);
            return ManifestResponse{service->getManifest(route.repository, route.reference)};
        case HttpMethod::Put: {
            authorizer->authorize(request, route.repository, Access::Write);
            auto mediaType = request.getHeader("Content-Type");
            auto result = service->putManifest(route.repository, route.reference, request.getBody(),
                                               mediaType ? *mediaType : std::string{});
            printLog(boost::format("Pushed manifest %s to %s:%s")
                     % result.digest % route.repository % route.reference, libdepot::LogLevel::INFO);
            return ManifestCreatedResponse{route.repository, result};
        }
        case HttpMethod::Delete:
            authorizer->authorize(request, route.repository, Access::Write);
            service->deleteManifest(route.repository, route.reference);
            return EmptyResponse{202};
        default:
            throwUnsupportedMethod(request, route.endpoint);
    }
    return EmptyResponse{405};
}

Response ProtocolHandler::handleBlob(const HttpRequest& request, const Route& route) {
    switch(request.getMethod()) {
        case HttpMethod::Head: {
            authorizer->authorize(request, route.repository, Access::Read);
            auto digest = common::Digest::parse(route.reference);
            return BlobResponse{service->statBlob(route.repository, digest), boost::none};
        }
        case HttpMethod::Get: {
            authorizer->authorize(request, route.repository, Access::Read);
            auto digest = common::Digest::parse(route.reference);
            auto blob = service->statBlob(route.repository, digest);
            auto content = service->getBlob(route.repository, digest);
            blob.size = content.size();
            return BlobResponse{blob, std::move(content)};
        }
        case HttpMethod::Delete: {
            authorizer->authorize(request, route.repository, Access::Write);
            service->deleteBlob(route.repository, common::Digest::parse(route.reference));
            return EmptyResponse{202};
        }
        default:
            throwUnsupportedMethod(request, route.endpoint);
    }
    return EmptyResponse{405};
}

/**
 * Starts an upload session, unless the request asks to mount an existing
 * blob from another repository or carries the whole blob (monolithic upload).
 * A mount that can't be satisfied falls back to starting a session.
 */
Response ProtocolHandler::handleUploadStart(const HttpRequest& request, const Route& route) {
    if(request.getMethod() != HttpMethod::Post) {
        throwUnsupportedMethod(request, route.endpoint);
    }
    authorizer->authorize(request, route.repository, Access::Write);

    auto mount = request.getQueryParameter("mount");
    auto from = request.getQueryParameter("from");
    if(mount && from) {
        authorizer->authorize(request, *from, Access::Read);
        auto blob = service->mountBlob(route.repository, common::Digest::parse(*mount), *from);
        if(blob) {
            return BlobCreatedResponse{route.repository, *blob};
        }
    }

    if(request.getQueryParameter("digest")) {
        auto digest = parseDigestParameter(request, "digest");
        auto blob = service->uploadMonolithic(route.repository, request.getBody(), digest);
        return BlobCreatedResponse{route.repository, blob};
    }

    auto id = service->startUpload(route.repository);
    return UploadResponse{202, service->getUploadStatus(route.repository, id)};
}

Response ProtocolHandler::handleUpload(const HttpRequest& request, const Route& route) {
    const auto& id = route.reference;
    switch(request.getMethod()) {
        case HttpMethod::Get:
        case HttpMethod::Head:
            authorizer->authorize(request, route.repository, Access::Read);
            return UploadResponse{204, service->getUploadStatus(route.repository, id)};
        case HttpMethod::Patch: {
            authorizer->authorize(request, route.repository, Access::Write);
            auto startOffset = parseContentRange(request);
            auto offset = service->appendChunk(route.repository, id, request.getBody(), startOffset);
            return UploadResponse{202, upload::UploadStatus{id, route.repository, offset}};
        }
        case HttpMethod::Put: {
            authorizer->authorize(request, route.repository, Access::Write);
            auto digest = parseDigestParameter(request, "digest");
            auto blob = service->completeUpload(route.repository, id, request.getBody(), digest);
            printLog(boost::format("Completed upload %s of blob %s to %s") % id % blob.digest % route.repository,
                     libdepot::LogLevel::INFO);
            return BlobCreatedResponse{route.repository, blob};
        }
        case HttpMethod::Delete:
            authorizer->authorize(request, route.repository, Access::Write);
            service->cancelUpload(route.repository, id);
            return EmptyResponse{204};
        default:
            throwUnsupportedMethod(request, route.endpoint);
    }
    return EmptyResponse{405};
}

registry::Pagination ProtocolHandler::parsePagination(const HttpRequest& request) const {
    auto pagination = registry::Pagination{};
    if(auto n = request.getQueryParameter("n")) {
        pagination.n = parseCount(*n);
    }
    if(auto last = request.getQueryParameter("last")) {
        pagination.last = *last;
    }
    return pagination;
}

/**
 * Without Content-Range the chunk is appended at the current offset.
 * With it, the range must describe the chunk exactly and returns where
 * the chunk is expected to start.
 */
boost::optional<std::size_t> ProtocolHandler::parseContentRange(const HttpRequest& request) const {
    auto header = request.getHeader("Content-Range");
    if(!header) {
        return boost::none;
    }

    static const auto regex = boost::regex{"^(?:bytes[ =])?([0-9]+)-([0-9]+)(?:/(?:[0-9]+|\\*))?$"};
    auto matches = boost::smatch{};
    auto value = boost::algorithm::trim_copy(*header);
    if(!boost::regex_match(value, matches, regex)) {
        auto message = boost::format("Invalid Content-Range '%s': expected <start>-<end>") % *header;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RangeInvalid, message.str());
    }

    auto start = std::size_t{};
    auto end = std::size_t{};
    try {
        start = boost::lexical_cast<std::size_t>(matches[1].str());
        end = boost::lexical_cast<std::size_t>(matches[2].str());
    }
    catch(const boost::bad_lexical_cast&) {
        auto message = boost::format("Invalid Content-Range '%s': value out of range") % *header;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RangeInvalid, message.str());
    }

    if(end < start || end - start + 1 != request.getBody().size()) {
        auto message = boost::format("Invalid Content-Range '%s': the range doesn't match the %d bytes of the chunk")
            % *header % request.getBody().size();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RangeInvalid, message.str());
    }
    return start;
}

common::Digest ProtocolHandler::parseDigestParameter(const HttpRequest& request, const std::string& name) const {
    auto value = request.getQueryParameter(name);
    if(!value) {
        auto message = boost::format("Missing query parameter '%s'") % name;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestInvalid, message.str());
    }
    return common::Digest::parse(*value);
}

Response ProtocolHandler::makeErrorResponse(const HttpRequest& request, const libdepot::Error& error) const {
    auto code = error.getErrorCode();
    if(getHttpStatus(code) >= 500) {
        printLog(boost::format("%s %s failed") % getHttpMethodString(request.getMethod()) % request.getPath(),
                 libdepot::LogLevel::ERROR);
        libdepot::Logger::getInstance().logErrorTrace(error, sysname);
    }
    else {
        printLog(boost::format("%s %s: %s (%s)") % getHttpMethodString(request.getMethod()) % request.getPath()
                 % libdepot::getErrorCodeString(code) % error.what(), libdepot::LogLevel::INFO);
    }
    return ErrorResponse{code, error.what()};
}

void ProtocolHandler::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                               std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
