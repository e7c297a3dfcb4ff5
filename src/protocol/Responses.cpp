/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "protocol/Responses.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libdepot/utility/json.hpp"
#include "libdepot/utility/string.hpp"
#include "cache/CacheKey.hpp"


namespace depot {
namespace protocol {

namespace rj = rapidjson;

namespace {

const std::string jsonContentType = "application/json; charset=utf-8";

HttpResponse makeJsonResponse(unsigned status, const rj::Value& json) {
    auto response = HttpResponse{};
    response.status = status;
    response.setHeader("Content-Type", jsonContentType);
    response.body = libdepot::json::serialize(json);
    return response;
}

rj::Value makeStringArray(const std::vector<std::string>& strings, rj::Document::AllocatorType& allocator) {
    auto array = rj::Value{rj::kArrayType};
    for(const auto& string : strings) {
        array.PushBack(rj::Value{string.c_str(), allocator}, allocator);
    }
    return array;
}

void addPaginationLink(HttpResponse& response, const std::string& path, std::size_t pageSize,
                       const registry::Page& page) {
    if(!page.truncated || page.entries.empty()) {
        return;
    }
    auto link = boost::format("<%s?n=%d&last=%s>; rel=\"next\"")
        % path % pageSize % libdepot::string::percentEncode(page.entries.back());
    response.setHeader("Link", link.str());
}

std::string makeRange(std::size_t offset) {
    // an empty upload is reported as 0-0
    auto end = offset > 0 ? offset - 1 : 0;
    return (boost::format("0-%d") % end).str();
}

std::size_t countEntries(const cache::CacheStats& stats, cache::CacheKind kind) {
    auto it = stats.memory.entriesPerKind.find(kind);
    return it != stats.memory.entriesPerKind.cend() ? it->second : 0;
}

}

unsigned getHttpStatus(libdepot::ErrorCode code) {
    switch(code) {
        case libdepot::ErrorCode::NotFound:
        case libdepot::ErrorCode::NameUnknown:
        case libdepot::ErrorCode::ManifestUnknown:
        case libdepot::ErrorCode::BlobUnknown:
        case libdepot::ErrorCode::SessionNotFound:
            return 404;
        case libdepot::ErrorCode::DigestMismatch:
        case libdepot::ErrorCode::DigestInvalid:
        case libdepot::ErrorCode::RangeInvalid:
        case libdepot::ErrorCode::PaginationInvalid:
        case libdepot::ErrorCode::RepositoryInvalid:
        case libdepot::ErrorCode::TagInvalid:
        case libdepot::ErrorCode::ManifestInvalid:
        case libdepot::ErrorCode::ManifestBlobUnknown:
            return 400;
        case libdepot::ErrorCode::OffsetMismatch:
            return 416;
        case libdepot::ErrorCode::Conflict:
            return 409;
        case libdepot::ErrorCode::Unauthorized:
            return 401;
        case libdepot::ErrorCode::Denied:
            return 403;
        case libdepot::ErrorCode::Unsupported:
            return 405;
        case libdepot::ErrorCode::Generic:
        case libdepot::ErrorCode::StoreUnavailable:
            return 500;
    }
    return 500;
}

std::string getDistributionErrorCode(libdepot::ErrorCode code) {
    switch(code) {
        case libdepot::ErrorCode::NameUnknown:         return "NAME_UNKNOWN";
        case libdepot::ErrorCode::ManifestUnknown:     return "MANIFEST_UNKNOWN";
        case libdepot::ErrorCode::BlobUnknown:         return "BLOB_UNKNOWN";
        case libdepot::ErrorCode::SessionNotFound:     return "BLOB_UPLOAD_UNKNOWN";
        case libdepot::ErrorCode::DigestMismatch:
        case libdepot::ErrorCode::DigestInvalid:       return "DIGEST_INVALID";
        case libdepot::ErrorCode::OffsetMismatch:
        case libdepot::ErrorCode::RangeInvalid:        return "BLOB_UPLOAD_INVALID";
        case libdepot::ErrorCode::PaginationInvalid:   return "PAGINATION_NUMBER_INVALID";
        case libdepot::ErrorCode::RepositoryInvalid:   return "NAME_INVALID";
        case libdepot::ErrorCode::TagInvalid:          return "TAG_INVALID";
        case libdepot::ErrorCode::ManifestInvalid:     return "MANIFEST_INVALID";
        case libdepot::ErrorCode::ManifestBlobUnknown: return "MANIFEST_BLOB_UNKNOWN";
        case libdepot::ErrorCode::Unauthorized:        return "UNAUTHORIZED";
        case libdepot::ErrorCode::Denied:              return "DENIED";
        case libdepot::ErrorCode::Unsupported:         return "UNSUPPORTED";
        case libdepot::ErrorCode::NotFound:
        case libdepot::ErrorCode::Conflict:
        case libdepot::ErrorCode::Generic:
        case libdepot::ErrorCode::StoreUnavailable:    return "UNKNOWN";
    }
    return "UNKNOWN";
}

HttpResponse ResponseRenderer::operator()(const ApiVersionResponse&) const {
    auto json = rj::Document{rj::kObjectType};
    return makeJsonResponse(200, json);
}

HttpResponse ResponseRenderer::operator()(const HealthResponse&) const {
    auto json = rj::Document{rj::kObjectType};
    json.AddMember("status", "ok", json.GetAllocator());
    return makeJsonResponse(200, json);
}

HttpResponse ResponseRenderer::operator()(const CacheStatsResponse& response) const {
    const auto& stats = response.stats;
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    auto manifests = countEntries(stats, cache::CacheKind::ManifestByTag)
                   + countEntries(stats, cache::CacheKind::ManifestByDigest)
                   + countEntries(stats, cache::CacheKind::ManifestContent);

    auto memory = rj::Value{rj::kObjectType};
    memory.AddMember("enabled", stats.memoryEnabled, allocator);
    memory.AddMember("entries", rj::Value{static_cast<uint64_t>(stats.memory.entries)}, allocator);
    memory.AddMember("max_entries", rj::Value{static_cast<uint64_t>(stats.memory.maxEntries)}, allocator);
    memory.AddMember("manifest_count", rj::Value{static_cast<uint64_t>(manifests)}, allocator);
    memory.AddMember("tag_count",
                     rj::Value{static_cast<uint64_t>(countEntries(stats, cache::CacheKind::TagList))}, allocator);
    memory.AddMember("repository_count",
                     rj::Value{static_cast<uint64_t>(countEntries(stats, cache::CacheKind::Catalog))}, allocator);
    memory.AddMember("hits", rj::Value{static_cast<uint64_t>(stats.memory.hits)}, allocator);
    memory.AddMember("misses", rj::Value{static_cast<uint64_t>(stats.memory.misses)}, allocator);
    memory.AddMember("evictions", rj::Value{static_cast<uint64_t>(stats.memory.evictions)}, allocator);

    auto cacheStats = rj::Value{rj::kObjectType};
    cacheStats.AddMember("memory_cache", memory, allocator);
    cacheStats.AddMember("redis_configured", stats.sharedConfigured, allocator);
    cacheStats.AddMember("redis_connected", stats.sharedConnected, allocator);
    json.AddMember("cache_stats", cacheStats, allocator);
    return makeJsonResponse(200, json);
}

HttpResponse ResponseRenderer::operator()(const CatalogResponse& response) const {
    auto json = rj::Document{rj::kObjectType};
    json.AddMember("repositories", makeStringArray(response.page.entries, json.GetAllocator()), json.GetAllocator());
    auto http = makeJsonResponse(200, json);
    addPaginationLink(http, "/v2/_catalog", response.pageSize, response.page);
    return http;
}

HttpResponse ResponseRenderer::operator()(const TagListResponse& response) const {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();
    json.AddMember("name", rj::Value{response.repository.c_str(), allocator}, allocator);
    json.AddMember("tags", makeStringArray(response.page.entries, allocator), allocator);
    auto http = makeJsonResponse(200, json);
    if(response.pageSize) {
        addPaginationLink(http, "/v2/" + response.repository + "/tags/list", *response.pageSize, response.page);
    }
    return http;
}

HttpResponse ResponseRenderer::operator()(const ManifestResponse& response) const {
    auto http = HttpResponse{};
    http.status = 200;
    http.setHeader("Content-Type", response.manifest.mediaType);
    http.setHeader("Docker-Content-Digest", response.manifest.digest.string());
    http.body = response.manifest.content;
    return http;
}

HttpResponse ResponseRenderer::operator()(const ManifestCreatedResponse& response) const {
    auto http = HttpResponse{};
    http.status = 201;
    http.setHeader("Location", "/v2/" + response.repository + "/manifests/" + response.result.digest.string());
    http.setHeader("Docker-Content-Digest", response.result.digest.string());
    return http;
}

HttpResponse ResponseRenderer::operator()(const BlobResponse& response) const {
    auto http = HttpResponse{};
    http.status = 200;
    http.setHeader("Content-Type", response.blob.mediaType);
    http.setHeader("Docker-Content-Digest", response.blob.digest.string());
    if(response.content) {
        http.body = *response.content;
    }
    else {
        http.contentLength = response.blob.size;
    }
    return http;
}

HttpResponse ResponseRenderer::operator()(const BlobCreatedResponse& response) const {
    auto http = HttpResponse{};
    http.status = 201;
    http.setHeader("Location", "/v2/" + response.repository + "/blobs/" + response.blob.digest.string());
    http.setHeader("Docker-Content-Digest", response.blob.digest.string());
    return http;
}

HttpResponse ResponseRenderer::operator()(const UploadResponse& response) const {
    const auto& upload = response.upload;
    auto http = HttpResponse{};
    http.status = response.status;
    http.setHeader("Location", "/v2/" + upload.repository + "/blobs/uploads/" + upload.id);
    http.setHeader("Range", makeRange(upload.offset));
    http.setHeader("Docker-Upload-UUID", upload.id);
    return http;
}

HttpResponse ResponseRenderer::operator()(const EmptyResponse& response) const {
    auto http = HttpResponse{};
    http.status = response.status;
    return http;
}

HttpResponse ResponseRenderer::operator()(const ErrorResponse& response) const {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    auto error = rj::Value{rj::kObjectType};
    error.AddMember("code", rj::Value{getDistributionErrorCode(response.code).c_str(), allocator}, allocator);
    error.AddMember("message", rj::Value{libdepot::getErrorCodeString(response.code).c_str(), allocator}, allocator);
    error.AddMember("detail", rj::Value{response.detail.c_str(), allocator}, allocator);

    auto errors = rj::Value{rj::kArrayType};
    errors.PushBack(error, allocator);
    json.AddMember("errors", errors, allocator);
    return makeJsonResponse(getHttpStatus(response.code), json);
}

}
}
