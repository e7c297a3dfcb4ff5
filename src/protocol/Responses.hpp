/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_protocol_Responses_hpp
#define depot_protocol_Responses_hpp

#include <string>
#include <vector>
#include <cstddef>

#include <boost/variant.hpp>
#include <boost/optional.hpp>

#include "libdepot/Error.hpp"
#include "storage/ContentStore.hpp"
#include "upload/BlobUploadManager.hpp"
#include "cache/RegistryCache.hpp"
#include "registry/Manifest.hpp"
#include "registry/ManifestStore.hpp"
#include "protocol/HttpMessage.hpp"


namespace depot {
namespace protocol {

struct ApiVersionResponse {};

struct HealthResponse {};

struct CacheStatsResponse {
    cache::CacheStats stats;
};

struct CatalogResponse {
    registry::Page page;
    std::size_t pageSize; // used to build the link to the next page
};

struct TagListResponse {
    std::string repository;
    registry::Page page;
    boost::optional<std::size_t> pageSize;
};

struct ManifestResponse {
    registry::ManifestRecord manifest;
};

struct ManifestCreatedResponse {
    std::string repository;
    registry::PutResult result;
};

struct BlobResponse {
    storage::Blob blob;
    boost::optional<std::string> content; // none for HEAD requests
};

struct BlobCreatedResponse {
    std::string repository;
    storage::Blob blob;
};

struct UploadResponse {
    unsigned status;
    upload::UploadStatus upload;
};

struct EmptyResponse {
    unsigned status;
};

struct ErrorResponse {
    libdepot::ErrorCode code;
    std::string detail;
};

using Response = boost::variant<ApiVersionResponse,
                                HealthResponse,
                                CacheStatsResponse,
                                CatalogResponse,
                                TagListResponse,
                                ManifestResponse,
                                ManifestCreatedResponse,
                                BlobResponse,
                                BlobCreatedResponse,
                                UploadResponse,
                                EmptyResponse,
                                ErrorResponse>;

unsigned getHttpStatus(libdepot::ErrorCode code);
std::string getDistributionErrorCode(libdepot::ErrorCode code);

/**
 * Renders the typed responses to HTTP responses. The headers common to all
 * responses (API version, authentication challenge) are added by the
 * protocol handler.
 */
class ResponseRenderer : public boost::static_visitor<HttpResponse> {
public:
    HttpResponse operator()(const ApiVersionResponse&) const;
    HttpResponse operator()(const HealthResponse&) const;
    HttpResponse operator()(const CacheStatsResponse& response) const;
    HttpResponse operator()(const CatalogResponse& response) const;
    HttpResponse operator()(const TagListResponse& response) const;
    HttpResponse operator()(const ManifestResponse& response) const;
    HttpResponse operator()(const ManifestCreatedResponse& response) const;
    HttpResponse operator()(const BlobResponse& response) const;
    HttpResponse operator()(const BlobCreatedResponse& response) const;
    HttpResponse operator()(const UploadResponse& response) const;
    HttpResponse operator()(const EmptyResponse& response) const;
    HttpResponse operator()(const ErrorResponse& response) const;
};

}
}

#endif
