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
#include <memory>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libdepot/utility/json.hpp"
#include "libdepot/utility/string.hpp"
#include "common/Digest.hpp"
#include "storage/FilesystemContentStore.hpp"
#include "upload/BlobUploadManager.hpp"
#include "cache/RegistryCache.hpp"
#include "registry/ManifestStore.hpp"
#include "registry/RegistryService.hpp"
#include "protocol/HttpMessage.hpp"
#include "protocol/ConfigAuthorizer.hpp"
#include "protocol/ProtocolHandler.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace rj = rapidjson;

namespace depot {
namespace protocol {
namespace test {

namespace {

std::string makeManifest(const std::string& configContent) {
    auto manifest = boost::format(
        "{\"schemaVersion\":2,"
        "\"mediaType\":\"application/vnd.oci.image.manifest.v1+json\","
        "\"config\":{\"mediaType\":\"application/vnd.oci.image.config.v1+json\",\"size\":%d,\"digest\":\"%s\"},"
        "\"layers\":[]}")
        % configContent.size() % common::digest::compute(configContent);
    return manifest.str();
}

// Anonymous users can read, "admin" (password "secret") can write
void restrictAnonymousAccess(rj::Document& json) {
    auto& allocator = json.GetAllocator();
    auto user = rj::Value{rj::kObjectType};
    user.AddMember("username", "admin", allocator);
    user.AddMember("password", "secret", allocator);
    user.AddMember("access", "write", allocator);
    auto users = rj::Value{rj::kArrayType};
    users.PushBack(user, allocator);

    auto authorization = rj::Value{rj::kObjectType};
    authorization.AddMember("anonymousAccess", "read", allocator);
    authorization.AddMember("realm", "Test Registry", allocator);
    authorization.AddMember("users", users, allocator);
    json.AddMember("authorization", authorization, allocator);
}

struct HandlerFixture {
    explicit HandlerFixture(const test_utility::config::Customizer& customize = test_utility::config::Customizer{})
        : configRAII{test_utility::config::makeConfig(customize)}
    {
        const auto& config = configRAII.config;
        auto contentStore = std::make_shared<storage::FilesystemContentStore>(config->directories.blobs);
        auto manifestStore = std::make_shared<registry::ManifestStore>(config, contentStore);
        auto uploadManager = std::make_shared<upload::BlobUploadManager>(config, contentStore);
        auto cache = std::make_shared<cache::RegistryCache>(config->cache);
        auto service = std::make_shared<registry::RegistryService>(config, contentStore, manifestStore,
                                                                   uploadManager, cache);
        auto authorizer = std::make_shared<ConfigAuthorizer>(config->authorization);
        handler = std::make_shared<ProtocolHandler>(config, service, authorizer);
    }

    HttpResponse send(HttpMethod method, const std::string& target, const std::string& body = "",
                      const std::string& headerName = "", const std::string& headerValue = "") {
        auto request = HttpRequest{method, target, body};
        if(!headerName.empty()) {
            request.setHeader(headerName, headerValue);
        }
        return handler->handle(request);
    }

    test_utility::config::ConfigRAII configRAII;
    std::shared_ptr<ProtocolHandler> handler;
};

std::string getErrorCode(const HttpResponse& response) {
    auto json = libdepot::json::parse(response.body);
    return json["errors"][0]["code"].GetString();
}

}

TEST_GROUP(ProtocolHandlerTestGroup) {
    HandlerFixture fixture;
};

TEST(ProtocolHandlerTestGroup, apiVersion) {
    auto response = fixture.send(HttpMethod::Get, "/v2/");
    CHECK_EQUAL(response.status, 200);
    CHECK(response.getHeader("Docker-Distribution-API-Version") == std::string("registry/2.0"));
    CHECK_EQUAL(response.body, std::string("{}"));
}

TEST(ProtocolHandlerTestGroup, chunkedBlobUpload) {
    auto start = fixture.send(HttpMethod::Post, "/v2/library/alpine/blobs/uploads/");
    CHECK_EQUAL(start.status, 202);
    auto id = *start.getHeader("Docker-Upload-UUID");
    CHECK(start.getHeader("Location") == "/v2/library/alpine/blobs/uploads/" + id);
    CHECK(start.getHeader("Range") == std::string("0-0"));

    auto location = *start.getHeader("Location");
    auto first = std::string(1024, 'a');
    auto second = std::string(1024, 'b');

    auto patch = fixture.send(HttpMethod::Patch, location, first, "Content-Range", "0-1023");
    CHECK_EQUAL(patch.status, 202);
    CHECK(patch.getHeader("Range") == std::string("0-1023"));

    // streamed chunk, appended at the current offset
    patch = fixture.send(HttpMethod::Patch, location, second);
    CHECK_EQUAL(patch.status, 202);
    CHECK(patch.getHeader("Range") == std::string("0-2047"));

    auto status = fixture.send(HttpMethod::Get, location);
    CHECK_EQUAL(status.status, 204);
    CHECK(status.getHeader("Range") == std::string("0-2047"));

    auto digest = common::digest::compute(first + second).string();
    auto put = fixture.send(HttpMethod::Put, location + "?digest=" + libdepot::string::percentEncode(digest));
    CHECK_EQUAL(put.status, 201);
    CHECK(put.getHeader("Docker-Content-Digest") == digest);
    CHECK(put.getHeader("Location") == "/v2/library/alpine/blobs/" + digest);

    auto head = fixture.send(HttpMethod::Head, "/v2/library/alpine/blobs/" + digest);
    CHECK_EQUAL(head.status, 200);
    CHECK(head.body.empty());
    CHECK(head.contentLength == std::size_t{2048});

    auto get = fixture.send(HttpMethod::Get, "/v2/library/alpine/blobs/" + digest);
    CHECK_EQUAL(get.status, 200);
    CHECK(get.body == first + second);
}

TEST(ProtocolHandlerTestGroup, uploadErrors) {
    auto start = fixture.send(HttpMethod::Post, "/v2/library/alpine/blobs/uploads/");
    auto location = *start.getHeader("Location");

    auto mismatch = fixture.send(HttpMethod::Patch, location, "abcde", "Content-Range", "5-9");
    CHECK_EQUAL(mismatch.status, 416);
    CHECK_EQUAL(getErrorCode(mismatch), std::string("BLOB_UPLOAD_INVALID"));

    auto invalidRange = fixture.send(HttpMethod::Patch, location, "abc", "Content-Range", "0-9");
    CHECK_EQUAL(invalidRange.status, 400);

    auto wrongDigest = common::digest::compute("other").string();
    auto put = fixture.send(HttpMethod::Put, location + "?digest=" + wrongDigest, "abc");
    CHECK_EQUAL(put.status, 400);
    CHECK_EQUAL(getErrorCode(put), std::string("DIGEST_INVALID"));

    // the session was discarded on mismatch
    auto unknown = fixture.send(HttpMethod::Patch, location, "abc");
    CHECK_EQUAL(unknown.status, 404);
    CHECK_EQUAL(getErrorCode(unknown), std::string("BLOB_UPLOAD_UNKNOWN"));

    auto missingDigest = fixture.send(HttpMethod::Post, "/v2/library/alpine/blobs/uploads/");
    auto missingDigestPut = fixture.send(HttpMethod::Put, *missingDigest.getHeader("Location"), "abc");
    CHECK_EQUAL(missingDigestPut.status, 400);

    auto cancel = fixture.send(HttpMethod::Delete, *missingDigest.getHeader("Location"));
    CHECK_EQUAL(cancel.status, 204);
}

TEST(ProtocolHandlerTestGroup, monolithicUploadAndMount) {
    auto digest = common::digest::compute("layer").string();
    auto upload = fixture.send(HttpMethod::Post, "/v2/library/alpine/blobs/uploads/?digest=" + digest, "layer");
    CHECK_EQUAL(upload.status, 201);
    CHECK(upload.getHeader("Docker-Content-Digest") == digest);

    auto mount = fixture.send(HttpMethod::Post,
                              "/v2/library/busybox/blobs/uploads/?mount=" + digest + "&from=library/alpine");
    CHECK_EQUAL(mount.status, 201);
    CHECK(mount.getHeader("Location") == "/v2/library/busybox/blobs/" + digest);

    // falls back to a regular upload
    auto missing = common::digest::compute("missing").string();
    auto fallback = fixture.send(HttpMethod::Post,
                                 "/v2/library/busybox/blobs/uploads/?mount=" + missing + "&from=library/alpine");
    CHECK_EQUAL(fallback.status, 202);
    CHECK(fallback.getHeader("Docker-Upload-UUID") != boost::none);
}

TEST(ProtocolHandlerTestGroup, manifests) {
    auto manifest = makeManifest("config");
    auto digest = common::digest::compute(manifest).string();

    auto put = fixture.send(HttpMethod::Put, "/v2/library/alpine/manifests/latest", manifest,
                            "Content-Type", "application/vnd.oci.image.manifest.v1+json");
    CHECK_EQUAL(put.status, 201);
    CHECK(put.getHeader("Docker-Content-Digest") == digest);
    CHECK(put.getHeader("Location") == "/v2/library/alpine/manifests/" + digest);

    for(const auto& reference : {std::string{"latest"}, digest}) {
        auto get = fixture.send(HttpMethod::Get, "/v2/library/alpine/manifests/" + reference);
        CHECK_EQUAL(get.status, 200);
        CHECK(get.body == manifest);
        CHECK(get.getHeader("Docker-Content-Digest") == digest);
        CHECK(get.getHeader("Content-Type") == std::string("application/vnd.oci.image.manifest.v1+json"));
    }

    auto head = fixture.send(HttpMethod::Head, "/v2/library/alpine/manifests/latest");
    CHECK_EQUAL(head.status, 200);
    CHECK(head.body.empty());
    CHECK(head.contentLength == manifest.size());

    auto tags = fixture.send(HttpMethod::Get, "/v2/library/alpine/tags/list");
    CHECK_EQUAL(tags.status, 200);
    auto json = libdepot::json::parse(tags.body);
    CHECK_EQUAL(json["name"].GetString(), std::string("library/alpine"));
    CHECK_EQUAL(json["tags"].Size(), 1);
    CHECK_EQUAL(json["tags"][0].GetString(), std::string("latest"));

    auto remove = fixture.send(HttpMethod::Delete, "/v2/library/alpine/manifests/latest");
    CHECK_EQUAL(remove.status, 202);
    auto removed = fixture.send(HttpMethod::Get, "/v2/library/alpine/manifests/latest");
    CHECK_EQUAL(removed.status, 404);
    CHECK_EQUAL(getErrorCode(removed), std::string("MANIFEST_UNKNOWN"));
}

TEST(ProtocolHandlerTestGroup, manifestErrors) {
    auto invalid = fixture.send(HttpMethod::Put, "/v2/library/alpine/manifests/latest", "{}",
                                "Content-Type", "application/vnd.oci.image.manifest.v1+json");
    CHECK_EQUAL(invalid.status, 400);
    CHECK_EQUAL(getErrorCode(invalid), std::string("MANIFEST_INVALID"));

    auto manifest = makeManifest("config");
    auto otherDigest = common::digest::compute("other").string();
    auto mismatch = fixture.send(HttpMethod::Put, "/v2/library/alpine/manifests/" + otherDigest, manifest);
    CHECK_EQUAL(mismatch.status, 400);

    auto unknownRepository = fixture.send(HttpMethod::Get, "/v2/library/unknown/tags/list");
    CHECK_EQUAL(unknownRepository.status, 404);
    CHECK_EQUAL(getErrorCode(unknownRepository), std::string("NAME_UNKNOWN"));

    auto invalidName = fixture.send(HttpMethod::Get, "/v2/Library/Alpine/tags/list");
    CHECK_EQUAL(invalidName.status, 400);
    CHECK_EQUAL(getErrorCode(invalidName), std::string("NAME_INVALID"));
}

TEST(ProtocolHandlerTestGroup, catalogPagination) {
    for(const auto& repository : {"repo0", "repo1", "repo2"}) {
        fixture.send(HttpMethod::Post, std::string{"/v2/"} + repository + "/blobs/uploads/");
    }

    auto first = fixture.send(HttpMethod::Get, "/v2/_catalog?n=2");
    CHECK_EQUAL(first.status, 200);
    auto json = libdepot::json::parse(first.body);
    CHECK_EQUAL(json["repositories"].Size(), 2);
    CHECK(first.getHeader("Link") == std::string("</v2/_catalog?n=2&last=repo1>; rel=\"next\""));

    auto second = fixture.send(HttpMethod::Get, "/v2/_catalog?n=2&last=repo1");
    json = libdepot::json::parse(second.body);
    CHECK_EQUAL(json["repositories"].Size(), 1);
    CHECK_EQUAL(json["repositories"][0].GetString(), std::string("repo2"));
    CHECK(second.getHeader("Link") == boost::none);

    auto invalid = fixture.send(HttpMethod::Get, "/v2/_catalog?n=abc");
    CHECK_EQUAL(invalid.status, 400);
    CHECK_EQUAL(getErrorCode(invalid), std::string("PAGINATION_NUMBER_INVALID"));
}

TEST(ProtocolHandlerTestGroup, authorization) {
    HandlerFixture restricted{restrictAnonymousAccess};

    auto read = restricted.send(HttpMethod::Get, "/v2/");
    CHECK_EQUAL(read.status, 200);

    auto write = restricted.send(HttpMethod::Post, "/v2/library/alpine/blobs/uploads/");
    CHECK_EQUAL(write.status, 401);
    CHECK(write.getHeader("WWW-Authenticate") == std::string("Basic realm=\"Test Registry\""));
    CHECK_EQUAL(getErrorCode(write), std::string("UNAUTHORIZED"));

    // admin:secret
    auto authorized = restricted.send(HttpMethod::Post, "/v2/library/alpine/blobs/uploads/", "",
                                      "Authorization", "Basic YWRtaW46c2VjcmV0");
    CHECK_EQUAL(authorized.status, 202);
}

TEST(ProtocolHandlerTestGroup, health) {
    auto health = fixture.send(HttpMethod::Get, "/health");
    CHECK_EQUAL(health.status, 200);

    fixture.send(HttpMethod::Put, "/v2/library/alpine/manifests/latest", makeManifest("config"));
    fixture.send(HttpMethod::Get, "/v2/library/alpine/manifests/latest");
    fixture.send(HttpMethod::Get, "/v2/library/alpine/tags/list");

    auto cache = fixture.send(HttpMethod::Get, "/health/cache");
    CHECK_EQUAL(cache.status, 200);
    auto json = libdepot::json::parse(cache.body);
    const auto& stats = json["cache_stats"];
    CHECK(stats["memory_cache"]["manifest_count"].GetUint64() >= 1);
    CHECK_EQUAL(stats["memory_cache"]["tag_count"].GetUint64(), 1);
    CHECK_FALSE(stats["redis_connected"].GetBool());
}

TEST(ProtocolHandlerTestGroup, unknownRequests) {
    auto unknownPath = fixture.send(HttpMethod::Get, "/v1/_ping");
    CHECK_EQUAL(unknownPath.status, 404);

    auto unsupported = fixture.send(HttpMethod::Post, "/v2/library/alpine/tags/list");
    CHECK_EQUAL(unsupported.status, 405);
    CHECK_EQUAL(getErrorCode(unsupported), std::string("UNSUPPORTED"));
}

}
}
}

DEPOT_UNITTEST_MAIN_FUNCTION();
