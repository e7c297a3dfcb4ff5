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
#include <atomic>
#include <thread>
#include <vector>
#include <algorithm>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libdepot/Error.hpp"
#include "common/Digest.hpp"
#include "storage/FilesystemContentStore.hpp"
#include "upload/BlobUploadManager.hpp"
#include "cache/RegistryCache.hpp"
#include "registry/ManifestStore.hpp"
#include "registry/RegistryService.hpp"
#include "test_utility/config.hpp"
#include "test_utility/errors.hpp"
#include "test_utility/unittest_main_function.hpp"

using test_utility::errors::getErrorCode;

namespace depot {
namespace registry {
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

struct ServiceFixture {
    explicit ServiceFixture(const test_utility::config::Customizer& customize = test_utility::config::Customizer{})
        : configRAII{test_utility::config::makeConfig(customize)}
        , contentStore{std::make_shared<storage::FilesystemContentStore>(configRAII.config->directories.blobs)}
        , manifestStore{std::make_shared<ManifestStore>(configRAII.config, contentStore)}
        , uploadManager{std::make_shared<upload::BlobUploadManager>(configRAII.config, contentStore)}
        , cache{std::make_shared<cache::RegistryCache>(configRAII.config->cache)}
        , service{configRAII.config, contentStore, manifestStore, uploadManager, cache}
    {}

    test_utility::config::ConfigRAII configRAII;
    std::shared_ptr<storage::FilesystemContentStore> contentStore;
    std::shared_ptr<ManifestStore> manifestStore;
    std::shared_ptr<upload::BlobUploadManager> uploadManager;
    std::shared_ptr<cache::RegistryCache> cache;
    RegistryService service;
};

}

TEST_GROUP(RegistryServiceTestGroup) {
    ServiceFixture fixture;
    RegistryService& service = fixture.service;
};

TEST(RegistryServiceTestGroup, ping) {
    service.ping();
}

TEST(RegistryServiceTestGroup, chunkedUploadThenStat) {
    auto bytes = std::string(2048, 'x');
    auto digest = common::digest::compute(bytes);

    auto id = service.startUpload("library/alpine");
    CHECK_EQUAL(service.getUploadStatus("library/alpine", id).offset, 0);
    CHECK_EQUAL(service.appendChunk("library/alpine", id, bytes.substr(0, 1024), boost::none), 1024);
    CHECK_EQUAL(service.appendChunk("library/alpine", id, bytes.substr(1024), std::size_t{1024}), 2048);

    auto blob = service.completeUpload("library/alpine", id, "", digest);
    CHECK(blob.digest == digest);
    CHECK_EQUAL(blob.size, 2048);

    auto stat = service.statBlob("library/alpine", digest);
    CHECK_EQUAL(stat.size, 2048);
    CHECK(service.getBlob("library/alpine", digest) == bytes);

    // the upload created the repository
    auto catalog = service.listRepositories(Pagination{});
    CHECK_EQUAL(catalog.entries.size(), 1);
    CHECK_EQUAL(catalog.entries[0], std::string("library/alpine"));
}

TEST(RegistryServiceTestGroup, uploadSessionBelongsToRepository) {
    auto id = service.startUpload("library/alpine");
    CHECK(getErrorCode([&]() { service.getUploadStatus("library/busybox", id); })
          == libdepot::ErrorCode::SessionNotFound);
    CHECK(getErrorCode([&]() { service.appendChunk("library/busybox", id, "abc", boost::none); })
          == libdepot::ErrorCode::SessionNotFound);

    // the owner can still use it
    CHECK_EQUAL(service.appendChunk("library/alpine", id, "abc", boost::none), 3);
}

TEST(RegistryServiceTestGroup, cancelUploadIsIdempotent) {
    auto id = service.startUpload("library/alpine");
    service.cancelUpload("library/alpine", id);
    service.cancelUpload("library/alpine", id);
    service.cancelUpload("library/alpine", "unknown-session");
    CHECK(getErrorCode([&]() { service.getUploadStatus("library/alpine", id); })
          == libdepot::ErrorCode::SessionNotFound);
}

TEST(RegistryServiceTestGroup, monolithicUpload) {
    auto digest = common::digest::compute("layer");
    auto blob = service.uploadMonolithic("library/alpine", "layer", digest);
    CHECK(blob.digest == digest);
    CHECK_EQUAL(blob.size, 5);

    auto wrongDigest = common::digest::compute("other");
    CHECK(getErrorCode([&]() { service.uploadMonolithic("library/alpine", "layer2", wrongDigest); })
          == libdepot::ErrorCode::DigestMismatch);
    CHECK_EQUAL(fixture.uploadManager->countSessions(), 0);
}

TEST(RegistryServiceTestGroup, unknownBlob) {
    auto digest = common::digest::compute("missing");
    CHECK(getErrorCode([&]() { service.statBlob("library/alpine", digest); })
          == libdepot::ErrorCode::BlobUnknown);
    CHECK(getErrorCode([&]() { service.getBlob("library/alpine", digest); })
          == libdepot::ErrorCode::BlobUnknown);
    CHECK(getErrorCode([&]() { service.statBlob("Invalid", digest); })
          == libdepot::ErrorCode::RepositoryInvalid);
}

TEST(RegistryServiceTestGroup, mountBlob) {
    auto digest = common::digest::compute("layer");
    service.uploadMonolithic("library/alpine", "layer", digest);

    auto mounted = service.mountBlob("library/busybox", digest, "library/alpine");
    CHECK(mounted != boost::none);
    CHECK(mounted->digest == digest);
    CHECK_EQUAL(mounted->size, 5);
    CHECK(fixture.manifestStore->repositoryExists("library/busybox"));

    CHECK(service.mountBlob("library/busybox", digest, "library/unknown") == boost::none);
    CHECK(service.mountBlob("library/busybox", common::digest::compute("missing"), "library/alpine") == boost::none);
}

TEST(RegistryServiceTestGroup, deleteBlob) {
    auto digest = common::digest::compute("layer");
    service.uploadMonolithic("library/alpine", "layer", digest);
    service.deleteBlob("library/alpine", digest);
    CHECK(getErrorCode([&]() { service.statBlob("library/alpine", digest); })
          == libdepot::ErrorCode::BlobUnknown);
    CHECK(getErrorCode([&]() { service.deleteBlob("library/alpine", digest); })
          == libdepot::ErrorCode::BlobUnknown);
}

TEST(RegistryServiceTestGroup, deleteBlobDisabled) {
    ServiceFixture disabledFixture{[](rapidjson::Document& json) {
        json["registry"]["allowBlobDeletion"] = false;
    }};
    auto& disabledService = disabledFixture.service;

    auto digest = common::digest::compute("layer");
    disabledService.uploadMonolithic("library/alpine", "layer", digest);
    CHECK(getErrorCode([&]() { disabledService.deleteBlob("library/alpine", digest); })
          == libdepot::ErrorCode::Unsupported);
    CHECK(disabledFixture.contentStore->exists(digest));
}

TEST(RegistryServiceTestGroup, repeatedGetsReturnIdenticalBytes) {
    auto manifest = makeManifest("alpine config");
    service.putManifest("library/alpine", "latest", manifest, mediaTypes::ociManifest);

    auto first = service.getManifest("library/alpine", "latest");
    auto second = service.getManifest("library/alpine", "latest");
    auto byDigest = service.getManifest("library/alpine", first.digest.string());
    CHECK(first.content == manifest);
    CHECK(second.content == manifest);
    CHECK(byDigest.content == manifest);
    CHECK(first.digest == common::digest::compute(manifest));
    CHECK_EQUAL(second.mediaType, std::string(mediaTypes::ociManifest));

    CHECK(service.getCacheStats().memory.hits >= 1);
}

TEST(RegistryServiceTestGroup, readsReflectWritesImmediately) {
    auto first = makeManifest("first");
    auto second = makeManifest("second");

    service.putManifest("library/alpine", "latest", first, mediaTypes::ociManifest);
    CHECK(service.getManifest("library/alpine", "latest").content == first);
    CHECK_EQUAL(service.listTags("library/alpine", Pagination{}).entries.size(), 1);

    // cached entries for the tag and for the listing are invalidated
    service.putManifest("library/alpine", "3.18", first, mediaTypes::ociManifest);
    service.putManifest("library/alpine", "latest", second, mediaTypes::ociManifest);
    CHECK(service.getManifest("library/alpine", "latest").content == second);

    auto tags = service.listTags("library/alpine", Pagination{});
    CHECK_EQUAL(tags.entries.size(), 2);
    CHECK_EQUAL(tags.entries[0], std::string("3.18"));
    CHECK_EQUAL(tags.entries[1], std::string("latest"));

    service.deleteManifest("library/alpine", "3.18");
    CHECK(getErrorCode([&]() { service.getManifest("library/alpine", "3.18"); })
          == libdepot::ErrorCode::ManifestUnknown);
    CHECK_EQUAL(service.listTags("library/alpine", Pagination{}).entries.size(), 1);

    // the first manifest was dropped along with its last tag
    auto firstDigest = common::digest::compute(first).string();
    CHECK(getErrorCode([&]() { service.getManifest("library/alpine", firstDigest); })
          == libdepot::ErrorCode::ManifestUnknown);
}

TEST(RegistryServiceTestGroup, concurrentPushesOfSameTag) {
    const auto numberOfPushers = 8;
    auto manifests = std::vector<std::string>{};
    for(int i=0; i<numberOfPushers; ++i) {
        manifests.push_back(makeManifest("config " + std::to_string(i)));
    }

    std::atomic<int> failures{0};
    auto pushers = std::vector<std::thread>{};
    for(int i=0; i<numberOfPushers; ++i) {
        pushers.emplace_back([this, &manifests, &failures, i]() {
            try {
                service.putManifest("library/alpine", "latest", manifests[i], mediaTypes::ociManifest);
            }
            catch(const libdepot::Error&) {
                ++failures;
            }
        });
    }
    for(auto& pusher : pushers) {
        pusher.join();
    }
    CHECK_EQUAL(failures.load(), 0);

    // last writer wins, with a single tag entry
    auto tags = service.listTags("library/alpine", Pagination{});
    CHECK_EQUAL(tags.entries.size(), 1);
    CHECK_EQUAL(tags.entries[0], std::string("latest"));

    auto latest = service.getManifest("library/alpine", "latest");
    CHECK(std::find(manifests.cbegin(), manifests.cend(), latest.content) != manifests.cend());

    // the manifests that lost the race are no longer referenced
    for(const auto& manifest : manifests) {
        if(manifest == latest.content) {
            continue;
        }
        auto digest = common::digest::compute(manifest).string();
        CHECK(getErrorCode([&]() { service.getManifest("library/alpine", digest); })
              == libdepot::ErrorCode::ManifestUnknown);
    }
}

TEST(RegistryServiceTestGroup, tagListReflectsWritesRacingWithReads) {
    const auto numberOfTags = 50;
    auto manifest = makeManifest("alpine config");
    service.putManifest("library/alpine", "tag-0", manifest, mediaTypes::ociManifest);

    std::atomic<bool> writing{true};
    std::atomic<int> failures{0};
    auto readers = std::vector<std::thread>{};
    for(int i=0; i<4; ++i) {
        readers.emplace_back([this, &writing, &failures]() {
            while(writing) {
                try {
                    service.listTags("library/alpine", Pagination{});
                    service.listRepositories(Pagination{});
                }
                catch(const libdepot::Error&) {
                    ++failures;
                }
            }
        });
    }

    for(int i=1; i<numberOfTags; ++i) {
        service.putManifest("library/alpine", "tag-" + std::to_string(i), manifest, mediaTypes::ociManifest);
    }
    service.putManifest("library/busybox", "latest", manifest, mediaTypes::ociManifest);
    writing = false;
    for(auto& reader : readers) {
        reader.join();
    }

    CHECK_EQUAL(failures.load(), 0);
    CHECK_EQUAL(service.listTags("library/alpine", Pagination{}).entries.size(), numberOfTags);
    CHECK_EQUAL(service.listRepositories(Pagination{}).entries.size(), 2);
}

TEST(RegistryServiceTestGroup, catalogReflectsNewRepositories) {
    CHECK(service.listRepositories(Pagination{}).entries.empty());
    service.putManifest("library/alpine", "latest", makeManifest("a"), mediaTypes::ociManifest);
    CHECK_EQUAL(service.listRepositories(Pagination{}).entries.size(), 1);
    service.startUpload("library/busybox");
    CHECK_EQUAL(service.listRepositories(Pagination{}).entries.size(), 2);

    auto page = service.listRepositories(Pagination{std::size_t{1}, ""});
    CHECK_EQUAL(page.entries.size(), 1);
    CHECK(page.truncated);
}

TEST(RegistryServiceTestGroup, manifestErrors) {
    CHECK(getErrorCode([&]() { service.getManifest("library/alpine", "latest"); })
          == libdepot::ErrorCode::NameUnknown);
    CHECK(getErrorCode([&]() { service.putManifest("library/alpine", "latest", "not json", ""); })
          == libdepot::ErrorCode::ManifestInvalid);
    CHECK(getErrorCode([&]() { service.getManifest("library/alpine", "sha256:abc"); })
          == libdepot::ErrorCode::DigestInvalid);
    CHECK(getErrorCode([&]() { service.listTags("UPPER", Pagination{}); })
          == libdepot::ErrorCode::RepositoryInvalid);
}

}
}
}

DEPOT_UNITTEST_MAIN_FUNCTION();
