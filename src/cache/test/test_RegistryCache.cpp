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
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <vector>

#include "common/Config.hpp"
#include "common/Digest.hpp"
#include "cache/RegistryCache.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace depot {
namespace cache {
namespace test {

namespace {

class MapSharedCache : public SharedCache {
public:
    boost::optional<std::string> get(const std::string& key) override {
        auto value = values.find(key);
        if(!connected || value == values.cend()) {
            return boost::none;
        }
        return value->second;
    }
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds) override {
        if(connected) {
            values[key] = value;
        }
    }
    void remove(const std::string& key) override {
        values.erase(key);
    }
    bool isConnected() const override {
        return connected;
    }

    bool connected = true;
    std::map<std::string, std::string> values;
};

common::Config::Cache makeCacheConfig() {
    auto config = common::Config::Cache{};
    config.maxMemoryEntries = 100;
    return config;
}

CacheValue makeListing(const std::string& entry) {
    return CachedListing{{entry}, false};
}

CacheValue makeManifest(const std::string& content) {
    return CachedManifest{common::digest::compute(content), "application/vnd.oci.image.manifest.v1+json", content};
}

}

TEST_GROUP(RegistryCacheTestGroup) {
    std::shared_ptr<MapSharedCache> shared = std::make_shared<MapSharedCache>();
    RegistryCache cache{makeCacheConfig(), shared};
};

TEST(RegistryCacheTestGroup, getOrLoad) {
    auto key = CacheKey::tagList("alpine", boost::none, "");
    auto loads = 0;
    auto loader = [&loads]() -> CacheValue {
        ++loads;
        return makeListing("latest");
    };

    auto first = cache.getOrLoad(key, loader);
    auto second = cache.getOrLoad(key, loader);
    CHECK_EQUAL(loads, 1);
    CHECK(boost::get<CachedListing>(first).entries == boost::get<CachedListing>(second).entries);

    auto stats = cache.getStats();
    CHECK(stats.memoryEnabled);
    CHECK_EQUAL(stats.memory.hits, 1);
    CHECK_EQUAL(stats.memory.entriesPerKind[CacheKind::TagList], 1);
}

TEST(RegistryCacheTestGroup, invalidateRepository) {
    auto digest = common::digest::compute("manifest");
    cache.put(CacheKey::catalog(boost::none, ""), makeListing("alpine"));
    cache.put(CacheKey::tagList("alpine", boost::none, ""), makeListing("latest"));
    cache.put(CacheKey::tagList("alpine", std::size_t{1}, ""), makeListing("latest"));
    cache.put(CacheKey::manifestByTag("alpine", "latest"), makeManifest("manifest"));
    cache.put(CacheKey::manifestByDigest("alpine", digest), makeManifest("manifest"));
    cache.put(CacheKey::tagList("ubuntu", boost::none, ""), makeListing("22.04"));

    cache.invalidate("alpine");

    CHECK(cache.get(CacheKey::catalog(boost::none, "")) == boost::none);
    CHECK(cache.get(CacheKey::tagList("alpine", boost::none, "")) == boost::none);
    CHECK(cache.get(CacheKey::tagList("alpine", std::size_t{1}, "")) == boost::none);
    CHECK(cache.get(CacheKey::manifestByTag("alpine", "latest")) == boost::none);
    // digests are immutable, writes to tags leave them alone
    CHECK(cache.get(CacheKey::manifestByDigest("alpine", digest)) != boost::none);
    CHECK(cache.get(CacheKey::tagList("ubuntu", boost::none, "")) != boost::none);
}

TEST(RegistryCacheTestGroup, invalidateManifest) {
    auto digest = common::digest::compute("manifest");
    auto otherDigest = common::digest::compute("other");
    cache.put(CacheKey::manifestByDigest("alpine", digest), makeManifest("manifest"));
    cache.put(CacheKey::manifestByDigest("mirror/alpine", digest), makeManifest("manifest"));
    cache.put(CacheKey::manifestByDigest("alpine", otherDigest), makeManifest("other"));
    cache.put(CacheKey::manifestContent(digest), makeManifest("manifest"));

    cache.invalidateManifest(digest);

    CHECK(cache.get(CacheKey::manifestByDigest("alpine", digest)) == boost::none);
    CHECK(cache.get(CacheKey::manifestByDigest("mirror/alpine", digest)) == boost::none);
    CHECK(cache.get(CacheKey::manifestContent(digest)) == boost::none);
    CHECK(cache.get(CacheKey::manifestByDigest("alpine", otherDigest)) != boost::none);
    CHECK(shared->values.empty());
}

TEST(RegistryCacheTestGroup, onlyManifestContentIsShared) {
    auto digest = common::digest::compute("manifest");
    cache.put(CacheKey::tagList("alpine", boost::none, ""), makeListing("latest"));
    cache.put(CacheKey::manifestByTag("alpine", "latest"), makeManifest("manifest"));
    cache.put(CacheKey::manifestContent(digest), makeManifest("manifest"));

    CHECK_EQUAL(shared->values.size(), 1);
    CHECK_EQUAL(shared->values[CacheKey::manifestContent(digest).string()], std::string("manifest"));
}

TEST(RegistryCacheTestGroup, sharedTierServesOtherInstances) {
    auto digest = common::digest::compute("manifest");
    cache.put(CacheKey::manifestContent(digest), makeManifest("manifest"));

    RegistryCache otherInstance{makeCacheConfig(), shared};
    auto value = otherInstance.get(CacheKey::manifestContent(digest));
    CHECK(value != boost::none);
    CHECK_EQUAL(boost::get<CachedManifest>(*value).content, std::string("manifest"));
    CHECK(boost::get<CachedManifest>(*value).digest == digest);
}

TEST(RegistryCacheTestGroup, corruptedSharedEntryIsDiscarded) {
    auto digest = common::digest::compute("manifest");
    shared->values[CacheKey::manifestContent(digest).string()] = "tampered";

    CHECK(cache.get(CacheKey::manifestContent(digest)) == boost::none);
    CHECK(shared->values.empty());
}

TEST(RegistryCacheTestGroup, sharedTierFailureDegradesToMemory) {
    shared->connected = false;
    auto digest = common::digest::compute("manifest");
    auto loads = 0;
    auto loader = [&loads]() -> CacheValue {
        ++loads;
        return makeManifest("manifest");
    };

    cache.getOrLoad(CacheKey::manifestContent(digest), loader);
    cache.getOrLoad(CacheKey::manifestContent(digest), loader);
    CHECK_EQUAL(loads, 1);
    CHECK_FALSE(cache.getStats().sharedConnected);
    CHECK(cache.getStats().sharedConfigured);
}

TEST(RegistryCacheTestGroup, invalidationDuringLoad) {
    auto key = CacheKey::tagList("alpine", boost::none, "");
    cache.getOrLoad(key, [this]() -> CacheValue {
        // a concurrent writer
        cache.invalidate("alpine");
        return makeListing("stale");
    });
    CHECK(cache.get(key) == boost::none);
}

TEST(RegistryCacheTestGroup, concurrentLoadsNeverOutliveInvalidation) {
    auto key = CacheKey::tagList("alpine", boost::none, "");
    const auto lastVersion = 2000;

    std::mutex storeMutex;
    auto storedVersion = 0;
    auto loader = [&storeMutex, &storedVersion]() -> CacheValue {
        std::lock_guard<std::mutex> lock{storeMutex};
        return makeListing(std::to_string(storedVersion));
    };

    std::atomic<bool> writing{true};
    auto readers = std::vector<std::thread>{};
    for(int i=0; i<4; ++i) {
        readers.emplace_back([this, &key, &loader, &writing]() {
            while(writing) {
                cache.getOrLoad(key, loader);
            }
        });
    }

    for(int version=1; version<=lastVersion; ++version) {
        {
            std::lock_guard<std::mutex> lock{storeMutex};
            storedVersion = version;
        }
        cache.invalidate("alpine");
    }
    writing = false;
    for(auto& reader : readers) {
        reader.join();
    }

    // whatever is cached now was loaded after the last write
    auto cached = cache.get(key);
    if(cached) {
        CHECK_EQUAL(boost::get<CachedListing>(*cached).entries.front(), std::to_string(lastVersion));
    }
    auto value = cache.getOrLoad(key, loader);
    CHECK_EQUAL(boost::get<CachedListing>(value).entries.front(), std::to_string(lastVersion));
}

TEST(RegistryCacheTestGroup, memoryTierDisabled) {
    auto config = makeCacheConfig();
    config.enableMemory = false;
    RegistryCache sharedOnly{config, nullptr};

    auto loads = 0;
    auto loader = [&loads]() -> CacheValue {
        ++loads;
        return makeListing("latest");
    };
    auto key = CacheKey::tagList("alpine", boost::none, "");
    sharedOnly.getOrLoad(key, loader);
    sharedOnly.getOrLoad(key, loader);
    CHECK_EQUAL(loads, 2);
    CHECK_FALSE(sharedOnly.getStats().memoryEnabled);
    CHECK_FALSE(sharedOnly.getStats().sharedConfigured);
}

TEST(RegistryCacheTestGroup, clear) {
    cache.put(CacheKey::catalog(boost::none, ""), makeListing("alpine"));
    cache.clear();
    CHECK(cache.get(CacheKey::catalog(boost::none, "")) == boost::none);
}

}}}

DEPOT_UNITTEST_MAIN_FUNCTION();
