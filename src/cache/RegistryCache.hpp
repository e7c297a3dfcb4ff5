/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_cache_RegistryCache_hpp
#define depot_cache_RegistryCache_hpp

#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Digest.hpp"
#include "cache/CacheKey.hpp"
#include "cache/CacheValue.hpp"
#include "cache/MemoryCache.hpp"
#include "cache/SharedCache.hpp"


namespace depot {
namespace cache {

struct CacheStats {
    bool memoryEnabled;
    MemoryCache::Stats memory;
    bool sharedConfigured;
    bool sharedConnected;
};

/**
 * Read-through cache in front of the manifest and tag store.
 *
 * All keys are cached in memory. Manifest content, which is immutable and
 * addressed by digest, is also cached in the shared tier, so that the
 * shared tier never serves mutable state such as tags or listings.
 *
 * Writers invalidate synchronously before reporting success. A value loaded
 * concurrently with an invalidation is returned to its reader but not cached:
 * the generation check and the insertion of a loaded value happen under the
 * same mutex that invalidations hold while they bump the generation and erase.
 */
class RegistryCache {
public:
    RegistryCache(const common::Config::Cache& config, std::shared_ptr<SharedCache> sharedCache = nullptr);

    static std::unique_ptr<RegistryCache> create(const common::Config::Cache& config);

    boost::optional<CacheValue> get(const CacheKey& key);
    void put(const CacheKey& key, const CacheValue& value);
    CacheValue getOrLoad(const CacheKey& key, const std::function<CacheValue()>& loader);
    void invalidate(const std::string& repository);
    void invalidateManifest(const common::Digest& digest);
    void clear();
    CacheStats getStats() const;

private:
    void putIfUnchanged(const CacheKey& key, const CacheValue& value, std::uint64_t generation);
    void putInSharedTier(const CacheKey& key, const CacheValue& value);
    boost::optional<CacheValue> getFromSharedTier(const CacheKey& key);
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "RegistryCache";
    std::unique_ptr<MemoryCache> memoryCache;
    std::shared_ptr<SharedCache> sharedCache;
    std::chrono::milliseconds sharedTtl;
    std::mutex invalidationMutex;
    std::atomic<std::uint64_t> generation{0};
};

}
}

#endif
