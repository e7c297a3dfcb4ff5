/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_cache_MemoryCache_hpp
#define depot_cache_MemoryCache_hpp

#include <string>
#include <list>
#include <map>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <unordered_map>

#include <boost/optional.hpp>

#include "cache/CacheKey.hpp"
#include "cache/CacheValue.hpp"


namespace depot {
namespace cache {

/**
 * In-process cache with a time-to-live per kind of key and a bounded number
 * of entries. When full, expired entries are purged first, then the oldest
 * insertions are evicted.
 */
class MemoryCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Ttls {
        std::chrono::seconds catalog;
        std::chrono::seconds tagList;
        std::chrono::seconds manifest;
    };

    struct Stats {
        std::size_t entries;
        std::size_t maxEntries;
        std::map<CacheKind, std::size_t> entriesPerKind;
        std::uint64_t hits;
        std::uint64_t misses;
        std::uint64_t evictions;
    };

public:
    MemoryCache(std::size_t maxEntries, const Ttls& ttls);

    boost::optional<CacheValue> get(const CacheKey& key);
    void put(const CacheKey& key, const CacheValue& value);
    std::size_t eraseIf(const std::function<bool(const CacheKey&)>& predicate);
    std::size_t purgeExpired();
    void clear();
    Stats getStats() const;

private:
    struct Entry {
        CacheKey key;
        CacheValue value;
        Clock::time_point expiresAt;
        std::list<std::string>::iterator position;
    };
    using Entries = std::unordered_map<std::string, Entry>;

private:
    std::chrono::seconds getTtl(CacheKind kind) const;
    std::size_t purgeExpired(Clock::time_point now);
    Entries::iterator erase(Entries::iterator entry);

private:
    std::size_t maxEntries;
    Ttls ttls;

    mutable std::mutex mutex;
    Entries entries;
    std::list<std::string> insertionOrder; // oldest first
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
};

}
}

#endif
