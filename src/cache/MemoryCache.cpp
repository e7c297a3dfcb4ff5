/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "cache/MemoryCache.hpp"


namespace depot {
namespace cache {

MemoryCache::MemoryCache(std::size_t maxEntries, const Ttls& ttls)
    : maxEntries{maxEntries}
    , ttls(ttls)
{}

boost::optional<CacheValue> MemoryCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock{mutex};

    auto entry = entries.find(key.string());
    if(entry == entries.end()) {
        ++misses;
        return boost::none;
    }
    if(entry->second.expiresAt <= Clock::now()) {
        erase(entry);
        ++misses;
        return boost::none;
    }

    ++hits;
    return entry->second.value;
}

void MemoryCache::put(const CacheKey& key, const CacheValue& value) {
    if(maxEntries == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock{mutex};
    auto now = Clock::now();
    auto id = key.string();

    auto existing = entries.find(id);
    if(existing != entries.end()) {
        erase(existing);
    }

    if(entries.size() >= maxEntries) {
        purgeExpired(now);
    }
    while(entries.size() >= maxEntries) {
        erase(entries.find(insertionOrder.front()));
        ++evictions;
    }

    auto position = insertionOrder.insert(insertionOrder.end(), id);
    entries.emplace(id, Entry{key, value, now + getTtl(key.getKind()), position});
}

std::size_t MemoryCache::eraseIf(const std::function<bool(const CacheKey&)>& predicate) {
    std::lock_guard<std::mutex> lock{mutex};

    auto erased = std::size_t{0};
    for(auto entry = entries.begin(); entry != entries.end(); ) {
        if(predicate(entry->second.key)) {
            entry = erase(entry);
            ++erased;
        }
        else {
            ++entry;
        }
    }
    return erased;
}

std::size_t MemoryCache::purgeExpired() {
    std::lock_guard<std::mutex> lock{mutex};
    return purgeExpired(Clock::now());
}

void MemoryCache::clear() {
    std::lock_guard<std::mutex> lock{mutex};
    entries.clear();
    insertionOrder.clear();
}

MemoryCache::Stats MemoryCache::getStats() const {
    std::lock_guard<std::mutex> lock{mutex};

    auto stats = Stats{entries.size(), maxEntries, {}, hits, misses, evictions};
    for(const auto& entry : entries) {
        ++stats.entriesPerKind[entry.second.key.getKind()];
    }
    return stats;
}

std::chrono::seconds MemoryCache::getTtl(CacheKind kind) const {
    switch(kind) {
        case CacheKind::Catalog:
            return ttls.catalog;
        case CacheKind::TagList:
        case CacheKind::ManifestByTag:
            return ttls.tagList;
        case CacheKind::ManifestByDigest:
        case CacheKind::ManifestContent:
            return ttls.manifest;
    }
    return ttls.catalog;
}

std::size_t MemoryCache::purgeExpired(Clock::time_point now) {
    auto purged = std::size_t{0};
    for(auto entry = entries.begin(); entry != entries.end(); ) {
        if(entry->second.expiresAt <= now) {
            entry = erase(entry);
            ++purged;
        }
        else {
            ++entry;
        }
    }
    return purged;
}

MemoryCache::Entries::iterator MemoryCache::erase(Entries::iterator entry) {
    insertionOrder.erase(entry->second.position);
    return entries.erase(entry);
}

}
}
