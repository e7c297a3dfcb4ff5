/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "cache/RegistryCache.hpp"

#include "libdepot/Logger.hpp"
#include "cache/RedisSharedCache.hpp"


namespace depot {
namespace cache {

RegistryCache::RegistryCache(const common::Config::Cache& config, std::shared_ptr<SharedCache> sharedCache)
    : sharedCache{std::move(sharedCache)}
    , sharedTtl{config.redis ? std::chrono::duration_cast<std::chrono::milliseconds>(config.redis->ttl)
                             : std::chrono::milliseconds{3600 * 1000}}
{
    if(config.enableMemory) {
        auto ttls = MemoryCache::Ttls{config.catalogTtl, config.tagTtl, config.manifestTtl};
        memoryCache.reset(new MemoryCache{config.maxMemoryEntries, ttls});
    }
}

/**
 * Creates the cache described by the configuration, with a Redis tier if one is configured.
 */
std::unique_ptr<RegistryCache> RegistryCache::create(const common::Config::Cache& config) {
    auto sharedCache = std::shared_ptr<SharedCache>{};
    if(config.redis) {
        sharedCache = std::make_shared<RedisSharedCache>(*config.redis);
    }
    return std::unique_ptr<RegistryCache>{new RegistryCache{config, sharedCache}};
}

boost::optional<CacheValue> RegistryCache::get(const CacheKey& key) {
    if(memoryCache) {
        auto value = memoryCache->get(key);
        if(value) {
            return value;
        }
    }
    return getFromSharedTier(key);
}

void RegistryCache::put(const CacheKey& key, const CacheValue& value) {
    if(memoryCache) {
        memoryCache->put(key, value);
    }
    putInSharedTier(key, value);
}

CacheValue RegistryCache::getOrLoad(const CacheKey& key, const std::function<CacheValue()>& loader) {
    auto cached = get(key);
    if(cached) {
        printLog(boost::format("Cache hit for %s") % key, libdepot::LogLevel::DEBUG);
        return *cached;
    }

    auto generationBeforeLoad = generation.load();
    auto value = loader();
    putIfUnchanged(key, value, generationBeforeLoad);
    return value;
}

/**
 * Drops the state of the repository that a write can change: catalog pages,
 * tag lists and manifests resolved by tag.
 */
void RegistryCache::invalidate(const std::string& repository) {
    std::lock_guard<std::mutex> lock{invalidationMutex};
    ++generation;
    if(!memoryCache) {
        return;
    }
    auto erased = memoryCache->eraseIf([&repository](const CacheKey& key) {
        return key.getKind() == CacheKind::Catalog
            || (key.getRepository() == repository
                && (key.getKind() == CacheKind::TagList || key.getKind() == CacheKind::ManifestByTag));
    });
    printLog(boost::format("Invalidated %d cache entries of repository %s") % erased % repository,
             libdepot::LogLevel::DEBUG);
}

void RegistryCache::invalidateManifest(const common::Digest& digest) {
    {
        std::lock_guard<std::mutex> lock{invalidationMutex};
        ++generation;
        auto digestString = digest.string();
        if(memoryCache) {
            memoryCache->eraseIf([&digestString](const CacheKey& key) {
                return (key.getKind() == CacheKind::ManifestByDigest || key.getKind() == CacheKind::ManifestContent)
                    && key.getReference() == digestString;
            });
        }
    }
    if(sharedCache) {
        sharedCache->remove(CacheKey::manifestContent(digest).string());
    }
}

void RegistryCache::clear() {
    std::lock_guard<std::mutex> lock{invalidationMutex};
    ++generation;
    if(memoryCache) {
        memoryCache->clear();
    }
}

CacheStats RegistryCache::getStats() const {
    auto stats = CacheStats{};
    stats.memoryEnabled = static_cast<bool>(memoryCache);
    if(memoryCache) {
        stats.memory = memoryCache->getStats();
    }
    stats.sharedConfigured = static_cast<bool>(sharedCache);
    stats.sharedConnected = sharedCache && sharedCache->isConnected();
    return stats;
}

void RegistryCache::putIfUnchanged(const CacheKey& key, const CacheValue& value, std::uint64_t generationBeforeLoad) {
    {
        std::lock_guard<std::mutex> lock{invalidationMutex};
        if(generation.load() != generationBeforeLoad) {
            printLog(boost::format("Not caching %s, invalidated while loading") % key, libdepot::LogLevel::DEBUG);
            return;
        }
        if(memoryCache) {
            memoryCache->put(key, value);
        }
    }
    // immutable content, written outside the lock
    putInSharedTier(key, value);
}

void RegistryCache::putInSharedTier(const CacheKey& key, const CacheValue& value) {
    if(sharedCache && key.getKind() == CacheKind::ManifestContent) {
        sharedCache->set(key.string(), boost::get<CachedManifest>(value).content, sharedTtl);
    }
}

/**
 * Content from the shared tier is checked against its digest before use,
 * since other processes write to the tier too.
 */
boost::optional<CacheValue> RegistryCache::getFromSharedTier(const CacheKey& key) {
    if(!sharedCache || key.getKind() != CacheKind::ManifestContent) {
        return boost::none;
    }

    auto content = sharedCache->get(key.string());
    if(!content) {
        return boost::none;
    }

    auto digest = common::Digest::parse(key.getReference());
    if(!common::digest::matches(*content, digest)) {
        printLog(boost::format("Discarding shared cache entry %s, its content doesn't match the digest") % key,
                 libdepot::LogLevel::WARN);
        sharedCache->remove(key.string());
        return boost::none;
    }

    auto value = CacheValue{CachedManifest{digest, "", std::move(*content)}};
    if(memoryCache) {
        memoryCache->put(key, value);
    }
    return boost::optional<CacheValue>{std::move(value)};
}

void RegistryCache::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                             std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
