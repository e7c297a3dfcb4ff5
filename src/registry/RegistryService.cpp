/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "registry/RegistryService.hpp"

#include <vector>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"


namespace depot {
namespace registry {

namespace {

Page toPage(const cache::CacheValue& value) {
    const auto& listing = boost::get<cache::CachedListing>(value);
    auto page = Page{};
    page.entries = listing.entries;
    page.truncated = listing.truncated;
    return page;
}

cache::CacheValue toCacheValue(const Page& page) {
    return cache::CachedListing{page.entries, page.truncated};
}

}

RegistryService::RegistryService(std::shared_ptr<const common::Config> config,
                                 std::shared_ptr<storage::ContentStore> contentStore,
                                 std::shared_ptr<ManifestStore> manifestStore,
                                 std::shared_ptr<upload::BlobUploadManager> uploadManager,
                                 std::shared_ptr<cache::RegistryCache> cache)
    : contentStore{std::move(contentStore)}
    , manifestStore{std::move(manifestStore)}
    , uploadManager{std::move(uploadManager)}
    , cache{std::move(cache)}
    , namingPolicy{config->registry.maxRepositoryNameLength, config->registry.maxTagLength}
    , allowBlobDeletion{config->registry.allowBlobDeletion}
{}

void RegistryService::ping() const {
    contentStore->healthCheck();
}

Page RegistryService::listRepositories(const Pagination& pagination) {
    auto key = cache::CacheKey::catalog(pagination.n, pagination.last);
    auto value = cache->getOrLoad(key, [this, &pagination]() {
        return toCacheValue(manifestStore->listRepositories(pagination));
    });
    return toPage(value);
}

Page RegistryService::listTags(const std::string& repository, const Pagination& pagination) {
    namingPolicy.validateRepositoryName(repository);
    auto key = cache::CacheKey::tagList(repository, pagination.n, pagination.last);
    auto value = cache->getOrLoad(key, [this, &repository, &pagination]() {
        return toCacheValue(manifestStore->listTags(repository, pagination));
    });
    return toPage(value);
}

/**
 * The manifest store resolves the reference on a miss. The content itself is
 * looked up by digest, so that it can be served by the shared cache tier.
 */
ManifestRecord RegistryService::getManifest(const std::string& repository, const std::string& reference) {
    namingPolicy.validateRepositoryName(repository);

    auto key = common::NamingPolicy::isDigestReference(reference)
        ? cache::CacheKey::manifestByDigest(repository, common::Digest::parse(reference))
        : cache::CacheKey::manifestByTag(repository, reference);

    auto value = cache->getOrLoad(key, [this, &repository, &reference]() -> cache::CacheValue {
        auto descriptor = manifestStore->resolveManifest(repository, reference);
        auto content = loadManifestContent(descriptor.digest);
        return cache::CachedManifest{descriptor.digest, descriptor.mediaType, content};
    });

    const auto& manifest = boost::get<cache::CachedManifest>(value);
    return ManifestRecord{manifest.digest, manifest.mediaType, manifest.content};
}

PutResult RegistryService::putManifest(const std::string& repository, const std::string& reference,
                                       const std::string& content, const std::string& mediaType) {
    ensureRepository(repository);
    auto result = manifestStore->putManifest(repository, reference, content, mediaType);
    invalidate(repository, result.removed);
    return result;
}

DeleteResult RegistryService::deleteManifest(const std::string& repository, const std::string& reference) {
    auto result = manifestStore->deleteManifest(repository, reference);
    invalidate(repository, result.removedManifests);
    return result;
}

upload::SessionId RegistryService::startUpload(const std::string& repository) {
    ensureRepository(repository);
    return uploadManager->start(repository);
}

/**
 * Returns none if the blob can't be mounted, in which case the client is
 * expected to upload it.
 */
boost::optional<storage::Blob> RegistryService::mountBlob(const std::string& repository,
                                                          const common::Digest& digest,
                                                          const std::string& fromRepository) {
    namingPolicy.validateRepositoryName(repository);
    if(!manifestStore->repositoryExists(fromRepository)) {
        printLog(boost::format("Cannot mount blob %s from unknown repository %s") % digest % fromRepository,
                 libdepot::LogLevel::DEBUG);
        return boost::none;
    }

    auto info = contentStore->stat(digest);
    if(!info) {
        return boost::none;
    }

    ensureRepository(repository);
    printLog(boost::format("Mounted blob %s from repository %s into %s") % digest % fromRepository % repository,
             libdepot::LogLevel::INFO);
    return storage::Blob{digest, info->size, storage::defaultBlobMediaType, info->created};
}

upload::UploadStatus RegistryService::getUploadStatus(const std::string& repository, const upload::SessionId& id) {
    checkSessionRepository(repository, id);
    return uploadManager->getStatus(id);
}

std::size_t RegistryService::appendChunk(const std::string& repository, const upload::SessionId& id,
                                         const std::string& bytes, const boost::optional<std::size_t>& startOffset) {
    checkSessionRepository(repository, id);
    if(startOffset) {
        return uploadManager->appendChunk(id, bytes, *startOffset);
    }
    return uploadManager->appendChunk(id, bytes);
}

storage::Blob RegistryService::completeUpload(const std::string& repository, const upload::SessionId& id,
                                              const std::string& finalBytes, const common::Digest& digest) {
    checkSessionRepository(repository, id);
    return uploadManager->complete(id, finalBytes, digest);
}

storage::Blob RegistryService::uploadMonolithic(const std::string& repository, const std::string& bytes,
                                                const common::Digest& digest) {
    auto id = startUpload(repository);
    try {
        return uploadManager->complete(id, bytes, digest);
    }
    catch(libdepot::Error& e) {
        uploadManager->cancel(id);
        auto message = boost::format("Failed monolithic upload of blob %s to repository %s") % digest % repository;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Cancelling a session that is already gone succeeds.
 */
void RegistryService::cancelUpload(const std::string& repository, const upload::SessionId& id) {
    try {
        checkSessionRepository(repository, id);
    }
    catch(const libdepot::Error& e) {
        if(e.getErrorCode() != libdepot::ErrorCode::SessionNotFound) {
            throw;
        }
        printLog(boost::format("Cancel of unknown upload session %s of repository %s") % id % repository,
                 libdepot::LogLevel::DEBUG);
        return;
    }
    uploadManager->cancel(id);
}

storage::Blob RegistryService::statBlob(const std::string& repository, const common::Digest& digest) const {
    namingPolicy.validateRepositoryName(repository);
    auto info = contentStore->stat(digest);
    if(!info) {
        auto message = boost::format("Blob %s is not known") % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::BlobUnknown, message.str());
    }
    return storage::Blob{digest, info->size, storage::defaultBlobMediaType, info->created};
}

std::string RegistryService::getBlob(const std::string& repository, const common::Digest& digest) const {
    namingPolicy.validateRepositoryName(repository);
    auto content = contentStore->get(digest);
    if(!content) {
        auto message = boost::format("Blob %s is not known") % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::BlobUnknown, message.str());
    }
    return std::move(*content);
}

void RegistryService::deleteBlob(const std::string& repository, const common::Digest& digest) {
    namingPolicy.validateRepositoryName(repository);
    if(!allowBlobDeletion) {
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::Unsupported, "Deletion of blobs is disabled");
    }
    if(!contentStore->remove(digest)) {
        auto message = boost::format("Blob %s is not known") % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::BlobUnknown, message.str());
    }
    cache->invalidateManifest(digest);
    printLog(boost::format("Deleted blob %s") % digest, libdepot::LogLevel::INFO);
}

cache::CacheStats RegistryService::getCacheStats() const {
    return cache->getStats();
}

std::size_t RegistryService::reclaimExpiredUploads() {
    return uploadManager->reclaimExpired();
}

// A new repository changes the catalog
void RegistryService::ensureRepository(const std::string& repository) {
    if(manifestStore->repositoryExists(repository)) {
        return;
    }
    manifestStore->ensureRepository(repository);
    cache->invalidate(repository);
}

void RegistryService::checkSessionRepository(const std::string& repository, const upload::SessionId& id) {
    namingPolicy.validateRepositoryName(repository);
    auto status = uploadManager->getStatus(id);
    if(status.repository != repository) {
        auto message = boost::format("Upload session %s doesn't belong to repository %s") % id % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::SessionNotFound, message.str());
    }
}

std::string RegistryService::loadManifestContent(const common::Digest& digest) {
    auto key = cache::CacheKey::manifestContent(digest);
    auto value = cache->getOrLoad(key, [this, &digest]() -> cache::CacheValue {
        auto content = contentStore->get(digest);
        if(!content) {
            auto message = boost::format("Content of manifest %s is missing from the content store") % digest;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
        }
        return cache::CachedManifest{digest, "", std::move(*content)};
    });
    return boost::get<cache::CachedManifest>(value).content;
}

void RegistryService::invalidate(const std::string& repository, const std::vector<common::Digest>& removedManifests) {
    cache->invalidate(repository);
    for(const auto& digest : removedManifests) {
        cache->invalidateManifest(digest);
    }
}

void RegistryService::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                               std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
