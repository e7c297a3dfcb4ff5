/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_registry_RegistryService_hpp
#define depot_registry_RegistryService_hpp

#include <string>
#include <memory>
#include <cstddef>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Digest.hpp"
#include "common/NamingPolicy.hpp"
#include "storage/ContentStore.hpp"
#include "upload/BlobUploadManager.hpp"
#include "cache/RegistryCache.hpp"
#include "registry/Manifest.hpp"
#include "registry/ManifestStore.hpp"


namespace depot {
namespace registry {

/**
 * Operations of the registry, as consumed by the protocol handler.
 *
 * Reads of catalog, tags and manifests go through the cache with the stores
 * as loaders. Writes go to the stores and invalidate the cache before
 * returning, so that a read following a write always observes it.
 * Existence checks of blobs always consult the content store.
 */
class RegistryService {
public:
    RegistryService(std::shared_ptr<const common::Config> config,
                    std::shared_ptr<storage::ContentStore> contentStore,
                    std::shared_ptr<ManifestStore> manifestStore,
                    std::shared_ptr<upload::BlobUploadManager> uploadManager,
                    std::shared_ptr<cache::RegistryCache> cache);

    void ping() const;

    Page listRepositories(const Pagination& pagination);
    Page listTags(const std::string& repository, const Pagination& pagination);
    ManifestRecord getManifest(const std::string& repository, const std::string& reference);
    PutResult putManifest(const std::string& repository, const std::string& reference,
                          const std::string& content, const std::string& mediaType);
    DeleteResult deleteManifest(const std::string& repository, const std::string& reference);

    upload::SessionId startUpload(const std::string& repository);
    boost::optional<storage::Blob> mountBlob(const std::string& repository,
                                             const common::Digest& digest,
                                             const std::string& fromRepository);
    upload::UploadStatus getUploadStatus(const std::string& repository, const upload::SessionId& id);
    std::size_t appendChunk(const std::string& repository, const upload::SessionId& id,
                            const std::string& bytes, const boost::optional<std::size_t>& startOffset);
    storage::Blob completeUpload(const std::string& repository, const upload::SessionId& id,
                                 const std::string& finalBytes, const common::Digest& digest);
    storage::Blob uploadMonolithic(const std::string& repository, const std::string& bytes,
                                   const common::Digest& digest);
    void cancelUpload(const std::string& repository, const upload::SessionId& id);

    storage::Blob statBlob(const std::string& repository, const common::Digest& digest) const;
    std::string getBlob(const std::string& repository, const common::Digest& digest) const;
    void deleteBlob(const std::string& repository, const common::Digest& digest);

    cache::CacheStats getCacheStats() const;
    std::size_t reclaimExpiredUploads();

private:
    void ensureRepository(const std::string& repository);
    void checkSessionRepository(const std::string& repository, const upload::SessionId& id);
    std::string loadManifestContent(const common::Digest& digest);
    void invalidate(const std::string& repository, const std::vector<common::Digest>& removedManifests);
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "RegistryService";
    std::shared_ptr<storage::ContentStore> contentStore;
    std::shared_ptr<ManifestStore> manifestStore;
    std::shared_ptr<upload::BlobUploadManager> uploadManager;
    std::shared_ptr<cache::RegistryCache> cache;
    common::NamingPolicy namingPolicy;
    bool allowBlobDeletion;
};

}
}

#endif
