/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_registry_ManifestStore_hpp
#define depot_registry_ManifestStore_hpp

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <cstddef>
#include <iostream>
#include <unordered_map>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "libdepot/LogLevel.hpp"
#include "libdepot/Flock.hpp"
#include "common/Config.hpp"
#include "common/Digest.hpp"
#include "common/NamingPolicy.hpp"
#include "storage/ContentStore.hpp"
#include "registry/Manifest.hpp"


namespace depot {
namespace registry {

struct Pagination {
    boost::optional<std::size_t> n;
    std::string last;
};

struct Page {
    std::vector<std::string> entries;
    bool truncated = false; // more entries follow the last one returned
};

struct PutResult {
    common::Digest digest;
    std::string mediaType;
    std::vector<common::Digest> removed;
};

struct ManifestDescriptor {
    common::Digest digest;
    std::string mediaType;
    std::size_t size;
};

struct DeleteResult {
    std::vector<std::string> removedTags;
    std::vector<common::Digest> removedManifests;
};

/**
 * Content-addressed manifest persistence plus the mutable tag index.
 *
 * Manifest bytes live in the content store under their digest. Which
 * manifests belong to a repository and where its tags point is recorded in
 * <repositories>/<name>/_metadata.json, the list of repositories in
 * <repositories>/_catalog.json. Both files are replaced atomically, so that
 * readers never need a lock. Writers to the same repository are serialized
 * by a mutex of this process and by an advisory file lock held against
 * other processes sharing the same root directory.
 */
class ManifestStore {
public:
    ManifestStore(std::shared_ptr<const common::Config> config,
                  std::shared_ptr<storage::ContentStore> contentStore);

    bool createRepository(const std::string& repository);
    void ensureRepository(const std::string& repository);
    bool repositoryExists(const std::string& repository) const;
    DeleteResult deleteRepository(const std::string& repository);

    PutResult putManifest(const std::string& repository,
                          const std::string& reference,
                          const std::string& content,
                          const std::string& mediaType);
    ManifestDescriptor resolveManifest(const std::string& repository, const std::string& reference) const;
    ManifestRecord getManifest(const std::string& repository, const std::string& reference) const;
    bool hasManifest(const std::string& repository, const common::Digest& digest) const;
    Page listTags(const std::string& repository, const Pagination& pagination) const;
    Page listRepositories(const Pagination& pagination) const;
    DeleteResult deleteTag(const std::string& repository, const std::string& tag);
    DeleteResult deleteManifest(const std::string& repository, const std::string& reference);

private:
    class RepositoryLock {
    public:
        RepositoryLock(std::unique_lock<std::mutex>&& threadLock, libdepot::Flock&& fileLock)
            : threadLock{std::move(threadLock)}
            , fileLock{std::move(fileLock)}
        {}

    private:
        std::unique_lock<std::mutex> threadLock;
        libdepot::Flock fileLock;
    };

private:
    RepositoryLock lockRepository(const std::string& repository);
    RepositoryLock lockCatalog();
    boost::filesystem::path getRepositoryDirectory(const std::string& repository) const;
    boost::filesystem::path getMetadataFile(const std::string& repository) const;
    boost::filesystem::path getLockFile(const std::string& name) const;
    boost::optional<rapidjson::Document> readMetadata(const std::string& repository) const;
    rapidjson::Document readExistingMetadata(const std::string& repository) const;
    void writeMetadata(const std::string& repository, const rapidjson::Document& metadata) const;
    std::vector<std::string> readCatalog() const;
    void updateCatalog(const std::string& repository, bool present);
    void validateReferences(const ParsedManifest& manifest, const rapidjson::Document& metadata) const;
    std::vector<common::Digest> dropUnreferencedManifests(rapidjson::Document& metadata,
                                                         const std::vector<common::Digest>& candidates) const;
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;
    void printLog(const std::string& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ManifestStore";
    std::shared_ptr<storage::ContentStore> contentStore;
    common::NamingPolicy namingPolicy;
    boost::filesystem::path repositoriesDirectory;
    boost::filesystem::path locksDirectory;
    bool autoCreateRepositories;
    bool strictManifestValidation;
    libdepot::milliseconds lockTimeout;
    libdepot::milliseconds lockWarning;

    std::mutex catalogMutex;
    std::mutex repositoryMutexesMutex;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> repositoryMutexes;
};

}
}

#endif
