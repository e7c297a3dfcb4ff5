/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "registry/ManifestStore.hpp"

#include <algorithm>
#include <iterator>
#include <ctime>
#include <cstdint>

#include <boost/algorithm/string.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"
#include "libdepot/Utility.hpp"


namespace rj = rapidjson;

namespace depot {
namespace registry {

namespace {

void markStoreUnavailable(libdepot::Error& error) {
    if(error.getErrorCode() == libdepot::ErrorCode::Generic) {
        error.setErrorCode(libdepot::ErrorCode::StoreUnavailable);
        error.setLogLevel(libdepot::LogLevel::ERROR);
    }
}

std::int64_t now() {
    return static_cast<std::int64_t>(std::time(nullptr));
}

bool isObjectMember(const rj::Value& value, const char* name) {
    return value.IsObject() && value.HasMember(name) && value[name].IsObject();
}

Page paginate(const std::vector<std::string>& sortedEntries, const Pagination& pagination) {
    auto begin = sortedEntries.cbegin();
    if(!pagination.last.empty()) {
        begin = std::upper_bound(sortedEntries.cbegin(), sortedEntries.cend(), pagination.last);
    }
    auto available = static_cast<std::size_t>(std::distance(begin, sortedEntries.cend()));
    auto count = pagination.n ? std::min(*pagination.n, available) : available;

    auto page = Page{};
    page.entries.assign(begin, begin + count);
    page.truncated = count < available;
    return page;
}

}

ManifestStore::ManifestStore(std::shared_ptr<const common::Config> config,
                             std::shared_ptr<storage::ContentStore> contentStore)
    : contentStore{std::move(contentStore)}
    , namingPolicy{config->registry.maxRepositoryNameLength, config->registry.maxTagLength}
    , repositoriesDirectory{config->directories.repositories}
    , locksDirectory{config->directories.repositories / "_locks"}
    , autoCreateRepositories{config->registry.autoCreateRepositories}
    , strictManifestValidation{config->registry.strictManifestValidation}
    , lockTimeout{config->repositoryLockTimings.timeout}
    , lockWarning{config->repositoryLockTimings.warning}
{
    try {
        libdepot::filesystem::createFoldersIfNecessary(repositoriesDirectory);
        libdepot::filesystem::createFoldersIfNecessary(locksDirectory);
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to initialize manifest store in %s") % repositoriesDirectory;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Returns false if the repository already existed.
 */
bool ManifestStore::createRepository(const std::string& repository) {
    namingPolicy.validateRepositoryName(repository);

    auto lock = lockRepository(repository);
    if(repositoryExists(repository)) {
        return false;
    }

    auto metadata = rj::Document{rj::kObjectType};
    auto& allocator = metadata.GetAllocator();
    metadata.AddMember("name", rj::Value{repository.c_str(), allocator}, allocator);
    metadata.AddMember("created", rj::Value{now()}, allocator);
    metadata.AddMember("tags", rj::Value{rj::kObjectType}, allocator);
    metadata.AddMember("manifests", rj::Value{rj::kObjectType}, allocator);
    writeMetadata(repository, metadata);
    updateCatalog(repository, true);

    printLog(boost::format("Created repository %s") % repository, libdepot::LogLevel::INFO);
    return true;
}

/**
 * Transition every write path goes through before touching a repository:
 * creates the repository on first use, if auto-creation is enabled.
 */
void ManifestStore::ensureRepository(const std::string& repository) {
    namingPolicy.validateRepositoryName(repository);
    if(repositoryExists(repository)) {
        return;
    }
    if(!autoCreateRepositories) {
        auto message = boost::format("Repository %s is not known and automatic creation is disabled") % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::NameUnknown, message.str());
    }
    createRepository(repository);
}

bool ManifestStore::repositoryExists(const std::string& repository) const {
    if(!namingPolicy.isValidRepositoryName(repository)) {
        return false;
    }
    return boost::filesystem::exists(getMetadataFile(repository));
}

DeleteResult ManifestStore::deleteRepository(const std::string& repository) {
    namingPolicy.validateRepositoryName(repository);

    auto lock = lockRepository(repository);
    auto metadata = readExistingMetadata(repository);

    auto result = DeleteResult{};
    for(const auto& tag : metadata["tags"].GetObject()) {
        result.removedTags.push_back(tag.name.GetString());
    }
    for(const auto& manifest : metadata["manifests"].GetObject()) {
        result.removedManifests.push_back(common::Digest::parse(manifest.name.GetString()));
    }

    try {
        libdepot::filesystem::removeFile(getMetadataFile(repository));
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to delete repository %s") % repository;
        DEPOT_RETHROW_ERROR(e, message.str());
    }

    // directories of nested repositories (e.g. "library" of "library/alpine") must survive
    auto directory = getRepositoryDirectory(repository);
    while(directory != repositoriesDirectory) {
        boost::system::error_code ec;
        if(!boost::filesystem::is_empty(directory, ec) || ec) {
            break;
        }
        boost::filesystem::remove(directory, ec);
        if(ec) {
            break;
        }
        directory = directory.parent_path();
    }

    updateCatalog(repository, false);

    printLog(boost::format("Deleted repository %s (%d tags, %d manifests)")
                % repository % result.removedTags.size() % result.removedManifests.size(),
             libdepot::LogLevel::INFO);
    return result;
}

/**
 * Stores the manifest and, if the reference is a tag, points the tag at it.
 * A manifest that becomes unreferenced because its tag was repointed is
 * dropped from the repository, unless it was also pushed by digest.
 */
PutResult ManifestStore::putManifest(const std::string& repository,
                                     const std::string& reference,
                                     const std::string& content,
                                     const std::string& mediaType) {
    namingPolicy.validateRepositoryName(repository);

    auto isDigestReference = common::NamingPolicy::isDigestReference(reference);
    auto referencedDigest = boost::optional<common::Digest>{};
    if(isDigestReference) {
        referencedDigest = common::Digest::parse(reference);
    }
    else {
        namingPolicy.validateTag(reference);
    }

    auto parsed = parseManifest(content, mediaType);
    auto digest = common::digest::compute(content);
    if(referencedDigest && *referencedDigest != digest) {
        auto message = boost::format("Manifest pushed as %s hashes to %s") % *referencedDigest % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestMismatch, message.str());
    }

    auto lock = lockRepository(repository);
    auto metadata = readExistingMetadata(repository);
    auto& allocator = metadata.GetAllocator();

    if(strictManifestValidation) {
        validateReferences(parsed, metadata);
    }

    try {
        contentStore->put(digest, content);
    }
    catch(libdepot::Error& e) {
        auto message = boost::format("Failed to store manifest %s of repository %s") % digest % repository;
        DEPOT_RETHROW_ERROR(e, message.str());
    }

    auto result = PutResult{digest, parsed.mediaType, {}};
    auto digestString = digest.string();
    auto& manifests = metadata["manifests"];
    auto manifest = manifests.FindMember(digestString.c_str());
    if(manifest == manifests.MemberEnd()) {
        auto entry = rj::Value{rj::kObjectType};
        entry.AddMember("mediaType", rj::Value{parsed.mediaType.c_str(), allocator}, allocator);
        entry.AddMember("size", rj::Value{static_cast<std::uint64_t>(content.size())}, allocator);
        entry.AddMember("created", rj::Value{now()}, allocator);
        entry.AddMember("pinned", rj::Value{isDigestReference}, allocator);
        manifests.AddMember(rj::Value{digestString.c_str(), allocator}, entry, allocator);
    }
    else {
        // identical bytes keep the media type they were first pushed with
        result.mediaType = manifest->value["mediaType"].GetString();
        if(isDigestReference) {
            manifest->value["pinned"].SetBool(true);
        }
    }

    if(!isDigestReference) {
        auto previous = boost::optional<common::Digest>{};
        auto& tags = metadata["tags"];
        auto tag = tags.FindMember(reference.c_str());
        if(tag == tags.MemberEnd()) {
            auto entry = rj::Value{rj::kObjectType};
            entry.AddMember("digest", rj::Value{digestString.c_str(), allocator}, allocator);
            entry.AddMember("updated", rj::Value{now()}, allocator);
            tags.AddMember(rj::Value{reference.c_str(), allocator}, entry, allocator);
        }
        else {
            previous = common::Digest::parse(tag->value["digest"].GetString());
            tag->value["digest"].SetString(digestString.c_str(), allocator);
            tag->value["updated"].SetInt64(now());
        }

        if(previous && *previous != digest) {
            result.removed = dropUnreferencedManifests(metadata, {*previous});
        }
    }

    writeMetadata(repository, metadata);

    printLog(boost::format("Stored manifest %s (%s) in repository %s as %s")
                % digest % result.mediaType % repository % reference,
             libdepot::LogLevel::INFO);
    return result;
}

/**
 * Resolves a tag or digest reference to the manifest it designates in the
 * repository, without reading the manifest content.
 */
ManifestDescriptor ManifestStore::resolveManifest(const std::string& repository, const std::string& reference) const {
    namingPolicy.validateRepositoryName(repository);
    auto metadata = readExistingMetadata(repository);

    auto digest = common::Digest{};
    if(common::NamingPolicy::isDigestReference(reference)) {
        digest = common::Digest::parse(reference);
    }
    else {
        namingPolicy.validateTag(reference);
        const auto& tags = metadata["tags"];
        auto tag = tags.FindMember(reference.c_str());
        if(tag == tags.MemberEnd()) {
            auto message = boost::format("Tag %s is not known in repository %s") % reference % repository;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestUnknown, message.str());
        }
        digest = common::Digest::parse(tag->value["digest"].GetString());
    }

    const auto& manifests = metadata["manifests"];
    auto manifest = manifests.FindMember(digest.string().c_str());
    if(manifest == manifests.MemberEnd()) {
        if(common::NamingPolicy::isDigestReference(reference)) {
            auto message = boost::format("Manifest %s is not known in repository %s") % digest % repository;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestUnknown, message.str());
        }
        auto message = boost::format("Metadata of repository %s is inconsistent: tag %s points at unknown manifest %s")
            % repository % reference % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }

    auto size = std::size_t{0};
    if(manifest->value.HasMember("size") && manifest->value["size"].IsUint64()) {
        size = static_cast<std::size_t>(manifest->value["size"].GetUint64());
    }
    return ManifestDescriptor{digest, manifest->value["mediaType"].GetString(), size};
}

ManifestRecord ManifestStore::getManifest(const std::string& repository, const std::string& reference) const {
    auto descriptor = resolveManifest(repository, reference);

    auto content = contentStore->get(descriptor.digest);
    if(!content) {
        auto message = boost::format("Content of manifest %s of repository %s is missing from the content store")
            % descriptor.digest % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }

    return ManifestRecord{descriptor.digest, descriptor.mediaType, std::move(*content)};
}

bool ManifestStore::hasManifest(const std::string& repository, const common::Digest& digest) const {
    if(!namingPolicy.isValidRepositoryName(repository)) {
        return false;
    }
    auto metadata = readMetadata(repository);
    return metadata && (*metadata)["manifests"].HasMember(digest.string().c_str());
}

Page ManifestStore::listTags(const std::string& repository, const Pagination& pagination) const {
    namingPolicy.validateRepositoryName(repository);
    auto metadata = readExistingMetadata(repository);

    auto tags = std::vector<std::string>{};
    for(const auto& tag : metadata["tags"].GetObject()) {
        tags.push_back(tag.name.GetString());
    }
    std::sort(tags.begin(), tags.end());
    return paginate(tags, pagination);
}

Page ManifestStore::listRepositories(const Pagination& pagination) const {
    return paginate(readCatalog(), pagination);
}

DeleteResult ManifestStore::deleteTag(const std::string& repository, const std::string& tag) {
    namingPolicy.validateRepositoryName(repository);
    namingPolicy.validateTag(tag);

    auto lock = lockRepository(repository);
    auto metadata = readExistingMetadata(repository);

    auto& tags = metadata["tags"];
    auto entry = tags.FindMember(tag.c_str());
    if(entry == tags.MemberEnd()) {
        auto message = boost::format("Tag %s is not known in repository %s") % tag % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestUnknown, message.str());
    }
    auto digest = common::Digest::parse(entry->value["digest"].GetString());
    tags.EraseMember(entry);

    auto result = DeleteResult{};
    result.removedTags.push_back(tag);
    result.removedManifests = dropUnreferencedManifests(metadata, {digest});
    writeMetadata(repository, metadata);

    printLog(boost::format("Deleted tag %s of repository %s") % tag % repository, libdepot::LogLevel::INFO);
    return result;
}

/**
 * A tag reference deletes the tag only. A digest reference deletes the
 * manifest together with every tag pointing at it.
 */
DeleteResult ManifestStore::deleteManifest(const std::string& repository, const std::string& reference) {
    if(!common::NamingPolicy::isDigestReference(reference)) {
        return deleteTag(repository, reference);
    }

    namingPolicy.validateRepositoryName(repository);
    auto digest = common::Digest::parse(reference);
    auto digestString = digest.string();

    auto lock = lockRepository(repository);
    auto metadata = readExistingMetadata(repository);

    auto& manifests = metadata["manifests"];
    auto manifest = manifests.FindMember(digestString.c_str());
    if(manifest == manifests.MemberEnd()) {
        auto message = boost::format("Manifest %s is not known in repository %s") % digest % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestUnknown, message.str());
    }
    manifests.EraseMember(manifest);

    auto result = DeleteResult{};
    result.removedManifests.push_back(digest);

    auto& tags = metadata["tags"];
    for(auto tag = tags.MemberBegin(); tag != tags.MemberEnd(); ) {
        if(digestString == tag->value["digest"].GetString()) {
            result.removedTags.push_back(tag->name.GetString());
            tag = tags.EraseMember(tag);
        }
        else {
            ++tag;
        }
    }

    writeMetadata(repository, metadata);

    printLog(boost::format("Deleted manifest %s of repository %s (%d tags removed)")
                % digest % repository % result.removedTags.size(),
             libdepot::LogLevel::INFO);
    return result;
}

ManifestStore::RepositoryLock ManifestStore::lockRepository(const std::string& repository) {
    std::mutex* mutex;
    {
        std::lock_guard<std::mutex> lock{repositoryMutexesMutex};
        auto& entry = repositoryMutexes[repository];
        if(!entry) {
            entry.reset(new std::mutex{});
        }
        mutex = entry.get();
    }

    auto threadLock = std::unique_lock<std::mutex>{*mutex};
    try {
        auto lockFile = getLockFile(repository);
        libdepot::filesystem::createFileIfNecessary(lockFile);
        libdepot::Flock fileLock{lockFile, libdepot::Flock::writeLock, lockTimeout, lockWarning};
        return RepositoryLock{std::move(threadLock), std::move(fileLock)};
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to lock repository %s") % repository;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
}

ManifestStore::RepositoryLock ManifestStore::lockCatalog() {
    auto threadLock = std::unique_lock<std::mutex>{catalogMutex};
    try {
        auto lockFile = getLockFile("_catalog");
        libdepot::filesystem::createFileIfNecessary(lockFile);
        libdepot::Flock fileLock{lockFile, libdepot::Flock::writeLock, lockTimeout, lockWarning};
        return RepositoryLock{std::move(threadLock), std::move(fileLock)};
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        DEPOT_RETHROW_ERROR(e, "Failed to lock the repository catalog");
    }
}

boost::filesystem::path ManifestStore::getRepositoryDirectory(const std::string& repository) const {
    return repositoriesDirectory / repository;
}

boost::filesystem::path ManifestStore::getMetadataFile(const std::string& repository) const {
    return getRepositoryDirectory(repository) / "_metadata.json";
}

// '+' is not part of the repository name grammar
boost::filesystem::path ManifestStore::getLockFile(const std::string& name) const {
    return locksDirectory / (boost::algorithm::replace_all_copy(name, "/", "+") + ".lock");
}

boost::optional<rapidjson::Document> ManifestStore::readMetadata(const std::string& repository) const {
    auto file = getMetadataFile(repository);
    if(!boost::filesystem::exists(file)) {
        return boost::none;
    }

    auto metadata = rj::Document{};
    try {
        metadata = libdepot::json::read(file);
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to read metadata of repository %s") % repository;
        DEPOT_RETHROW_ERROR(e, message.str());
    }

    if(!isObjectMember(metadata, "tags") || !isObjectMember(metadata, "manifests")) {
        auto message = boost::format("Metadata file %s of repository %s is corrupted") % file % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
    for(const auto& tag : metadata["tags"].GetObject()) {
        if(!tag.value.IsObject() || !tag.value.HasMember("digest") || !tag.value["digest"].IsString()) {
            auto message = boost::format("Metadata file %s of repository %s has a corrupted entry for tag %s")
                % file % repository % tag.name.GetString();
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
        }
    }
    for(const auto& manifest : metadata["manifests"].GetObject()) {
        if(!manifest.value.IsObject() || !manifest.value.HasMember("mediaType") || !manifest.value["mediaType"].IsString()
           || !manifest.value.HasMember("pinned") || !manifest.value["pinned"].IsBool()) {
            auto message = boost::format("Metadata file %s of repository %s has a corrupted entry for manifest %s")
                % file % repository % manifest.name.GetString();
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
        }
    }

    return boost::optional<rj::Document>{std::move(metadata)};
}

rapidjson::Document ManifestStore::readExistingMetadata(const std::string& repository) const {
    auto metadata = readMetadata(repository);
    if(!metadata) {
        auto message = boost::format("Repository %s is not known") % repository;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::NameUnknown, message.str());
    }
    return std::move(*metadata);
}

void ManifestStore::writeMetadata(const std::string& repository, const rapidjson::Document& metadata) const {
    try {
        libdepot::filesystem::createFoldersIfNecessary(getRepositoryDirectory(repository));
        libdepot::json::atomicallyWrite(metadata, getMetadataFile(repository));
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to write metadata of repository %s") % repository;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
}

std::vector<std::string> ManifestStore::readCatalog() const {
    auto file = repositoriesDirectory / "_catalog.json";
    auto repositories = std::vector<std::string>{};
    if(!boost::filesystem::exists(file)) {
        return repositories;
    }

    auto catalog = rj::Document{};
    try {
        catalog = libdepot::json::read(file);
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        DEPOT_RETHROW_ERROR(e, "Failed to read the repository catalog");
    }

    if(!catalog.IsObject() || !catalog.HasMember("repositories") || !catalog["repositories"].IsArray()) {
        auto message = boost::format("Repository catalog %s is corrupted") % file;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
    for(const auto& repository : catalog["repositories"].GetArray()) {
        if(repository.IsString()) {
            repositories.push_back(repository.GetString());
        }
    }
    std::sort(repositories.begin(), repositories.end());
    return repositories;
}

void ManifestStore::updateCatalog(const std::string& repository, bool present) {
    auto lock = lockCatalog();
    auto repositories = readCatalog();

    auto position = std::lower_bound(repositories.begin(), repositories.end(), repository);
    auto listed = position != repositories.end() && *position == repository;
    if(present && !listed) {
        repositories.insert(position, repository);
    }
    else if(!present && listed) {
        repositories.erase(position);
    }
    else {
        return;
    }

    auto catalog = rj::Document{rj::kObjectType};
    auto& allocator = catalog.GetAllocator();
    auto array = rj::Value{rj::kArrayType};
    for(const auto& name : repositories) {
        array.PushBack(rj::Value{name.c_str(), allocator}, allocator);
    }
    catalog.AddMember("repositories", array, allocator);

    try {
        libdepot::json::atomicallyWrite(catalog, repositoriesDirectory / "_catalog.json");
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        DEPOT_RETHROW_ERROR(e, "Failed to update the repository catalog");
    }
}

void ManifestStore::validateReferences(const ParsedManifest& manifest, const rapidjson::Document& metadata) const {
    auto blobs = manifest.layers;
    if(manifest.config) {
        blobs.insert(blobs.begin(), *manifest.config);
    }
    for(const auto& blob : blobs) {
        if(!contentStore->exists(blob)) {
            auto message = boost::format("Manifest references unknown blob %s") % blob;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestBlobUnknown, message.str());
        }
    }
    for(const auto& child : manifest.manifests) {
        if(!metadata["manifests"].HasMember(child.string().c_str())) {
            auto message = boost::format("Index references manifest %s, which is not in the repository") % child;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestBlobUnknown, message.str());
        }
    }
}

std::vector<common::Digest> ManifestStore::dropUnreferencedManifests(rapidjson::Document& metadata,
                                                                     const std::vector<common::Digest>& candidates) const {
    auto dropped = std::vector<common::Digest>{};
    auto& manifests = metadata["manifests"];
    const auto& tags = metadata["tags"];

    for(const auto& candidate : candidates) {
        auto digestString = candidate.string();
        auto manifest = manifests.FindMember(digestString.c_str());
        if(manifest == manifests.MemberEnd() || manifest->value["pinned"].GetBool()) {
            continue;
        }
        auto referenced = std::any_of(tags.MemberBegin(), tags.MemberEnd(), [&digestString](const rj::Value::Member& tag) {
            return digestString == tag.value["digest"].GetString();
        });
        if(!referenced) {
            manifests.EraseMember(manifest);
            dropped.push_back(candidate);
            printLog(boost::format("Dropped manifest %s, no tag references it anymore") % candidate,
                     libdepot::LogLevel::DEBUG);
        }
    }

    return dropped;
}

void ManifestStore::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                             std::ostream& out, std::ostream& err) const {
    printLog(message.str(), logLevel, out, err);
}

void ManifestStore::printLog(const std::string& message, libdepot::LogLevel logLevel,
                             std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
