/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "upload/BlobUploadManager.hpp"

#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <rapidjson/document.h>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"
#include "libdepot/Utility.hpp"


namespace rj = rapidjson;

namespace depot {
namespace upload {

BlobUploadManager::BlobUploadManager(std::shared_ptr<const common::Config> config,
                                     std::shared_ptr<storage::ContentStore> contentStore)
    : contentStore{std::move(contentStore)}
    , namingPolicy{config->registry.maxRepositoryNameLength, config->registry.maxTagLength}
    , uploadsDirectory{config->directories.uploads}
    , sessionTtl{config->uploads.sessionTtl}
{
    libdepot::filesystem::createFoldersIfNecessary(uploadsDirectory);
    restoreSessions();
}

SessionId BlobUploadManager::start(const std::string& repository) {
    namingPolicy.validateRepositoryName(repository);

    auto session = std::make_shared<Session>();
    session->id = boost::uuids::to_string(boost::uuids::random_generator()());
    session->repository = repository;
    session->directory = uploadsDirectory / session->id;
    session->spoolFile = session->directory / "data";
    session->created = std::time(nullptr);
    session->lastActivity = Clock::now();

    try {
        libdepot::filesystem::createFoldersIfNecessary(session->directory);
        libdepot::filesystem::writeFile("", session->spoolFile);

        auto metadata = rj::Document{rj::kObjectType};
        auto& allocator = metadata.GetAllocator();
        metadata.AddMember("id", rj::Value{session->id.c_str(), allocator}, allocator);
        metadata.AddMember("repository", rj::Value{repository.c_str(), allocator}, allocator);
        metadata.AddMember("created", rj::Value{static_cast<int64_t>(session->created)}, allocator);
        libdepot::json::atomicallyWrite(metadata, session->directory / "session.json");
    }
    catch(const std::exception& e) {
        boost::system::error_code ec;
        boost::filesystem::remove_all(session->directory, ec);
        auto message = boost::format("Failed to create upload session for repository %s: %s") % repository % e.what();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }

    {
        std::lock_guard<std::mutex> lock{sessionsMutex};
        sessions[session->id] = session;
    }

    printLog(boost::format("Started upload session %s for repository %s") % session->id % repository,
             libdepot::LogLevel::INFO);
    return session->id;
}

UploadStatus BlobUploadManager::getStatus(const SessionId& id) {
    auto session = findSession(id);
    auto lock = lockOpenSession(*session);
    return UploadStatus{session->id, session->repository, session->offset};
}

std::size_t BlobUploadManager::appendChunk(const SessionId& id, const std::string& bytes, std::size_t expectedStartOffset) {
    auto session = findSession(id);
    auto lock = lockOpenSession(*session);

    if(expectedStartOffset != session->offset) {
        auto message = boost::format("Chunk for upload session %s starts at offset %d, but the session is at offset %d")
            % id % expectedStartOffset % session->offset;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::OffsetMismatch, message.str());
    }

    append(*session, bytes);
    return session->offset;
}

std::size_t BlobUploadManager::appendChunk(const SessionId& id, const std::string& bytes) {
    auto session = findSession(id);
    auto lock = lockOpenSession(*session);
    append(*session, bytes);
    return session->offset;
}

storage::Blob BlobUploadManager::complete(const SessionId& id, const std::string& finalBytes, const common::Digest& expectedDigest) {
    auto session = findSession(id);
    auto lock = lockOpenSession(*session);

    auto offsetBeforeComplete = session->offset;
    append(*session, finalBytes);

    auto computedDigest = common::Digest{};
    try {
        computedDigest = common::digest::computeFile(session->spoolFile);
    }
    catch(libdepot::Error& e) {
        rollBack(*session, offsetBeforeComplete);
        e.setErrorCode(libdepot::ErrorCode::StoreUnavailable);
        auto message = boost::format("Failed to hash the content of upload session %s") % id;
        DEPOT_RETHROW_ERROR(e, message.str());
    }

    if(computedDigest != expectedDigest) {
        printLog(boost::format("Discarding upload session %s: content hashes to %s instead of %s")
                    % id % computedDigest % expectedDigest,
                 libdepot::LogLevel::INFO);
        closeSession(*session);
        auto message = boost::format("Digest mismatch for upload session %s: expected %s but content hashes to %s")
            % id % expectedDigest % computedDigest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestMismatch, message.str());
    }

    auto blob = storage::Blob{computedDigest, session->offset, storage::defaultBlobMediaType, std::time(nullptr)};
    try {
        if(!contentStore->putFile(computedDigest, session->spoolFile)) {
            printLog(boost::format("Blob %s already present, upload deduplicated") % computedDigest,
                     libdepot::LogLevel::DEBUG);
        }
    }
    catch(libdepot::Error& e) {
        rollBack(*session, offsetBeforeComplete);
        auto message = boost::format("Failed to commit upload session %s as blob %s") % id % computedDigest;
        DEPOT_RETHROW_ERROR(e, message.str());
    }

    closeSession(*session);
    printLog(boost::format("Completed upload session %s: blob %s (%d bytes) in repository %s")
                % id % computedDigest % blob.size % session->repository,
             libdepot::LogLevel::INFO);
    return blob;
}

void BlobUploadManager::cancel(const SessionId& id) {
    auto session = std::shared_ptr<Session>{};
    {
        std::lock_guard<std::mutex> lock{sessionsMutex};
        auto it = sessions.find(id);
        if(it == sessions.cend()) {
            printLog(boost::format("Cancel of unknown upload session %s ignored") % id, libdepot::LogLevel::DEBUG);
            return;
        }
        session = it->second;
    }

    std::lock_guard<std::mutex> lock{session->mutex};
    if(session->closed) {
        return;
    }
    closeSession(*session);
    printLog(boost::format("Cancelled upload session %s") % id, libdepot::LogLevel::INFO);
}

/**
 * Removes the sessions that have been idle for longer than the session TTL.
 * Sessions busy with an operation are active by definition and are skipped.
 */
std::size_t BlobUploadManager::reclaimExpired() {
    auto candidates = std::vector<std::shared_ptr<Session>>{};
    {
        std::lock_guard<std::mutex> lock{sessionsMutex};
        for(const auto& entry : sessions) {
            candidates.push_back(entry.second);
        }
    }

    auto now = Clock::now();
    std::size_t reclaimed = 0;
    for(const auto& session : candidates) {
        std::unique_lock<std::mutex> lock{session->mutex, std::try_to_lock};
        if(!lock.owns_lock() || session->closed || !isExpired(*session, now)) {
            continue;
        }
        closeSession(*session);
        ++reclaimed;
        printLog(boost::format("Reclaimed expired upload session %s") % session->id, libdepot::LogLevel::INFO);
    }

    if(reclaimed > 0) {
        printLog(boost::format("Reclaimed %d expired upload sessions") % reclaimed, libdepot::LogLevel::DEBUG);
    }
    return reclaimed;
}

std::size_t BlobUploadManager::countSessions() const {
    std::lock_guard<std::mutex> lock{sessionsMutex};
    return sessions.size();
}

/**
 * Reloads the sessions persisted by a previous run. The offset of a restored
 * session is the size of its spool file and its idle timer restarts now.
 */
void BlobUploadManager::restoreSessions() {
    for(auto it = boost::filesystem::directory_iterator{uploadsDirectory};
        it != boost::filesystem::directory_iterator{};
        ++it) {
        auto directory = it->path();
        if(!boost::filesystem::is_directory(directory)) {
            continue;
        }

        try {
            auto metadata = libdepot::json::read(directory / "session.json");
            if(!metadata.IsObject()
               || !metadata.HasMember("id") || !metadata["id"].IsString()
               || !metadata.HasMember("repository") || !metadata["repository"].IsString()
               || !metadata.HasMember("created") || !metadata["created"].IsInt64()) {
                DEPOT_THROW_ERROR("malformed session metadata");
            }
            auto session = std::make_shared<Session>();
            session->id = metadata["id"].GetString();
            session->repository = metadata["repository"].GetString();
            session->created = static_cast<std::time_t>(metadata["created"].GetInt64());
            session->directory = directory;
            session->spoolFile = directory / "data";
            session->offset = libdepot::filesystem::getFileSize(session->spoolFile);
            session->lastActivity = Clock::now();

            if(session->id != directory.filename().string()) {
                auto message = boost::format("session id %s doesn't match its directory") % session->id;
                DEPOT_THROW_ERROR(message.str());
            }

            std::lock_guard<std::mutex> lock{sessionsMutex};
            sessions[session->id] = session;
            printLog(boost::format("Restored upload session %s for repository %s at offset %d")
                        % session->id % session->repository % session->offset,
                     libdepot::LogLevel::INFO);
        }
        catch(const std::exception& e) {
            printLog(boost::format("Removing unusable upload session directory %s: %s") % directory % e.what(),
                     libdepot::LogLevel::WARN);
            boost::system::error_code ec;
            boost::filesystem::remove_all(directory, ec);
        }
    }
}

std::shared_ptr<BlobUploadManager::Session> BlobUploadManager::findSession(const SessionId& id) const {
    std::lock_guard<std::mutex> lock{sessionsMutex};
    auto it = sessions.find(id);
    if(it == sessions.cend()) {
        auto message = boost::format("Upload session %s not found") % id;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::SessionNotFound, message.str());
    }
    return it->second;
}

/**
 * Locks the session for an operation. A session that was closed by a
 * concurrent operation, or that has expired, is reported as not found.
 */
std::unique_lock<std::mutex> BlobUploadManager::lockOpenSession(Session& session) {
    std::unique_lock<std::mutex> lock{session.mutex};

    if(session.closed) {
        auto message = boost::format("Upload session %s not found") % session.id;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::SessionNotFound, message.str());
    }

    auto now = Clock::now();
    if(isExpired(session, now)) {
        closeSession(session);
        auto message = boost::format("Upload session %s expired") % session.id;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::SessionNotFound, message.str());
    }

    session.lastActivity = now;
    return lock;
}

bool BlobUploadManager::isExpired(const Session& session, Clock::time_point now) const {
    return now - session.lastActivity > sessionTtl;
}

void BlobUploadManager::append(Session& session, const std::string& bytes) {
    if(bytes.empty()) {
        return;
    }

    try {
        libdepot::filesystem::writeFile(bytes, session.spoolFile, std::ios_base::app);
    }
    catch(const std::exception& e) {
        // drop a partially appended chunk so that the offset keeps matching the spool file
        boost::system::error_code ec;
        boost::filesystem::resize_file(session.spoolFile, session.offset, ec);
        auto message = boost::format("Failed to append %d bytes to upload session %s: %s")
            % bytes.size() % session.id % e.what();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }

    session.offset += bytes.size();
    printLog(boost::format("Upload session %s advanced to offset %d") % session.id % session.offset,
             libdepot::LogLevel::DEBUG);
}

/**
 * Drops the bytes appended by a completion that failed to commit, so that the
 * client can retry it. A session whose spool file was already consumed by the
 * content store can't be resumed and is closed.
 * Must be called with the session mutex held.
 */
void BlobUploadManager::rollBack(Session& session, std::size_t offset) {
    boost::system::error_code ec;
    if(boost::filesystem::exists(session.spoolFile, ec)) {
        boost::filesystem::resize_file(session.spoolFile, offset, ec);
        if(!ec) {
            session.offset = offset;
            printLog(boost::format("Upload session %s rolled back to offset %d") % session.id % offset,
                     libdepot::LogLevel::INFO);
            return;
        }
    }
    printLog(boost::format("Closing upload session %s: its spool file can't be restored") % session.id,
             libdepot::LogLevel::WARN);
    closeSession(session);
}

// Must be called with the session mutex held.
void BlobUploadManager::closeSession(Session& session) {
    session.closed = true;

    boost::system::error_code ec;
    boost::filesystem::remove_all(session.directory, ec);
    if(ec) {
        printLog(boost::format("Failed to remove spool directory %s of upload session %s: %s")
                    % session.directory % session.id % ec.message(),
                 libdepot::LogLevel::WARN);
    }

    std::lock_guard<std::mutex> lock{sessionsMutex};
    sessions.erase(session.id);
}

void BlobUploadManager::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                                 std::ostream& out, std::ostream& err) const {
    printLog(message.str(), logLevel, out, err);
}

void BlobUploadManager::printLog(const std::string& message, libdepot::LogLevel logLevel,
                                 std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
