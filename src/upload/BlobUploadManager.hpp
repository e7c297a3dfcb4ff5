/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_upload_BlobUploadManager_hpp
#define depot_upload_BlobUploadManager_hpp

#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include <ctime>
#include <cstddef>
#include <iostream>
#include <unordered_map>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Digest.hpp"
#include "common/NamingPolicy.hpp"
#include "storage/ContentStore.hpp"


namespace depot {
namespace upload {

using SessionId = std::string;

struct UploadStatus {
    SessionId id;
    std::string repository;
    std::size_t offset;
};

/**
 * Owns the lifecycle of blob upload sessions:
 * Created -> Accepting(offset) -> Completed | Cancelled | Expired
 *
 * The bytes of a session are spooled to <uploads>/<id>/data, outside the
 * content store, and committed to the content store only once their digest
 * has been verified. The session metadata is persisted next to the spool
 * file, so sessions survive a restart of the daemon.
 *
 * Operations on different sessions run in parallel. Operations on the same
 * session are serialized by a per-session mutex.
 */
class BlobUploadManager {
public:
    BlobUploadManager(std::shared_ptr<const common::Config> config,
                      std::shared_ptr<storage::ContentStore> contentStore);

    SessionId start(const std::string& repository);
    UploadStatus getStatus(const SessionId& id);
    std::size_t appendChunk(const SessionId& id, const std::string& bytes, std::size_t expectedStartOffset);
    std::size_t appendChunk(const SessionId& id, const std::string& bytes);
    storage::Blob complete(const SessionId& id, const std::string& finalBytes, const common::Digest& expectedDigest);
    void cancel(const SessionId& id);
    std::size_t reclaimExpired();
    std::size_t countSessions() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Session {
        SessionId id;
        std::string repository;
        std::size_t offset = 0;
        boost::filesystem::path directory;
        boost::filesystem::path spoolFile;
        std::time_t created = 0;
        Clock::time_point lastActivity;
        bool closed = false;
        std::mutex mutex;
    };

private:
    void restoreSessions();
    std::shared_ptr<Session> findSession(const SessionId& id) const;
    std::unique_lock<std::mutex> lockOpenSession(Session& session);
    bool isExpired(const Session& session, Clock::time_point now) const;
    void append(Session& session, const std::string& bytes);
    void rollBack(Session& session, std::size_t offset);
    void closeSession(Session& session);
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;
    void printLog(const std::string& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "BlobUploadManager";
    std::shared_ptr<storage::ContentStore> contentStore;
    common::NamingPolicy namingPolicy;
    boost::filesystem::path uploadsDirectory;
    std::chrono::seconds sessionTtl;

    // guards the map only, never held while waiting on a session mutex
    mutable std::mutex sessionsMutex;
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions;
};

}
}

#endif
