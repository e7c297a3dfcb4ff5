/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "storage/FilesystemContentStore.hpp"

#include <unistd.h>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"
#include "libdepot/Utility.hpp"


namespace depot {
namespace storage {

namespace {

// Failures of the filesystem must never be mistaken for absent objects
void markStoreUnavailable(libdepot::Error& error) {
    if(error.getErrorCode() == libdepot::ErrorCode::Generic) {
        error.setErrorCode(libdepot::ErrorCode::StoreUnavailable);
        error.setLogLevel(libdepot::LogLevel::ERROR);
    }
}

}

FilesystemContentStore::FilesystemContentStore(const boost::filesystem::path& rootDirectory)
    : rootDirectory{rootDirectory}
{
    try {
        libdepot::filesystem::createFoldersIfNecessary(rootDirectory);
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to initialize content store in %s") % rootDirectory;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
}

bool FilesystemContentStore::put(const common::Digest& digest, const std::string& bytes) {
    common::digest::verify(bytes, digest);

    if(exists(digest)) {
        printLog(boost::format("Content %s already present, skipping write") % digest, libdepot::LogLevel::DEBUG);
        return false;
    }

    printLog(boost::format("Storing %d bytes as %s") % bytes.size() % digest, libdepot::LogLevel::DEBUG);
    try {
        libdepot::filesystem::createFoldersIfNecessary(getObjectDirectory(digest));
        libdepot::filesystem::atomicallyWriteFile(bytes, getDataFile(digest));
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to store content %s") % digest;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
    return true;
}

bool FilesystemContentStore::putFile(const common::Digest& digest, const boost::filesystem::path& file) {
    try {
        if(exists(digest)) {
            printLog(boost::format("Content %s already present, discarding %s") % digest % file,
                     libdepot::LogLevel::DEBUG);
            libdepot::filesystem::removeFile(file);
            return false;
        }

        printLog(boost::format("Moving %s into the store as %s") % file % digest, libdepot::LogLevel::DEBUG);
        libdepot::filesystem::createFoldersIfNecessary(getObjectDirectory(digest));

        auto target = getDataFile(digest);
        boost::system::error_code ec;
        boost::filesystem::rename(file, target, ec);
        if(ec) {
            // the spool file may live on a different filesystem: copy next to
            // the target first, then rename atomically
            printLog(boost::format("Cannot rename %s (%s), copying it instead") % file % ec.message(),
                     libdepot::LogLevel::DEBUG);
            auto temporaryFile = libdepot::filesystem::makeUniquePathWithRandomSuffix(target);
            boost::filesystem::copy_file(file, temporaryFile);
            boost::filesystem::rename(temporaryFile, target);
            boost::filesystem::remove(file);
        }
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to store file %s as %s") % file % digest;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to store file %s as %s: %s") % file % digest % e.what();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
    return true;
}

boost::optional<std::string> FilesystemContentStore::get(const common::Digest& digest) const {
    if(!exists(digest)) {
        return boost::none;
    }
    try {
        return libdepot::filesystem::readFile(getDataFile(digest));
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to read content %s") % digest;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
}

bool FilesystemContentStore::exists(const common::Digest& digest) const {
    boost::system::error_code ec;
    auto status = boost::filesystem::status(getDataFile(digest), ec);
    if(status.type() == boost::filesystem::file_not_found) {
        return false;
    }
    if(ec) {
        auto message = boost::format("Failed to check existence of content %s: %s") % digest % ec.message();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
    return boost::filesystem::is_regular_file(status);
}

boost::optional<BlobInfo> FilesystemContentStore::stat(const common::Digest& digest) const {
    if(!exists(digest)) {
        return boost::none;
    }
    try {
        auto file = getDataFile(digest);
        return BlobInfo{ libdepot::filesystem::getFileSize(file), boost::filesystem::last_write_time(file) };
    }
    catch(libdepot::Error& e) {
        markStoreUnavailable(e);
        auto message = boost::format("Failed to stat content %s") % digest;
        DEPOT_RETHROW_ERROR(e, message.str());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to stat content %s: %s") % digest % e.what();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
}

bool FilesystemContentStore::remove(const common::Digest& digest) {
    if(!exists(digest)) {
        return false;
    }

    printLog(boost::format("Removing content %s") % digest, libdepot::LogLevel::DEBUG);
    boost::system::error_code ec;
    boost::filesystem::remove_all(getObjectDirectory(digest), ec);
    if(ec) {
        auto message = boost::format("Failed to remove content %s: %s") % digest % ec.message();
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
    return true;
}

void FilesystemContentStore::healthCheck() const {
    if(!boost::filesystem::is_directory(rootDirectory) || access(rootDirectory.c_str(), R_OK | W_OK | X_OK) != 0) {
        auto message = boost::format("Content store directory %s is not accessible") % rootDirectory;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::StoreUnavailable, message.str());
    }
}

boost::filesystem::path FilesystemContentStore::getObjectDirectory(const common::Digest& digest) const {
    if(digest.getHex().size() < 2) {
        auto message = boost::format("Cannot address content with malformed digest '%s'") % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestInvalid, message.str());
    }
    return rootDirectory / digest.getAlgorithm() / digest.getHex().substr(0, 2) / digest.getHex();
}

boost::filesystem::path FilesystemContentStore::getDataFile(const common::Digest& digest) const {
    return getObjectDirectory(digest) / "data";
}

void FilesystemContentStore::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                                      std::ostream& out, std::ostream& err) const {
    printLog(message.str(), logLevel, out, err);
}

void FilesystemContentStore::printLog(const std::string& message, libdepot::LogLevel logLevel,
                                      std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
