/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Flock.hpp"

#include <chrono>
#include <thread>
#include <sys/file.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <boost/format.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"

namespace libdepot {

const milliseconds Flock::noTimeout = milliseconds{std::numeric_limits<unsigned long long>::max()};

Flock::Flock()
    : logger{&libdepot::Logger::getInstance()}
    , lockType{Type::readLock}
    , timeoutTime{milliseconds{noTimeout}}
    , warningTime{milliseconds{1000}}
{}

Flock::Flock(const boost::filesystem::path& file, const Type type, const milliseconds& timeoutMs, const milliseconds& warningMs)
    : logger{&libdepot::Logger::getInstance()}
    , lockfile{file}
    , lockType{type}
    , timeoutTime{timeoutMs}
    , warningTime{warningMs}
{
    auto message = boost::format("Initializing lock on file %s") % file;
    logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::DEBUG);
    timedLockAcquisition();
    logger->log("Successfully initialized lock", loggerSubsystemName, libdepot::LogLevel::DEBUG);
}

Flock::Flock(Flock&& rhs)
    : logger{std::move(rhs.logger)}
    , lockfile{std::move(rhs.lockfile)}
    , lockType{std::move(rhs.lockType)}
    , fileFd{rhs.fileFd}
    , timeoutTime{std::move(rhs.timeoutTime)}
    , warningTime{std::move(rhs.warningTime)}
{
    // the moved-from object must not release the lock on destruction
    rhs.fileFd = -1;
    rhs.lockfile.reset();
    logger->log("move constructed lock", loggerSubsystemName, libdepot::LogLevel::DEBUG);
}

Flock& Flock::operator=(Flock&& rhs) {
    if(this == &rhs) {
        return *this;
    }
    // Release the lock from the current file before acquiring the one from the rhs
    // otherwise this process would be silently holding both locks
    this->release();
    lockType = rhs.lockType;
    lockfile = std::move(rhs.lockfile);
    fileFd = rhs.fileFd;
    timeoutTime = rhs.timeoutTime;
    warningTime = rhs.warningTime;
    rhs.fileFd = -1;
    rhs.lockfile.reset();
    logger->log("move assigned lock", loggerSubsystemName, libdepot::LogLevel::DEBUG);
    return *this;
}

Flock::~Flock() {
    release();
}

void Flock::convertToType(const Type type) {
    if (type != lockType) {
        lockType = type;
        timedLockAcquisition();
    }
}

void Flock::timedLockAcquisition() {
    milliseconds elapsedTime{0};
    milliseconds backoffTime{100};
    while(!acquireLockAtomically()) {
        if(timeoutTime != milliseconds{noTimeout} && elapsedTime >= timeoutTime) {
            auto message = boost::format("Failed to acquire lock on file %s (expired timeout of %d milliseconds)") % *lockfile % timeoutTime.count();
            DEPOT_THROW_ERROR(message.str());
        }
        std::this_thread::sleep_for(backoffTime);
        elapsedTime += backoffTime;
        if(elapsedTime.count() % warningTime.count() == 0) {
            auto message = boost::format("Still attempting to acquire lock on file %s after %d ms (will timeout after %d milliseconds)...")
                                   % *lockfile % elapsedTime.count() % timeoutTime.count();
            logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::WARN);
        }
    }
}

static std::pair<int, int> getFlockFlags(const Flock::Type &lockType) {
    if (lockType == Flock::Type::readLock) {
        return std::make_pair(O_RDONLY, LOCK_SH);
    }
    if (lockType == Flock::Type::writeLock) {
        return std::make_pair(O_RDWR, LOCK_EX);
    }
    auto message = boost::format("unknown lock type specified: %d") % lockType;
    DEPOT_THROW_ERROR(message.str());
    return std::make_pair(-1, 0);
}

bool Flock::acquireLockAtomically() {
    int openMode;
    int flockOperation;
    std::tie(openMode, flockOperation) = getFlockFlags(lockType);

    auto message = boost::format("Attempting to acquire %s lock on file %s")
                   % (lockType==Type::readLock ? "read" : "write") % *lockfile;
    logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::DEBUG);

    if (fileFd < 0) {
        auto fd = open(lockfile->string().c_str(), openMode | O_CLOEXEC);
        if(fd == -1) {
            message = boost::format("failed to open %s for locking") % *lockfile;
            logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::DEBUG);
            return false;
        }
        fileFd = fd;
    }

    if (flock(fileFd, flockOperation | LOCK_NB) == -1) {
        message = boost::format("failed to flock() on %s (fd %d): %s") % *lockfile % fileFd % strerror(errno);
        logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::DEBUG);
        return false;
    }

    logger->log("successfully acquired lock", loggerSubsystemName, libdepot::LogLevel::DEBUG);
    return true;
}

void Flock::release() {
    if (fileFd >= 0) {
        if (flock(fileFd, LOCK_UN | LOCK_NB) == -1) {
            auto message = boost::format("failed to release lock on %s (fd %d): %s") % *lockfile % fileFd % strerror(errno);
            logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::WARN);
        }
        if(close(fileFd) != 0) {
            auto message = boost::format("failed to close file descriptor %d of file %s") % fileFd % *lockfile;
            logger->log(message.str(), loggerSubsystemName, libdepot::LogLevel::WARN);
        }
        fileFd = -1;
    }
}

}
