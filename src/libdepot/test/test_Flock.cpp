/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include <chrono>
#include <type_traits>

#include <boost/filesystem.hpp>

#include "aux/unitTestMain.hpp"
#include "libdepot/Error.hpp"
#include "libdepot/Flock.hpp"
#include "libdepot/Utility.hpp"


namespace libdepot {
namespace test {

static const auto shortTimeout = std::chrono::milliseconds{10};

static bool lockAcquisitionDoesntThrow(const boost::filesystem::path &fileToLock, const libdepot::Flock::Type &lockType) {
    try {
        libdepot::Flock{fileToLock, lockType, shortTimeout};
    } catch (const libdepot::Error &) {
        return false;
    }
    return true;
}

TEST_GROUP(FlockTestGroup) {
    boost::filesystem::path fileToLock = libdepot::filesystem::makeUniquePathWithRandomSuffix("/tmp/depot-file-to-lock");

    void setup() {
        libdepot::filesystem::createFileIfNecessary(fileToLock);
    }

    void teardown() {
        boost::filesystem::remove(fileToLock);
    }
};

TEST(FlockTestGroup, lock_is_released_when_the_object_is_destroyed) {
    {
        libdepot::Flock lock{fileToLock, libdepot::Flock::Type::writeLock};
    }
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libdepot::Flock::Type::writeLock));
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libdepot::Flock::Type::writeLock));
}

TEST(FlockTestGroup, move_constructor_moves_resources) {
    libdepot::Flock original{fileToLock, libdepot::Flock::Type::writeLock};
    {
        libdepot::Flock moveConstructed{std::move(original)};
        CHECK_THROWS(libdepot::Error, libdepot::Flock(fileToLock, libdepot::Flock::Type::writeLock, shortTimeout));
    }
    // the moved-from lock doesn't hold the file anymore
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libdepot::Flock::Type::writeLock));
}

TEST(FlockTestGroup, move_assignment_moves_resources) {
    libdepot::Flock original{fileToLock, libdepot::Flock::Type::writeLock};
    {
        libdepot::Flock moveAssigned;
        moveAssigned = std::move(original);
        CHECK_THROWS(libdepot::Error, libdepot::Flock(fileToLock, libdepot::Flock::Type::writeLock, shortTimeout));
    }
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libdepot::Flock::Type::writeLock));
}

TEST(FlockTestGroup, write_fails_if_resource_is_in_use) {
    {
        libdepot::Flock lock{fileToLock, libdepot::Flock::Type::writeLock};
        CHECK_THROWS(libdepot::Error, libdepot::Flock(fileToLock, libdepot::Flock::Type::writeLock, shortTimeout));
    }
    {
        libdepot::Flock lock{fileToLock, libdepot::Flock::Type::readLock};
        CHECK_THROWS(libdepot::Error, libdepot::Flock(fileToLock, libdepot::Flock::Type::writeLock, shortTimeout));
    }
}

TEST(FlockTestGroup, concurrent_read_are_allowed) {
    libdepot::Flock lock{fileToLock, libdepot::Flock::Type::readLock};
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libdepot::Flock::Type::readLock));
}

TEST(FlockTestGroup, convert_read_to_write) {
    libdepot::Flock lock{fileToLock, libdepot::Flock::Type::readLock};
    lock.convertToType(libdepot::Flock::Type::writeLock);
    CHECK_THROWS(libdepot::Error, libdepot::Flock(fileToLock, libdepot::Flock::Type::readLock, shortTimeout));
}

TEST(FlockTestGroup, missing_lockfile_times_out) {
    auto missing = libdepot::filesystem::makeUniquePathWithRandomSuffix("/tmp/depot-missing-lockfile");
    CHECK_THROWS(libdepot::Error, libdepot::Flock(missing, libdepot::Flock::Type::writeLock, shortTimeout));
}

static_assert(!std::is_copy_constructible<libdepot::Flock>::value, "");
static_assert(!std::is_copy_assignable<libdepot::Flock>::value, "");
static_assert(std::is_move_constructible<libdepot::Flock>::value, "");
static_assert(std::is_move_assignable<libdepot::Flock>::value, "");

}}

DEPOT_UNITTEST_MAIN_FUNCTION();
