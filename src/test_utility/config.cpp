/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "config.hpp"

#include <memory>

#include "libdepot/Utility.hpp"

namespace rj = rapidjson;

namespace test_utility {
namespace config {

ConfigRAII::~ConfigRAII() {
    if(!config) {
        return;
    }
    auto dir = boost::filesystem::path{ config->json["rootDir"].GetString() };
    boost::system::error_code ec;
    boost::filesystem::remove_all(dir, ec);
}

static void populateJSON(rj::Document& document) {
    auto& allocator = document.GetAllocator();

    auto rootDir = libdepot::filesystem::makeUniquePathWithRandomSuffix(boost::filesystem::absolute("/tmp/depot-test-root-dir"));

    document.AddMember( "rootDir",
                        rj::Value{rootDir.c_str(), allocator},
                        allocator);
    document.AddMember( "logLevel",
                        rj::Value{"warn", allocator},
                        allocator);

    rj::Value uploads(rj::kObjectType);
    uploads.AddMember("sessionTtlSeconds", 3600, allocator);
    uploads.AddMember("reapIntervalSeconds", 60, allocator);
    document.AddMember("uploads", uploads, allocator);

    rj::Value registry(rj::kObjectType);
    registry.AddMember("autoCreateRepositories", true, allocator);
    registry.AddMember("strictManifestValidation", false, allocator);
    registry.AddMember("allowBlobDeletion", true, allocator);
    document.AddMember("registry", registry, allocator);

    rj::Value cache(rj::kObjectType);
    cache.AddMember("enableMemory", true, allocator);
    cache.AddMember("maxMemoryEntries", 1000, allocator);
    document.AddMember("cache", cache, allocator);

    rj::Value lockTimings(rj::kObjectType);
    lockTimings.AddMember("timeoutMs", 5000, allocator);
    lockTimings.AddMember("warningMs", 1000, allocator);
    document.AddMember("repositoryLockTimings", lockTimings, allocator);
}

ConfigRAII makeConfig(const Customizer& customize) {
    auto raii = ConfigRAII{};
    raii.config = std::make_shared<depot::common::Config>();
    populateJSON(raii.config->json);
    if(customize) {
        customize(raii.config->json);
    }
    raii.config->initializeSettings();
    return raii;
}

boost::filesystem::path getSchemaFile() {
    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    return repoRootDir / "etc/depot.schema.json";
}

}
}
