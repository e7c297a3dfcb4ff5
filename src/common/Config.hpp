/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_common_Config_hpp
#define depot_common_Config_hpp

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "libdepot/LogLevel.hpp"


namespace depot {
namespace common {

/**
 * Daemon configuration. The raw JSON document is kept in 'json' (validated
 * against the configuration schema when read from file) and its values are
 * unpacked into the typed settings below by initializeSettings(). Optional
 * keys missing from the document keep the defaults declared here.
 */
class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& installationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        struct Directories {
            void initialize(const common::Config& config);
            boost::filesystem::path root;
            boost::filesystem::path blobs;
            boost::filesystem::path uploads;
            boost::filesystem::path repositories;
            boost::filesystem::path temp;
        };

        struct Server {
            std::string bindAddress = "0.0.0.0";
            std::uint16_t port = 5000;
            std::size_t threads = 8;
            std::size_t maxBodySizeBytes = 1024 * 1024 * 1024;
        };

        struct Uploads {
            std::chrono::seconds sessionTtl{3600};
            std::chrono::seconds reapInterval{60};
        };

        struct Registry {
            bool autoCreateRepositories = true;
            bool strictManifestValidation = false;
            bool allowBlobDeletion = false;
            std::size_t maxRepositoryNameLength = 255;
            std::size_t maxTagLength = 128;
            std::size_t defaultPageSize = 100;
        };

        struct Redis {
            std::string host;
            std::uint16_t port = 6379;
            std::chrono::milliseconds timeout{500};
            std::chrono::seconds ttl{3600};
            std::chrono::seconds retryInterval{30};
        };

        struct Cache {
            bool enableMemory = true;
            std::size_t maxMemoryEntries = 10000;
            std::chrono::seconds manifestTtl{300};
            std::chrono::seconds tagTtl{120};
            std::chrono::seconds catalogTtl{60};
            boost::optional<Redis> redis;
        };

        struct User {
            std::string username;
            std::string password;
            std::string access;
            std::vector<std::string> repositoryPrefixes;
        };

        struct Authorization {
            std::string anonymousAccess = "write";
            std::string realm = "Depot Registry";
            std::vector<User> users;
        };

        struct LockTimings {
            std::chrono::milliseconds timeout{60000};
            std::chrono::milliseconds warning{1000};
        };

        void initializeSettings();

        BuildTime buildTime;
        rapidjson::Document json{ rapidjson::kObjectType };
        libdepot::LogLevel logLevel = libdepot::LogLevel::WARN;
        Directories directories;
        Server server;
        Uploads uploads;
        Registry registry;
        Cache cache;
        Authorization authorization;
        LockTimings repositoryLockTimings;
};

}
}

#endif
