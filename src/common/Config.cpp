/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"
#include "libdepot/Utility.hpp"

#ifndef DEPOT_VERSION
#define DEPOT_VERSION "unknown"
#endif


namespace depot {
namespace common {

namespace {

const rapidjson::Value* findMember(const rapidjson::Value& object, const char* key) {
    if(!object.IsObject()) {
        return nullptr;
    }
    auto it = object.FindMember(key);
    if(it == object.MemberEnd()) {
        return nullptr;
    }
    return &it->value;
}

void readBool(const rapidjson::Value& object, const char* key, bool& value) {
    auto* member = findMember(object, key);
    if(member) {
        if(!member->IsBool()) {
            auto message = boost::format("Invalid configuration: '%s' must be a boolean") % key;
            DEPOT_THROW_ERROR(message.str());
        }
        value = member->GetBool();
    }
}

void readString(const rapidjson::Value& object, const char* key, std::string& value) {
    auto* member = findMember(object, key);
    if(member) {
        if(!member->IsString()) {
            auto message = boost::format("Invalid configuration: '%s' must be a string") % key;
            DEPOT_THROW_ERROR(message.str());
        }
        value = member->GetString();
    }
}

template<class T>
void readUnsigned(const rapidjson::Value& object, const char* key, T& value) {
    auto* member = findMember(object, key);
    if(member) {
        if(!member->IsUint64()) {
            auto message = boost::format("Invalid configuration: '%s' must be a non-negative integer") % key;
            DEPOT_THROW_ERROR(message.str());
        }
        value = static_cast<T>(member->GetUint64());
    }
}

template<class Duration>
void readDuration(const rapidjson::Value& object, const char* key, Duration& value) {
    auto count = static_cast<std::uint64_t>(value.count());
    readUnsigned(object, key, count);
    value = Duration{static_cast<typename Duration::rep>(count)};
}

}

Config::BuildTime::BuildTime()
    : version{DEPOT_VERSION}
{}

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/depot.json", installationPrefixDir / "etc/depot.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libdepot::json::readAndValidate(configFilename, configSchemaFilename) }
{
    initializeSettings();
}

void Config::initializeSettings() {
    if(!json.HasMember("rootDir") || !json["rootDir"].IsString()) {
        DEPOT_THROW_ERROR("Invalid configuration: missing mandatory string 'rootDir'");
    }

    if(json.HasMember("logLevel")) {
        logLevel = libdepot::parseLogLevel(json["logLevel"].GetString());
    }

    if(auto* value = findMember(json, "server")) {
        readString(*value, "bindAddress", server.bindAddress);
        readUnsigned(*value, "port", server.port);
        readUnsigned(*value, "threads", server.threads);
        readUnsigned(*value, "maxBodySizeBytes", server.maxBodySizeBytes);
        if(server.threads == 0) {
            DEPOT_THROW_ERROR("Invalid configuration: 'server.threads' must be at least 1");
        }
    }

    if(auto* value = findMember(json, "uploads")) {
        readDuration(*value, "sessionTtlSeconds", uploads.sessionTtl);
        readDuration(*value, "reapIntervalSeconds", uploads.reapInterval);
    }

    if(auto* value = findMember(json, "registry")) {
        readBool(*value, "autoCreateRepositories", registry.autoCreateRepositories);
        readBool(*value, "strictManifestValidation", registry.strictManifestValidation);
        readBool(*value, "allowBlobDeletion", registry.allowBlobDeletion);
        readUnsigned(*value, "maxRepositoryNameLength", registry.maxRepositoryNameLength);
        readUnsigned(*value, "maxTagLength", registry.maxTagLength);
        readUnsigned(*value, "defaultPageSize", registry.defaultPageSize);
    }

    if(auto* value = findMember(json, "cache")) {
        readBool(*value, "enableMemory", cache.enableMemory);
        readUnsigned(*value, "maxMemoryEntries", cache.maxMemoryEntries);
        readDuration(*value, "manifestTtlSeconds", cache.manifestTtl);
        readDuration(*value, "tagTtlSeconds", cache.tagTtl);
        readDuration(*value, "catalogTtlSeconds", cache.catalogTtl);

        if(auto* redisValue = findMember(*value, "redis")) {
            auto redis = Redis{};
            readString(*redisValue, "host", redis.host);
            readUnsigned(*redisValue, "port", redis.port);
            readDuration(*redisValue, "timeoutMs", redis.timeout);
            readDuration(*redisValue, "ttlSeconds", redis.ttl);
            readDuration(*redisValue, "retryIntervalSeconds", redis.retryInterval);
            if(redis.host.empty()) {
                DEPOT_THROW_ERROR("Invalid configuration: 'cache.redis.host' must not be empty");
            }
            cache.redis = redis;
        }
    }

    if(auto* value = findMember(json, "authorization")) {
        readString(*value, "anonymousAccess", authorization.anonymousAccess);
        readString(*value, "realm", authorization.realm);
        if(auto* users = findMember(*value, "users")) {
            for(const auto& userValue : users->GetArray()) {
                auto user = User{};
                readString(userValue, "username", user.username);
                readString(userValue, "password", user.password);
                readString(userValue, "access", user.access);
                if(auto* prefixes = findMember(userValue, "repositoryPrefixes")) {
                    for(const auto& prefix : prefixes->GetArray()) {
                        user.repositoryPrefixes.push_back(prefix.GetString());
                    }
                }
                authorization.users.push_back(user);
            }
        }
    }

    if(auto* value = findMember(json, "repositoryLockTimings")) {
        readDuration(*value, "timeoutMs", repositoryLockTimings.timeout);
        readDuration(*value, "warningMs", repositoryLockTimings.warning);
    }

    directories.initialize(*this);
}

void Config::Directories::initialize(const common::Config& config) {
    libdepot::logMessage(boost::format("initializing storage directories under %s") % config.json["rootDir"].GetString(),
                         libdepot::LogLevel::DEBUG);

    root = boost::filesystem::path{ config.json["rootDir"].GetString() };
    blobs = root / "blobs";
    uploads = root / "uploads";
    repositories = root / "repositories";

    libdepot::filesystem::createFoldersIfNecessary(blobs);
    libdepot::filesystem::createFoldersIfNecessary(uploads);
    libdepot::filesystem::createFoldersIfNecessary(repositories);

    if(config.json.HasMember("tempDir")) {
        temp = boost::filesystem::path(config.json["tempDir"].GetString());
    }
    else {
        temp = root / "tmp";
        libdepot::filesystem::createFoldersIfNecessary(temp);
    }
    if (!boost::filesystem::is_directory(temp)) {
        auto message = boost::format("Invalid temporary directory %s") % temp;
        DEPOT_THROW_ERROR(message.str(), libdepot::LogLevel::INFO);
    }
}

}} // namespaces
