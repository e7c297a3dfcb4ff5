/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "registry/Manifest.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "libdepot/Error.hpp"


namespace rj = rapidjson;

namespace depot {
namespace registry {

namespace mediaTypes {

const std::string dockerManifest = "application/vnd.docker.distribution.manifest.v2+json";
const std::string dockerManifestList = "application/vnd.docker.distribution.manifest.list.v2+json";
const std::string ociManifest = "application/vnd.oci.image.manifest.v1+json";
const std::string ociIndex = "application/vnd.oci.image.index.v1+json";

bool isManifestType(const std::string& mediaType) {
    return mediaType == dockerManifest || mediaType == ociManifest;
}

bool isIndexType(const std::string& mediaType) {
    return mediaType == dockerManifestList || mediaType == ociIndex;
}

}

namespace {

[[noreturn]] void throwInvalid(const std::string& reason) {
    auto message = boost::format("Invalid manifest: %s") % reason;
    DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::ManifestInvalid, message.str());
}

common::Digest parseDescriptor(const rj::Value& descriptor, const std::string& field) {
    if(!descriptor.IsObject() || !descriptor.HasMember("digest") || !descriptor["digest"].IsString()) {
        throwInvalid((boost::format("descriptor in '%s' has no digest") % field).str());
    }
    try {
        return common::Digest::parse(descriptor["digest"].GetString());
    }
    catch(const libdepot::Error& e) {
        throwInvalid((boost::format("descriptor in '%s' has an invalid digest: %s") % field % e.what()).str());
    }
}

std::vector<common::Digest> parseDescriptors(const rj::Value& document, const char* field) {
    auto digests = std::vector<common::Digest>{};
    if(!document.HasMember(field)) {
        return digests;
    }
    const auto& array = document[field];
    if(!array.IsArray()) {
        throwInvalid((boost::format("'%s' is not an array") % field).str());
    }
    for(const auto& descriptor : array.GetArray()) {
        digests.push_back(parseDescriptor(descriptor, field));
    }
    return digests;
}

// Content-Type values that carry no information about the manifest kind
bool isGenericMediaType(const std::string& mediaType) {
    return mediaType.empty()
        || mediaType == "application/json"
        || mediaType == "application/octet-stream";
}

bool isKnownType(const std::string& mediaType) {
    return mediaTypes::isManifestType(mediaType) || mediaTypes::isIndexType(mediaType);
}

}

ParsedManifest parseManifest(const std::string& content, const std::string& declaredMediaType) {
    auto document = rj::Document{};
    document.Parse(content.c_str(), content.size());
    if(document.HasParseError()) {
        throwInvalid((boost::format("not valid JSON (offset %u): %s")
                        % static_cast<unsigned>(document.GetErrorOffset())
                        % rj::GetParseError_En(document.GetParseError())).str());
    }
    if(!document.IsObject()) {
        throwInvalid("expected a JSON object");
    }
    if(!document.HasMember("schemaVersion") || !document["schemaVersion"].IsInt()
       || document["schemaVersion"].GetInt() != 2) {
        throwInvalid("expected schemaVersion 2");
    }

    // parameters such as "; charset=utf-8" are not part of the media type
    auto declared = boost::algorithm::trim_copy(declaredMediaType.substr(0, declaredMediaType.find(';')));

    auto embedded = std::string{};
    if(document.HasMember("mediaType")) {
        if(!document["mediaType"].IsString()) {
            throwInvalid("'mediaType' is not a string");
        }
        embedded = document["mediaType"].GetString();
    }

    auto parsed = ParsedManifest{};
    if(!isGenericMediaType(declared)) {
        if(!embedded.empty() && isKnownType(declared) && isKnownType(embedded) && declared != embedded) {
            throwInvalid((boost::format("Content-Type '%s' doesn't match embedded mediaType '%s'")
                            % declared % embedded).str());
        }
        parsed.mediaType = declared;
    }
    else if(!embedded.empty()) {
        parsed.mediaType = embedded;
    }
    else if(document.HasMember("manifests")) {
        parsed.mediaType = mediaTypes::ociIndex;
    }
    else {
        parsed.mediaType = mediaTypes::ociManifest;
    }

    if(mediaTypes::isIndexType(parsed.mediaType)) {
        if(!document.HasMember("manifests")) {
            throwInvalid("an index requires a 'manifests' array");
        }
        parsed.manifests = parseDescriptors(document, "manifests");
    }
    else {
        if(document.HasMember("config")) {
            parsed.config = parseDescriptor(document["config"], "config");
        }
        else if(mediaTypes::isManifestType(parsed.mediaType)) {
            throwInvalid("an image manifest requires a 'config' descriptor");
        }
        parsed.layers = parseDescriptors(document, "layers");
    }

    return parsed;
}

}
}
