/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_registry_Manifest_hpp
#define depot_registry_Manifest_hpp

#include <string>
#include <vector>
#include <cstddef>

#include <boost/optional.hpp>

#include "common/Digest.hpp"


namespace depot {
namespace registry {

namespace mediaTypes {

extern const std::string dockerManifest;
extern const std::string dockerManifestList;
extern const std::string ociManifest;
extern const std::string ociIndex;

bool isManifestType(const std::string& mediaType);
bool isIndexType(const std::string& mediaType);

}

struct ManifestRecord {
    common::Digest digest;
    std::string mediaType;
    std::string content;
};

/**
 * Structurally validated manifest: the effective media type and the
 * content it references (config and layer blobs, or child manifests
 * for an index).
 */
struct ParsedManifest {
    std::string mediaType;
    boost::optional<common::Digest> config;
    std::vector<common::Digest> layers;
    std::vector<common::Digest> manifests;
};

/**
 * Checks that the bytes are a JSON object with schemaVersion 2 and determines
 * the effective media type from the declared Content-Type, the embedded
 * mediaType field or, failing both, the structure of the document.
 * Fails with ManifestInvalid.
 */
ParsedManifest parseManifest(const std::string& content, const std::string& declaredMediaType);

}
}

#endif
