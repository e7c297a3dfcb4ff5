/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_cache_CacheValue_hpp
#define depot_cache_CacheValue_hpp

#include <string>
#include <vector>

#include <boost/variant.hpp>

#include "common/Digest.hpp"


namespace depot {
namespace cache {

struct CachedListing {
    std::vector<std::string> entries;
    bool truncated;
};

struct CachedManifest {
    common::Digest digest;
    std::string mediaType;
    std::string content;
};

using CacheValue = boost::variant<CachedListing, CachedManifest>;

}
}

#endif
