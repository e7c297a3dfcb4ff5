/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_cache_SharedCache_hpp
#define depot_cache_SharedCache_hpp

#include <string>
#include <chrono>

#include <boost/optional.hpp>


namespace depot {
namespace cache {

/**
 * Cache tier shared by the registry instances of a deployment.
 *
 * The tier is best-effort: implementations don't report failures to the
 * caller. A failed lookup is a miss and a failed write is dropped.
 */
class SharedCache {
public:
    virtual ~SharedCache() = default;

    virtual boost::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual bool isConnected() const = 0;
};

}
}

#endif
