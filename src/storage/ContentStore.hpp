/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_storage_ContentStore_hpp
#define depot_storage_ContentStore_hpp

#include <string>
#include <ctime>
#include <cstddef>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "common/Digest.hpp"


namespace depot {
namespace storage {

struct BlobInfo {
    std::size_t size;
    std::time_t created;
};

struct Blob {
    common::Digest digest;
    std::size_t size;
    std::string mediaType;
    std::time_t created;
};

extern const std::string defaultBlobMediaType;

/**
 * Durable byte storage addressed by digest.
 *
 * Objects are immutable: storing a digest that is already present is a no-op.
 * Failures of the underlying storage are reported as StoreUnavailable errors,
 * absent objects as empty optionals (or false), so that callers can tell
 * "not found" from "can't tell".
 */
class ContentStore {
public:
    virtual ~ContentStore() = default;

    // Stores the bytes under the digest, after checking that they hash to it.
    // Returns false if the digest was already present.
    virtual bool put(const common::Digest& digest, const std::string& bytes) = 0;

    // Moves a fully written file into the store. The caller is responsible for
    // having computed the digest of the file content. The source file is
    // consumed in either case. Returns false if the digest was already present.
    virtual bool putFile(const common::Digest& digest, const boost::filesystem::path& file) = 0;

    virtual boost::optional<std::string> get(const common::Digest& digest) const = 0;
    virtual bool exists(const common::Digest& digest) const = 0;
    virtual boost::optional<BlobInfo> stat(const common::Digest& digest) const = 0;

    // Returns false if the digest was not present.
    virtual bool remove(const common::Digest& digest) = 0;

    virtual void healthCheck() const = 0;
};

}
}

#endif
