/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_cache_CacheKey_hpp
#define depot_cache_CacheKey_hpp

#include <string>
#include <cstddef>
#include <ostream>

#include <boost/optional.hpp>

#include "common/Digest.hpp"


namespace depot {
namespace cache {

enum class CacheKind {
    Catalog,
    TagList,
    ManifestByTag,
    ManifestByDigest,
    ManifestContent
};

std::string getCacheKindString(CacheKind kind);

/**
 * Identifies a cache entry. Listings are keyed together with their
 * pagination parameters, manifests by repository and reference, and
 * manifest content by digest only, since it is shared by every repository.
 */
class CacheKey {
public:
    static CacheKey catalog(const boost::optional<std::size_t>& n, const std::string& last);
    static CacheKey tagList(const std::string& repository, const boost::optional<std::size_t>& n, const std::string& last);
    static CacheKey manifestByTag(const std::string& repository, const std::string& tag);
    static CacheKey manifestByDigest(const std::string& repository, const common::Digest& digest);
    static CacheKey manifestContent(const common::Digest& digest);

    CacheKind getKind() const { return kind; }
    const std::string& getRepository() const { return repository; }
    const std::string& getReference() const { return reference; }
    std::string string() const;

private:
    CacheKey(CacheKind kind, const std::string& repository, const std::string& reference, const std::string& page);

private:
    CacheKind kind;
    std::string repository;
    std::string reference;
    std::string page;
};

bool operator==(const CacheKey&, const CacheKey&);
std::ostream& operator<<(std::ostream&, const CacheKey&);

}
}

#endif
