/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "cache/CacheKey.hpp"

#include <boost/format.hpp>


namespace depot {
namespace cache {

namespace {

std::string makePage(const boost::optional<std::size_t>& n, const std::string& last) {
    auto page = boost::format("n=%s,last=%s") % (n ? std::to_string(*n) : std::string{"all"}) % last;
    return page.str();
}

}

std::string getCacheKindString(CacheKind kind) {
    switch(kind) {
        case CacheKind::Catalog:          return "catalog";
        case CacheKind::TagList:          return "tag list";
        case CacheKind::ManifestByTag:    return "manifest by tag";
        case CacheKind::ManifestByDigest: return "manifest by digest";
        case CacheKind::ManifestContent:  return "manifest content";
    }
    return "unknown";
}

CacheKey::CacheKey(CacheKind kind, const std::string& repository, const std::string& reference, const std::string& page)
    : kind{kind}
    , repository{repository}
    , reference{reference}
    , page{page}
{}

CacheKey CacheKey::catalog(const boost::optional<std::size_t>& n, const std::string& last) {
    return CacheKey{CacheKind::Catalog, "", "", makePage(n, last)};
}

CacheKey CacheKey::tagList(const std::string& repository, const boost::optional<std::size_t>& n, const std::string& last) {
    return CacheKey{CacheKind::TagList, repository, "", makePage(n, last)};
}

CacheKey CacheKey::manifestByTag(const std::string& repository, const std::string& tag) {
    return CacheKey{CacheKind::ManifestByTag, repository, tag, ""};
}

CacheKey CacheKey::manifestByDigest(const std::string& repository, const common::Digest& digest) {
    return CacheKey{CacheKind::ManifestByDigest, repository, digest.string(), ""};
}

CacheKey CacheKey::manifestContent(const common::Digest& digest) {
    return CacheKey{CacheKind::ManifestContent, "", digest.string(), ""};
}

std::string CacheKey::string() const {
    switch(kind) {
        case CacheKind::Catalog:          return "repos:" + page;
        case CacheKind::TagList:          return "tags:" + repository + ":" + page;
        case CacheKind::ManifestByTag:    return "manifest:" + repository + ":" + reference;
        case CacheKind::ManifestByDigest: return "manifest:" + repository + "@" + reference;
        case CacheKind::ManifestContent:  return "manifest:" + reference;
    }
    return reference;
}

bool operator==(const CacheKey& lhs, const CacheKey& rhs) {
    return lhs.string() == rhs.string();
}

std::ostream& operator<<(std::ostream& os, const CacheKey& key) {
    return os << key.string();
}

}
}
