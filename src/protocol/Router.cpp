/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "protocol/Router.hpp"

#include <boost/format.hpp>

#include "libdepot/Error.hpp"
#include "common/regex.hpp"


namespace depot {
namespace protocol {

namespace strings = common::regex::strings;

std::string getEndpointString(Endpoint endpoint) {
    switch(endpoint) {
        case Endpoint::ApiVersion:  return "api version";
        case Endpoint::Catalog:     return "catalog";
        case Endpoint::TagList:     return "tag list";
        case Endpoint::Manifest:    return "manifest";
        case Endpoint::Blob:        return "blob";
        case Endpoint::UploadStart: return "upload start";
        case Endpoint::Upload:      return "upload";
        case Endpoint::Health:      return "health";
        case Endpoint::CacheHealth: return "cache health";
    }
    return "unknown";
}

Router::Router() {
    auto name = strings::capture(strings::repositoryName);
    auto reference = strings::capture("[^/]+");

    // uploads before blobs, "uploads" would otherwise be taken for a digest
    patterns = std::vector<Pattern>{
        { boost::regex{strings::anchored("/v2/?")}, Endpoint::ApiVersion, false, false },
        { boost::regex{strings::anchored("/v2/_catalog")}, Endpoint::Catalog, false, false },
        { boost::regex{strings::anchored("/v2/" + name + "/tags/list")}, Endpoint::TagList, true, false },
        { boost::regex{strings::anchored("/v2/" + name + "/manifests/" + reference)}, Endpoint::Manifest, true, true },
        { boost::regex{strings::anchored("/v2/" + name + "/blobs/uploads/?")}, Endpoint::UploadStart, true, false },
        { boost::regex{strings::anchored("/v2/" + name + "/blobs/uploads/" + reference)}, Endpoint::Upload, true, true },
        { boost::regex{strings::anchored("/v2/" + name + "/blobs/" + reference)}, Endpoint::Blob, true, true },
        { boost::regex{strings::anchored("/health")}, Endpoint::Health, false, false },
        { boost::regex{strings::anchored("/health/cache")}, Endpoint::CacheHealth, false, false }
    };

    repositoryEndpointShape = boost::regex{"^/v2/(.+)/(?:tags/list|manifests/[^/]+|blobs/.*)$"};
}

boost::optional<Route> Router::match(const std::string& path) const {
    auto matches = boost::smatch{};
    for(const auto& pattern : patterns) {
        if(!boost::regex_match(path, matches, pattern.regex)) {
            continue;
        }
        auto route = Route{pattern.endpoint, "", ""};
        if(pattern.hasRepository) {
            route.repository = matches[1];
        }
        if(pattern.hasReference) {
            route.reference = matches[2];
        }
        return route;
    }

    if(boost::regex_match(path, matches, repositoryEndpointShape)
       && !boost::regex_match(matches[1].str(), common::regex::repositoryName)) {
        auto message = boost::format("Invalid repository name '%s'") % matches[1];
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RepositoryInvalid, message.str());
    }

    return boost::none;
}

}
}
