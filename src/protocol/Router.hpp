/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_protocol_Router_hpp
#define depot_protocol_Router_hpp

#include <string>
#include <vector>

#include <boost/regex.hpp>
#include <boost/optional.hpp>


namespace depot {
namespace protocol {

enum class Endpoint {
    ApiVersion,
    Catalog,
    TagList,
    Manifest,
    Blob,
    UploadStart,
    Upload,
    Health,
    CacheHealth
};

std::string getEndpointString(Endpoint endpoint);

struct Route {
    Endpoint endpoint;
    std::string repository;
    std::string reference; // tag or digest, blob digest, or upload session id
};

/**
 * Maps request paths to the V2 endpoints. Repository names must follow the
 * distribution name grammar: a path that has the shape of a V2 repository
 * endpoint but whose name doesn't match the grammar is reported as
 * RepositoryInvalid rather than as an unknown path.
 */
class Router {
public:
    Router();
    boost::optional<Route> match(const std::string& path) const;

private:
    struct Pattern {
        boost::regex regex;
        Endpoint endpoint;
        bool hasRepository;
        bool hasReference;
    };

private:
    std::vector<Pattern> patterns;
    boost::regex repositoryEndpointShape;
};

}
}

#endif
