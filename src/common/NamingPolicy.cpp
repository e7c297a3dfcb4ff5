/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "common/NamingPolicy.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libdepot/Error.hpp"
#include "common/regex.hpp"


namespace depot {
namespace common {

const std::size_t NamingPolicy::defaultMaxRepositoryNameLength = 255;
const std::size_t NamingPolicy::defaultMaxTagLength = 128;

NamingPolicy::NamingPolicy(std::size_t maxRepositoryNameLength, std::size_t maxTagLength)
    : maxRepositoryNameLength{maxRepositoryNameLength}
    , maxTagLength{maxTagLength}
{}

void NamingPolicy::validateRepositoryName(const std::string& name) const {
    if(name.empty()) {
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RepositoryInvalid, "Invalid repository name: name is empty");
    }
    if(name.size() > maxRepositoryNameLength) {
        auto message = boost::format("Invalid repository name '%s': length %d exceeds the maximum of %d characters")
            % name % name.size() % maxRepositoryNameLength;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RepositoryInvalid, message.str());
    }
    if(!boost::regex_match(name, regex::repositoryName)) {
        auto message = boost::format("Invalid repository name '%s': expected one or more '/' separated"
                                     " components of lowercase alphanumerics optionally joined by '.', '_', '__' or '-'")
            % name;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::RepositoryInvalid, message.str());
    }
}

void NamingPolicy::validateTag(const std::string& tag) const {
    if(tag.size() > maxTagLength) {
        auto message = boost::format("Invalid tag '%s': length %d exceeds the maximum of %d characters")
            % tag % tag.size() % maxTagLength;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::TagInvalid, message.str());
    }
    if(!boost::regex_match(tag, regex::tag)) {
        auto message = boost::format("Invalid tag '%s': expected a word character followed by"
                                     " word characters, '.' or '-'") % tag;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::TagInvalid, message.str());
    }
}

bool NamingPolicy::isValidRepositoryName(const std::string& name) const {
    return !name.empty()
        && name.size() <= maxRepositoryNameLength
        && boost::regex_match(name, regex::repositoryName);
}

bool NamingPolicy::isValidTag(const std::string& tag) const {
    return tag.size() <= maxTagLength && boost::regex_match(tag, regex::tag);
}

bool NamingPolicy::isDigestReference(const std::string& reference) {
    return reference.find(':') != std::string::npos;
}

}
}
