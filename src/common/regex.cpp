/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "common/regex.hpp"

#include <sstream>


namespace depot {
namespace common {
namespace regex {
namespace strings {

// alphaNumeric defines the alpha numeric atom, typically a
// component of names. This only allows lower case characters and digits.
const std::string alphaNumeric{"[a-z0-9]+"};

// separator defines the separators allowed to be embedded in name
// components. This allows one period, one or two underscore and multiple
// dashes.
const std::string separator{"(?:[._]|__|[-]+)"};

// pathComponent restricts repository path components to start
// with at least one letter or number, with following parts able to be
// separated by one period, one or two underscore and multiple dashes.
const std::string pathComponent = concatenate({ alphaNumeric,
                                                optional(repeated(separator + alphaNumeric))
                                              });

// repositoryName consists of one or more forward slash (/) delimited
// path components (i.e. <namespace>/<repo name>). The registry host is
// never part of the name on the wire.
const std::string repositoryName = concatenate({ pathComponent,
                                                 optional(repeated("\\/" + pathComponent))
                                               });

// tag matches valid tag names. The length limit is enforced separately.
const std::string tag{"[\\w][\\w.-]*"};

// digest matches the algorithm:hex grammar of content digests.
const std::string digestAlgorithm{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*"};
const std::string digestHex{"[0-9A-Fa-f]{32,}"};
const std::string digest = concatenate({ capture(digestAlgorithm), "[:]", capture(digestHex) });

std::string concatenate(const std::initializer_list<std::string> expr) {
    std::stringstream output;
    for (const auto& exp : expr) {
        output << exp;
    }
    return output.str();
}

// Wraps the expression in a non-capturing group and makes the group optional.
std::string optional(const std::string& expr) {
    return group(expr) + "?";
}

// Wraps the regexp in a non-capturing group to get one or more matches.
std::string repeated(const std::string& expr) {
    return group(expr) + "+";
}

// Wraps the regexp in a non-capturing group.
std::string group(const std::string& expr) {
    return "(?:" + expr + ")";
}

// Wraps the expression in a capturing group.
std::string capture(const std::string& expr) {
    return "(" + expr + ")";
}

// Anchors the regular expression by adding start and end delimiters.
std::string anchored(const std::string& expr) {
    return "^" + expr + "$";
}

} //namespace

const boost::regex repositoryName(strings::anchored(strings::repositoryName));
const boost::regex tag(strings::anchored(strings::tag));
const boost::regex digest(strings::anchored(strings::digest));

} // namespace
} // namespace
} // namespace
