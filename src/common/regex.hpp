/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_common_regex_hpp
#define depot_common_regex_hpp

#include <string>
#include <initializer_list>

#include <boost/regex.hpp>

namespace depot {
namespace common {
namespace regex {

extern const boost::regex repositoryName;
extern const boost::regex tag;
extern const boost::regex digest;

namespace strings {

extern const std::string alphaNumeric;
extern const std::string separator;
extern const std::string pathComponent;
extern const std::string repositoryName;
extern const std::string tag;
extern const std::string digestAlgorithm;
extern const std::string digestHex;
extern const std::string digest;

std::string concatenate(const std::initializer_list<std::string> expr);
std::string optional(const std::string& expr);
std::string repeated(const std::string& expr);
std::string group(const std::string& expr);
std::string capture(const std::string& expr);
std::string anchored(const std::string& expr);

}
}
}
}

#endif
