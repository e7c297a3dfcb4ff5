/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_common_NamingPolicy_hpp
#define depot_common_NamingPolicy_hpp

#include <string>
#include <cstddef>


namespace depot {
namespace common {

/**
 * Validates repository names and tags against the distribution grammar
 * (see common/regex.hpp) and the configured length limits.
 */
class NamingPolicy {
public:
    static const std::size_t defaultMaxRepositoryNameLength;
    static const std::size_t defaultMaxTagLength;

public:
    NamingPolicy(std::size_t maxRepositoryNameLength = defaultMaxRepositoryNameLength,
                 std::size_t maxTagLength = defaultMaxTagLength);

    void validateRepositoryName(const std::string& name) const;
    void validateTag(const std::string& tag) const;
    bool isValidRepositoryName(const std::string& name) const;
    bool isValidTag(const std::string& tag) const;

    // A reference is a digest when it contains the algorithm separator,
    // which the tag grammar doesn't allow.
    static bool isDigestReference(const std::string& reference);

private:
    std::size_t maxRepositoryNameLength;
    std::size_t maxTagLength;
};

}
}

#endif
