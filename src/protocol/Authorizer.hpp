/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_protocol_Authorizer_hpp
#define depot_protocol_Authorizer_hpp

#include <string>

#include "protocol/HttpMessage.hpp"


namespace depot {
namespace protocol {

// Ordered: a level grants the levels below it
enum class Access {
    None,
    Read,
    Write
};

Access parseAccess(const std::string& value);
std::string getAccessString(Access access);

enum class Decision {
    Granted,
    AuthenticationRequired,
    Denied
};

/**
 * Decides whether a request may access a repository at the given level.
 * An empty repository name stands for the registry as a whole (API version
 * check, catalog).
 */
class Authorizer {
public:
    virtual ~Authorizer() = default;
    virtual Decision decide(const HttpRequest& request, const std::string& repository, Access required) const = 0;
    virtual std::string getRealm() const = 0;

    // Throws Unauthorized or Denied unless the access is granted
    void authorize(const HttpRequest& request, const std::string& repository, Access required) const;
};

}
}

#endif
