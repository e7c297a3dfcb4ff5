/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_protocol_ConfigAuthorizer_hpp
#define depot_protocol_ConfigAuthorizer_hpp

#include <string>
#include <vector>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libdepot/LogLevel.hpp"
#include "common/Config.hpp"
#include "protocol/Authorizer.hpp"


namespace depot {
namespace protocol {

/**
 * Authorizer backed by the "authorization" section of the configuration.
 *
 * Requests without credentials get the anonymous access level on every
 * repository. Requests with HTTP Basic credentials get the access level of
 * the matching user, restricted to the repositories named by one of the
 * user's prefixes or nested below it ("library" covers "library/alpine" but
 * not "librarypwn/x"). A user without prefixes, or with an empty one, is
 * granted every repository.
 * Invalid credentials are never downgraded to anonymous access.
 */
class ConfigAuthorizer : public Authorizer {
public:
    explicit ConfigAuthorizer(const common::Config::Authorization& config);

    Decision decide(const HttpRequest& request, const std::string& repository, Access required) const override;
    std::string getRealm() const override;

private:
    struct User {
        std::string username;
        std::string password;
        Access access;
        std::vector<std::string> repositoryPrefixes;
    };

    struct Credentials {
        std::string username;
        std::string password;
    };

private:
    boost::optional<Credentials> parseCredentials(const std::string& authorization) const;
    const User* authenticate(const Credentials& credentials) const;
    bool isInScope(const User& user, const std::string& repository) const;
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ConfigAuthorizer";
    Access anonymousAccess;
    std::string realm;
    std::vector<User> users;
};

}
}

#endif
