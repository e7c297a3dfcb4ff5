/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "protocol/ConfigAuthorizer.hpp"

#include <openssl/crypto.h>
#include <boost/algorithm/string.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"
#include "libdepot/utility/string.hpp"


namespace depot {
namespace protocol {

ConfigAuthorizer::ConfigAuthorizer(const common::Config::Authorization& config)
    : anonymousAccess{parseAccess(config.anonymousAccess)}
    , realm{config.realm}
{
    for(const auto& user : config.users) {
        users.push_back(User{user.username, user.password, parseAccess(user.access), user.repositoryPrefixes});
    }
}

Decision ConfigAuthorizer::decide(const HttpRequest& request, const std::string& repository, Access required) const {
    auto authorization = request.getHeader("Authorization");
    if(!authorization) {
        if(required <= anonymousAccess) {
            return Decision::Granted;
        }
        return Decision::AuthenticationRequired;
    }

    auto credentials = parseCredentials(*authorization);
    if(!credentials) {
        printLog(boost::format("Malformed Authorization header"), libdepot::LogLevel::INFO);
        return Decision::AuthenticationRequired;
    }

    const auto* user = authenticate(*credentials);
    if(!user) {
        printLog(boost::format("Authentication of user '%s' failed") % credentials->username,
                 libdepot::LogLevel::INFO);
        return Decision::AuthenticationRequired;
    }

    if(required <= user->access && isInScope(*user, repository)) {
        return Decision::Granted;
    }
    printLog(boost::format("Denied %s access to '%s' for user '%s'")
             % getAccessString(required) % repository % user->username, libdepot::LogLevel::INFO);
    return Decision::Denied;
}

std::string ConfigAuthorizer::getRealm() const {
    return realm;
}

boost::optional<ConfigAuthorizer::Credentials> ConfigAuthorizer::parseCredentials(const std::string& authorization) const {
    const auto scheme = std::string{"basic "};
    if(authorization.size() <= scheme.size()
       || !boost::algorithm::iequals(authorization.substr(0, scheme.size()), scheme)) {
        return boost::none;
    }

    auto userPass = std::string{};
    try {
        userPass = libdepot::string::base64Decode(authorization.substr(scheme.size()));
    }
    catch(const libdepot::Error&) {
        return boost::none;
    }

    auto separator = userPass.find(':');
    if(separator == std::string::npos) {
        return boost::none;
    }
    return Credentials{userPass.substr(0, separator), userPass.substr(separator + 1)};
}

const ConfigAuthorizer::User* ConfigAuthorizer::authenticate(const Credentials& credentials) const {
    for(const auto& user : users) {
        if(user.username != credentials.username) {
            continue;
        }
        if(user.password.size() == credentials.password.size()
           && CRYPTO_memcmp(user.password.data(), credentials.password.data(), user.password.size()) == 0) {
            return &user;
        }
        return nullptr;
    }
    return nullptr;
}

bool ConfigAuthorizer::isInScope(const User& user, const std::string& repository) const {
    if(repository.empty() || user.repositoryPrefixes.empty()) {
        return true;
    }
    // a prefix covers whole name components only
    for(const auto& prefix : user.repositoryPrefixes) {
        auto trimmed = boost::algorithm::trim_right_copy_if(prefix, boost::algorithm::is_any_of("/"));
        if(trimmed.empty()
           || repository == trimmed
           || boost::algorithm::starts_with(repository, trimmed + "/")) {
            return true;
        }
    }
    return false;
}

void ConfigAuthorizer::printLog(const boost::format& message, libdepot::LogLevel logLevel,
                                std::ostream& out, std::ostream& err) const {
    libdepot::Logger::getInstance().log(message, sysname, logLevel, out, err);
}

}
}
