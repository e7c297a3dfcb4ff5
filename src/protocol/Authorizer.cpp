/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "protocol/Authorizer.hpp"

#include <boost/format.hpp>

#include "libdepot/Error.hpp"


namespace depot {
namespace protocol {

Access parseAccess(const std::string& value) {
    if(value == "none") {
        return Access::None;
    }
    if(value == "read") {
        return Access::Read;
    }
    if(value == "write") {
        return Access::Write;
    }
    auto message = boost::format("Failed to parse access level '%s'. Expected one of: none, read, write") % value;
    DEPOT_THROW_ERROR(message.str());
}

std::string getAccessString(Access access) {
    switch(access) {
        case Access::None:  return "none";
        case Access::Read:  return "read";
        case Access::Write: return "write";
    }
    return "none";
}

void Authorizer::authorize(const HttpRequest& request, const std::string& repository, Access required) const {
    auto target = repository.empty() ? std::string{"registry"} : "repository " + repository;
    switch(decide(request, repository, required)) {
        case Decision::Granted:
            return;
        case Decision::AuthenticationRequired: {
            auto message = boost::format("Authentication required for %s access to %s")
                % getAccessString(required) % target;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::Unauthorized, message.str());
        }
        case Decision::Denied: {
            auto message = boost::format("Denied %s access to %s") % getAccessString(required) % target;
            DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::Denied, message.str());
        }
    }
}

}
}
