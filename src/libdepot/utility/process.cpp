/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <limits.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libdepot/Error.hpp"

/**
 * Utility functions for system operations
 */

namespace libdepot {
namespace process {

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        DEPOT_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

}}
