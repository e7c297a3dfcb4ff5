/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include <boost/format.hpp>

#include "Error.hpp"
#include "Logger.hpp"

namespace libdepot {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    if(this != &rhs) {
        removePath();
        path = std::move(rhs.path);
        rhs.release();
    }
    return *this;
}

PathRAII::~PathRAII() {
    removePath();
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path.value();
}

void PathRAII::release() {
    path.reset();
}

// Destructors must not throw: a failed removal is only reported.
void PathRAII::removePath() {
    if(!path) {
        return;
    }
    boost::system::error_code ec;
    boost::filesystem::remove_all(*path, ec);
    if(ec) {
        auto message = boost::format("Failed to remove %s: %s") % *path % ec.message();
        Logger::getInstance().log(message, "PathRAII", LogLevel::WARN);
    }
    path.reset();
}

}
