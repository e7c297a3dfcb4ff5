/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_test_utility_errors_hpp
#define depot_test_utility_errors_hpp

#include <boost/optional.hpp>

#include "libdepot/Error.hpp"

namespace test_utility {
namespace errors {

// Runs the function and returns the code of the libdepot::Error it throws,
// or none if it doesn't throw.
template<class Function>
boost::optional<libdepot::ErrorCode> getErrorCode(Function function) {
    try {
        function();
    }
    catch(const libdepot::Error& e) {
        return e.getErrorCode();
    }
    return boost::none;
}

}
}

#endif
