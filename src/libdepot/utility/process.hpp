/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libdepot_utility_process_hpp
#define libdepot_utility_process_hpp

#include <string>

/**
 * Utility functions for system operations
 */

namespace libdepot {
namespace process {

std::string getHostname();

}}

#endif
