/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libdepot_utility_string_hpp
#define libdepot_utility_string_hpp

#include <string>
#include <sys/types.h>

/**
 * Utility functions for string manipulation
 */

namespace libdepot {
namespace string {

std::string generateRandom(size_t size);
std::string percentDecode(const std::string& input);
std::string percentEncode(const std::string& input);
std::string base64Decode(const std::string& input);

}}

#endif
