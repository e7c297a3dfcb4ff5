/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libdepot_Utility_hpp
#define libdepot_Utility_hpp

/*
 * All utility headers.
 * All source files including this header should be eventually updated to
 * include individual headers instead.
 */

#include "libdepot/utility/filesystem.hpp"
#include "libdepot/utility/json.hpp"
#include "libdepot/utility/logging.hpp"
#include "libdepot/utility/process.hpp"
#include "libdepot/utility/string.hpp"

#endif
