/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "storage/ContentStore.hpp"


namespace depot {
namespace storage {

const std::string defaultBlobMediaType = "application/octet-stream";

}
}
