/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef depot_test_utility_config_hpp
#define depot_test_utility_config_hpp

#include <memory>
#include <functional>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(const ConfigRAII&) = delete;
    ConfigRAII(ConfigRAII&&) = default;
    ~ConfigRAII();
    std::shared_ptr<depot::common::Config> config;
};

using Customizer = std::function<void(rapidjson::Document&)>;

// Creates a configuration rooted in a unique temporary directory,
// removed when the returned object goes out of scope. The optional
// customizer adjusts the JSON document before the typed settings
// are initialized from it.
ConfigRAII makeConfig(const Customizer& customize = Customizer{});

boost::filesystem::path getSchemaFile();

}
}

#endif
