/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_test_utility_unittest_main_function_hpp
#define depot_test_utility_unittest_main_function_hpp

#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>


#define DEPOT_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    /* lazily initialized singletons and caches would be reported as leaks */ \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libdepot::Error& e) { \
        libdepot::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
