/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libdepot_utility_filesystem_hpp
#define libdepot_utility_filesystem_hpp

#include <string>
#include <ios>
#include <sys/types.h>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation and investigation
 */

namespace libdepot {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
void createFileIfNecessary(const boost::filesystem::path&);
void removeFile(const boost::filesystem::path& path);
size_t getFileSize(const boost::filesystem::path& filename);
std::string readFile(const boost::filesystem::path& path);
void writeFile(const std::string& content,
               const boost::filesystem::path& filename,
               const std::ios_base::openmode mode = std::ios_base::out);
void atomicallyWriteFile(const std::string& content, const boost::filesystem::path& filename);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);

}}

#endif
