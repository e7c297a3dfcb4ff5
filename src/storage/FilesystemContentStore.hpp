/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_storage_FilesystemContentStore_hpp
#define depot_storage_FilesystemContentStore_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libdepot/LogLevel.hpp"
#include "storage/ContentStore.hpp"


namespace depot {
namespace storage {

/**
 * Content store on a local (or network mounted) filesystem.
 *
 * Layout: <root>/<algorithm>/<first two hex chars>/<hex>/data
 * Objects are written to a temporary file next to their final location
 * and renamed into place, so a reader never observes partial content.
 */
class FilesystemContentStore : public ContentStore {
public:
    FilesystemContentStore(const boost::filesystem::path& rootDirectory);

    bool put(const common::Digest& digest, const std::string& bytes) override;
    bool putFile(const common::Digest& digest, const boost::filesystem::path& file) override;
    boost::optional<std::string> get(const common::Digest& digest) const override;
    bool exists(const common::Digest& digest) const override;
    boost::optional<BlobInfo> stat(const common::Digest& digest) const override;
    bool remove(const common::Digest& digest) override;
    void healthCheck() const override;

    boost::filesystem::path getDataFile(const common::Digest& digest) const;

private:
    boost::filesystem::path getObjectDirectory(const common::Digest& digest) const;
    void printLog(const boost::format& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;
    void printLog(const std::string& message, libdepot::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ContentStore";
    boost::filesystem::path rootDirectory;
};

}
}

#endif
