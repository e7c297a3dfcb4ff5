/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <clocale>

#include <sys/types.h>
#include <sys/stat.h>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libdepot/Error.hpp"
#include "libdepot/Logger.hpp"
#include "storage/FilesystemContentStore.hpp"
#include "upload/BlobUploadManager.hpp"
#include "cache/RegistryCache.hpp"
#include "registry/ManifestStore.hpp"
#include "registry/RegistryService.hpp"
#include "protocol/ConfigAuthorizer.hpp"
#include "protocol/ProtocolHandler.hpp"
#include "server/HttpServer.hpp"

using namespace depot;

namespace po = boost::program_options;

static po::options_description makeOptionsDescription(const boost::filesystem::path& installationPrefixDir);
static void printHelp(const po::options_description& optionsDescription);

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8");
    umask(022);

    auto& logger = libdepot::Logger::getInstance();

    try {
        auto installationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto optionsDescription = makeOptionsDescription(installationPrefixDir);

        po::variables_map values;
        try {
            po::store(po::command_line_parser(argc, argv)
                        .options(optionsDescription)
                        .style(po::command_line_style::unix_style)
                        .run(), values);
            po::notify(values);
        }
        catch(const std::exception& e) {
            auto message = boost::format("%s\nSee 'depotd --help'") % e.what();
            logger.log(message, "main", libdepot::LogLevel::GENERAL, std::cerr);
            return 1;
        }

        if(values.count("help")) {
            printHelp(optionsDescription);
            return 0;
        }

        if(values.count("version")) {
            logger.log(common::Config::BuildTime{}.version, "main", libdepot::LogLevel::GENERAL);
            return 0;
        }

        auto config = std::make_shared<common::Config>(values["config"].as<std::string>(),
                                                       values["schema"].as<std::string>());

        // command line options take precedence over the configuration file
        if(values.count("debug")) {
            logger.setLevel(libdepot::LogLevel::DEBUG);
        }
        else if(values.count("verbose")) {
            logger.setLevel(libdepot::LogLevel::INFO);
        }
        else {
            logger.setLevel(config->logLevel);
        }

        auto contentStore = std::make_shared<storage::FilesystemContentStore>(config->directories.blobs);
        auto manifestStore = std::make_shared<registry::ManifestStore>(config, contentStore);
        auto uploadManager = std::make_shared<upload::BlobUploadManager>(config, contentStore);
        auto registryCache = std::shared_ptr<cache::RegistryCache>{cache::RegistryCache::create(config->cache)};
        auto service = std::make_shared<registry::RegistryService>(config, contentStore, manifestStore,
                                                                   uploadManager, registryCache);
        auto authorizer = std::make_shared<protocol::ConfigAuthorizer>(config->authorization);
        auto handler = std::make_shared<protocol::ProtocolHandler>(config, service, authorizer);

        auto message = boost::format("Starting depot %s with root directory %s")
            % config->buildTime.version % config->directories.root;
        logger.log(message, "main", libdepot::LogLevel::INFO);

        server::HttpServer{config, handler, service}.run();
    }
    catch(const libdepot::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libdepot::LogLevel::ERROR);
        return 1;
    }

    return 0;
}

static po::options_description makeOptionsDescription(const boost::filesystem::path& installationPrefixDir) {
    auto defaultConfig = (installationPrefixDir / "etc/depot.json").string();
    auto defaultSchema = (installationPrefixDir / "etc/depot.schema.json").string();

    auto optionsDescription = po::options_description{"Options"};
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("config", po::value<std::string>()->default_value(defaultConfig), "Path of the configuration file")
        ("schema", po::value<std::string>()->default_value(defaultSchema), "Path of the configuration schema")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)");
    return optionsDescription;
}

static void printHelp(const po::options_description& optionsDescription) {
    auto& logger = libdepot::Logger::getInstance();
    logger.log("Usage: depotd [OPTIONS]\n\nContainer image registry daemon\n", "main", libdepot::LogLevel::GENERAL);
    std::stringstream stream;
    stream << optionsDescription;
    logger.log(stream.str(), "main", libdepot::LogLevel::GENERAL);
}
