/**
 * @file main.cpp
 * @brief Main entry point for locus-cli
 *
 * Geocodes place names, searches postal code areas around a point and
 * looks up postal codes, cities and regions. Results go to stdout as JSON.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "locus.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/LocationStore.hpp"
#include "core/LocusServices.hpp"
#include "core/Logger.hpp"
#include <iostream>
#include <memory>

using namespace locus;

/**
 * @brief Built-in city list, or the configured replacement
 */
std::shared_ptr<const LocationStore> load_store(const LocusConfig& config) {
    if (!config.locations_file) {
        return std::make_shared<const LocationStore>(LocationStore::with_default_locations());
    }

    auto store = LocationStore::load_from_file(*config.locations_file);
    if (!store) {
        return nullptr;
    }
    return std::make_shared<const LocationStore>(std::move(*store));
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    Logger logger("main");

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help shown or parsing failed
        }

        cli.print_config();

        auto store = load_store(cli.get_config());
        if (!store) {
            logger.error("Could not load locations file: " + cli.get_config().locations_file.value_or(""));
            return 1;
        }

        LocusServices services(cli.get_config(), nullptr, store);
        int status = cli.run(services);

        logger.flush();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
