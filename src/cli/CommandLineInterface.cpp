/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "JsonOutput.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/InputValidator.hpp"
#include "../core/LocusServices.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <cstdlib>

namespace locus {

namespace {

SimpleCommandLineParser make_parser() {
    SimpleCommandLineParser parser("locus-cli",
        "LOCUS - Place name geocoding, nearby search and postal code lookup");

    parser.add_option("config", "c", "Path to key=value configuration file");
    parser.add_option("country", "", "Country code; comma-separated list for nearby");
    parser.add_option("radius", "r", "Search radius in km");
    parser.add_option("limit", "n", "Maximum number of results");
    parser.add_option("lat", "", "Latitude of the search center");
    parser.add_option("lng", "", "Longitude of the search center");

    parser.add_flag("silent", "s", "Only log errors");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level 1-6 (3=INFO default), per facility as \"3,NearbySearchEngine=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_option("create-config", "", "Create default configuration file at path");
    parser.add_flag("version", "", "Show version information");
    return parser;
}

// Leading number of "4,Facility=6"; nullopt when the string has none
std::optional<int> default_level_of(const std::string& log_config) {
    const std::string first = log_config.substr(0, log_config.find(','));
    if (first.empty() || first.find('=') != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoi(first);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void print_json(const json& value) {
    std::cout << value.dump(2) << std::endl;
}

} // namespace

std::optional<CommandLineInterface::Command> CommandLineInterface::parse_command(const std::string& name) {
    if (name == "geocode") return Command::GEOCODE;
    if (name == "search") return Command::SEARCH;
    if (name == "nearby") return Command::NEARBY;
    if (name == "reverse") return Command::REVERSE;
    if (name == "postal") return Command::POSTAL;
    if (name == "city") return Command::CITY;
    if (name == "region") return Command::REGION;
    if (name == "lookup") return Command::LOOKUP;
    if (name == "validate") return Command::VALIDATE;
    return std::nullopt;
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

bool CommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser = make_parser();
    exit_code_ = 0;

    if (!parser.parse(args)) {
        if (parser.help_requested()) {
            parser.show_help();
        } else {
            exit_code_ = 1;
        }
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "locus-cli v" << LOCUS_VERSION_STRING << std::endl;
        std::cout << "Built with libcurl and nlohmann::json" << std::endl;
        return false;
    }

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to write configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    const auto& positional = parser.get_positional();
    if (positional.empty()) {
        std::cerr << "Missing command. Run with --help for usage." << std::endl;
        exit_code_ = 1;
        return false;
    }

    auto command = parse_command(positional[0]);
    if (!command) {
        std::cerr << "Unknown command: " << positional[0] << std::endl;
        exit_code_ = 1;
        return false;
    }
    command_ = *command;

    argument_.clear();
    for (size_t i = 1; i < positional.size(); ++i) {
        if (!argument_.empty()) argument_ += " ";
        argument_ += positional[i];
    }

    if (!apply_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    apply_logging_options(parser);

    const bool needs_argument = command_ != Command::NEARBY && command_ != Command::REVERSE;
    if (needs_argument && argument_.empty()) {
        std::cerr << "Command '" << positional[0] << "' needs an argument" << std::endl;
        exit_code_ = 1;
        return false;
    }

    const bool has_center = lat_.has_value() && lng_.has_value();
    if (command_ == Command::REVERSE && !has_center) {
        std::cerr << "Command 'reverse' needs --lat and --lng" << std::endl;
        exit_code_ = 1;
        return false;
    }
    if (command_ == Command::NEARBY && !has_center && argument_.empty()) {
        std::cerr << "Command 'nearby' needs --lat and --lng, or a place name" << std::endl;
        exit_code_ = 1;
        return false;
    }

    InputValidator validator;
    ValidationResult validation = validator.validate(config_);
    if (validation.has_errors()) {
        std::cerr << validation.format_error_message();
        exit_code_ = 1;
        return false;
    }

    return true;
}

bool CommandLineInterface::apply_options(const SimpleCommandLineParser& parser) {
    auto check = [&parser](const char* name, bool parsed) {
        if (parser.get(name).has_value() && !parsed) {
            std::cerr << "Invalid numeric value for --" << name << ": " << parser.get(name).value() << std::endl;
            return false;
        }
        return true;
    };

    lat_ = parser.get_as<double>("lat");
    lng_ = parser.get_as<double>("lng");
    radius_km_ = parser.get_as<double>("radius");
    limit_ = parser.get_as<int>("limit");

    if (!check("lat", lat_.has_value()) || !check("lng", lng_.has_value()) ||
        !check("radius", radius_km_.has_value()) || !check("limit", limit_.has_value())) {
        return false;
    }

    countries_.clear();
    if (auto value = parser.get("country")) {
        countries_ = ConfigurationManager::split_list(value.value());
    }

    return true;
}

void CommandLineInterface::apply_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > config file > defaults
    Logger::setDefaultLevel(static_cast<LogLevel>(config_.log_level));

    // 1. Check environment variable first
    if (const char* env_log_level = std::getenv("LOCUS_LOG_LEVEL")) {
        std::string env_config(env_log_level);
        Logger::parseLogConfig(env_config);
        if (auto level = default_level_of(env_config)) {
            config_.log_level = *level;
        }
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        Logger::parseLogConfig(value.value());
        if (auto level = default_level_of(value.value())) {
            config_.log_level = *level;
        }
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    // 4. Log file configuration
    if (const char* env_log_file = std::getenv("LOCUS_LOG_FILE")) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();  // CLI overrides environment
    }
    Logger::setSharedLogFile(config_.log_file);
}

std::string CommandLineInterface::country_or_default() const {
    return countries_.empty() ? config_.default_country_code : countries_.front();
}

int CommandLineInterface::run(LocusServices& services) const {
    switch (command_) {
        case Command::GEOCODE: {
            GeocodingOptions options;
            if (!countries_.empty()) {
                options.preferred_country = countries_.front();
            }
            auto result = services.resolver().geocode(argument_, options);
            if (!result) {
                print_json(nullptr);
                return 2;
            }
            print_json(*result);
            return 0;
        }

        case Command::SEARCH: {
            const int limit = limit_.value_or(config_.autocomplete_limit);
            print_json(services.resolver().search(argument_, static_cast<size_t>(std::max(limit, 0))));
            return 0;
        }

        case Command::NEARBY: {
            const double radius = radius_km_.value_or(config_.default_radius_km);
            if (!lat_ || !lng_) {
                print_json(services.nearby().geocode_with_nearby(argument_, radius,
                                                                 limit_.value_or(20)));
                return 0;
            }

            NearbySearchOptions options;
            options.center = GeographicCoordinates(*lat_, *lng_);
            options.radius_km = radius;
            options.countries = countries_.empty() ? config_.default_countries : countries_;
            options.max_results = limit_.value_or(config_.default_max_results);

            ValidationResult validation = InputValidator().validate(options);
            if (validation.has_errors()) {
                std::cerr << validation.format_error_message();
                return 1;
            }

            print_json(services.nearby().search_nearby(options));
            return 0;
        }

        case Command::REVERSE: {
            auto location = services.nearby().reverse_geocode(GeographicCoordinates(*lat_, *lng_));
            if (!location) {
                print_json(nullptr);
                return 2;
            }
            print_json(*location);
            return 0;
        }

        case Command::POSTAL:
            print_json(services.lookups().lookup_by_postal_code(argument_, country_or_default()));
            return 0;

        case Command::CITY:
            print_json(services.lookups().lookup_by_city(argument_, country_or_default()));
            return 0;

        case Command::REGION:
            print_json(services.lookups().lookup_by_region(argument_, country_or_default()));
            return 0;

        case Command::LOOKUP:
            print_json(services.lookups().smart_lookup(argument_, country_or_default()));
            return 0;

        case Command::VALIDATE: {
            const std::string country = country_or_default();
            const bool valid = PostalLookupService::validate_postal_code(argument_, country);
            print_json(json{
                {"postalCode", argument_},
                {"country", country},
                {"valid", valid},
                {"formatted", PostalLookupService::format_postal_code(argument_, country)}
            });
            return valid ? 0 : 2;
        }
    }
    return 1;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager;
    manager.from_locus_config(LocusConfig{});
    return manager.save_to_file(filename);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.load_from_file(filename)) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }
    config_ = manager.to_locus_config();
    return true;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::clog << "\n=== Configuration ===\n";
    std::clog << "Nominatim: " << config_.nominatim_url << "\n";
    std::clog << "Location index: " << config_.location_index_url << "\n";
    std::clog << "Timeout: " << config_.timeout_seconds << "s\n";
    std::clog << "Default countries: ";
    for (size_t i = 0; i < config_.default_countries.size(); ++i) {
        if (i > 0) std::clog << ", ";
        std::clog << config_.default_countries[i];
    }
    std::clog << "\nDefault radius: " << config_.default_radius_km << "km\n";
    std::clog << "Cache: " << (config_.enable_cache ? "enabled" : "disabled") << "\n";
    if (config_.locations_file) {
        std::clog << "Locations file: " << *config_.locations_file << "\n";
    }
    std::clog << "=====================\n\n";
}

} // namespace locus
