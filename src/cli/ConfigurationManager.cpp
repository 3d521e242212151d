/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for locus-cli
 */

#include "ConfigurationManager.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace locus {

namespace {

std::string trim_blanks(std::string value) {
    value.erase(0, value.find_first_not_of(" \t\r"));
    value.erase(value.find_last_not_of(" \t\r") + 1);
    return value;
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    load_from_string(buffer.str());
    return true;
}

void ConfigurationManager::load_from_string(const std::string& text) {
    std::istringstream input(text);

    // Simple key=value parser
    std::string line;
    while (std::getline(input, line)) {
        line = trim_blanks(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim_blanks(line.substr(0, eq_pos));
        std::string value = trim_blanks(line.substr(eq_pos + 1));
        if (!key.empty()) {
            config_values_[key] = value;
        }
    }
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# LocusCore Configuration" << std::endl;
    file << "# Generated automatically" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << "=" << value << std::endl;
    }

    return true;
}

std::vector<std::string> ConfigurationManager::split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim_blanks(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> ConfigurationManager::get_list(const std::string& key,
                                                        const std::vector<std::string>& default_value) const {
    if (!has_value(key)) {
        return default_value;
    }
    return split_list(get_string(key));
}

LocusConfig ConfigurationManager::to_locus_config() const {
    LocusConfig config;

    config.nominatim_url = get_string("nominatim_url", config.nominatim_url);
    config.location_index_url = get_string("location_index_url", config.location_index_url);
    config.user_agent = get_string("user_agent", config.user_agent);
    config.nominatim_language = get_string("nominatim_language", config.nominatim_language);
    config.timeout_seconds = get_int("timeout_seconds", config.timeout_seconds);
    if (has_value("locations_file") && !get_string("locations_file").empty()) {
        config.locations_file = get_string("locations_file");
    }

    config.default_countries = get_list("default_countries", config.default_countries);
    config.default_radius_km = get_double("default_radius_km", config.default_radius_km);
    config.default_max_results = get_int("default_max_results", config.default_max_results);

    config.autocomplete_limit = get_int("autocomplete_limit", config.autocomplete_limit);
    config.default_country_code = get_string("default_country_code", config.default_country_code);

    config.enable_cache = get_bool("enable_cache", config.enable_cache);
    config.nearby_cache_ttl = std::chrono::seconds(
        get_int("nearby_cache_ttl_seconds", static_cast<int>(config.nearby_cache_ttl.count())));
    config.lookup_cache_ttl = std::chrono::seconds(
        get_int("lookup_cache_ttl_seconds", static_cast<int>(config.lookup_cache_ttl.count())));
    config.geocode_cache_ttl = std::chrono::seconds(
        get_int("geocode_cache_ttl_seconds", static_cast<int>(config.geocode_cache_ttl.count())));

    config.log_level = get_int("log_level", config.log_level);
    if (has_value("log_file") && !get_string("log_file").empty()) {
        config.log_file = get_string("log_file");
    }

    return config;
}

void ConfigurationManager::from_locus_config(const LocusConfig& config) {
    set_value("nominatim_url", config.nominatim_url);
    set_value("location_index_url", config.location_index_url);
    set_value("user_agent", config.user_agent);
    set_value("nominatim_language", config.nominatim_language);
    set_value("timeout_seconds", std::to_string(config.timeout_seconds));
    set_value("locations_file", config.locations_file.value_or(""));

    // Store countries as DE,IT,ES,FR
    std::ostringstream countries_ss;
    for (size_t i = 0; i < config.default_countries.size(); ++i) {
        if (i > 0) countries_ss << ",";
        countries_ss << config.default_countries[i];
    }
    set_value("default_countries", countries_ss.str());

    std::ostringstream radius_ss;
    radius_ss << config.default_radius_km;
    set_value("default_radius_km", radius_ss.str());
    set_value("default_max_results", std::to_string(config.default_max_results));

    set_value("autocomplete_limit", std::to_string(config.autocomplete_limit));
    set_value("default_country_code", config.default_country_code);

    set_value("enable_cache", config.enable_cache ? "true" : "false");
    set_value("nearby_cache_ttl_seconds", std::to_string(config.nearby_cache_ttl.count()));
    set_value("lookup_cache_ttl_seconds", std::to_string(config.lookup_cache_ttl.count()));
    set_value("geocode_cache_ttl_seconds", std::to_string(config.geocode_cache_ttl.count()));

    set_value("log_level", std::to_string(config.log_level));
    set_value("log_file", config.log_file.value_or(""));
}

} // namespace locus
