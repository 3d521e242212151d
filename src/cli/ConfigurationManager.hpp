/**
 * @file ConfigurationManager.hpp
 * @brief Configuration file management for locus-cli
 */

#pragma once

#include "locus.hpp"
#include <string>
#include <map>
#include <optional>
#include <vector>

namespace locus {

/**
 * @brief Configuration file manager for loading and saving settings
 *
 * Files are plain key=value lines; '#' starts a comment line. Keys match
 * the LocusConfig field names, with cache TTLs given in seconds.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Parse key=value text (same format as the file)
     */
    void load_from_string(const std::string& text);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to LocusConfig, keeping defaults for absent or unparseable keys
     */
    LocusConfig to_locus_config() const;

    void from_locus_config(const LocusConfig& config);

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                return std::stoi(it->second);
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    double get_double(const std::string& key, double default_value = 0.0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                return std::stod(it->second);
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "1" || value == "yes";
        }
        return default_value;
    }

    /**
     * @brief Comma-separated list, entries trimmed, empty entries dropped
     */
    std::vector<std::string> get_list(const std::string& key,
                                      const std::vector<std::string>& default_value = {}) const;

    static std::vector<std::string> split_list(const std::string& value);

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace locus
