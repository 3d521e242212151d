/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "StringUtils.hpp"
#include <sstream>
#include <cctype>
#include <cmath>

namespace locus {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const NearbySearchOptions& options) const {
    ValidationResult result;

    if (auto conflict = check_coordinates(options.center)) {
        result.add(*conflict);
    }
    if (auto conflict = check_radius(options.radius_km)) {
        result.add(*conflict);
    }
    if (auto conflict = check_result_limit(options.max_results, "--limit")) {
        result.add(*conflict);
    }
    if (auto conflict = check_countries(options.countries, "--country")) {
        result.add(*conflict);
    }

    return result;
}

ValidationResult InputValidator::validate(const LocusConfig& config) const {
    ValidationResult result;

    if (auto conflict = check_endpoint(config.nominatim_url, "nominatim_url")) {
        result.add(*conflict);
    }
    if (auto conflict = check_endpoint(config.location_index_url, "location_index_url")) {
        result.add(*conflict);
    }
    if (config.timeout_seconds <= 0) {
        ParameterConflict conflict;
        conflict.description = "HTTP timeout must be positive (got " +
                               std::to_string(config.timeout_seconds) + "s)";
        conflict.involved_params = {"timeout_seconds = " + std::to_string(config.timeout_seconds)};
        conflict.suggestions = {"Set timeout_seconds to 10"};
        result.add(conflict);
    }
    if (auto conflict = check_radius(config.default_radius_km)) {
        result.add(*conflict);
    }
    if (auto conflict = check_result_limit(config.default_max_results, "default_max_results")) {
        result.add(*conflict);
    }
    if (auto conflict = check_result_limit(config.autocomplete_limit, "autocomplete_limit")) {
        result.add(*conflict);
    }
    if (auto conflict = check_countries(config.default_countries, "default_countries")) {
        result.add(*conflict);
    }
    if (config.log_level < 1 || config.log_level > 6) {
        ParameterConflict conflict;
        conflict.description = "Log level must be between 1 (errors) and 6 (trace)";
        conflict.involved_params = {"log_level = " + std::to_string(config.log_level)};
        conflict.suggestions = {"Use 3 for normal output", "Use 5 to see request URLs and cache hits"};
        result.add(conflict);
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_coordinates(const GeographicCoordinates& center) const {
    if (center.is_valid()) {
        return std::nullopt;
    }

    std::ostringstream lat, lng;
    lat << center.lat;
    lng << center.lng;

    ParameterConflict conflict;
    conflict.description = "Search center is outside the valid coordinate range";
    conflict.involved_params = {"--lat = " + lat.str() + " (must be in [-90, 90])",
                                "--lng = " + lng.str() + " (must be in [-180, 180])"};
    conflict.suggestions = {"Check that latitude and longitude are not swapped"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_radius(double radius_km) const {
    if (std::isfinite(radius_km) && radius_km > 0.0) {
        return std::nullopt;
    }

    std::ostringstream value;
    value << radius_km;

    ParameterConflict conflict;
    conflict.description = "Search radius must be a positive number of kilometers";
    conflict.involved_params = {"--radius = " + value.str()};
    conflict.suggestions = {"Use --radius 25 for the default city-scale search"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_result_limit(int limit, const std::string& param) const {
    if (limit > 0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Result limit must be at least 1";
    conflict.involved_params = {param + " = " + std::to_string(limit)};
    conflict.suggestions = {"Omit " + param + " to use the default"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_countries(const std::vector<std::string>& countries,
                                                                 const std::string& param) const {
    if (countries.empty()) {
        ParameterConflict conflict;
        conflict.description = "At least one country must be searched";
        conflict.involved_params = {param + " is empty"};
        conflict.suggestions = {"Use " + param + " DE,IT,ES,FR"};
        return conflict;
    }

    std::vector<std::string> malformed;
    for (const auto& code : countries) {
        const std::string trimmed = trim(code);
        bool two_letters = trimmed.size() == 2 &&
                           std::isalpha(static_cast<unsigned char>(trimmed[0])) &&
                           std::isalpha(static_cast<unsigned char>(trimmed[1]));
        if (!two_letters) {
            malformed.push_back("'" + code + "'");
        }
    }

    if (malformed.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Countries must be given as two-letter ISO codes";
    conflict.involved_params = {param + " contains " + join(malformed, ", ")};
    conflict.suggestions = {"Write Germany as DE, Italy as IT, Spain as ES, France as FR"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_endpoint(const std::string& url,
                                                                const std::string& param) const {
    if (starts_with(url, "http://") || starts_with(url, "https://")) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Endpoint must be an http:// or https:// URL";
    conflict.involved_params = {param + " = '" + url + "'"};
    conflict.suggestions = {"Include the scheme, e.g. https://nominatim.openstreetmap.org"};
    return conflict;
}

} // namespace locus
