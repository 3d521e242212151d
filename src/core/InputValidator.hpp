/**
 * @file InputValidator.hpp
 * @brief Input validation for search parameters and configuration
 *
 * Reports every problem found in one pass, with suggested fixes, so the
 * command line can show them all at once.
 */

#pragma once

#include "locus.hpp"
#include <string>
#include <vector>
#include <optional>

namespace locus {

/**
 * @brief A single invalid or conflicting input
 */
struct ParameterConflict {
    std::string description;           // Description of the problem
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(const ParameterConflict& conflict) {
        conflicts.push_back(conflict);
        is_valid = false;
    }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate a nearby search before any request is made
     *
     * Rejects out-of-range coordinates, a non-positive radius or limit,
     * and an empty country list.
     */
    ValidationResult validate(const NearbySearchOptions& options) const;

    /**
     * @brief Validate a loaded configuration
     */
    ValidationResult validate(const LocusConfig& config) const;

private:
    std::optional<ParameterConflict> check_coordinates(const GeographicCoordinates& center) const;

    std::optional<ParameterConflict> check_radius(double radius_km) const;

    std::optional<ParameterConflict> check_result_limit(int limit, const std::string& param) const;

    /**
     * @brief Country list must be non-empty and contain only two-letter codes
     */
    std::optional<ParameterConflict> check_countries(const std::vector<std::string>& countries,
                                                     const std::string& param) const;

    std::optional<ParameterConflict> check_endpoint(const std::string& url,
                                                    const std::string& param) const;
};

} // namespace locus
