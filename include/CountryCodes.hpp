/**
 * @file CountryCodes.hpp
 * @brief Shared ISO 3166-1 alpha-2 country table
 *
 * Single source of truth for country code <-> name mapping and for the
 * postal code format of each supported market. Every component that needs
 * a country name, a code, or a postal pattern goes through these functions.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace locus {

struct CountryInfo {
    const char* code;             // ISO 3166-1 alpha-2, upper case
    const char* name;             // English name
    const char* postal_pattern;   // ECMAScript regex, nullptr if unknown
    bool postal_case_insensitive;
};

/**
 * @brief All countries known to the core, in table order
 */
const std::vector<CountryInfo>& known_countries();

/**
 * @brief Look up a country by ISO code (case-insensitive)
 */
std::optional<CountryInfo> find_country(const std::string& code);

/**
 * @brief English country name for a code
 * @return The name, or the code itself when the code is unknown
 */
std::string country_name(const std::string& code);

/**
 * @brief ISO code for an English country name (case-insensitive)
 */
std::optional<std::string> country_code_for_name(const std::string& name);

/**
 * @brief Accept either a country name or a two-letter code
 * @return Upper-case ISO code, or nullopt when neither form is recognized
 */
std::optional<std::string> resolve_country_code(const std::string& name_or_code);

/**
 * @brief Whether display names for this country omit the country suffix
 *
 * The core markets (Germany, Italy, Spain, France) are shown without it.
 */
bool is_home_market(const std::string& country_name);

} // namespace locus
