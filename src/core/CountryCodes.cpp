/**
 * @file CountryCodes.cpp
 * @brief Shared country table implementation
 */

#include "CountryCodes.hpp"
#include "StringUtils.hpp"

#include <algorithm>

namespace locus {

const std::vector<CountryInfo>& known_countries() {
    static const std::vector<CountryInfo> countries = {
        {"DE", "Germany",        "^[0-9]{5}$", false},
        {"IT", "Italy",          "^[0-9]{5}$", false},
        {"ES", "Spain",          "^[0-9]{5}$", false},
        {"FR", "France",         "^[0-9]{5}$", false},
        {"AT", "Austria",        "^[0-9]{4}$", false},
        {"CH", "Switzerland",    "^[0-9]{4}$", false},
        {"NL", "Netherlands",    "^[0-9]{4}\\s?[A-Z]{2}$", true},
        {"BE", "Belgium",        "^[0-9]{4}$", false},
        {"US", "United States",  "^[0-9]{5}(-[0-9]{4})?$", false},
        {"GB", "United Kingdom", "^[A-Z]{1,2}[0-9R][0-9A-Z]?\\s?[0-9][A-Z]{2}$", true},
    };
    return countries;
}

std::optional<CountryInfo> find_country(const std::string& code) {
    const std::string upper = to_upper_ascii(trim(code));
    const auto& countries = known_countries();
    auto it = std::find_if(countries.begin(), countries.end(),
        [&upper](const CountryInfo& info) { return upper == info.code; });
    if (it == countries.end()) {
        return std::nullopt;
    }
    return *it;
}

std::string country_name(const std::string& code) {
    auto info = find_country(code);
    return info ? std::string(info->name) : code;
}

std::optional<std::string> country_code_for_name(const std::string& name) {
    const std::string wanted = to_lower(trim(name));
    for (const auto& info : known_countries()) {
        if (to_lower(info.name) == wanted) {
            return std::string(info.code);
        }
    }
    return std::nullopt;
}

std::optional<std::string> resolve_country_code(const std::string& name_or_code) {
    if (auto info = find_country(name_or_code)) {
        return std::string(info->code);
    }
    return country_code_for_name(name_or_code);
}

bool is_home_market(const std::string& country_name) {
    return country_name == "Germany" || country_name == "Italy" ||
           country_name == "Spain" || country_name == "France";
}

} // namespace locus
