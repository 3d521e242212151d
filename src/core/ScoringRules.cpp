/**
 * @file ScoringRules.cpp
 * @brief Scoring policies used by the matcher and the external geocoder
 */

#include "ScoringRules.hpp"
#include "StringUtils.hpp"

#include <algorithm>

namespace locus {

namespace {

bool has_field(const AddressFields& fields, const char* key) {
    auto it = fields.find(key);
    return it != fields.end() && !it->second.empty();
}

} // namespace

const RuleSet<NameMatchContext, double>& name_relevance_rules() {
    using Rules = RuleSet<NameMatchContext, double>;
    static const Rules rules(std::vector<Rules::Rule>{
        {"exact", [](const NameMatchContext& c) { return c.candidate == c.query; }, 1.0},
        {"prefix", [](const NameMatchContext& c) { return starts_with(c.candidate, c.query); }, 0.9},
        {"contains", [](const NameMatchContext& c) { return contains(c.candidate, c.query); }, 0.7},
    });
    return rules;
}

const RuleSet<AddressMatchContext, double>& external_confidence_rules() {
    using Rules = RuleSet<AddressMatchContext, double>;
    static const Rules rules(std::vector<Rules::Rule>{
        {"display-name-contains",
         [](const AddressMatchContext& c) { return contains(c.display_name, c.query); }, 0.9},
        {"component-equals",
         [](const AddressMatchContext& c) {
             return std::any_of(c.address_values.begin(), c.address_values.end(),
                                [&c](const std::string& v) { return v == c.query; });
         }, 0.8},
        {"component-contains",
         [](const AddressMatchContext& c) {
             return std::any_of(c.address_values.begin(), c.address_values.end(),
                                [&c](const std::string& v) { return contains(v, c.query); });
         }, 0.7},
    }, 0.6);
    return rules;
}

const RuleSet<AddressFields, LocationType>& location_type_rules() {
    using Rules = RuleSet<AddressFields, LocationType>;
    static const Rules rules(std::vector<Rules::Rule>{
        {"city", [](const AddressFields& f) { return has_field(f, "city"); }, LocationType::CITY},
        {"town", [](const AddressFields& f) { return has_field(f, "town"); }, LocationType::TOWN},
        {"village", [](const AddressFields& f) { return has_field(f, "village"); }, LocationType::VILLAGE},
        {"suburb",
         [](const AddressFields& f) { return has_field(f, "suburb") || has_field(f, "neighbourhood"); },
         LocationType::SUBURB},
        {"district",
         [](const AddressFields& f) { return has_field(f, "county") || has_field(f, "district"); },
         LocationType::DISTRICT},
        {"region",
         [](const AddressFields& f) { return has_field(f, "state") || has_field(f, "region"); },
         LocationType::REGION},
        {"country", [](const AddressFields& f) { return has_field(f, "country"); }, LocationType::COUNTRY},
    }, LocationType::CITY);
    return rules;
}

} // namespace locus
