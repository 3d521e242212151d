/**
 * @file ScoringRules.hpp
 * @brief Ordered (predicate, score) rule lists for relevance and confidence
 *
 * A rule set is evaluated top to bottom and the first matching rule
 * decides the score. Keeping the policies as data lets them be inspected
 * and tested independently of the components that use them.
 */

#pragma once

#include "locus.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace locus {

template<typename Context, typename Outcome>
class RuleSet {
public:
    struct Rule {
        std::string name;
        std::function<bool(const Context&)> predicate;
        Outcome outcome;
    };

    RuleSet() = default;
    RuleSet(std::vector<Rule> rules, std::optional<Outcome> fallback = std::nullopt)
        : rules_(std::move(rules)), fallback_(std::move(fallback)) {}

    /**
     * @brief Outcome of the first matching rule, else the fallback
     */
    std::optional<Outcome> evaluate(const Context& context) const {
        for (const auto& rule : rules_) {
            if (rule.predicate(context)) {
                return rule.outcome;
            }
        }
        return fallback_;
    }

    /**
     * @brief Name of the first matching rule; "fallback" or "" when none
     */
    std::string matching_rule(const Context& context) const {
        for (const auto& rule : rules_) {
            if (rule.predicate(context)) {
                return rule.name;
            }
        }
        return fallback_ ? "fallback" : "";
    }

    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
    std::optional<Outcome> fallback_;
};

// ============================================================================
// Name relevance (static matcher)
// ============================================================================

/**
 * @brief Both strings already normalized (trimmed, lower-cased)
 */
struct NameMatchContext {
    std::string candidate;
    std::string query;
};

/**
 * @brief exact 1.0, prefix 0.9, substring 0.7, otherwise no score
 */
const RuleSet<NameMatchContext, double>& name_relevance_rules();

// ============================================================================
// External geocoder confidence and location type
// ============================================================================

/**
 * @brief Lower-cased display name and address components of one result
 */
struct AddressMatchContext {
    std::string display_name;
    std::vector<std::string> address_values;
    std::string query;
};

/**
 * @brief display name contains 0.9, component equals 0.8,
 *        component contains 0.7, floor 0.6
 */
const RuleSet<AddressMatchContext, double>& external_confidence_rules();

/**
 * @brief Provider address breakdown keyed by field name
 */
using AddressFields = std::map<std::string, std::string>;

/**
 * @brief city > town > village > suburb/neighbourhood > county/district
 *        > state/region > country, defaulting to city
 */
const RuleSet<AddressFields, LocationType>& location_type_rules();

} // namespace locus
