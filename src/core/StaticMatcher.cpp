/**
 * @file StaticMatcher.cpp
 * @brief Implementation of the in-memory name matcher
 */

#include "StaticMatcher.hpp"
#include "ScoringRules.hpp"
#include "StringUtils.hpp"

#include <algorithm>

namespace locus {

StaticMatcher::StaticMatcher(std::shared_ptr<const LocationStore> store)
    : store_(store ? std::move(store) : std::make_shared<const LocationStore>()),
      logger_("StaticMatcher") {
}

std::optional<StaticMatcher::ScoredName> StaticMatcher::score_record(
    const LocationRecord& record, const std::string& normalized_query) const {

    const auto& rules = name_relevance_rules();
    std::optional<ScoredName> best;

    auto consider = [&](const std::string& name) {
        auto score = rules.evaluate(NameMatchContext{to_lower(name), normalized_query});
        if (score && (!best || *score > best->score)) {
            best = ScoredName{*score, name};
        }
    };

    consider(record.name);
    for (const auto& variant : record.name_variants) {
        consider(variant);
    }

    return best;
}

std::vector<LocationSearchResult> StaticMatcher::match(const std::string& query, size_t limit) const {
    const std::string normalized = normalize_query(query);
    if (normalized.size() < MIN_QUERY_LENGTH || limit == 0) {
        return {};
    }

    std::vector<LocationSearchResult> results;

    for (const auto& record : store_->records()) {
        auto scored = score_record(record, normalized);
        if (!scored) {
            continue;
        }

        LocationSearchResult result;
        result.name = scored->matched_name;
        result.hierarchy = LocationHierarchy::from_record(record);
        result.display_name = format_display_name(result.hierarchy);
        result.coordinates = record.coordinates;
        result.relevance_score = scored->score;
        results.push_back(std::move(result));
    }

    std::stable_sort(results.begin(), results.end(),
        [](const LocationSearchResult& a, const LocationSearchResult& b) {
            if (a.relevance_score != b.relevance_score) {
                return a.relevance_score > b.relevance_score;
            }
            return a.hierarchy.population.value_or(0) > b.hierarchy.population.value_or(0);
        });

    if (results.size() > limit) {
        results.resize(limit);
    }

    logger_.detailed("Matched '" + normalized + "': " + std::to_string(results.size()) + " results");
    return results;
}

std::optional<GeocodingResult> StaticMatcher::best_match(const std::string& query) const {
    const std::string normalized = normalize_query(query);
    if (normalized.empty()) {
        return std::nullopt;
    }

    const auto& records = store_->records();

    auto names_of = [](const LocationRecord& record) {
        std::vector<std::string> names{to_lower(record.name)};
        for (const auto& variant : record.name_variants) {
            names.push_back(to_lower(variant));
        }
        return names;
    };

    const LocationRecord* match = nullptr;
    bool exact = false;

    for (const auto& record : records) {
        auto names = names_of(record);
        if (std::find(names.begin(), names.end(), normalized) != names.end()) {
            match = &record;
            exact = true;
            break;
        }
    }

    if (!match) {
        for (const auto& record : records) {
            auto names = names_of(record);
            if (std::any_of(names.begin(), names.end(),
                            [&normalized](const std::string& n) { return contains(n, normalized); })) {
                match = &record;
                break;
            }
        }
    }

    if (!match) {
        logger_.debug("No static match for '" + normalized + "'");
        return std::nullopt;
    }

    GeocodingResult result;
    result.coordinates = match->coordinates;
    result.hierarchy = LocationHierarchy::from_record(*match);
    result.source = GeocodingSource::STATIC;
    result.confidence = exact ? 1.0 : 0.8;

    logger_.debug("Static match for '" + normalized + "': " + match->name);
    return result;
}

std::string StaticMatcher::format_display_name(const LocationHierarchy& hierarchy) {
    std::vector<std::string> parts{hierarchy.city};

    if (hierarchy.district && *hierarchy.district != hierarchy.city) {
        parts.push_back(*hierarchy.district);
    }

    parts.push_back(hierarchy.region);
    return join(parts, ", ");
}

} // namespace locus
