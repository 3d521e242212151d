/**
 * @file PostalLookupService.cpp
 * @brief Implementation of postal code, city and region lookups
 */

#include "PostalLookupService.hpp"
#include "CountryCodes.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>

namespace locus {

namespace {

// std::map keeps groups in key order; results list groups in first-seen order instead
template<typename Key>
class OrderedGroups {
public:
    std::vector<const IndexRow*>& operator[](const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            it = index_.emplace(key, groups_.size()).first;
            groups_.emplace_back();
            keys_.push_back(key);
        }
        return groups_[it->second];
    }

    size_t size() const { return groups_.size(); }
    const Key& key(size_t i) const { return keys_[i]; }
    const std::vector<const IndexRow*>& rows(size_t i) const { return groups_[i]; }

private:
    std::map<Key, size_t> index_;
    std::vector<Key> keys_;
    std::vector<std::vector<const IndexRow*>> groups_;
};

std::vector<std::string> distinct_sorted(const std::vector<const IndexRow*>& rows,
                                         std::string IndexRow::*field) {
    std::set<std::string> values;
    for (const auto* row : rows) {
        if (!(row->*field).empty()) {
            values.insert(row->*field);
        }
    }
    return std::vector<std::string>(values.begin(), values.end());
}

} // namespace

PostalLookupService::PostalLookupService(std::shared_ptr<LocationIndexClient> index,
                                         const CacheConfig& cache_config,
                                         std::shared_ptr<Clock> clock)
    : index_(std::move(index)),
      lookup_cache_(cache_config, clock),
      region_cache_(cache_config, clock),
      logger_("PostalLookupService") {
}

std::string PostalLookupService::cache_key(const std::string& kind,
                                           const std::string& query,
                                           const std::string& country) {
    return kind + ":" + to_lower(query) + ":" + country;
}

std::vector<PostalCodeLookupResult> PostalLookupService::lookup_by_postal_code(const std::string& postal_code,
                                                                               const std::string& country_code) {
    const std::string code = trim(postal_code);
    if (code.empty() || !index_) {
        return {};
    }

    const std::string key = cache_key("postal", code, country_code);
    if (auto cached = lookup_cache_.get(key)) {
        logger_.debug("Cache hit for " + key);
        return cached->postal;
    }

    auto outcome = index_->postal_lookup(code, country_code, POSTAL_LOOKUP_LIMIT);
    if (!outcome) {
        logger_.warning("Postal code lookup for '" + code + "' failed (" + outcome.describe() + ")");
        return {};
    }

    std::vector<PostalCodeLookupResult> results;
    for (const auto& row : outcome.value()) {
        PostalCodeLookupResult result;
        result.postal_code = row.postal_code;
        result.city = row.city;
        result.region = row.region;
        result.district = row.district;
        result.country_code = row.country_code;
        result.country = country_name(row.country_code);
        result.coordinates = row.coordinates;
        result.confidence = row.confidence.value_or(DEFAULT_POSTAL_CONFIDENCE);
        result.display_name = format_display_name(row.city, row.region, row.postal_code, result.country);
        results.push_back(std::move(result));
    }

    logger_.detailed("Postal code '" + code + "': " + std::to_string(results.size()) + " results");
    lookup_cache_.put(key, CachedLookup{results, {}});
    return results;
}

std::vector<CityLookupResult> PostalLookupService::lookup_by_city(const std::string& city,
                                                                  const std::string& country_code) {
    const std::string name = trim(city);
    if (name.empty() || !index_) {
        return {};
    }

    const std::string key = cache_key("city", name, country_code);
    if (auto cached = lookup_cache_.get(key)) {
        logger_.debug("Cache hit for " + key);
        return cached->cities;
    }

    auto outcome = index_->city_lookup(name, country_code, CITY_LOOKUP_LIMIT);
    if (!outcome) {
        logger_.warning("City lookup for '" + name + "' failed (" + outcome.describe() + ")");
        return {};
    }

    OrderedGroups<std::pair<std::string, std::string>> groups;
    for (const auto& row : outcome.value()) {
        groups[{row.city, row.region}].push_back(&row);
    }

    std::vector<CityLookupResult> results;
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& rows = groups.rows(i);
        const IndexRow& first = *rows.front();

        CityLookupResult result;
        result.city = first.city;
        result.postal_codes = distinct_sorted(rows, &IndexRow::postal_code);
        result.region = first.region;
        result.district = first.district;
        result.country_code = first.country_code;
        result.country = country_name(first.country_code);
        result.coordinates = first.coordinates;
        result.confidence = first.confidence.value_or(DEFAULT_CITY_CONFIDENCE);
        result.display_name = format_display_name(
            first.city, first.region,
            result.postal_codes.empty() ? std::string() : result.postal_codes.front(),
            result.country);
        results.push_back(std::move(result));
    }

    logger_.detailed("City '" + name + "': " + std::to_string(results.size()) + " groups");
    lookup_cache_.put(key, CachedLookup{{}, results});
    return results;
}

std::vector<RegionLookupResult> PostalLookupService::lookup_by_region(const std::string& region,
                                                                      const std::string& country_code) {
    const std::string name = trim(region);
    if (name.empty() || !index_) {
        return {};
    }

    const std::string key = cache_key("region", name, country_code);
    if (auto cached = region_cache_.get(key)) {
        logger_.debug("Cache hit for " + key);
        return *cached;
    }

    auto outcome = index_->region_lookup(name, country_code, REGION_LOOKUP_LIMIT);
    if (!outcome) {
        logger_.warning("Region lookup for '" + name + "' failed (" + outcome.describe() + ")");
        return {};
    }

    std::vector<IndexRow> rows = std::move(outcome.value());

    // TODO: drop this fallback once every country has region data in the index
    if (rows.empty()) {
        logger_.detailed("No region rows for '" + name + "', falling back to city lookup");
        auto fallback = index_->city_lookup(name, country_code, REGION_LOOKUP_LIMIT);
        if (!fallback) {
            logger_.warning("Region fallback for '" + name + "' failed (" + fallback.describe() + ")");
            return {};
        }

        const std::string needle = to_lower(name);
        for (auto& row : fallback.value()) {
            if (!row.region.empty() && contains(to_lower(row.region), needle)) {
                rows.push_back(std::move(row));
            }
        }
    }

    OrderedGroups<std::string> groups;
    for (const auto& row : rows) {
        groups[row.region.empty() ? std::string("Unknown") : row.region].push_back(&row);
    }

    std::vector<RegionLookupResult> results;
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& members = groups.rows(i);
        const IndexRow& first = *members.front();

        double lat_sum = 0.0;
        double lng_sum = 0.0;
        for (const auto* row : members) {
            lat_sum += row->coordinates.lat;
            lng_sum += row->coordinates.lng;
        }

        RegionLookupResult result;
        result.region = groups.key(i);
        result.cities = distinct_sorted(members, &IndexRow::city);
        result.postal_code_ranges = summarize_postal_codes(distinct_sorted(members, &IndexRow::postal_code));
        result.country_code = first.country_code.empty() ? to_upper_ascii(country_code) : first.country_code;
        result.country = country_name(result.country_code);
        result.coordinates = GeographicCoordinates(lat_sum / members.size(), lng_sum / members.size());
        result.confidence = REGION_CONFIDENCE;
        results.push_back(std::move(result));
    }

    logger_.detailed("Region '" + name + "': " + std::to_string(results.size()) + " regions");
    region_cache_.put(key, results);
    return results;
}

SmartLookupResult PostalLookupService::smart_lookup(const std::string& input, const std::string& country_code) {
    SmartLookupResult result;
    result.postal_results = lookup_by_postal_code(input, country_code);
    result.city_results = lookup_by_city(input, country_code);
    return result;
}

bool PostalLookupService::validate_postal_code(const std::string& postal_code, const std::string& country_code) {
    auto info = find_country(country_code);
    if (!info || !info->postal_pattern) {
        return true;
    }

    auto flags = std::regex::ECMAScript;
    if (info->postal_case_insensitive) {
        flags |= std::regex::icase;
    }

    const std::regex pattern(info->postal_pattern, flags);
    return std::regex_match(trim(postal_code), pattern);
}

std::string PostalLookupService::format_postal_code(const std::string& postal_code, const std::string& country_code) {
    std::string cleaned;
    for (char c : postal_code) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            cleaned.push_back(c);
        }
    }
    cleaned = to_upper_ascii(cleaned);

    const std::string country = to_upper_ascii(trim(country_code));
    if (country == "NL" && cleaned.size() == 6) {
        return cleaned.substr(0, 4) + " " + cleaned.substr(4);
    }
    if (country == "GB" && cleaned.size() >= 5) {
        return cleaned.substr(0, cleaned.size() - 3) + " " + cleaned.substr(cleaned.size() - 3);
    }
    if (country == "US" && cleaned.size() == 9) {
        return cleaned.substr(0, 5) + "-" + cleaned.substr(5);
    }
    return cleaned;
}

std::vector<std::string> PostalLookupService::summarize_postal_codes(const std::vector<std::string>& sorted_codes) {
    const size_t count = sorted_codes.size();
    if (count <= 3) {
        return sorted_codes;
    }

    if (count > 10) {
        return {sorted_codes.front() + " - " + sorted_codes.back(),
                "(" + std::to_string(count) + " codes)"};
    }

    std::vector<std::string> summary(sorted_codes.begin(), sorted_codes.begin() + std::min<size_t>(count, 5));
    if (count > 5) {
        summary.push_back("+" + std::to_string(count - 5) + " more");
    }
    return summary;
}

std::string PostalLookupService::format_display_name(const std::string& city,
                                                     const std::string& region,
                                                     const std::string& postal_code,
                                                     const std::string& country) {
    std::vector<std::string> parts;
    if (!postal_code.empty()) {
        parts.push_back(postal_code);
    }
    parts.push_back(city);
    if (!region.empty() && region != city) {
        parts.push_back(region);
    }
    if (!country.empty() && !is_home_market(country)) {
        parts.push_back(country);
    }
    return join(parts, ", ");
}

void PostalLookupService::clear_cache() {
    lookup_cache_.clear();
    region_cache_.clear();
    logger_.detailed("Lookup caches cleared");
}

LookupCacheStats PostalLookupService::cache_stats() const {
    return LookupCacheStats{lookup_cache_.get_stats(), region_cache_.get_stats()};
}

} // namespace locus
