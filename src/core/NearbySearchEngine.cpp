/**
 * @file NearbySearchEngine.cpp
 * @brief Implementation of the multi-country nearby search
 */

#include "NearbySearchEngine.hpp"
#include "GeoMath.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <future>
#include <sstream>

namespace locus {

NearbySearchEngine::NearbySearchEngine(std::shared_ptr<LocationIndexClient> index,
                                       std::shared_ptr<GeocodingResolver> resolver,
                                       const CacheConfig& cache_config,
                                       std::shared_ptr<Clock> clock)
    : index_(std::move(index)),
      resolver_(std::move(resolver)),
      cache_(cache_config, std::move(clock)),
      logger_("NearbySearchEngine") {
}

std::string NearbySearchEngine::cache_key(const NearbySearchOptions& options) {
    std::ostringstream key;
    key.precision(10);
    key << "nearby:" << options.center.lat << "," << options.center.lng
        << ":" << options.radius_km
        << ":" << join(options.countries, ",")
        << ":" << options.max_results;
    return key.str();
}

LookupOutcome<std::vector<MapLocation>> NearbySearchEngine::search_country(const NearbySearchOptions& options,
                                                                           const std::string& country,
                                                                           int per_country_limit) {
    using Outcome = LookupOutcome<std::vector<MapLocation>>;

    if (!index_) {
        return Outcome::fail(ErrorKind::UPSTREAM_UNAVAILABLE, "no location index configured");
    }

    auto outcome = index_->nearby(options.center, options.radius_km, country, per_country_limit);
    if (!outcome) {
        logger_.warning("Nearby search for " + country + " failed (" + outcome.describe() + ")");
        return Outcome::fail(outcome.error(), outcome.reason());
    }

    std::vector<MapLocation> locations;
    for (const auto& row : outcome.value()) {
        MapLocation location;
        const std::string row_country = row.country_code.empty() ? country : row.country_code;
        location.id = row_country + "-" + row.postal_code + "-" + row.id;
        location.name = row.name.empty() ? row.city : row.name;
        location.coordinates = row.coordinates;
        if (!row.postal_code.empty()) {
            location.postal_code = row.postal_code;
        }
        location.country = row_country;
        if (!row.region.empty()) {
            location.region = row.region;
        }
        location.district = row.district;
        location.type = MapLocationType::NEARBY;
        if (options.include_distance) {
            location.distance_km = geo::distance_km(options.center, row.coordinates);
        }
        location.relevance_score = row.relevance_score;
        locations.push_back(std::move(location));
    }

    logger_.debug(country + ": " + std::to_string(locations.size()) + " locations");
    return Outcome::ok(std::move(locations));
}

MapSearchResult NearbySearchEngine::search_nearby(const NearbySearchOptions& options) {
    MapSearchResult result;
    result.center = options.center;
    result.bounds = geo::compute_bounds({options.center});

    ValidationResult validation = validator_.validate(options);
    if (validation.has_errors()) {
        for (const auto& conflict : validation.conflicts) {
            logger_.warning("Rejected nearby search: " + conflict.description);
        }
        return result;
    }

    const std::string key = cache_key(options);
    if (auto cached = cache_.get(key)) {
        logger_.debug("Cache hit for " + key);
        return *cached;
    }

    const int country_count = static_cast<int>(options.countries.size());
    const int per_country_limit = (options.max_results + country_count - 1) / country_count;

    logger_.detailed("Searching " + std::to_string(country_count) + " countries within " +
                     geo::format_distance(options.radius_km) + ", " +
                     std::to_string(per_country_limit) + " per country");

    std::vector<std::future<LookupOutcome<std::vector<MapLocation>>>> pending;
    pending.reserve(options.countries.size());
    for (const auto& country : options.countries) {
        const std::string code = to_upper_ascii(trim(country));
        pending.push_back(std::async(std::launch::async, [this, &options, code, per_country_limit]() {
            return search_country(options, code, per_country_limit);
        }));
    }

    std::vector<MapLocation> merged;
    size_t failed_countries = 0;
    for (auto& future : pending) {
        auto outcome = future.get();
        if (!outcome) {
            ++failed_countries;
            continue;
        }
        auto& locations = outcome.value();
        merged.insert(merged.end(),
                      std::make_move_iterator(locations.begin()),
                      std::make_move_iterator(locations.end()));
    }

    std::stable_sort(merged.begin(), merged.end(), [](const MapLocation& a, const MapLocation& b) {
        return a.distance_km.value_or(0.0) < b.distance_km.value_or(0.0);
    });

    result.total_found = merged.size();
    if (merged.size() > static_cast<size_t>(options.max_results)) {
        merged.resize(options.max_results);
    }

    std::vector<GeographicCoordinates> points{options.center};
    for (const auto& location : merged) {
        points.push_back(location.coordinates);
    }
    result.bounds = geo::compute_bounds(points);
    result.locations = std::move(merged);

    logger_.info("Nearby search found " + std::to_string(result.total_found) + " locations, returning " +
                 std::to_string(result.locations.size()));

    if (failed_countries > 0) {
        logger_.detailed("Not caching " + key + ": " + std::to_string(failed_countries) +
                         " of " + std::to_string(country_count) + " countries failed");
        return result;
    }

    cache_.put(key, result);
    return result;
}

GeocodeWithNearbyResult NearbySearchEngine::geocode_with_nearby(const std::string& location_name,
                                                                double radius_km,
                                                                int max_nearby) {
    GeocodeWithNearbyResult result;
    if (!resolver_) {
        logger_.warning("No geocoding resolver configured");
        return result;
    }

    auto geocoded = resolver_->geocode(location_name);
    if (!geocoded) {
        return result;
    }

    MapLocation main;
    main.id = "main-" + location_name;
    main.name = geocoded->hierarchy.city;
    main.coordinates = geocoded->coordinates;
    main.country = geocoded->hierarchy.country_code;
    if (!geocoded->hierarchy.region.empty()) {
        main.region = geocoded->hierarchy.region;
    }
    main.district = geocoded->hierarchy.district;
    main.type = MapLocationType::SEARCH;

    NearbySearchOptions options;
    options.center = geocoded->coordinates;
    options.radius_km = radius_km;
    options.max_results = max_nearby;
    options.include_distance = true;

    MapSearchResult nearby = search_nearby(options);

    std::vector<GeographicCoordinates> points{geocoded->coordinates};
    for (const auto& location : nearby.locations) {
        points.push_back(location.coordinates);
    }

    result.main = std::move(main);
    result.nearby = std::move(nearby.locations);
    result.bounds = geo::compute_bounds(points);
    return result;
}

std::optional<MapLocation> NearbySearchEngine::reverse_geocode(const GeographicCoordinates& coordinates) {
    NearbySearchOptions options;
    options.center = coordinates;
    options.radius_km = REVERSE_GEOCODE_RADIUS_KM;
    options.max_results = 1;
    options.include_distance = true;

    MapSearchResult nearby = search_nearby(options);
    if (nearby.locations.empty()) {
        return std::nullopt;
    }

    MapLocation location = nearby.locations.front();
    location.type = MapLocationType::SEARCH;
    return location;
}

void NearbySearchEngine::clear_cache() {
    cache_.clear();
    logger_.detailed("Nearby cache cleared");
}

} // namespace locus
