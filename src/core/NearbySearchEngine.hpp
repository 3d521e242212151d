/**
 * @file NearbySearchEngine.hpp
 * @brief Multi-country radius search over the location index
 */

#pragma once

#include "locus.hpp"
#include "GeocodingResolver.hpp"
#include "InputValidator.hpp"
#include "LocationIndexClient.hpp"
#include "Logger.hpp"
#include "TtlCache.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace locus {

/**
 * @brief A resolved place with the index rows around it
 */
struct GeocodeWithNearbyResult {
    std::optional<MapLocation> main;
    std::vector<MapLocation> nearby;
    MapBounds bounds;
};

/**
 * @brief Fans a radius search out to one index request per country
 *
 * Countries are queried concurrently; a country whose request fails
 * contributes no rows and does not fail the search. Such a partial
 * result is returned but not cached.
 */
class NearbySearchEngine {
public:
    static constexpr double REVERSE_GEOCODE_RADIUS_KM = 5.0;

    NearbySearchEngine(std::shared_ptr<LocationIndexClient> index,
                       std::shared_ptr<GeocodingResolver> resolver = nullptr,
                       const CacheConfig& cache_config = CacheConfig{std::chrono::minutes(5), true},
                       std::shared_ptr<Clock> clock = default_clock());

    MapSearchResult search_nearby(const NearbySearchOptions& options);

    /**
     * @brief Resolve a name, then search around it
     *
     * An unknown name yields no main location, no nearby rows and the
     * all-zero box.
     */
    GeocodeWithNearbyResult geocode_with_nearby(const std::string& location_name,
                                                double radius_km = 25.0,
                                                int max_nearby = 20);

    /**
     * @brief Nearest indexed location within 5 km, typed SEARCH
     */
    std::optional<MapLocation> reverse_geocode(const GeographicCoordinates& coordinates);

    void clear_cache();
    CacheStats cache_stats() const { return cache_.get_stats(); }

    static std::string cache_key(const NearbySearchOptions& options);

private:
    std::shared_ptr<LocationIndexClient> index_;
    std::shared_ptr<GeocodingResolver> resolver_;
    TtlCache<MapSearchResult> cache_;
    InputValidator validator_;
    Logger logger_;

    /**
     * @brief One country's rows; a failed request is reported, not thrown
     */
    LookupOutcome<std::vector<MapLocation>> search_country(const NearbySearchOptions& options,
                                                           const std::string& country,
                                                           int per_country_limit);
};

} // namespace locus
