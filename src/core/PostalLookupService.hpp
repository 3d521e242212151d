/**
 * @file PostalLookupService.hpp
 * @brief Postal code, city and region lookups against the location index
 *
 * Results are cached for ten minutes: postal and city lookups share one
 * cache, region lookups have their own.
 */

#pragma once

#include "locus.hpp"
#include "LocationIndexClient.hpp"
#include "Logger.hpp"
#include "TtlCache.hpp"

#include <memory>
#include <string>
#include <vector>

namespace locus {

struct SmartLookupResult {
    std::vector<PostalCodeLookupResult> postal_results;
    std::vector<CityLookupResult> city_results;
};

struct LookupCacheStats {
    CacheStats lookups;   // Postal and city lookups
    CacheStats regions;
};

class PostalLookupService {
public:
    static constexpr int POSTAL_LOOKUP_LIMIT = 8;
    static constexpr int CITY_LOOKUP_LIMIT = 8;
    static constexpr int REGION_LOOKUP_LIMIT = 50;

    static constexpr double DEFAULT_POSTAL_CONFIDENCE = 0.9;
    static constexpr double DEFAULT_CITY_CONFIDENCE = 0.8;
    static constexpr double REGION_CONFIDENCE = 0.9;

    explicit PostalLookupService(std::shared_ptr<LocationIndexClient> index,
                                 const CacheConfig& cache_config = CacheConfig{std::chrono::minutes(10), true},
                                 std::shared_ptr<Clock> clock = default_clock());

    std::vector<PostalCodeLookupResult> lookup_by_postal_code(const std::string& postal_code,
                                                              const std::string& country_code = "DE");

    /**
     * @brief Index rows grouped into one result per (city, region)
     *
     * Postal codes in each group are distinct and sorted; the remaining
     * fields come from the group's first row.
     */
    std::vector<CityLookupResult> lookup_by_city(const std::string& city,
                                                 const std::string& country_code = "DE");

    /**
     * @brief Cities and postal code ranges per region
     *
     * When the region endpoint returns nothing, city-lookup rows whose
     * region contains the query are used instead.
     */
    std::vector<RegionLookupResult> lookup_by_region(const std::string& region,
                                                     const std::string& country_code = "DE");

    /**
     * @brief Run both postal and city lookups on the same input
     */
    SmartLookupResult smart_lookup(const std::string& input, const std::string& country_code = "DE");

    /**
     * @brief Check a postal code against the country's format
     * @return true for countries without a known format
     */
    static bool validate_postal_code(const std::string& postal_code, const std::string& country_code);

    /**
     * @brief Canonical spacing and case: NL "1234 AB", GB "SW1A 1AA", US "12345-6789"
     */
    static std::string format_postal_code(const std::string& postal_code, const std::string& country_code);

    /**
     * @brief Compact summary of a sorted postal code list
     *
     * Up to 3 codes are listed in full; more than 10 become
     * "first - last" and "(N codes)"; otherwise the first 5 plus "+N more".
     */
    static std::vector<std::string> summarize_postal_codes(const std::vector<std::string>& sorted_codes);

    static std::string format_display_name(const std::string& city,
                                           const std::string& region,
                                           const std::string& postal_code,
                                           const std::string& country);

    void clear_cache();
    LookupCacheStats cache_stats() const;

private:
    struct CachedLookup {
        std::vector<PostalCodeLookupResult> postal;
        std::vector<CityLookupResult> cities;
    };

    std::shared_ptr<LocationIndexClient> index_;
    TtlCache<CachedLookup> lookup_cache_;
    TtlCache<std::vector<RegionLookupResult>> region_cache_;
    Logger logger_;

    static std::string cache_key(const std::string& kind, const std::string& query, const std::string& country);
};

} // namespace locus
