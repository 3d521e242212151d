/**
 * @file GeocodingResolver.hpp
 * @brief Name to coordinates resolution: cache, static store, then Nominatim
 */

#pragma once

#include "locus.hpp"
#include "Logger.hpp"
#include "NominatimGeocoder.hpp"
#include "StaticMatcher.hpp"
#include "TtlCache.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace locus {

struct GeocodingOptions {
    std::optional<std::string> preferred_country;   // Name or ISO code
    bool use_cache = true;                          // false skips both read and write
    size_t max_results = 1;
};

/**
 * @brief Resolves place names with a three-stage fallback
 *
 * Successful results are cached under the normalized query. Failed
 * lookups are never cached, so a name that the external provider could
 * not resolve is retried on the next call.
 */
class GeocodingResolver {
public:
    GeocodingResolver(std::shared_ptr<const StaticMatcher> matcher,
                      std::shared_ptr<NominatimGeocoder> external,
                      const CacheConfig& cache_config = CacheConfig{std::chrono::hours(24), true},
                      std::shared_ptr<Clock> clock = default_clock());

    std::optional<GeocodingResult> geocode(const std::string& name,
                                           const GeocodingOptions& options = GeocodingOptions());

    /**
     * @brief Autocomplete against the static store only
     */
    std::vector<LocationSearchResult> search(const std::string& query, size_t limit = 10) const;

    void clear_cache();
    CacheStats cache_stats() const { return cache_.get_stats(); }

private:
    std::shared_ptr<const StaticMatcher> matcher_;
    std::shared_ptr<NominatimGeocoder> external_;
    mutable TtlCache<GeocodingResult> cache_;
    Logger logger_;
};

} // namespace locus
