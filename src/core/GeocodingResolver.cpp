/**
 * @file GeocodingResolver.cpp
 * @brief Implementation of the geocoding fallback chain
 */

#include "GeocodingResolver.hpp"
#include "StringUtils.hpp"

namespace locus {

GeocodingResolver::GeocodingResolver(std::shared_ptr<const StaticMatcher> matcher,
                                     std::shared_ptr<NominatimGeocoder> external,
                                     const CacheConfig& cache_config,
                                     std::shared_ptr<Clock> clock)
    : matcher_(std::move(matcher)),
      external_(std::move(external)),
      cache_(cache_config, std::move(clock)),
      logger_("GeocodingResolver") {
}

std::optional<GeocodingResult> GeocodingResolver::geocode(const std::string& name,
                                                          const GeocodingOptions& options) {
    const std::string key = normalize_query(name);
    if (key.empty()) {
        return std::nullopt;
    }

    if (options.use_cache) {
        if (auto cached = cache_.get(key)) {
            logger_.debug("Cache hit for '" + key + "'");
            return cached;
        }
    }

    std::optional<GeocodingResult> result;

    if (matcher_) {
        result = matcher_->best_match(key);
        if (result) {
            logger_.detailed("Resolved '" + key + "' from static store");
        }
    }

    if (!result && external_) {
        logger_.detailed("No static match for '" + key + "', trying external geocoder");
        result = external_->resolve(trim(name), options.preferred_country);
    }

    if (!result) {
        logger_.info("Could not geocode '" + name + "'");
        return std::nullopt;
    }

    if (options.use_cache) {
        cache_.put(key, *result);
    }
    return result;
}

std::vector<LocationSearchResult> GeocodingResolver::search(const std::string& query, size_t limit) const {
    if (!matcher_) {
        return {};
    }
    return matcher_->match(query, limit);
}

void GeocodingResolver::clear_cache() {
    cache_.clear();
    logger_.detailed("Geocoding cache cleared");
}

} // namespace locus
