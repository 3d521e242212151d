/**
 * @file LocusServices.cpp
 * @brief Service wiring
 */

#include "LocusServices.hpp"

namespace locus {

namespace {

CacheConfig cache_config(const LocusConfig& config, std::chrono::seconds ttl) {
    CacheConfig cache;
    cache.default_ttl = std::chrono::duration_cast<std::chrono::milliseconds>(ttl);
    cache.enable_cache = config.enable_cache;
    return cache;
}

} // namespace

LocusServices::LocusServices(const LocusConfig& config,
                             std::shared_ptr<HttpClient> http,
                             std::shared_ptr<const LocationStore> store,
                             std::shared_ptr<Clock> clock)
    : config_(config) {
    if (http) {
        http_ = std::move(http);
    } else {
        CurlHttpClient::Options options;
        options.user_agent = config.user_agent;
        options.timeout_seconds = config.timeout_seconds;
        http_ = std::make_shared<CurlHttpClient>(options);
    }

    if (!store) {
        store = std::make_shared<const LocationStore>(LocationStore::with_default_locations());
    }
    matcher_ = std::make_shared<const StaticMatcher>(std::move(store));

    NominatimGeocoder::Options nominatim;
    nominatim.nominatim_url = config.nominatim_url;
    nominatim.language = config.nominatim_language;
    external_ = std::make_shared<NominatimGeocoder>(http_, nominatim);

    index_ = std::make_shared<LocationIndexClient>(http_, config.location_index_url);

    resolver_ = std::make_shared<GeocodingResolver>(
        matcher_, external_, cache_config(config, config.geocode_cache_ttl), clock);
    nearby_ = std::make_shared<NearbySearchEngine>(
        index_, resolver_, cache_config(config, config.nearby_cache_ttl), clock);
    lookups_ = std::make_shared<PostalLookupService>(
        index_, cache_config(config, config.lookup_cache_ttl), clock);
}

void LocusServices::clear_caches() {
    resolver_->clear_cache();
    nearby_->clear_cache();
    lookups_->clear_cache();
}

} // namespace locus
