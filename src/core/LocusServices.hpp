/**
 * @file LocusServices.hpp
 * @brief Wires the location services together from a LocusConfig
 */

#pragma once

#include "locus.hpp"
#include "Clock.hpp"
#include "GeocodingResolver.hpp"
#include "HttpClient.hpp"
#include "LocationIndexClient.hpp"
#include "LocationStore.hpp"
#include "NearbySearchEngine.hpp"
#include "NominatimGeocoder.hpp"
#include "PostalLookupService.hpp"
#include "StaticMatcher.hpp"

#include <memory>

namespace locus {

/**
 * @brief Owns one instance of every service, sharing transport and clock
 *
 * Passing an HttpClient replaces libcurl (tests use a scripted fake);
 * passing a store replaces the built-in location list.
 */
class LocusServices {
public:
    explicit LocusServices(const LocusConfig& config,
                           std::shared_ptr<HttpClient> http = nullptr,
                           std::shared_ptr<const LocationStore> store = nullptr,
                           std::shared_ptr<Clock> clock = default_clock());

    const LocusConfig& config() const { return config_; }

    GeocodingResolver& resolver() { return *resolver_; }
    NearbySearchEngine& nearby() { return *nearby_; }
    PostalLookupService& lookups() { return *lookups_; }
    const StaticMatcher& matcher() const { return *matcher_; }

    void clear_caches();

private:
    LocusConfig config_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<const StaticMatcher> matcher_;
    std::shared_ptr<NominatimGeocoder> external_;
    std::shared_ptr<LocationIndexClient> index_;
    std::shared_ptr<GeocodingResolver> resolver_;
    std::shared_ptr<NearbySearchEngine> nearby_;
    std::shared_ptr<PostalLookupService> lookups_;
};

} // namespace locus
