/**
 * @file NominatimGeocoder.hpp
 * @brief Fallback geocoding through a Nominatim-compatible search API
 *
 * Used when the in-memory store has no match. Converts the provider's
 * free-form address breakdown into a LocationHierarchy and scores how well
 * the result matches the query.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "locus.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include "LookupOutcome.hpp"

#include <memory>
#include <optional>
#include <string>

namespace locus {

class NominatimGeocoder {
public:
    struct Options {
        std::string nominatim_url;
        std::string language;

        Options()
            : nominatim_url("https://nominatim.openstreetmap.org"),
              language("") {}
    };

    explicit NominatimGeocoder(std::shared_ptr<HttpClient> http,
                               const Options& options = Options());

    /**
     * @brief Resolve free text to a single place
     *
     * Never throws; network errors, non-2xx responses and unusable bodies
     * all come back as nullopt.
     *
     * @param query Place name or address
     * @param preferred_country Country name or ISO code restricting the search
     */
    std::optional<GeocodingResult> resolve(const std::string& query,
                                           const std::optional<std::string>& preferred_country = std::nullopt);

    /**
     * @brief Same as resolve() but keeps the failure reason
     */
    LookupOutcome<GeocodingResult> try_resolve(const std::string& query,
                                               const std::optional<std::string>& preferred_country = std::nullopt);

    /**
     * @brief Parse a search response body (JSON array, first element used)
     */
    LookupOutcome<GeocodingResult> parse_search_response(const std::string& json_response,
                                                         const std::string& query) const;

    std::string build_search_url(const std::string& query,
                                 const std::optional<std::string>& country_code) const;

private:
    std::shared_ptr<HttpClient> http_;
    Options options_;
    Logger logger_;
};

} // namespace locus
