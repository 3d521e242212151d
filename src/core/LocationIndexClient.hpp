/**
 * @file LocationIndexClient.hpp
 * @brief Client for the postal-code location index HTTP API
 *
 * All four endpoints answer with {"results": [...]}. Rows are normalized
 * into IndexRow regardless of which field spelling the server used.
 */

#pragma once

#include "locus.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include "LookupOutcome.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace locus {

/**
 * @brief One row of an index response
 */
struct IndexRow {
    std::string id;
    std::string name;                       // Place name as sent
    std::string city;                       // city | name
    std::string postal_code;
    std::string region;                     // region | admin_name1
    std::optional<std::string> district;    // district | admin_name2
    std::string country_code;               // countryCode | country
    GeographicCoordinates coordinates;
    std::optional<double> confidence;       // confidence | relevanceScore
    std::optional<double> relevance_score;
};

class LocationIndexClient {
public:
    LocationIndexClient(std::shared_ptr<HttpClient> http, const std::string& base_url);

    LookupOutcome<std::vector<IndexRow>> nearby(const GeographicCoordinates& center,
                                                double radius_km,
                                                const std::string& country,
                                                int limit);

    LookupOutcome<std::vector<IndexRow>> postal_lookup(const std::string& postal_code,
                                                       const std::string& country,
                                                       int limit);

    LookupOutcome<std::vector<IndexRow>> city_lookup(const std::string& city,
                                                     const std::string& country,
                                                     int limit);

    LookupOutcome<std::vector<IndexRow>> region_lookup(const std::string& region,
                                                       const std::string& country,
                                                       int limit);

    /**
     * @brief Parse a {"results": [...]} body
     *
     * Rows without finite coordinates are dropped; an empty list is a
     * successful outcome, not NOT_FOUND.
     */
    static LookupOutcome<std::vector<IndexRow>> parse_results(const std::string& body);

    const std::string& base_url() const { return base_url_; }

private:
    std::shared_ptr<HttpClient> http_;
    std::string base_url_;
    Logger logger_;

    LookupOutcome<std::vector<IndexRow>> fetch(const std::string& url);
};

} // namespace locus
