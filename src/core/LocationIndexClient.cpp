/**
 * @file LocationIndexClient.cpp
 * @brief Implementation of the location index client
 */

#include "LocationIndexClient.hpp"
#include "StringUtils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <initializer_list>

using json = nlohmann::json;

namespace locus {

namespace {

std::string string_field(const json& row, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (!row.contains(key)) {
            continue;
        }
        const json& value = row[key];
        if (value.is_string() && !value.get<std::string>().empty()) {
            return value.get<std::string>();
        }
        if (value.is_number_integer()) {
            return std::to_string(value.get<int64_t>());
        }
    }
    return "";
}

std::optional<double> number_field(const json& row, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (row.contains(key) && row[key].is_number()) {
            double value = row[key].get<double>();
            if (std::isfinite(value)) {
                return value;
            }
        }
    }
    return std::nullopt;
}

// Scores outside [0, 1] are pinned to the nearest bound.
std::optional<double> unit_field(const json& row, std::initializer_list<const char*> keys) {
    auto value = number_field(row, keys);
    if (value) {
        *value = std::clamp(*value, 0.0, 1.0);
    }
    return value;
}

std::optional<GeographicCoordinates> parse_coordinates(const json& row) {
    if (!row.contains("coordinates") || !row["coordinates"].is_object()) {
        return std::nullopt;
    }
    const json& coords = row["coordinates"];
    auto lat = number_field(coords, {"lat", "latitude"});
    auto lng = number_field(coords, {"lng", "lon", "longitude"});
    if (!lat || !lng) {
        return std::nullopt;
    }
    return GeographicCoordinates(*lat, *lng);
}

} // namespace

LocationIndexClient::LocationIndexClient(std::shared_ptr<HttpClient> http, const std::string& base_url)
    : http_(std::move(http)), base_url_(base_url), logger_("LocationIndexClient") {
}

LookupOutcome<std::vector<IndexRow>> LocationIndexClient::nearby(const GeographicCoordinates& center,
                                                                 double radius_km,
                                                                 const std::string& country,
                                                                 int limit) {
    UrlBuilder url(base_url_, "/locations/nearby");
    url.param("lat", center.lat)
       .param("lng", center.lng)
       .param("radius", radius_km)
       .param("country", country)
       .param("limit", limit);
    return fetch(url.str());
}

LookupOutcome<std::vector<IndexRow>> LocationIndexClient::postal_lookup(const std::string& postal_code,
                                                                        const std::string& country,
                                                                        int limit) {
    UrlBuilder url(base_url_, "/locations/postal-lookup");
    url.param("postal_code", postal_code).param("country", country).param("limit", limit);
    return fetch(url.str());
}

LookupOutcome<std::vector<IndexRow>> LocationIndexClient::city_lookup(const std::string& city,
                                                                      const std::string& country,
                                                                      int limit) {
    UrlBuilder url(base_url_, "/locations/city-lookup");
    url.param("city", city).param("country", country).param("limit", limit);
    return fetch(url.str());
}

LookupOutcome<std::vector<IndexRow>> LocationIndexClient::region_lookup(const std::string& region,
                                                                        const std::string& country,
                                                                        int limit) {
    UrlBuilder url(base_url_, "/locations/region-lookup");
    url.param("region", region).param("country", country).param("limit", limit);
    return fetch(url.str());
}

LookupOutcome<std::vector<IndexRow>> LocationIndexClient::fetch(const std::string& url) {
    using Outcome = LookupOutcome<std::vector<IndexRow>>;

    if (!http_) {
        return Outcome::fail(ErrorKind::UPSTREAM_UNAVAILABLE, "no HTTP client");
    }

    logger_.debug("GET " + url);
    HttpResponse response = http_->get(url);
    if (!response.ok()) {
        std::string reason = response.error.empty()
            ? "HTTP " + std::to_string(response.status_code)
            : response.error;
        return Outcome::fail(ErrorKind::UPSTREAM_UNAVAILABLE, reason);
    }

    auto outcome = parse_results(response.body);
    if (outcome) {
        logger_.trace(std::to_string(outcome.value().size()) + " rows from " + url);
    }
    return outcome;
}

LookupOutcome<std::vector<IndexRow>> LocationIndexClient::parse_results(const std::string& body) {
    using Outcome = LookupOutcome<std::vector<IndexRow>>;

    json root;
    try {
        root = json::parse(body);
    } catch (const json::exception& e) {
        return Outcome::fail(ErrorKind::MALFORMED_UPSTREAM_DATA, e.what());
    }

    if (!root.is_object() || !root.contains("results") || !root["results"].is_array()) {
        return Outcome::fail(ErrorKind::MALFORMED_UPSTREAM_DATA, "missing results array");
    }

    std::vector<IndexRow> rows;
    for (const auto& item : root["results"]) {
        if (!item.is_object()) {
            continue;
        }

        auto coordinates = parse_coordinates(item);
        if (!coordinates) {
            continue;
        }

        IndexRow row;
        row.id = string_field(item, {"id"});
        row.name = string_field(item, {"name"});
        row.city = string_field(item, {"city", "name"});
        row.postal_code = string_field(item, {"postalCode", "postal_code"});
        row.region = string_field(item, {"region", "admin_name1"});

        std::string district = string_field(item, {"district", "admin_name2"});
        if (!district.empty()) {
            row.district = district;
        }

        row.country_code = to_upper_ascii(string_field(item, {"countryCode", "country"}));
        row.coordinates = *coordinates;
        row.confidence = unit_field(item, {"confidence", "relevanceScore"});
        row.relevance_score = unit_field(item, {"relevanceScore"});
        rows.push_back(std::move(row));
    }

    return Outcome::ok(std::move(rows));
}

} // namespace locus
