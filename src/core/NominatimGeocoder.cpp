/**
 * @file NominatimGeocoder.cpp
 * @brief Implementation of the external geocoder adapter
 */

#include "NominatimGeocoder.hpp"
#include "CountryCodes.hpp"
#include "ScoringRules.hpp"
#include "StringUtils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

using json = nlohmann::json;

namespace locus {

namespace {

// Nominatim sends coordinates as strings; some mirrors send numbers
std::optional<double> parse_coordinate(const json& value) {
    if (value.is_number()) {
        double parsed = value.get<double>();
        return std::isfinite(parsed) ? std::optional<double>(parsed) : std::nullopt;
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const std::string text = trim(value.get<std::string>());
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<int64_t> parse_population(const json& extratags) {
    if (!extratags.is_object() || !extratags.contains("population")) {
        return std::nullopt;
    }

    const auto& value = extratags["population"];
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<std::string> first_present(const AddressFields& fields,
                                          std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = fields.find(key);
        if (it != fields.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return std::nullopt;
}

} // namespace

NominatimGeocoder::NominatimGeocoder(std::shared_ptr<HttpClient> http, const Options& options)
    : http_(std::move(http)), options_(options), logger_("NominatimGeocoder") {
}

std::optional<GeocodingResult> NominatimGeocoder::resolve(const std::string& query,
                                                          const std::optional<std::string>& preferred_country) {
    auto outcome = try_resolve(query, preferred_country);
    if (!outcome) {
        if (outcome.error() == ErrorKind::NOT_FOUND) {
            logger_.detailed("No results found for: " + query);
        } else {
            logger_.warning("Geocoding '" + query + "' failed (" + outcome.describe() + ")");
        }
    }
    return std::move(outcome).to_optional();
}

LookupOutcome<GeocodingResult> NominatimGeocoder::try_resolve(const std::string& query,
                                                              const std::optional<std::string>& preferred_country) {
    if (trim(query).empty()) {
        return LookupOutcome<GeocodingResult>::fail(ErrorKind::INVALID_INPUT, "empty query");
    }
    if (!http_) {
        return LookupOutcome<GeocodingResult>::fail(ErrorKind::UPSTREAM_UNAVAILABLE, "no HTTP client");
    }

    std::optional<std::string> country_code;
    if (preferred_country && !trim(*preferred_country).empty()) {
        country_code = resolve_country_code(*preferred_country);
        if (!country_code) {
            logger_.debug("Ignoring unknown preferred country: " + *preferred_country);
        }
    }

    const std::string url = build_search_url(query, country_code);
    logger_.info("Geocoding query: " + query);
    logger_.debug("Nominatim URL: " + url);

    HttpResponse response = http_->get(url);
    if (!response.ok()) {
        std::string reason = response.error.empty()
            ? "HTTP " + std::to_string(response.status_code)
            : response.error;
        return LookupOutcome<GeocodingResult>::fail(ErrorKind::UPSTREAM_UNAVAILABLE, reason);
    }

    auto outcome = parse_search_response(response.body, query);
    if (outcome) {
        logger_.info("Geocoded '" + query + "' to " + outcome.value().hierarchy.city + " (" +
                     std::to_string(outcome.value().coordinates.lat) + ", " +
                     std::to_string(outcome.value().coordinates.lng) + ")");
    }
    return outcome;
}

LookupOutcome<GeocodingResult> NominatimGeocoder::parse_search_response(const std::string& json_response,
                                                                        const std::string& query) const {
    using Outcome = LookupOutcome<GeocodingResult>;

    json root;
    try {
        root = json::parse(json_response);
    } catch (const json::exception& e) {
        return Outcome::fail(ErrorKind::MALFORMED_UPSTREAM_DATA, e.what());
    }

    if (!root.is_array()) {
        return Outcome::fail(ErrorKind::MALFORMED_UPSTREAM_DATA, "expected a JSON array");
    }
    if (root.empty()) {
        return Outcome::fail(ErrorKind::NOT_FOUND);
    }

    const json& item = root[0];
    if (!item.is_object() || !item.contains("lat") || !item.contains("lon")) {
        return Outcome::fail(ErrorKind::MALFORMED_UPSTREAM_DATA, "missing coordinates");
    }

    auto lat = parse_coordinate(item["lat"]);
    auto lng = parse_coordinate(item["lon"]);
    if (!lat || !lng) {
        return Outcome::fail(ErrorKind::MALFORMED_UPSTREAM_DATA, "coordinates are not finite numbers");
    }

    const std::string display_name = item.contains("display_name") && item["display_name"].is_string()
        ? item["display_name"].get<std::string>()
        : std::string();

    AddressFields address;
    if (item.contains("address") && item["address"].is_object()) {
        const json& fields = item["address"];
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            if (it.value().is_string()) {
                address[it.key()] = it.value().get<std::string>();
            }
        }
    }

    GeocodingResult result;
    result.coordinates = GeographicCoordinates(*lat, *lng);
    result.source = GeocodingSource::EXTERNAL;

    LocationHierarchy& hierarchy = result.hierarchy;
    hierarchy.country = first_present(address, {"country"}).value_or("Unknown");
    hierarchy.country_code = to_upper_ascii(first_present(address, {"country_code"}).value_or("XX"));
    hierarchy.region = first_present(address, {"state", "region", "province"}).value_or("");
    hierarchy.district = first_present(address, {"county", "district"});
    hierarchy.suburb = first_present(address, {"suburb", "neighbourhood"});
    hierarchy.village = first_present(address, {"village"});
    hierarchy.postal_code = first_present(address, {"postcode"});
    hierarchy.coordinates = result.coordinates;
    hierarchy.location_type = location_type_rules().evaluate(address).value_or(LocationType::CITY);

    auto city = first_present(address, {"city", "town", "village", "municipality"});
    if (!city) {
        city = trim(display_name.substr(0, display_name.find(',')));
    }
    hierarchy.city = *city;

    if (item.contains("extratags")) {
        hierarchy.population = parse_population(item["extratags"]);
    }

    AddressMatchContext context;
    context.display_name = to_lower(display_name);
    context.query = normalize_query(query);
    for (const auto& [key, value] : address) {
        context.address_values.push_back(to_lower(value));
    }
    result.confidence = external_confidence_rules().evaluate(context).value_or(0.6);

    logger_.debug("Confidence for '" + query + "': " + std::to_string(result.confidence) +
                  " (" + external_confidence_rules().matching_rule(context) + ")");

    return Outcome::ok(std::move(result));
}

std::string NominatimGeocoder::build_search_url(const std::string& query,
                                                const std::optional<std::string>& country_code) const {
    UrlBuilder url(options_.nominatim_url, "/search");
    url.param("q", query)
       .param("format", std::string("json"))
       .param("limit", 1)
       .param("addressdetails", 1)
       .param("extratags", 1);

    if (country_code) {
        url.param("countrycodes", to_lower(*country_code));
    }

    if (!options_.language.empty()) {
        url.param("accept-language", options_.language);
    }

    return url.str();
}

} // namespace locus
