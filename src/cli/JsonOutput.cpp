/**
 * @file JsonOutput.cpp
 * @brief JSON serialization of result types
 */

#include "JsonOutput.hpp"

namespace locus {

namespace {

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

void to_json(json& j, const GeographicCoordinates& coordinates) {
    j = json{{"lat", coordinates.lat}, {"lng", coordinates.lng}};
}

void to_json(json& j, const MapBounds& bounds) {
    j = json{{"north", bounds.north}, {"south", bounds.south},
             {"east", bounds.east}, {"west", bounds.west}};
}

void to_json(json& j, const LocationHierarchy& hierarchy) {
    j = json{
        {"country", hierarchy.country},
        {"countryCode", hierarchy.country_code},
        {"region", hierarchy.region},
        {"city", hierarchy.city},
        {"coordinates", hierarchy.coordinates},
        {"locationType", to_string(hierarchy.location_type)}
    };
    put_optional(j, "district", hierarchy.district);
    put_optional(j, "suburb", hierarchy.suburb);
    put_optional(j, "village", hierarchy.village);
    put_optional(j, "postalCode", hierarchy.postal_code);
    put_optional(j, "population", hierarchy.population);
}

void to_json(json& j, const GeocodingResult& result) {
    j = json{
        {"coordinates", result.coordinates},
        {"hierarchy", result.hierarchy},
        {"source", to_string(result.source)},
        {"confidence", result.confidence}
    };
}

void to_json(json& j, const LocationSearchResult& result) {
    j = json{
        {"name", result.name},
        {"displayName", result.display_name},
        {"coordinates", result.coordinates},
        {"hierarchy", result.hierarchy},
        {"relevanceScore", result.relevance_score}
    };
}

void to_json(json& j, const MapLocation& location) {
    j = json{
        {"id", location.id},
        {"name", location.name},
        {"coordinates", location.coordinates},
        {"country", location.country},
        {"type", to_string(location.type)}
    };
    put_optional(j, "postalCode", location.postal_code);
    put_optional(j, "region", location.region);
    put_optional(j, "district", location.district);
    put_optional(j, "distance", location.distance_km);
    put_optional(j, "relevanceScore", location.relevance_score);
}

void to_json(json& j, const MapSearchResult& result) {
    j = json{
        {"locations", result.locations},
        {"center", result.center},
        {"bounds", result.bounds},
        {"totalFound", result.total_found}
    };
}

void to_json(json& j, const GeocodeWithNearbyResult& result) {
    j = json{
        {"main", nullptr},
        {"nearby", result.nearby},
        {"bounds", result.bounds}
    };
    if (result.main) {
        j["main"] = *result.main;
    }
}

void to_json(json& j, const PostalCodeLookupResult& result) {
    j = json{
        {"postalCode", result.postal_code},
        {"city", result.city},
        {"region", result.region},
        {"country", result.country},
        {"countryCode", result.country_code},
        {"coordinates", result.coordinates},
        {"confidence", result.confidence},
        {"displayName", result.display_name}
    };
    put_optional(j, "district", result.district);
}

void to_json(json& j, const CityLookupResult& result) {
    j = json{
        {"city", result.city},
        {"postalCodes", result.postal_codes},
        {"region", result.region},
        {"country", result.country},
        {"countryCode", result.country_code},
        {"coordinates", result.coordinates},
        {"confidence", result.confidence},
        {"displayName", result.display_name}
    };
    put_optional(j, "district", result.district);
}

void to_json(json& j, const RegionLookupResult& result) {
    j = json{
        {"region", result.region},
        {"cities", result.cities},
        {"postalCodeRanges", result.postal_code_ranges},
        {"country", result.country},
        {"countryCode", result.country_code},
        {"coordinates", result.coordinates},
        {"confidence", result.confidence}
    };
}

void to_json(json& j, const SmartLookupResult& result) {
    j = json{
        {"postalResults", result.postal_results},
        {"cityResults", result.city_results}
    };
}

} // namespace locus
