/**
 * @file LocationTypes.cpp
 * @brief Conversions for the shared location data model
 */

#include "locus.hpp"

namespace locus {

std::string to_string(LocationType type) {
    switch (type) {
        case LocationType::CITY: return "city";
        case LocationType::TOWN: return "town";
        case LocationType::VILLAGE: return "village";
        case LocationType::REGION: return "region";
        case LocationType::SUBURB: return "suburb";
        case LocationType::DISTRICT: return "district";
        case LocationType::COUNTRY: return "country";
    }
    return "city";
}

LocationType parse_location_type(const std::string& name) {
    if (name == "town") return LocationType::TOWN;
    if (name == "village") return LocationType::VILLAGE;
    if (name == "region") return LocationType::REGION;
    if (name == "suburb") return LocationType::SUBURB;
    if (name == "district") return LocationType::DISTRICT;
    if (name == "country") return LocationType::COUNTRY;
    return LocationType::CITY;
}

std::string to_string(GeocodingSource source) {
    return source == GeocodingSource::STATIC ? "static" : "external";
}

std::string to_string(MapLocationType type) {
    switch (type) {
        case MapLocationType::SEARCH: return "search";
        case MapLocationType::NEARBY: return "nearby";
        case MapLocationType::LISTING: return "listing";
        case MapLocationType::USER: return "user";
    }
    return "nearby";
}

LocationHierarchy LocationHierarchy::from_record(const LocationRecord& record) {
    LocationHierarchy hierarchy;
    hierarchy.country = record.country;
    hierarchy.country_code = record.country_code;
    hierarchy.region = record.region;
    hierarchy.district = record.district;
    hierarchy.city = record.name;
    hierarchy.coordinates = record.coordinates;
    hierarchy.population = record.population;
    hierarchy.location_type = record.location_type;
    return hierarchy;
}

} // namespace locus
