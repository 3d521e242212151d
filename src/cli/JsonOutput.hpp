/**
 * @file JsonOutput.hpp
 * @brief nlohmann::json serializers for the result types printed by locus-cli
 *
 * Field names follow the camelCase used by the location index API.
 * Absent optional fields are omitted rather than written as null.
 */

#pragma once

#include "locus.hpp"
#include "NearbySearchEngine.hpp"
#include "PostalLookupService.hpp"

#include <nlohmann/json.hpp>

namespace locus {

using json = nlohmann::json;

void to_json(json& j, const GeographicCoordinates& coordinates);
void to_json(json& j, const MapBounds& bounds);
void to_json(json& j, const LocationHierarchy& hierarchy);
void to_json(json& j, const GeocodingResult& result);
void to_json(json& j, const LocationSearchResult& result);
void to_json(json& j, const MapLocation& location);
void to_json(json& j, const MapSearchResult& result);
void to_json(json& j, const GeocodeWithNearbyResult& result);
void to_json(json& j, const PostalCodeLookupResult& result);
void to_json(json& j, const CityLookupResult& result);
void to_json(json& j, const RegionLookupResult& result);
void to_json(json& j, const SmartLookupResult& result);

} // namespace locus
