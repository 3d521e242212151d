#pragma once

/**
 * @file locus.hpp
 * @brief Main header for the Locus location resolution core
 *
 * Shared data model for place resolution, autocomplete, nearby search and
 * postal code lookups. Every component of the core speaks these types.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace locus {

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief WGS84 latitude/longitude pair in decimal degrees
 */
struct GeographicCoordinates {
    double lat = 0.0;
    double lng = 0.0;

    GeographicCoordinates() = default;
    GeographicCoordinates(double latitude, double longitude)
        : lat(latitude), lng(longitude) {}

    bool is_valid() const {
        return std::isfinite(lat) && std::isfinite(lng) &&
               lat >= -90.0 && lat <= 90.0 &&
               lng >= -180.0 && lng <= 180.0;
    }

    bool operator==(const GeographicCoordinates& other) const {
        return lat == other.lat && lng == other.lng;
    }
};

/**
 * @brief Map viewport in degrees
 */
struct MapBounds {
    double north = 0.0;
    double south = 0.0;
    double east = 0.0;
    double west = 0.0;

    bool operator==(const MapBounds& other) const {
        return north == other.north && south == other.south &&
               east == other.east && west == other.west;
    }
};

// ============================================================================
// Location hierarchy
// ============================================================================

enum class LocationType {
    CITY,
    TOWN,
    VILLAGE,
    REGION,
    SUBURB,
    DISTRICT,
    COUNTRY
};

std::string to_string(LocationType type);

/**
 * @brief Parse a location type name ("city", "town", ...)
 *
 * Unknown names map to LocationType::CITY.
 */
LocationType parse_location_type(const std::string& name);

/**
 * @brief Entry of the in-memory reference store
 */
struct LocationRecord {
    std::string name;
    std::vector<std::string> name_variants;   // e.g. "München" for "Munich"
    GeographicCoordinates coordinates;
    std::string country;
    std::string country_code;                 // ISO 3166-1 alpha-2
    std::string region;                       // State / Land
    std::optional<std::string> district;      // Landkreis / county
    std::optional<int64_t> population;
    LocationType location_type = LocationType::CITY;
    std::vector<std::string> postal_codes;
};

/**
 * @brief Denormalized administrative view attached to every resolution
 */
struct LocationHierarchy {
    std::string country;
    std::string country_code;
    std::string region;
    std::optional<std::string> district;
    std::string city;
    std::optional<std::string> suburb;
    std::optional<std::string> village;
    std::optional<std::string> postal_code;
    GeographicCoordinates coordinates;
    std::optional<int64_t> population;
    LocationType location_type = LocationType::CITY;

    static LocationHierarchy from_record(const LocationRecord& record);
};

// ============================================================================
// Results
// ============================================================================

enum class GeocodingSource {
    STATIC,
    EXTERNAL
};

std::string to_string(GeocodingSource source);

struct GeocodingResult {
    GeographicCoordinates coordinates;
    LocationHierarchy hierarchy;
    GeocodingSource source = GeocodingSource::STATIC;
    double confidence = 0.0;    // [0,1], quality signal only
};

/**
 * @brief Autocomplete row
 */
struct LocationSearchResult {
    std::string name;           // Matched name (variant if a variant matched)
    std::string display_name;
    GeographicCoordinates coordinates;
    LocationHierarchy hierarchy;
    double relevance_score = 0.0;
};

enum class MapLocationType {
    SEARCH,
    NEARBY,
    LISTING,
    USER
};

std::string to_string(MapLocationType type);

/**
 * @brief Nearby-search row
 */
struct MapLocation {
    std::string id;
    std::string name;
    GeographicCoordinates coordinates;
    std::optional<std::string> postal_code;
    std::string country;
    std::optional<std::string> region;
    std::optional<std::string> district;
    MapLocationType type = MapLocationType::NEARBY;
    std::optional<double> distance_km;
    std::optional<double> relevance_score;
};

struct MapSearchResult {
    std::vector<MapLocation> locations;
    GeographicCoordinates center;
    MapBounds bounds;
    size_t total_found = 0;     // Size before truncation to max_results
};

struct NearbySearchOptions {
    GeographicCoordinates center;
    double radius_km = 25.0;
    std::vector<std::string> countries = {"DE", "IT", "ES", "FR"};
    int max_results = 50;
    bool include_distance = true;
};

struct PostalCodeLookupResult {
    std::string postal_code;
    std::string city;
    std::string region;
    std::optional<std::string> district;
    std::string country;
    std::string country_code;
    GeographicCoordinates coordinates;
    double confidence = 0.0;
    std::string display_name;
};

struct CityLookupResult {
    std::string city;
    std::vector<std::string> postal_codes;
    std::string region;
    std::optional<std::string> district;
    std::string country;
    std::string country_code;
    GeographicCoordinates coordinates;
    double confidence = 0.0;
    std::string display_name;
};

struct RegionLookupResult {
    std::string region;
    std::vector<std::string> cities;
    std::vector<std::string> postal_code_ranges;
    std::string country;
    std::string country_code;
    GeographicCoordinates coordinates;    // Centroid of member rows
    double confidence = 0.0;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Runtime configuration for the location core
 *
 * The core never reads files or the environment; callers fill this struct
 * (directly or via ConfigurationManager) and hand it to the services.
 */
struct LocusConfig {
    // Upstream endpoints
    std::string nominatim_url = "https://nominatim.openstreetmap.org";
    std::string location_index_url = "http://localhost:8787/api";
    std::string user_agent = "LocusCore/1.0";
    std::string nominatim_language;          // accept-language, empty = provider default
    int timeout_seconds = 10;

    // Replaces the built-in German city list when set (JSON array of records)
    std::optional<std::string> locations_file;

    // Nearby search defaults
    std::vector<std::string> default_countries = {"DE", "IT", "ES", "FR"};
    double default_radius_km = 25.0;
    int default_max_results = 50;

    // Autocomplete / lookup defaults
    int autocomplete_limit = 10;
    std::string default_country_code = "DE";

    // Cache policy
    bool enable_cache = true;
    std::chrono::seconds nearby_cache_ttl{5 * 60};
    std::chrono::seconds lookup_cache_ttl{10 * 60};
    std::chrono::seconds geocode_cache_ttl{24 * 60 * 60};

    // Logging
    int log_level = 3;                       // 1=ERROR ... 6=TRACE
    std::optional<std::string> log_file;
};

} // namespace locus
