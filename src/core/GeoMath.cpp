/**
 * @file GeoMath.cpp
 * @brief Implementation of distance and bounds computations
 */

#include "GeoMath.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace locus {
namespace geo {

double distance_km(const GeographicCoordinates& a, const GeographicCoordinates& b) {
    if (a == b) {
        return 0.0;
    }

    const double d_lat = to_radians(b.lat - a.lat);
    const double d_lng = to_radians(b.lng - a.lng);

    // sin^2 and the cosine product are symmetric in (a, b)
    const double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                     std::cos(to_radians(a.lat)) * std::cos(to_radians(b.lat)) *
                     std::sin(d_lng / 2) * std::sin(d_lng / 2);

    const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return EARTH_RADIUS_KM * c;
}

MapBounds compute_bounds(const std::vector<GeographicCoordinates>& points) {
    MapBounds bounds;
    if (points.empty()) {
        return bounds;
    }

    bounds.north = bounds.south = points.front().lat;
    bounds.east = bounds.west = points.front().lng;

    for (const auto& point : points) {
        bounds.north = std::max(bounds.north, point.lat);
        bounds.south = std::min(bounds.south, point.lat);
        bounds.east = std::max(bounds.east, point.lng);
        bounds.west = std::min(bounds.west, point.lng);
    }

    const double lat_padding = (bounds.north - bounds.south) * BOUNDS_PADDING_FRACTION;
    const double lng_padding = (bounds.east - bounds.west) * BOUNDS_PADDING_FRACTION;

    bounds.north += lat_padding;
    bounds.south -= lat_padding;
    bounds.east += lng_padding;
    bounds.west -= lng_padding;

    return bounds;
}

int optimal_zoom(double radius_km) {
    if (radius_km <= 1) return 15;
    if (radius_km <= 5) return 13;
    if (radius_km <= 10) return 12;
    if (radius_km <= 25) return 11;
    if (radius_km <= 50) return 10;
    if (radius_km <= 100) return 9;
    return 8;
}

std::string format_distance(double distance_km) {
    std::ostringstream oss;
    if (distance_km < 1.0) {
        oss << static_cast<long>(std::lround(distance_km * 1000.0)) << "m";
    } else {
        oss << std::fixed << std::setprecision(1) << distance_km << "km";
    }
    return oss.str();
}

} // namespace geo
} // namespace locus
