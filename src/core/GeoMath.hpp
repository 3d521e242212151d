/**
 * @file GeoMath.hpp
 * @brief Great-circle distance, viewport bounds and zoom hints
 *
 * Pure functions; no state, no I/O.
 */

#pragma once

#include "locus.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace locus {
namespace geo {

constexpr double EARTH_RADIUS_KM = 6371.0;
constexpr double BOUNDS_PADDING_FRACTION = 0.1;

inline double to_radians(double degrees) {
    return degrees * (M_PI / 180.0);
}

/**
 * @brief Haversine distance in kilometers
 *
 * Symmetric, and exactly zero for identical points.
 */
double distance_km(const GeographicCoordinates& a, const GeographicCoordinates& b);

/**
 * @brief Bounding box of the points, padded by 10% of each span
 *
 * A single point yields a zero-size box on that point; an empty list
 * yields the all-zero box.
 */
MapBounds compute_bounds(const std::vector<GeographicCoordinates>& points);

/**
 * @brief Map zoom level suited to a search radius
 *
 * Presentation hint only: <=1km 15, <=5 13, <=10 12, <=25 11, <=50 10,
 * <=100 9, otherwise 8.
 */
int optimal_zoom(double radius_km);

/**
 * @brief "350m" below one kilometer, otherwise "12.3km"
 */
std::string format_distance(double distance_km);

} // namespace geo
} // namespace locus
