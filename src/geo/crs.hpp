/**
 * @file crs.hpp
 * @brief Coordinate reference system handling for Tidemark
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Wraps GDAL/OGR spatial references. A CRS is carried around as the
 * user-facing definition string ("EPSG:4326", WKT, PROJ string); it is
 * only parsed when two layers must be compared or reprojected. Axis order
 * is always x = easting/longitude, y = northing/latitude.
 */

#pragma once

#include "geo/layer.hpp"
#include <glm/glm.hpp>
#include <string>

class OGRCoordinateTransformation;

namespace tidemark::geo {

/// Default geographic CRS of OSM data
constexpr const char* WGS84 = "EPSG:4326";

// ============================================================================
// CRS Queries
// ============================================================================

/**
 * @brief Check if two CRS definitions describe the same system
 *
 * Identical strings are equal without consulting GDAL.
 * @throws UserInputError if a definition cannot be parsed
 */
[[nodiscard]] bool same_crs(const std::string& a, const std::string& b);

/**
 * @brief Check if a CRS is geographic (degrees)
 * @throws UserInputError if the definition cannot be parsed
 */
[[nodiscard]] bool is_geographic(const std::string& crs);

/**
 * @brief Size of one unit of a projected CRS in meters (1.0 for metric CRS)
 */
[[nodiscard]] double linear_unit_in_meters(const std::string& crs);

/**
 * @brief WGS84 UTM zone containing a longitude/latitude position
 * @return "EPSG:326zz" (north) or "EPSG:327zz" (south)
 */
[[nodiscard]] std::string utm_crs(const glm::dvec2& lon_lat);

// ============================================================================
// Transformation
// ============================================================================

/**
 * @brief Point transformation between two coordinate systems
 *
 * Owns an OGRCoordinateTransformation. Non-copyable.
 */
class CrsTransformer {
public:
    /**
     * @throws UserInputError if either CRS is invalid or no transformation exists
     */
    CrsTransformer(const std::string& from, const std::string& to);
    ~CrsTransformer();

    CrsTransformer(const CrsTransformer&) = delete;
    CrsTransformer& operator=(const CrsTransformer&) = delete;

    /**
     * @brief Transform a single point
     * @throws UserInputError if the point cannot be transformed
     */
    [[nodiscard]] glm::dvec2 transform(const glm::dvec2& p) const;

    /**
     * @brief Transform every vertex of a geometry
     */
    [[nodiscard]] Geometry transform(const Geometry& geometry) const;

private:
    std::string m_from;
    std::string m_to;
    OGRCoordinateTransformation* m_transform = nullptr;
};

/**
 * @brief Copy of a layer with its geometries in another CRS
 * @throws CrsMissingError if the layer has no CRS
 */
[[nodiscard]] GeometryLayer reproject(const GeometryLayer& layer, const std::string& crs);

/**
 * @brief Copy of a layer in a projected CRS suitable for measurements
 *
 * Geographic layers are reprojected to the UTM zone of their center.
 * Projected layers and layers without a CRS are returned unchanged.
 */
[[nodiscard]] GeometryLayer to_local_projected(const GeometryLayer& layer);

// ============================================================================
// Harmonizer
// ============================================================================

/**
 * @brief Bring a newly supplied layer onto the CRS of an existing one
 * @param left Existing layer (defines the target CRS, never modified)
 * @param right Newly supplied layer
 * @return `right`, reprojected when the systems differ
 * @throws CrsMissingError if either layer has no CRS
 */
[[nodiscard]] GeometryLayer harmonize(const GeometryLayer& left, const GeometryLayer& right);

/**
 * @brief Reduce every multi-part polygon of a layer to its largest part
 *
 * Keeps one geometry per attribute row. The number of reduced features is
 * logged.
 */
[[nodiscard]] GeometryLayer normalize_to_single_part(const GeometryLayer& layer);

} // namespace tidemark::geo
