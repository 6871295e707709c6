/**
 * @file geometry.hpp
 * @brief Geometry types and planar geometry utilities for Tidemark
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Geometries are stored as plain vertex lists in the coordinates of their
 * layer's CRS (x = easting/longitude, y = northing/latitude). Measurements
 * (area, length, distance) are planar and only meaningful in a projected
 * CRS; see geo/crs.hpp for reprojection to a local projected system.
 */

#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <limits>
#include <vector>

namespace tidemark::geo {

// ============================================================================
// Types
// ============================================================================

/// Ordered ring or polyline vertices
using Ring = std::vector<glm::dvec2>;

/**
 * @brief Kind of geometry stored in a Geometry
 */
enum class GeometryType {
    Point,          ///< Single point
    LineString,     ///< One or more polylines (MultiLineString collapsed here)
    Polygon,        ///< One or more polygons (MultiPolygon collapsed here)
    Empty           ///< No geometry
};

/**
 * @brief Polygon with an outer ring and optional holes
 */
struct Polygon {
    Ring outer;                 ///< Outer ring
    std::vector<Ring> holes;    ///< Inner rings
};

/**
 * @brief Axis-aligned envelope
 */
struct Envelope {
    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();

    void expand(const glm::dvec2& p) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }

    void expand(const Envelope& other) {
        if (!other.is_valid()) return;
        min_x = std::min(min_x, other.min_x);
        min_y = std::min(min_y, other.min_y);
        max_x = std::max(max_x, other.max_x);
        max_y = std::max(max_y, other.max_y);
    }

    /// Grow the envelope by a distance on every side
    [[nodiscard]] Envelope buffered(double distance) const {
        return Envelope{min_x - distance, min_y - distance, max_x + distance, max_y + distance};
    }

    [[nodiscard]] bool is_valid() const { return min_x <= max_x && min_y <= max_y; }

    [[nodiscard]] bool intersects(const Envelope& other) const {
        return is_valid() && other.is_valid() &&
               min_x <= other.max_x && other.min_x <= max_x &&
               min_y <= other.max_y && other.min_y <= max_y;
    }

    [[nodiscard]] glm::dvec2 center() const {
        return glm::dvec2((min_x + max_x) / 2.0, (min_y + max_y) / 2.0);
    }
};

/**
 * @brief A single feature geometry
 *
 * Only the member matching `type` is populated: `point` for Point,
 * `lines` for LineString, `polygons` for Polygon. Multi-part inputs keep
 * all their parts until normalized (see largest_part()).
 */
struct Geometry {
    GeometryType type = GeometryType::Empty;
    glm::dvec2 point{0.0};
    std::vector<Ring> lines;
    std::vector<Polygon> polygons;

    static Geometry make_point(const glm::dvec2& p);
    static Geometry make_line(Ring line);
    static Geometry make_polygon(Ring outer, std::vector<Ring> holes = {});

    [[nodiscard]] bool is_point() const { return type == GeometryType::Point; }
    [[nodiscard]] bool is_line() const { return type == GeometryType::LineString; }
    [[nodiscard]] bool is_polygon() const { return type == GeometryType::Polygon; }
    [[nodiscard]] bool is_empty() const { return type == GeometryType::Empty; }
    [[nodiscard]] bool is_multi_part() const {
        return (is_polygon() && polygons.size() > 1) || (is_line() && lines.size() > 1);
    }
};

[[nodiscard]] const char* geometry_type_name(GeometryType type);

// ============================================================================
// Geometry Utilities
// ============================================================================

/**
 * @brief Calculate the signed area of a ring
 * @param ring Ordered list of vertices (closing vertex optional)
 * @return Signed area (positive = CCW, negative = CW)
 *
 * Uses the shoelace formula.
 */
[[nodiscard]] double ring_area(const Ring& ring);

/**
 * @brief Check if a ring has clockwise winding
 */
[[nodiscard]] bool is_clockwise(const Ring& ring);

/**
 * @brief Ensure ring has counter-clockwise winding (standard for outer rings)
 */
void ensure_ccw(Ring& ring);

/**
 * @brief Area of a polygon (outer ring minus holes, always positive)
 */
[[nodiscard]] double polygon_area(const Polygon& polygon);

/**
 * @brief Area of a geometry (0 for points and lines)
 */
[[nodiscard]] double area(const Geometry& geometry);

/**
 * @brief Calculate the area centroid of a ring
 * @return Centroid point (vertex mean for degenerate rings)
 */
[[nodiscard]] glm::dvec2 centroid(const Ring& ring);

/**
 * @brief Representative point used by nearest joins and raster sampling
 *
 * Point: the point itself. Line: mean of all vertices. Polygon: area
 * centroid of the largest part.
 */
[[nodiscard]] glm::dvec2 representative_point(const Geometry& geometry);

/**
 * @brief Calculate the length of a polyline
 */
[[nodiscard]] double polyline_length(const Ring& points);

/**
 * @brief Total length of a geometry (sum of all line parts, 0 otherwise)
 */
[[nodiscard]] double length(const Geometry& geometry);

/**
 * @brief Simplify a polyline using Douglas-Peucker algorithm
 * @param points Input polyline
 * @param epsilon Maximum perpendicular distance for point removal
 */
[[nodiscard]] Ring simplify(const Ring& points, double epsilon);

/**
 * @brief Calculate perpendicular distance from point to line segment
 */
[[nodiscard]] double point_to_line_distance(
    const glm::dvec2& point,
    const glm::dvec2& line_start,
    const glm::dvec2& line_end
);

/**
 * @brief Even-odd point in ring test (boundary points count as inside)
 */
[[nodiscard]] bool ring_contains(const Ring& ring, const glm::dvec2& point);

/**
 * @brief Point in polygon, honouring holes
 */
[[nodiscard]] bool polygon_contains(const Polygon& polygon, const glm::dvec2& point);

/**
 * @brief Point in any part of a polygonal geometry
 */
[[nodiscard]] bool contains(const Geometry& geometry, const glm::dvec2& point);

/**
 * @brief Envelope of a geometry
 */
[[nodiscard]] Envelope envelope(const Geometry& geometry);

/**
 * @brief Reduce a multi-part polygon to its largest part
 *
 * Geometries that are not multi-part polygons are returned unchanged.
 */
[[nodiscard]] Geometry largest_part(const Geometry& geometry);

/**
 * @brief Exact area of the overlay of two polygonal geometries
 *
 * Computed with the GDAL/OGR overlay engine. Returns 0 when either side is
 * not polygonal or the overlay fails.
 */
[[nodiscard]] double intersection_area(const Geometry& a, const Geometry& b);

/**
 * @brief Apply a transformation to every vertex of a geometry
 */
template <typename Fn>
Geometry transform_vertices(const Geometry& geometry, Fn&& fn) {
    Geometry result = geometry;
    if (result.is_point()) {
        result.point = fn(result.point);
    }
    for (auto& line : result.lines) {
        for (auto& p : line) p = fn(p);
    }
    for (auto& polygon : result.polygons) {
        for (auto& p : polygon.outer) p = fn(p);
        for (auto& hole : polygon.holes) {
            for (auto& p : hole) p = fn(p);
        }
    }
    return result;
}

} // namespace tidemark::geo
