/**
 * @file geometry.cpp
 * @brief Implementation of planar geometry utilities
 */

#include "geo/geometry.hpp"
#include <ogr_geometry.h>
#include <ogr_api.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <memory>

namespace tidemark::geo {

// ============================================================================
// Geometry Construction
// ============================================================================

Geometry Geometry::make_point(const glm::dvec2& p) {
    Geometry g;
    g.type = GeometryType::Point;
    g.point = p;
    return g;
}

Geometry Geometry::make_line(Ring line) {
    Geometry g;
    g.type = GeometryType::LineString;
    g.lines.push_back(std::move(line));
    return g;
}

Geometry Geometry::make_polygon(Ring outer, std::vector<Ring> holes) {
    Geometry g;
    g.type = GeometryType::Polygon;
    g.polygons.push_back(Polygon{std::move(outer), std::move(holes)});
    return g;
}

const char* geometry_type_name(GeometryType type) {
    switch (type) {
        case GeometryType::Point:      return "Point";
        case GeometryType::LineString: return "LineString";
        case GeometryType::Polygon:    return "Polygon";
        case GeometryType::Empty:      return "Empty";
    }
    return "Empty";
}

// ============================================================================
// Measurements
// ============================================================================

double ring_area(const Ring& ring) {
    if (ring.size() < 3) return 0.0;

    // Shoelace formula
    double area = 0.0;
    size_t n = ring.size();

    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += ring[i].x * ring[j].y;
        area -= ring[j].x * ring[i].y;
    }

    return area / 2.0;
}

bool is_clockwise(const Ring& ring) {
    return ring_area(ring) < 0.0;
}

void ensure_ccw(Ring& ring) {
    if (is_clockwise(ring)) {
        std::reverse(ring.begin(), ring.end());
    }
}

double polygon_area(const Polygon& polygon) {
    double result = std::abs(ring_area(polygon.outer));
    for (const auto& hole : polygon.holes) {
        result -= std::abs(ring_area(hole));
    }
    return std::max(result, 0.0);
}

double area(const Geometry& geometry) {
    if (!geometry.is_polygon()) return 0.0;

    double total = 0.0;
    for (const auto& polygon : geometry.polygons) {
        total += polygon_area(polygon);
    }
    return total;
}

glm::dvec2 centroid(const Ring& ring) {
    if (ring.empty()) return glm::dvec2(0.0);
    if (ring.size() == 1) return ring[0];
    if (ring.size() == 2) return (ring[0] + ring[1]) / 2.0;

    // Shift to the first vertex to keep the cross products small for
    // projected coordinates in the millions
    const glm::dvec2 origin = ring[0];
    double cx = 0.0;
    double cy = 0.0;
    double signed_area = 0.0;
    size_t n = ring.size();

    for (size_t i = 0; i < n; ++i) {
        glm::dvec2 a = ring[i] - origin;
        glm::dvec2 b = ring[(i + 1) % n] - origin;
        double cross = a.x * b.y - b.x * a.y;
        signed_area += cross;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }

    signed_area /= 2.0;
    if (std::abs(signed_area) < 1e-12) {
        // Degenerate polygon, return simple average
        glm::dvec2 sum(0.0);
        for (const auto& p : ring) sum += p;
        return sum / static_cast<double>(n);
    }

    cx /= (6.0 * signed_area);
    cy /= (6.0 * signed_area);

    return origin + glm::dvec2(cx, cy);
}

glm::dvec2 representative_point(const Geometry& geometry) {
    switch (geometry.type) {
        case GeometryType::Point:
            return geometry.point;

        case GeometryType::LineString: {
            glm::dvec2 sum(0.0);
            size_t count = 0;
            for (const auto& line : geometry.lines) {
                for (const auto& p : line) {
                    sum += p;
                    ++count;
                }
            }
            return count > 0 ? sum / static_cast<double>(count) : glm::dvec2(0.0);
        }

        case GeometryType::Polygon: {
            const Polygon* largest = nullptr;
            double largest_area = -1.0;
            for (const auto& polygon : geometry.polygons) {
                double a = polygon_area(polygon);
                if (a > largest_area) {
                    largest_area = a;
                    largest = &polygon;
                }
            }
            return largest ? centroid(largest->outer) : glm::dvec2(0.0);
        }

        case GeometryType::Empty:
            break;
    }
    return glm::dvec2(0.0);
}

double point_to_line_distance(
    const glm::dvec2& point,
    const glm::dvec2& line_start,
    const glm::dvec2& line_end
) {
    glm::dvec2 line = line_end - line_start;
    double line_len_sq = glm::dot(line, line);

    if (line_len_sq < 1e-10) {
        // Degenerate line (start == end)
        return glm::length(point - line_start);
    }

    // Project point onto line, clamping to segment
    double t = std::clamp(glm::dot(point - line_start, line) / line_len_sq, 0.0, 1.0);
    glm::dvec2 projection = line_start + t * line;

    return glm::length(point - projection);
}

double polyline_length(const Ring& points) {
    if (points.size() < 2) return 0.0;

    double length = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        length += glm::length(points[i] - points[i - 1]);
    }
    return length;
}

double length(const Geometry& geometry) {
    if (!geometry.is_line()) return 0.0;

    double total = 0.0;
    for (const auto& line : geometry.lines) {
        total += polyline_length(line);
    }
    return total;
}

Ring simplify(const Ring& points, double epsilon) {
    if (points.size() < 3) return points;

    // Douglas-Peucker: keep the vertex farthest from the chord if it is
    // beyond epsilon and recurse on both halves
    double max_dist = 0.0;
    size_t max_idx = 0;

    const auto& first = points.front();
    const auto& last = points.back();

    for (size_t i = 1; i < points.size() - 1; ++i) {
        double dist = point_to_line_distance(points[i], first, last);
        if (dist > max_dist) {
            max_dist = dist;
            max_idx = i;
        }
    }

    if (max_dist <= epsilon) {
        return {first, last};
    }

    Ring first_half(points.begin(), points.begin() + static_cast<std::ptrdiff_t>(max_idx) + 1);
    Ring second_half(points.begin() + static_cast<std::ptrdiff_t>(max_idx), points.end());

    auto simplified_first = simplify(first_half, epsilon);
    auto simplified_second = simplify(second_half, epsilon);

    // Drop the duplicated junction vertex
    Ring result;
    result.reserve(simplified_first.size() + simplified_second.size() - 1);
    result.insert(result.end(), simplified_first.begin(), simplified_first.end() - 1);
    result.insert(result.end(), simplified_second.begin(), simplified_second.end());
    return result;
}

namespace {

double distance_to_ring(const Ring& ring, const glm::dvec2& point) {
    if (ring.empty()) return std::numeric_limits<double>::infinity();

    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < ring.size(); ++i) {
        best = std::min(best, point_to_line_distance(point, ring[i], ring[(i + 1) % ring.size()]));
    }
    return best;
}

} // anonymous namespace

// ============================================================================
// Predicates
// ============================================================================

bool ring_contains(const Ring& ring, const glm::dvec2& point) {
    size_t n = ring.size();
    if (n < 3) return false;

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const auto& a = ring[i];
        const auto& b = ring[j];

        // Boundary counts as inside
        if (point_to_line_distance(point, a, b) < 1e-12) return true;

        if ((a.y > point.y) != (b.y > point.y)) {
            double x_cross = (b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x;
            if (point.x < x_cross) inside = !inside;
        }
    }
    return inside;
}

bool polygon_contains(const Polygon& polygon, const glm::dvec2& point) {
    if (!ring_contains(polygon.outer, point)) return false;
    for (const auto& hole : polygon.holes) {
        if (ring_contains(hole, point)) {
            // A point on the hole boundary is still on the polygon
            if (distance_to_ring(hole, point) < 1e-12) return true;
            return false;
        }
    }
    return true;
}

bool contains(const Geometry& geometry, const glm::dvec2& point) {
    if (!geometry.is_polygon()) return false;
    for (const auto& polygon : geometry.polygons) {
        if (polygon_contains(polygon, point)) return true;
    }
    return false;
}

Envelope envelope(const Geometry& geometry) {
    Envelope env;
    switch (geometry.type) {
        case GeometryType::Point:
            env.expand(geometry.point);
            break;
        case GeometryType::LineString:
            for (const auto& line : geometry.lines) {
                for (const auto& p : line) env.expand(p);
            }
            break;
        case GeometryType::Polygon:
            for (const auto& polygon : geometry.polygons) {
                for (const auto& p : polygon.outer) env.expand(p);
            }
            break;
        case GeometryType::Empty:
            break;
    }
    return env;
}

Geometry largest_part(const Geometry& geometry) {
    if (!geometry.is_polygon() || geometry.polygons.size() <= 1) return geometry;

    size_t best = 0;
    double best_area = -1.0;
    for (size_t i = 0; i < geometry.polygons.size(); ++i) {
        double a = polygon_area(geometry.polygons[i]);
        if (a > best_area) {
            best_area = a;
            best = i;
        }
    }

    Geometry result;
    result.type = GeometryType::Polygon;
    result.polygons.push_back(geometry.polygons[best]);
    return result;
}

// ============================================================================
// Overlay (GDAL/OGR)
// ============================================================================

namespace {

OGRLinearRing* make_ogr_ring(const Ring& ring) {
    auto* ogr_ring = new OGRLinearRing();
    for (const auto& p : ring) {
        ogr_ring->addPoint(p.x, p.y);
    }
    ogr_ring->closeRings();
    return ogr_ring;
}

std::unique_ptr<OGRMultiPolygon> to_ogr(const Geometry& geometry) {
    auto multi = std::make_unique<OGRMultiPolygon>();
    for (const auto& polygon : geometry.polygons) {
        if (polygon.outer.size() < 3) continue;

        auto* ogr_polygon = new OGRPolygon();
        ogr_polygon->addRingDirectly(make_ogr_ring(polygon.outer));
        for (const auto& hole : polygon.holes) {
            if (hole.size() >= 3) {
                ogr_polygon->addRingDirectly(make_ogr_ring(hole));
            }
        }
        multi->addGeometryDirectly(ogr_polygon);
    }
    return multi;
}

} // anonymous namespace

double intersection_area(const Geometry& a, const Geometry& b) {
    if (!a.is_polygon() || !b.is_polygon()) return 0.0;
    if (!envelope(a).intersects(envelope(b))) return 0.0;

    auto ogr_a = to_ogr(a);
    auto ogr_b = to_ogr(b);

    OGRGeometry* overlay = ogr_a->Intersection(ogr_b.get());
    if (!overlay) {
        spdlog::debug("Geometry: overlay failed, treating intersection as empty");
        return 0.0;
    }

    double result = OGR_G_Area(OGRGeometry::ToHandle(overlay));
    OGRGeometryFactory::destroyGeometry(overlay);
    return result;
}

} // namespace tidemark::geo
