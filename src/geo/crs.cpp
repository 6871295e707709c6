#include "geo/crs.hpp"
#include "core/errors.hpp"
#include <ogr_spatialref.h>
#include <spdlog/spdlog.h>
#include <cmath>

namespace tidemark::geo {

namespace {

OGRSpatialReference parse_crs(const std::string& crs) {
    OGRSpatialReference srs;
    if (srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
        throw UserInputError("Invalid coordinate reference system '" + crs + "'");
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

} // anonymous namespace

// ============================================================================
// CRS Queries
// ============================================================================

bool same_crs(const std::string& a, const std::string& b) {
    if (a == b) return true;
    if (a.empty() || b.empty()) return false;

    OGRSpatialReference srs_a = parse_crs(a);
    OGRSpatialReference srs_b = parse_crs(b);
    return srs_a.IsSame(&srs_b);
}

bool is_geographic(const std::string& crs) {
    if (crs.empty()) return false;
    return parse_crs(crs).IsGeographic();
}

double linear_unit_in_meters(const std::string& crs) {
    if (crs.empty()) return 1.0;

    OGRSpatialReference srs = parse_crs(crs);
    if (!srs.IsProjected()) return 1.0;
    return srs.GetLinearUnits();
}

std::string utm_crs(const glm::dvec2& lon_lat) {
    double lon = lon_lat.x;
    double lat = lon_lat.y;

    // Normalize longitude to [-180, 180)
    lon = std::fmod(lon + 180.0, 360.0);
    if (lon < 0.0) lon += 360.0;
    lon -= 180.0;

    int zone = static_cast<int>(std::floor((lon + 180.0) / 6.0)) + 1;
    zone = std::clamp(zone, 1, 60);

    int code = (lat >= 0.0 ? 32600 : 32700) + zone;
    return "EPSG:" + std::to_string(code);
}

// ============================================================================
// CrsTransformer Implementation
// ============================================================================

CrsTransformer::CrsTransformer(const std::string& from, const std::string& to)
    : m_from(from), m_to(to) {
    OGRSpatialReference source = parse_crs(from);
    OGRSpatialReference target = parse_crs(to);

    m_transform = OGRCreateCoordinateTransformation(&source, &target);
    if (!m_transform) {
        throw UserInputError("No transformation from '" + from + "' to '" + to + "'");
    }
}

CrsTransformer::~CrsTransformer() {
    if (m_transform) {
        OGRCoordinateTransformation::DestroyCT(m_transform);
    }
}

glm::dvec2 CrsTransformer::transform(const glm::dvec2& p) const {
    double x = p.x;
    double y = p.y;
    if (!m_transform->Transform(1, &x, &y)) {
        throw UserInputError("Cannot transform point (" + std::to_string(p.x) + ", " +
                             std::to_string(p.y) + ") from '" + m_from + "' to '" + m_to + "'");
    }
    return glm::dvec2(x, y);
}

Geometry CrsTransformer::transform(const Geometry& geometry) const {
    return transform_vertices(geometry, [this](const glm::dvec2& p) { return transform(p); });
}

// ============================================================================
// Reprojection
// ============================================================================

GeometryLayer reproject(const GeometryLayer& layer, const std::string& crs) {
    if (!layer.has_crs()) {
        throw CrsMissingError(layer.name);
    }

    GeometryLayer result;
    result.name = layer.name;
    result.crs = crs;
    result.attributes = layer.attributes;

    if (layer.crs == crs) {
        result.geometries = layer.geometries;
        return result;
    }

    CrsTransformer transformer(layer.crs, crs);
    result.geometries.reserve(layer.geometries.size());
    for (const auto& geometry : layer.geometries) {
        result.geometries.push_back(transformer.transform(geometry));
    }
    return result;
}

GeometryLayer to_local_projected(const GeometryLayer& layer) {
    if (!layer.has_crs() || !is_geographic(layer.crs) || layer.empty()) {
        return layer;
    }

    // Zone is picked from the WGS84 position of the layer center
    glm::dvec2 center = layer.bounds().center();
    if (!same_crs(layer.crs, WGS84)) {
        CrsTransformer to_wgs84(layer.crs, WGS84);
        center = to_wgs84.transform(center);
    }

    std::string utm = utm_crs(center);
    spdlog::debug("CRS: projecting layer '{}' to {} for measurements", layer.name, utm);
    return reproject(layer, utm);
}

// ============================================================================
// Harmonizer
// ============================================================================

GeometryLayer harmonize(const GeometryLayer& left, const GeometryLayer& right) {
    if (!left.has_crs()) throw CrsMissingError(left.name);
    if (!right.has_crs()) throw CrsMissingError(right.name);

    if (same_crs(left.crs, right.crs)) {
        return right;
    }

    spdlog::info("CRS: reprojecting layer '{}' from '{}' to '{}' of layer '{}'",
                 right.name, right.crs, left.crs, left.name);
    return reproject(right, left.crs);
}

GeometryLayer normalize_to_single_part(const GeometryLayer& layer) {
    GeometryLayer result = layer;
    size_t reduced = 0;

    for (auto& geometry : result.geometries) {
        if (geometry.is_polygon() && geometry.is_multi_part()) {
            geometry = largest_part(geometry);
            ++reduced;
        }
    }

    if (reduced > 0) {
        spdlog::info("CRS: reduced {} multi-part polygons of layer '{}' to their largest part",
                     reduced, layer.name);
    }
    return result;
}

} // namespace tidemark::geo
