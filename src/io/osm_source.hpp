/**
 * @file osm_source.hpp
 * @brief Asset layers from OpenStreetMap files using libosmium
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Supported formats (auto-detected by extension):
 *   - .osm     - XML format
 *   - .osm.pbf - Protobuf binary format
 *   - .osm.bz2 - Bzip2-compressed XML
 *   - .osm.gz  - Gzip-compressed XML
 *
 * Geometries are returned in WGS84 (EPSG:4326).
 */

#pragma once

#include "geo/layer.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace tidemark::io {

// ============================================================================
// Source Configuration
// ============================================================================

/**
 * @brief Configuration options for OSM reading
 */
struct OsmSourceConfig {
    // What to import
    bool import_buildings = true;       ///< Closed ways with building=*
    bool import_roads = true;           ///< Ways with highway=*

    // Processing options
    bool simplify_geometry = false;     ///< Apply Douglas-Peucker simplification
    double simplify_tolerance = 0.5;    ///< Simplification tolerance (meters)

    // Area filter (optional), in longitude/latitude
    std::optional<geo::Envelope> filter_bounds;
};

/**
 * @brief Layers extracted from one OSM file
 */
struct OsmLayers {
    geo::GeometryLayer buildings;   ///< osm_id, building, building_levels, height
    geo::GeometryLayer roads;       ///< osm_id, highway, lanes (null when untagged), name
};

/**
 * @brief Reader for OpenStreetMap data files
 *
 * Usage:
 * @code
 * tidemark::io::OsmSource source;
 * source.set_config(config);
 * auto layers = source.read("city.osm.pbf");
 * @endcode
 */
class OsmSource {
public:
    void set_config(const OsmSourceConfig& config) { m_config = config; }
    [[nodiscard]] const OsmSourceConfig& get_config() const { return m_config; }

    /**
     * @brief Read an OSM file
     * @throws ProviderError if the file is missing or cannot be parsed
     */
    [[nodiscard]] OsmLayers read(const std::filesystem::path& filepath) const;

private:
    OsmSourceConfig m_config;
};

} // namespace tidemark::io
