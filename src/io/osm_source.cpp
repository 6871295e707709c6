/**
 * @file osm_source.cpp
 * @brief Implementation of the OSM source using libosmium
 */

#include "io/osm_source.hpp"
#include "core/errors.hpp"
#include "geo/crs.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>

// libosmium includes
#include <osmium/io/any_input.hpp>
#include <osmium/handler.hpp>
#include <osmium/visitor.hpp>
#include <osmium/index/map/flex_mem.hpp>
#include <osmium/handler/node_locations_for_ways.hpp>

namespace tidemark::io {

// ============================================================================
// Type aliases for libosmium
// ============================================================================

using LocationIndex = osmium::index::map::FlexMem<
    osmium::unsigned_object_id_type,
    osmium::Location
>;

using LocationHandler = osmium::handler::NodeLocationsForWays<LocationIndex>;

namespace {

/// Approximate meters per degree, used to scale the simplification tolerance
constexpr double METERS_PER_DEGREE = 111320.0;

/**
 * @brief Leading number of a tag value ("12", "12 m", "12m")
 */
std::optional<double> parse_number(const char* text) {
    if (!text) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text) return std::nullopt;
    return value;
}

Value number_or_null(const char* text) {
    auto value = parse_number(text);
    return value ? Value(*value) : Value();
}

Value string_or_null(const char* text) {
    return text ? Value(std::string(text)) : Value();
}

/**
 * @brief Feature columns of one output layer
 */
struct LayerBuilder {
    geo::GeometryLayer layer;
    std::vector<std::string> names;
    std::vector<ValueColumn> values;

    LayerBuilder(const std::string& name, std::vector<std::string> columns)
        : names(std::move(columns)), values(names.size()) {
        layer.name = name;
        layer.crs = geo::WGS84;
    }

    void add(geo::Geometry geometry, std::vector<Value> row) {
        layer.geometries.push_back(std::move(geometry));
        for (size_t i = 0; i < row.size(); ++i) {
            values[i].push_back(std::move(row[i]));
        }
    }

    geo::GeometryLayer finish() {
        layer.attributes = AttributeTable(layer.geometries.size());
        for (size_t i = 0; i < names.size(); ++i) {
            layer.attributes.set_column(names[i], std::move(values[i]));
        }
        return std::move(layer);
    }
};

// ============================================================================
// Internal Handler
// ============================================================================

/**
 * @brief Internal handler turning ways into layer features
 */
class WayHandler : public osmium::handler::Handler {
public:
    explicit WayHandler(const OsmSourceConfig& config)
        : m_config(config),
          m_buildings("buildings", {"osm_id", "building", "building_levels", "height"}),
          m_roads("roads", {"osm_id", "highway", "lanes", "name"}) {}

    void way(const osmium::Way& way) {
        const osmium::TagList& tags = way.tags();
        const char* building = tags.get_value_by_key("building");
        const char* highway = tags.get_value_by_key("highway");

        bool wants_building = m_config.import_buildings && building;
        bool wants_road = m_config.import_roads && highway;
        if (!wants_building && !wants_road) return;

        ++m_ways;
        geo::Ring coords = resolve_way_coords(way);
        if (coords.size() < 2) {
            ++m_incomplete;
            return;
        }

        if (m_config.filter_bounds) {
            geo::Envelope extent;
            for (const auto& p : coords) extent.expand(p);
            if (!extent.intersects(*m_config.filter_bounds)) return;
        }

        if (m_config.simplify_geometry && coords.size() > 2) {
            coords = geo::simplify(coords, m_config.simplify_tolerance / METERS_PER_DEGREE);
        }

        const auto osm_id = static_cast<int64_t>(way.id());
        bool closed = way.nodes().size() > 2 && way.is_closed();

        if (wants_road) {
            // Untagged lane counts stay null and read as one lane downstream
            m_roads.add(geo::Geometry::make_line(coords),
                        {osm_id, std::string(highway),
                         number_or_null(tags.get_value_by_key("lanes")),
                         string_or_null(tags.get_value_by_key("name"))});
        }

        // Need at least 3 unique points + closing
        if (!wants_building || !closed || coords.size() < 4) return;

        geo::Ring ring = std::move(coords);
        geo::ensure_ccw(ring);
        m_buildings.add(geo::Geometry::make_polygon(std::move(ring)),
                        {osm_id, std::string(building),
                         number_or_null(tags.get_value_by_key("building:levels")),
                         number_or_null(tags.get_value_by_key("height"))});
    }

    OsmLayers finish() {
        if (m_incomplete > 0) {
            spdlog::warn("OSM source: skipped {} of {} ways with unresolved nodes",
                         m_incomplete, m_ways);
        }
        return OsmLayers{m_buildings.finish(), m_roads.finish()};
    }

private:
    geo::Ring resolve_way_coords(const osmium::Way& way) const {
        geo::Ring coords;
        coords.reserve(way.nodes().size());
        for (const auto& node_ref : way.nodes()) {
            if (!node_ref.location().valid()) continue;
            coords.emplace_back(node_ref.location().lon(), node_ref.location().lat());
        }
        return coords;
    }

    const OsmSourceConfig& m_config;
    LayerBuilder m_buildings;
    LayerBuilder m_roads;
    size_t m_ways = 0;
    size_t m_incomplete = 0;
};

} // anonymous namespace

// ============================================================================
// OsmSource Implementation
// ============================================================================

OsmLayers OsmSource::read(const std::filesystem::path& filepath) const {
    using Clock = std::chrono::high_resolution_clock;

    if (!std::filesystem::exists(filepath)) {
        throw ProviderError("OSM file not found: " + filepath.string());
    }

    auto parse_start = Clock::now();
    WayHandler handler(m_config);

    try {
        // libosmium auto-detects format from extension
        const osmium::io::File input_file{filepath.string()};
        osmium::io::Reader reader{input_file,
            osmium::osm_entity_bits::node | osmium::osm_entity_bits::way
        };

        LocationIndex index;
        LocationHandler location_handler{index};
        location_handler.ignore_errors();  // Don't fail on missing nodes

        osmium::apply(reader, location_handler, handler);
        reader.close();
    } catch (const std::exception& e) {
        throw ProviderError("Cannot read OSM file " + filepath.string() + ": " + e.what());
    }

    OsmLayers layers = handler.finish();

    double elapsed = std::chrono::duration<double, std::milli>(Clock::now() - parse_start).count();
    spdlog::info("OSM source: {} buildings, {} roads from {} in {:.1f}ms",
                 layers.buildings.size(), layers.roads.size(),
                 filepath.filename().string(), elapsed);
    return layers;
}

} // namespace tidemark::io
