/**
 * @file pipeline_config.hpp
 * @brief YAML configuration of an exposure preparation run
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Plain structs mirroring the YAML layout. Optional keys take the defaults
 * given here; enumerated values are validated while loading. A minimal
 * configuration:
 *
 * @code{.yaml}
 * unit: feet
 * output_dir: output
 * asset_locations:
 *   source: osm
 *   path: data/city.osm.pbf
 * object_types:
 *   source_column: building
 *   translation_table: data/building_types.csv
 * damage_types: [structure, content]
 * max_damage:
 *   source: jrc
 *   table: data/jrc_base_damage_values.csv
 *   country: Netherlands
 * ground_floor_height:
 *   source: constant
 *   value: 1.0
 * vulnerability:
 *   curves: data/curves.csv
 *   linking: data/linking.csv
 * @endcode
 */

#pragma once

#include "core/units.hpp"
#include "exposure/exposure.hpp"
#include "exposure/ground_floor.hpp"
#include "exposure/selection.hpp"
#include "exposure/spatial_join.hpp"
#include "geo/raster.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace tidemark::config {

// ============================================================================
// Shared pieces
// ============================================================================

/**
 * @brief A vector file joined onto the assets
 */
struct JoinConfig {
    std::string path;
    std::string layer;                                  ///< OGR layer; empty reads the first
    std::string attribute;
    exposure::JoinMethod method = exposure::JoinMethod::Nearest;
    double max_distance = exposure::DEFAULT_MAX_DISTANCE;
};

/**
 * @brief Asset selection of a measure
 */
struct SelectionConfig {
    exposure::SelectionType type = exposure::SelectionType::All;
    std::vector<std::string> object_types;
    std::vector<std::string> excluded_types;
    std::vector<int64_t> ids;
    std::string aggregation;
    std::string aggregation_area;
    std::string polygons;                               ///< Polygon type: vector file
};

// ============================================================================
// Steps
// ============================================================================

struct AssetLocationConfig {
    enum class Source { Osm, Vector };

    Source source = Source::Vector;
    std::string path;
    std::string layer;
    std::string extract_method = exposure::EXTRACT_CENTROID;
    double simplify_tolerance = 0.0;                    ///< OSM only, meters; 0 disables
};

struct RoadConfig {
    enum class Damage { None, Constant, Lanes };

    bool enabled = false;
    AssetLocationConfig::Source source = AssetLocationConfig::Source::Osm;
    std::string path;                                   ///< Defaults to the asset OSM file
    std::string layer;
    Damage damage = Damage::None;
    double constant = 0.0;
    std::string cost_table;
    std::string cost_column = "cost [USD/ft]";
    UnitSystem cost_unit = UnitSystem::Feet;
};

struct ObjectTypeConfig {
    enum class Method { Column, SpatialJoin };

    Method method = Method::Column;

    // Column
    std::string source_column;
    std::string secondary_column;
    std::string translation_table;
    std::optional<std::string> unclassified_fill;
    bool drop_unclassified = false;

    // Spatial join (land use)
    JoinConfig join;
    std::string target = "primary_object_type";
};

struct AggregationConfig {
    std::string path;
    std::string attribute;
    std::string name;                                   ///< Label name; defaults to the file stem
};

struct MaxDamageConfig {
    enum class Source { Constant, Layers, Jrc, Hazus, Translation };

    struct LayerEntry {
        std::string damage_type;
        JoinConfig join;
    };

    Source source = Source::Constant;
    double value = 0.0;
    std::vector<LayerEntry> layers;
    std::string table;
    std::string country;
    bool convert_to_usd = false;
    std::string source_column = "primary_object_type";
    std::string value_column;
};

struct HeightConfig {
    enum class Source { Default, Constant, Layer, Raster };

    Source source = Source::Default;
    double value = 0.0;
    JoinConfig join;
    std::string raster;
    geo::ZonalStatistic statistic = geo::ZonalStatistic::Mean;
    std::optional<UnitSystem> unit;                     ///< Overrides the band unit of the raster
};

struct VulnerabilityConfig {
    std::string curves;
    std::string linking;
};

struct FloodproofConfig {
    SelectionConfig selection;
    double floodproof_to = 0.0;
};

struct RaiseConfig {
    SelectionConfig selection;
    double raise_by = 0.0;
    exposure::HeightReference reference = exposure::HeightReference::Datum;
    std::string path;                                   ///< Geom: layer; table: table file
    std::string attribute;                              ///< Geom: layer attribute; table: value column
};

struct GrowthConfig {
    double percent_growth = 0.0;
    std::string path;
    double ground_floor_height = 0.0;
    std::string height_attribute = "height";
    exposure::HeightReference elevation_reference = exposure::HeightReference::Datum;
    std::string reference_path;
    std::string reference_attribute;
    std::optional<HeightConfig> ground_elevation;       ///< DEM sampled for the new areas
};

/// Table of object_id and max_damage_<type> columns overwriting resolved values
struct MaxDamageUpdateConfig {
    std::string path;
};

// ============================================================================
// Pipeline
// ============================================================================

struct PipelineConfig {
    std::filesystem::path base_dir;                     ///< Relative paths resolve against this
    UnitSystem unit = UnitSystem::Meters;
    std::string output_dir = "output";
    std::string region;

    AssetLocationConfig assets;
    RoadConfig roads;
    std::optional<ObjectTypeConfig> object_types;
    std::vector<AggregationConfig> aggregation;
    std::vector<std::string> damage_types = {"structure", "content"};
    std::optional<MaxDamageConfig> max_damage;
    HeightConfig ground_floor_height;
    HeightConfig ground_elevation;
    std::optional<VulnerabilityConfig> vulnerability;
    std::vector<MaxDamageUpdateConfig> max_damage_updates;
    std::vector<FloodproofConfig> floodproof;
    std::vector<RaiseConfig> raise;
    std::vector<GrowthConfig> growth;

    /**
     * @brief Resolve a configured path against base_dir
     */
    [[nodiscard]] std::filesystem::path resolve(const std::string& path) const;
};

/**
 * @brief Parse a configuration document
 * @throws ConfigError naming the offending key
 */
[[nodiscard]] PipelineConfig parse_config(const YAML::Node& root);

/**
 * @brief Load and parse a configuration file
 * @throws ConfigError if the file is missing or malformed
 *
 * Relative paths in the file resolve against the file's directory.
 */
[[nodiscard]] PipelineConfig load_config(const std::filesystem::path& path);

} // namespace tidemark::config
