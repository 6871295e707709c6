#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <optional>

namespace tidemark::config {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

// ============================================================================
// Node access
// ============================================================================

/**
 * @brief Value of an optional key, or the fallback when absent or null
 * @throws ConfigError if the value has the wrong type
 */
template <typename T>
T read(const YAML::Node& node, const std::string& key, const T& fallback,
       const std::string& context) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for '" + context + key + "': " + e.msg);
    }
}

/**
 * @brief Value of a mandatory key
 * @throws ConfigError if the key is absent or has the wrong type
 */
template <typename T>
T require(const YAML::Node& node, const std::string& key, const std::string& context) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        throw ConfigError("Missing required key '" + context + key + "'");
    }
    return read<T>(node, key, T{}, context);
}

template <typename T>
std::vector<T> read_list(const YAML::Node& node, const std::string& key,
                         const std::vector<T>& fallback, const std::string& context) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    if (!value.IsSequence()) {
        throw ConfigError("Key '" + context + key + "' must be a list");
    }
    return read<std::vector<T>>(node, key, fallback, context);
}

/**
 * @brief Sub-mapping of a key, or an undefined node when absent
 */
YAML::Node section(const YAML::Node& node, const std::string& key, const std::string& context) {
    const YAML::Node value = node[key];
    if (value && !value.IsNull() && !value.IsMap()) {
        throw ConfigError("Key '" + context + key + "' must be a mapping");
    }
    return value;
}

/**
 * @brief Enumerated value of an optional key
 * @throws ConfigError if the name is not recognised
 */
template <typename T>
T read_enum(const YAML::Node& node, const std::string& key, T fallback,
            const std::string& context, std::optional<T> (*parse)(const std::string&)) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;

    std::string name = read<std::string>(node, key, std::string(), context);
    std::optional<T> parsed = parse(name);
    if (!parsed) {
        throw ConfigError("Unknown value '" + name + "' for '" + context + key + "'");
    }
    return *parsed;
}

// ============================================================================
// Enumerations
// ============================================================================

std::optional<AssetLocationConfig::Source> parse_asset_source(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "osm") return AssetLocationConfig::Source::Osm;
    if (lower == "vector" || lower == "file") return AssetLocationConfig::Source::Vector;
    return std::nullopt;
}

std::optional<RoadConfig::Damage> parse_road_damage(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "none") return RoadConfig::Damage::None;
    if (lower == "constant") return RoadConfig::Damage::Constant;
    if (lower == "lanes") return RoadConfig::Damage::Lanes;
    return std::nullopt;
}

std::optional<ObjectTypeConfig::Method> parse_type_method(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "column") return ObjectTypeConfig::Method::Column;
    if (lower == "spatial_join") return ObjectTypeConfig::Method::SpatialJoin;
    return std::nullopt;
}

std::optional<MaxDamageConfig::Source> parse_damage_source(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "constant") return MaxDamageConfig::Source::Constant;
    if (lower == "layers") return MaxDamageConfig::Source::Layers;
    if (lower == "jrc") return MaxDamageConfig::Source::Jrc;
    if (lower == "hazus") return MaxDamageConfig::Source::Hazus;
    if (lower == "translation") return MaxDamageConfig::Source::Translation;
    return std::nullopt;
}

std::optional<HeightConfig::Source> parse_height_source(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "default") return HeightConfig::Source::Default;
    if (lower == "constant") return HeightConfig::Source::Constant;
    if (lower == "layer") return HeightConfig::Source::Layer;
    if (lower == "raster" || lower == "dem") return HeightConfig::Source::Raster;
    return std::nullopt;
}

// ============================================================================
// Sections
// ============================================================================

JoinConfig parse_join(const YAML::Node& node, const std::string& context) {
    JoinConfig join;
    join.path = require<std::string>(node, "path", context);
    join.layer = read<std::string>(node, "layer", "", context);
    join.attribute = require<std::string>(node, "attribute", context);
    join.method = read_enum(node, "method", exposure::JoinMethod::Nearest, context,
                            exposure::parse_join_method);
    join.max_distance = read<double>(node, "max_distance", exposure::DEFAULT_MAX_DISTANCE, context);
    return join;
}

SelectionConfig parse_selection(const YAML::Node& node, const std::string& context) {
    SelectionConfig selection;
    if (!node) return selection;

    selection.type = read_enum(node, "type", exposure::SelectionType::All, context,
                               exposure::parse_selection_type);
    selection.object_types = read_list<std::string>(node, "object_types", {}, context);
    selection.excluded_types = read_list<std::string>(node, "excluded_types", {}, context);
    selection.ids = read_list<int64_t>(node, "ids", {}, context);
    selection.aggregation = read<std::string>(node, "aggregation", "", context);
    selection.aggregation_area = read<std::string>(node, "aggregation_area", "", context);
    selection.polygons = read<std::string>(node, "polygons", "", context);

    switch (selection.type) {
        case exposure::SelectionType::Ids:
            if (selection.ids.empty()) {
                throw ConfigError("Selection '" + context + "' of type ids needs 'ids'");
            }
            break;
        case exposure::SelectionType::AggregationArea:
            if (selection.aggregation.empty() || selection.aggregation_area.empty()) {
                throw ConfigError("Selection '" + context +
                                  "' needs 'aggregation' and 'aggregation_area'");
            }
            break;
        case exposure::SelectionType::Polygon:
            if (selection.polygons.empty()) {
                throw ConfigError("Selection '" + context + "' of type polygon needs 'polygons'");
            }
            break;
        case exposure::SelectionType::All:
            break;
    }
    return selection;
}

AssetLocationConfig parse_assets(const YAML::Node& node) {
    const std::string context = "asset_locations.";
    AssetLocationConfig assets;
    assets.source = read_enum(node, "source", AssetLocationConfig::Source::Vector, context,
                              parse_asset_source);
    assets.path = require<std::string>(node, "path", context);
    assets.layer = read<std::string>(node, "layer", "", context);
    assets.extract_method = to_lower(read<std::string>(node, "extract_method",
                                                       exposure::EXTRACT_CENTROID, context));
    if (assets.extract_method != exposure::EXTRACT_CENTROID &&
        assets.extract_method != exposure::EXTRACT_AREA) {
        throw ConfigError("Unknown value '" + assets.extract_method + "' for '" + context +
                          "extract_method'");
    }
    assets.simplify_tolerance = read<double>(node, "simplify_tolerance", 0.0, context);
    return assets;
}

RoadConfig parse_roads(const YAML::Node& node) {
    const std::string context = "roads.";
    RoadConfig roads;
    roads.enabled = read<bool>(node, "enabled", true, context);
    roads.source = read_enum(node, "source", AssetLocationConfig::Source::Osm, context,
                             parse_asset_source);
    roads.path = read<std::string>(node, "path", "", context);
    roads.layer = read<std::string>(node, "layer", "", context);
    roads.damage = read_enum(node, "damage", RoadConfig::Damage::None, context, parse_road_damage);
    roads.constant = read<double>(node, "constant", 0.0, context);
    roads.cost_table = read<std::string>(node, "cost_table", "", context);
    roads.cost_column = read<std::string>(node, "cost_column", roads.cost_column, context);
    roads.cost_unit = read_enum(node, "cost_unit", UnitSystem::Feet, context, parse_unit);

    if (roads.source == AssetLocationConfig::Source::Vector && roads.path.empty()) {
        throw ConfigError("Missing required key 'roads.path' for vector roads");
    }
    if (roads.damage == RoadConfig::Damage::Lanes && roads.cost_table.empty()) {
        throw ConfigError("Missing required key 'roads.cost_table' for lane based damage");
    }
    return roads;
}

ObjectTypeConfig parse_object_types(const YAML::Node& node) {
    const std::string context = "object_types.";
    ObjectTypeConfig types;
    types.method = read_enum(node, "method", ObjectTypeConfig::Method::Column, context,
                             parse_type_method);

    if (types.method == ObjectTypeConfig::Method::SpatialJoin) {
        types.join = parse_join(node, context);
        types.target = read<std::string>(node, "target", types.target, context);
        return types;
    }

    types.source_column = require<std::string>(node, "source_column", context);
    types.secondary_column = read<std::string>(node, "secondary_column", "", context);
    types.translation_table = read<std::string>(node, "translation_table", "", context);
    if (node["unclassified_fill"]) {
        types.unclassified_fill = require<std::string>(node, "unclassified_fill", context);
    }
    types.drop_unclassified = read<bool>(node, "drop_unclassified", false, context);
    return types;
}

MaxDamageConfig parse_max_damage(const YAML::Node& node) {
    const std::string context = "max_damage.";
    MaxDamageConfig damage;
    damage.source = read_enum(node, "source", MaxDamageConfig::Source::Constant, context,
                              parse_damage_source);

    switch (damage.source) {
        case MaxDamageConfig::Source::Constant:
            damage.value = require<double>(node, "value", context);
            break;

        case MaxDamageConfig::Source::Layers: {
            const YAML::Node layers = node["layers"];
            if (!layers || !layers.IsSequence() || layers.size() == 0) {
                throw ConfigError("Key 'max_damage.layers' must be a non-empty list");
            }
            for (size_t i = 0; i < layers.size(); ++i) {
                std::string entry_context = context + "layers[" + std::to_string(i) + "].";
                MaxDamageConfig::LayerEntry entry;
                entry.damage_type = require<std::string>(layers[i], "damage_type", entry_context);
                entry.join = parse_join(layers[i], entry_context);
                damage.layers.push_back(std::move(entry));
            }
            break;
        }

        case MaxDamageConfig::Source::Jrc:
            damage.table = read<std::string>(node, "table", "", context);
            damage.country = read<std::string>(node, "country", "", context);
            damage.convert_to_usd = read<bool>(node, "convert_to_usd", false, context);
            break;

        case MaxDamageConfig::Source::Hazus:
            damage.table = read<std::string>(node, "table", "", context);
            break;

        case MaxDamageConfig::Source::Translation:
            damage.table = read<std::string>(node, "table", "", context);
            damage.source_column = read<std::string>(node, "source_column", damage.source_column,
                                                     context);
            damage.value_column = require<std::string>(node, "value_column", context);
            break;
    }
    return damage;
}

/// DEM path, zonal statistic and unit override of a raster height
void parse_dem(const YAML::Node& node, const std::string& context, HeightConfig& height) {
    height.raster = require<std::string>(node, "path", context);
    height.statistic = read_enum(node, "statistic", geo::ZonalStatistic::Mean, context,
                                 geo::parse_zonal_statistic);
    if (node["unit"]) {
        height.unit = read_enum(node, "unit", UnitSystem::Meters, context, parse_unit);
    }
}

HeightConfig parse_height(const YAML::Node& node, const std::string& context) {
    HeightConfig height;
    if (!node) return height;

    height.source = read_enum(node, "source", HeightConfig::Source::Default, context,
                              parse_height_source);
    switch (height.source) {
        case HeightConfig::Source::Default:
            break;
        case HeightConfig::Source::Constant:
            height.value = require<double>(node, "value", context);
            break;
        case HeightConfig::Source::Layer:
            height.join = parse_join(node, context);
            break;
        case HeightConfig::Source::Raster:
            parse_dem(node, context, height);
            break;
    }
    return height;
}

template <typename T, typename Parse>
std::vector<T> parse_sequence(const YAML::Node& root, const std::string& key, Parse parse) {
    std::vector<T> result;
    const YAML::Node list = root[key];
    if (!list || list.IsNull()) return result;
    if (!list.IsSequence()) {
        throw ConfigError("Key '" + key + "' must be a list");
    }
    for (size_t i = 0; i < list.size(); ++i) {
        result.push_back(parse(list[i], key + "[" + std::to_string(i) + "]."));
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// PipelineConfig
// ============================================================================

std::filesystem::path PipelineConfig::resolve(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.empty() || p.is_absolute() || base_dir.empty()) return p;
    return base_dir / p;
}

PipelineConfig parse_config(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigError("Configuration must be a mapping");
    }

    PipelineConfig config;
    config.unit = read_enum(root, "unit", UnitSystem::Meters, "", parse_unit);
    config.output_dir = read<std::string>(root, "output_dir", config.output_dir, "");
    config.region = read<std::string>(root, "region", "", "");

    const YAML::Node assets = section(root, "asset_locations", "");
    if (!assets) {
        throw ConfigError("Missing required key 'asset_locations'");
    }
    config.assets = parse_assets(assets);

    if (const YAML::Node roads = section(root, "roads", "")) {
        config.roads = parse_roads(roads);
    }
    if (const YAML::Node types = section(root, "object_types", "")) {
        config.object_types = parse_object_types(types);
    }

    config.aggregation = parse_sequence<AggregationConfig>(
        root, "aggregation", [](const YAML::Node& node, const std::string& context) {
            AggregationConfig area;
            area.path = require<std::string>(node, "path", context);
            area.attribute = require<std::string>(node, "attribute", context);
            area.name = read<std::string>(node, "name", "", context);
            return area;
        });

    config.damage_types = read_list<std::string>(root, "damage_types", config.damage_types, "");
    if (config.damage_types.empty()) {
        throw ConfigError("Key 'damage_types' must not be empty");
    }

    if (const YAML::Node damage = section(root, "max_damage", "")) {
        config.max_damage = parse_max_damage(damage);
    }
    config.ground_floor_height = parse_height(section(root, "ground_floor_height", ""),
                                              "ground_floor_height.");
    config.ground_elevation = parse_height(section(root, "ground_elevation", ""),
                                           "ground_elevation.");

    if (const YAML::Node vulnerability = section(root, "vulnerability", "")) {
        VulnerabilityConfig links;
        links.curves = require<std::string>(vulnerability, "curves", "vulnerability.");
        links.linking = require<std::string>(vulnerability, "linking", "vulnerability.");
        config.vulnerability = links;
    }

    config.max_damage_updates = parse_sequence<MaxDamageUpdateConfig>(
        root, "max_damage_updates", [](const YAML::Node& node, const std::string& context) {
            MaxDamageUpdateConfig update;
            update.path = require<std::string>(node, "path", context);
            return update;
        });

    config.floodproof = parse_sequence<FloodproofConfig>(
        root, "floodproof", [](const YAML::Node& node, const std::string& context) {
            FloodproofConfig measure;
            measure.selection = parse_selection(node["selection"], context + "selection.");
            measure.floodproof_to = require<double>(node, "floodproof_to", context);
            return measure;
        });

    config.raise = parse_sequence<RaiseConfig>(
        root, "raise", [](const YAML::Node& node, const std::string& context) {
            RaiseConfig measure;
            measure.selection = parse_selection(node["selection"], context + "selection.");
            measure.raise_by = require<double>(node, "raise_by", context);
            measure.reference = read_enum(node, "reference", exposure::HeightReference::Datum,
                                          context, exposure::parse_height_reference);
            if (measure.reference != exposure::HeightReference::Datum) {
                measure.path = require<std::string>(node, "path", context);
                measure.attribute = require<std::string>(node, "attribute", context);
            }
            return measure;
        });

    config.growth = parse_sequence<GrowthConfig>(
        root, "growth", [](const YAML::Node& node, const std::string& context) {
            GrowthConfig measure;
            measure.percent_growth = require<double>(node, "percent_growth", context);
            measure.path = require<std::string>(node, "path", context);
            measure.ground_floor_height = read<double>(node, "ground_floor_height", 0.0, context);
            measure.height_attribute = read<std::string>(node, "height_attribute",
                                                         measure.height_attribute, context);
            measure.elevation_reference = read_enum(node, "elevation_reference",
                                                    exposure::HeightReference::Datum, context,
                                                    exposure::parse_height_reference);
            if (measure.elevation_reference == exposure::HeightReference::Table) {
                throw ConfigError("Key '" + context +
                                  "elevation_reference' must be 'datum' or 'geom'");
            }
            if (measure.elevation_reference == exposure::HeightReference::Geom) {
                measure.reference_path = require<std::string>(node, "reference_path", context);
                measure.reference_attribute = require<std::string>(node, "reference_attribute",
                                                                   context);
            }
            if (const YAML::Node dem = section(node, "ground_elevation", context)) {
                HeightConfig elevation;
                elevation.source = HeightConfig::Source::Raster;
                parse_dem(dem, context + "ground_elevation.", elevation);
                measure.ground_elevation = elevation;
            }
            return measure;
        });

    return config;
}

PipelineConfig load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }

    PipelineConfig config = parse_config(root);
    config.base_dir = path.parent_path();
    spdlog::info("Config: loaded {}", path.filename().string());
    return config;
}

} // namespace tidemark::config
