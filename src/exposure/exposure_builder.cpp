#include "exposure/exposure_builder.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace tidemark::exposure {

namespace {

/**
 * @brief True when every feature carries a distinct, non-null object id
 */
bool has_usable_ids(const AttributeTable& attributes) {
    if (!attributes.has_column(columns::OBJECT_ID)) return false;
    for (const auto& value : attributes.column(columns::OBJECT_ID)) {
        if (!as_integer(value)) return false;
    }
    return duplicate_object_ids(attributes).empty();
}

/**
 * @brief Table rows and id-only geometry layer for a set of new assets
 */
void split_layer(const geo::GeometryLayer& layer, const ValueColumn& ids,
                 AttributeTable& rows, geo::GeometryLayer& geometries) {
    rows = layer.attributes;
    if (rows.column_count() == 0) rows = AttributeTable(layer.size());
    rows.set_column(columns::OBJECT_ID, ids);

    geometries = layer;
    geometries.attributes = AttributeTable(layer.size());
    geometries.attributes.set_column(columns::OBJECT_ID, ids);
}

} // anonymous namespace

ExposureBuilder::ExposureBuilder(UnitSystem unit) {
    m_model.unit = unit;
}

// ============================================================================
// Precondition checks
// ============================================================================

void ExposureBuilder::require(const std::string& step, const std::string& column,
                              const std::string& dependency) const {
    if (!m_model.table.has_column(column)) {
        throw PipelineOrderError(step, dependency);
    }
}

void ExposureBuilder::require_damage_columns(const std::string& step, const std::string& prefix,
                                             const std::vector<std::string>& damage_types,
                                             const std::string& dependency) const {
    for (const auto& damage_type : damage_types) {
        require(step, prefix + damage_type, dependency + " of '" + damage_type + "'");
    }
}

// ============================================================================
// Geometry setup
// ============================================================================

void ExposureBuilder::setup_asset_locations(const geo::GeometryLayer& layer,
                                            const std::string& extract_method) {
    spdlog::info("Exposure: setting up {} asset locations from layer '{}'", layer.size(), layer.name);

    ValueColumn ids(layer.size());
    if (has_usable_ids(layer.attributes)) {
        ids = layer.attributes.column(columns::OBJECT_ID);
    } else {
        spdlog::info("Exposure: layer '{}' has no unique object ids, numbering assets 1 to {}",
                     layer.name, layer.size());
        for (size_t i = 0; i < ids.size(); ++i) {
            ids[i] = static_cast<int64_t>(i + 1);
        }
    }

    AttributeTable rows;
    geo::GeometryLayer geometries;
    split_layer(layer, ids, rows, geometries);
    rows.fill_column(columns::EXTRACT_METHOD, extract_method);

    m_model.table = std::move(rows);
    m_model.geoms = geo::GeometryLayers();
    m_model.crs.clear();
    add_geometry_layer(m_model, geometries);
}

void ExposureBuilder::setup_roads(const geo::GeometryLayer& layer, const RoadDamageSource& damage) {
    const int64_t first_id = max_object_id(m_model.table) + 1;
    spdlog::info("Exposure: adding {} road segments from layer '{}' (ids from {})",
                 layer.size(), layer.name, first_id);

    ValueColumn ids(layer.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        ids[i] = first_id + static_cast<int64_t>(i);
    }

    AttributeTable rows;
    geo::GeometryLayer geometries;
    split_layer(layer, ids, rows, geometries);
    rows.fill_column(columns::PRIMARY_OBJECT_TYPE, std::string(ROAD_OBJECT_TYPE));
    if (rows.has_column(ROAD_CLASS_ATTRIBUTE)) {
        rows.set_column(columns::SECONDARY_OBJECT_TYPE, rows.column(ROAD_CLASS_ATTRIBUTE));
    }
    rows.fill_column(columns::EXTRACT_METHOD, std::string(EXTRACT_CENTROID));

    m_model.table.append_rows(rows);
    add_geometry_layer(m_model, geometries);
    m_model.table = assign_road_damage(m_model, layer.name, damage);
}

// ============================================================================
// Attributes
// ============================================================================

void ExposureBuilder::setup_object_types(const ObjectTypeRequest& request) {
    require("object types", columns::OBJECT_ID, "asset locations");

    m_model.table = classify_object_types(std::move(m_model.table), request);
    if (request.drop_unclassified) {
        prune_geometries(m_model);
    }
}

void ExposureBuilder::setup_object_types_from_layer(const geo::GeometryLayer& land_use,
                                                    const SpatialJoinRequest& join,
                                                    const std::string& target) {
    require("object types", columns::OBJECT_ID, "asset locations");

    geo::GeometryLayer assets = exposure_geometry(m_model);
    m_model.table = join_into_table(std::move(m_model.table), assets, land_use, join, target);
    spdlog::info("Exposure: {} joined from land use layer '{}'", target, land_use.name);
}

void ExposureBuilder::setup_aggregation_labels(const std::vector<AggregationArea>& areas) {
    require("aggregation labels", columns::OBJECT_ID, "asset locations");
    m_model.table = assign_aggregation_labels(m_model, areas);
}

void ExposureBuilder::setup_max_damage(const DamageRequest& request) {
    require("max damage", columns::OBJECT_ID, "asset locations");

    bool needs_types = std::holds_alternative<CatalogDamage>(request.source) ||
                       std::holds_alternative<TranslationDamage>(request.source);
    if (needs_types) {
        require("max damage", columns::PRIMARY_OBJECT_TYPE, "object types");
    }
    m_model.table = assign_max_damage(m_model, request);
}

void ExposureBuilder::setup_ground_floor_height(const HeightSource& source) {
    require("ground floor height", columns::OBJECT_ID, "asset locations");
    m_model.table = assign_height_attribute(m_model, columns::GROUND_FLHT, source);
}

void ExposureBuilder::setup_ground_elevation(const HeightSource& source) {
    require("ground elevation", columns::OBJECT_ID, "asset locations");
    m_model.table = assign_height_attribute(m_model, columns::GROUND_ELEVTN, source);
}

void ExposureBuilder::setup_vulnerability(const LinkingTable& linking,
                                          const std::vector<std::string>& damage_types) {
    require("vulnerability", columns::PRIMARY_OBJECT_TYPE, "object types");
    require_damage_columns("vulnerability", columns::MAX_DAMAGE_PREFIX, damage_types, "max damage");
    require("vulnerability", columns::GROUND_FLHT, "ground floor height");

    m_model.table = link_vulnerability(std::move(m_model.table), linking, damage_types);
}

// ============================================================================
// Measures
// ============================================================================

void ExposureBuilder::floodproof(const Selection& selection, double floodproof_to,
                                 const std::vector<std::string>& damage_types) {
    require_damage_columns("floodproof", columns::FN_DAMAGE_PREFIX, damage_types, "vulnerability");

    auto ids = select_object_ids(m_model, selection);
    exposure::floodproof(m_model, m_curves, ids, floodproof_to, damage_types);
}

void ExposureBuilder::raise_ground_floor(const Selection& selection, RaiseRequest request) {
    require("raise ground floor", columns::GROUND_FLHT, "ground floor height");
    require("raise ground floor", columns::GROUND_ELEVTN, "ground elevation");

    request.object_ids = select_object_ids(m_model, selection);
    m_model.table = raise_ground_floor_height(m_model, request);
}

void ExposureBuilder::update_max_damage(const AttributeTable& updates) {
    require("max damage update", columns::OBJECT_ID, "asset locations");
    for (const auto& name : updates.column_names()) {
        if (name.rfind(columns::MAX_DAMAGE_PREFIX, 0) == 0) {
            require("max damage update", name, "max damage");
        }
    }
    m_model.table = exposure::update_max_damage(m_model.table, updates);
}

void ExposureBuilder::add_composite_growth(const CompositeGrowthSpec& spec) {
    require_damage_columns("composite growth", columns::MAX_DAMAGE_PREFIX, spec.damage_types,
                           "max damage");
    require_damage_columns("composite growth", columns::FN_DAMAGE_PREFIX, spec.damage_types,
                           "vulnerability");

    exposure::add_composite_growth(m_model, m_curves, spec);
}

} // namespace tidemark::exposure
