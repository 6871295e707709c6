#include "exposure/growth.hpp"
#include "exposure/spatial_join.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <numeric>

namespace tidemark::exposure {

namespace {

/**
 * @brief Composite curve for one damage type, or nullopt when no asset has a curve
 */
std::optional<std::string> composite_curve(const AttributeTable& table,
                                           CurveLibrary& curves,
                                           const std::string& damage_type) {
    const std::string column = columns::fn_damage(damage_type);
    if (!table.has_column(column)) return std::nullopt;

    std::map<std::string, size_t> counts;
    for (const auto& value : table.column(column)) {
        if (auto curve_id = as_string(value)) ++counts[*curve_id];
    }
    if (counts.empty()) return std::nullopt;

    std::string id = COMPOSITE_CURVE_PREFIX + damage_type;
    curves.add(blend_curves(curves, counts, id));
    spdlog::info("Growth: curve '{}' blended from {} curves", id, counts.size());
    return id;
}

/**
 * @brief Layer name not yet used by the model
 */
std::string free_layer_name(const ExposureModel& model, const std::string& base, int64_t first_id) {
    if (!model.geoms.contains(base)) return base;
    return base + "_" + std::to_string(first_id);
}

} // anonymous namespace

void add_composite_growth(ExposureModel& model, CurveLibrary& curves,
                          const CompositeGrowthSpec& spec) {
    const geo::GeometryLayer& areas = spec.areas;
    spdlog::info("Growth: adding {} development areas holding {}% of current exposure",
                 areas.size(), spec.percent_growth);

    std::vector<std::string> damage_columns;
    for (const auto& damage_type : spec.damage_types) {
        damage_columns.push_back(columns::max_damage(damage_type));
    }
    model.table.require_columns(damage_columns, "composite growth");

    double fraction = spec.percent_growth / 100.0;
    std::map<std::string, double> new_damage;
    for (const auto& damage_type : spec.damage_types) {
        double total = 0.0;
        for (const auto& value : model.table.column(columns::max_damage(damage_type))) {
            total += as_number(value).value_or(0.0);
        }
        new_damage[damage_type] = fraction * total;
    }

    std::vector<double> area = projected_areas(areas, model.unit);
    double total_area = std::accumulate(area.begin(), area.end(), 0.0);
    if (areas.empty() || total_area <= 0.0) {
        throw UserInputError("Growth: development layer '" + areas.name + "' has no area");
    }

    // Rows of the new assets
    const size_t count = areas.size();
    const int64_t first_id = max_object_id(model.table) + 1;

    AttributeTable rows(count);
    ValueColumn ids(count);
    for (size_t i = 0; i < count; ++i) {
        ids[i] = first_id + static_cast<int64_t>(i);
    }
    rows.set_column(columns::OBJECT_ID, ids);
    rows.fill_column(columns::PRIMARY_OBJECT_TYPE, std::string(NEW_DEVELOPMENT_TYPE));
    rows.fill_column(columns::SECONDARY_OBJECT_TYPE, std::string(NEW_DEVELOPMENT_TYPE));
    rows.fill_column(columns::EXTRACT_METHOD, std::string(EXTRACT_AREA));

    for (const auto& damage_type : spec.damage_types) {
        ValueColumn damage(count);
        for (size_t i = 0; i < count; ++i) {
            damage[i] = new_damage[damage_type] * area[i] / total_area;
        }
        rows.set_column(columns::max_damage(damage_type), std::move(damage));

        auto curve_id = composite_curve(model.table, curves, damage_type);
        if (curve_id) {
            rows.fill_column(columns::fn_damage(damage_type), *curve_id);
        } else {
            spdlog::warn("Growth: no '{}' curves in use, new areas get no curve", damage_type);
            rows.ensure_column(columns::fn_damage(damage_type));
        }
    }

    // Height per polygon, falling back to the uniform value
    std::vector<double> heights(count, spec.ground_floor_height);
    if (areas.attributes.has_column(spec.height_attribute)) {
        const ValueColumn& attribute = areas.attributes.column(spec.height_attribute);
        for (size_t i = 0; i < count; ++i) {
            if (auto h = as_number(attribute[i])) heights[i] = *h;
        }
    }

    // Ground elevation per polygon, 0 without a DEM
    std::vector<double> elevation(count, 0.0);
    if (spec.ground_elevation) {
        auto sampled = sample_raster(areas, *spec.ground_elevation, model.unit);
        size_t missing = 0;
        for (size_t i = 0; i < count; ++i) {
            if (sampled[i]) {
                elevation[i] = *sampled[i];
            } else {
                ++missing;
            }
        }
        if (missing > 0) {
            spdlog::warn("Growth: {} development areas have no DEM value, ground elevation set to 0",
                         missing);
        }
    } else {
        spdlog::info("Growth: no DEM given, ground elevation of new areas set to 0");
    }
    rows.set_column(columns::GROUND_ELEVTN, ValueColumn(elevation.begin(), elevation.end()));

    ValueColumn floor(count, Value(0.0));
    if (spec.elevation_reference == HeightReference::Geom) {
        if (!spec.reference_layer) {
            throw UserInputError("Growth: 'geom' elevation reference needs a reference layer");
        }
        ValueColumn levels = join_max_intersecting(areas, *spec.reference_layer,
                                                   spec.reference_attribute);
        std::vector<size_t> without_reference;
        for (size_t i = 0; i < count; ++i) {
            auto level = as_number(levels[i]);
            if (!level) {
                without_reference.push_back(i);
                continue;
            }
            floor[i] = std::max(0.0, *level + heights[i] - elevation[i]);
        }
        if (!without_reference.empty()) {
            spdlog::warn("Growth: {} development areas have no reference level (ids: {})",
                         without_reference.size(),
                         sample_ids(ids_of_rows(rows, without_reference)));
        }
    } else {
        for (size_t i = 0; i < count; ++i) {
            floor[i] = std::max(0.0, heights[i] - elevation[i]);
        }
    }
    rows.set_column(columns::GROUND_FLHT, std::move(floor));

    // Geometry layer of the new assets
    geo::GeometryLayer layer = areas;
    layer.name = free_layer_name(model, areas.name.empty() ? "new_development_area" : areas.name,
                                 first_id);
    layer.attributes = AttributeTable(count);
    layer.attributes.set_column(columns::OBJECT_ID, ids);

    ExposureModel added;
    added.table = std::move(rows);
    added.crs = model.crs;
    added.unit = model.unit;
    add_geometry_layer(added, layer);
    added.table = assign_aggregation_labels(added, spec.aggregation);

    model.table.append_rows(added.table);
    for (const auto& geometries : added.geoms) {
        model.geoms.set(geometries);
    }
    if (model.crs.empty()) model.crs = added.crs;

    spdlog::info("Growth: {} assets added (ids {} to {}) in layer '{}'", count, first_id,
                 first_id + static_cast<int64_t>(count) - 1, layer.name);
}

} // namespace tidemark::exposure
