#include "exposure/ground_floor.hpp"
#include "exposure/merge.hpp"
#include "exposure/selection.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include "geo/crs.hpp"
#include "geo/spatial_index.hpp"
#include <glm/glm.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace tidemark::exposure {

namespace {

/**
 * @brief Bring features into the raster CRS when both declare one
 */
geo::GeometryLayer align_to_raster(const geo::GeometryLayer& features, const geo::Raster& raster) {
    if (raster.crs.empty() || !features.has_crs()) {
        spdlog::debug("Ground floor: raster or layer '{}' has no CRS, sampling as is",
                      features.name);
        return features;
    }

    geo::GeometryLayer grid;
    grid.name = "dem";
    grid.crs = raster.crs;
    return geo::harmonize(grid, features);
}

/**
 * @brief Nearest indexed point to an origin, ties to the lowest index
 *
 * The search window starts at one cell and grows until a point inside the
 * search radius is found.
 */
std::optional<size_t> nearest_indexed(const geo::SpatialIndex& index,
                                      const std::vector<glm::dvec2>& points,
                                      const glm::dvec2& origin) {
    if (index.empty() || !std::isfinite(origin.x) || !std::isfinite(origin.y)) {
        return std::nullopt;
    }

    double radius = index.cell_size();
    while (true) {
        double best_distance = std::numeric_limits<double>::infinity();
        std::optional<size_t> best;
        for (size_t candidate : index.query_radius(origin, radius)) {
            double d = glm::distance(points[candidate], origin);
            if (d < best_distance) {
                best_distance = d;
                best = candidate;
            }
        }

        // A hit beyond the radius may still have a closer point in an unsearched cell
        if (best && best_distance <= radius) return best;
        radius = best ? best_distance : radius * 2.0;
    }
}

/**
 * @brief Dispatches a HeightSource to its resolution routine
 */
struct HeightResolver {
    const ExposureModel& model;
    const std::string& column;

    AttributeTable operator()(const DefaultHeight&) const {
        AttributeTable table = model.table;
        table.ensure_column(column);

        size_t filled = 0;
        for (auto& value : table.column(column)) {
            if (!is_null(value)) continue;
            value = 0.0;
            ++filled;
        }
        if (filled > 0) {
            spdlog::warn("Ground floor: no source for {}, {} assets without a value default to 0",
                         column, filled);
        }
        return table;
    }

    AttributeTable operator()(const ConstantHeight& source) const {
        AttributeTable table = model.table;
        spdlog::info("Ground floor: constant {} of {} {}", column, source.value,
                     unit_name(model.unit));
        table.fill_column(column, source.value);
        return table;
    }

    AttributeTable operator()(const LayerHeight& source) const {
        geo::GeometryLayer assets = exposure_geometry(model);
        spdlog::info("Ground floor: {} from attribute '{}' of layer '{}' ({} join)", column,
                     source.join.attribute, source.layer.name,
                     join_method_name(source.join.method));
        return join_into_table(model.table, assets, source.layer, source.join, column);
    }

    AttributeTable operator()(const RasterHeight& source) const {
        AttributeTable table = model.table;
        geo::GeometryLayer assets = exposure_geometry(model);

        auto sampled = sample_raster(assets, source, model.unit);
        ValueColumn values(assets.size());
        for (size_t i = 0; i < sampled.size(); ++i) {
            if (sampled[i]) values[i] = *sampled[i];
        }

        const std::string helper = "__sampled_" + column;
        table.set_column(helper, align_to_table(table, assets, values));
        return merge_attribute(std::move(table), column, helper);
    }
};

} // anonymous namespace

// ============================================================================
// Height sources
// ============================================================================

std::vector<std::optional<double>> sample_raster(const geo::GeometryLayer& features,
                                                 const RasterHeight& source,
                                                 UnitSystem unit) {
    const geo::Raster& raster = source.raster;
    geo::GeometryLayer aligned = align_to_raster(features, raster);

    std::vector<std::optional<double>> values(aligned.size());
    std::vector<size_t> centroid_rows;

    for (size_t i = 0; i < aligned.size(); ++i) {
        const geo::Geometry& geometry = aligned.geometries[i];
        values[i] = raster.zonal(geometry, source.statistic);
        if (values[i]) continue;

        // Footprint smaller than a cell or partly outside the grid
        values[i] = raster.sample_nearest(geo::centroid(geometry));
        if (values[i]) centroid_rows.push_back(i);
    }

    std::vector<glm::dvec2> points;
    points.reserve(aligned.size());
    for (const auto& geometry : aligned.geometries) {
        points.push_back(geo::representative_point(geometry));
    }

    // Index the resolved features only; unresolved rows keep an empty envelope
    std::vector<geo::Envelope> envelopes(values.size());
    std::vector<size_t> unresolved;
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i]) {
            envelopes[i].expand(points[i]);
        } else {
            unresolved.push_back(i);
        }
    }

    size_t copied = 0;
    if (!unresolved.empty() && unresolved.size() < values.size()) {
        geo::SpatialIndex index;
        index.build(envelopes);

        for (size_t i : unresolved) {
            auto nearest = nearest_indexed(index, points, points[i]);
            if (nearest) {
                values[i] = values[*nearest];
                ++copied;
            }
        }
    }

    if (!centroid_rows.empty()) {
        spdlog::info("Ground floor: {} features sampled at their centroid (no {} over the footprint)",
                     centroid_rows.size(), geo::zonal_statistic_name(source.statistic));
    }
    if (copied > 0) {
        spdlog::warn("Ground floor: {} features outside the DEM copied the value of the nearest feature",
                     copied);
    }
    if (copied < unresolved.size()) {
        spdlog::warn("Ground floor: {} features have no DEM value", unresolved.size() - copied);
    }

    if (raster.unit && *raster.unit != unit) {
        for (auto& value : values) {
            if (value) value = convert_length(*value, *raster.unit, unit);
        }
        spdlog::info("Ground floor: DEM values converted from {} to {}",
                     unit_name(*raster.unit), unit_name(unit));
    }
    return values;
}

AttributeTable assign_height_attribute(const ExposureModel& model,
                                       const std::string& column,
                                       const HeightSource& source) {
    return std::visit(HeightResolver{model, column}, source);
}

// ============================================================================
// Raise to level
// ============================================================================

std::optional<HeightReference> parse_height_reference(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "datum") return HeightReference::Datum;
    if (lower == "geom") return HeightReference::Geom;
    if (lower == "table") return HeightReference::Table;
    return std::nullopt;
}

AttributeTable raise_ground_floor_height(const ExposureModel& model, const RaiseRequest& request) {
    AttributeTable table = model.table;
    table.require_columns({columns::OBJECT_ID, columns::GROUND_FLHT, columns::GROUND_ELEVTN},
                          "raise ground floor height");

    // Reference level per table row, before raise_by
    ValueColumn reference(table.row_count());
    switch (request.reference) {
        case HeightReference::Datum:
            std::fill(reference.begin(), reference.end(), Value(0.0));
            break;

        case HeightReference::Geom: {
            if (!request.reference_layer) {
                throw UserInputError("Raise ground floor height: 'geom' reference needs a layer");
            }
            geo::GeometryLayer assets = exposure_geometry(model);
            ValueColumn joined = join_max_intersecting(assets, *request.reference_layer,
                                                       request.reference_attribute);
            reference = align_to_table(table, assets, joined);
            break;
        }

        case HeightReference::Table: {
            if (!request.reference_table) {
                throw UserInputError("Raise ground floor height: 'table' reference needs a table");
            }
            const AttributeTable& levels = *request.reference_table;
            levels.require_columns({columns::OBJECT_ID, request.reference_column},
                                   "raise ground floor height reference table");

            auto rows = index_by_object_id(table);
            const ValueColumn& ids = levels.column(columns::OBJECT_ID);
            const ValueColumn& values = levels.column(request.reference_column);
            for (size_t i = 0; i < levels.row_count(); ++i) {
                auto id = as_integer(ids[i]);
                if (!id) continue;
                auto it = rows.find(*id);
                if (it != rows.end() && is_null(reference[it->second])) {
                    reference[it->second] = values[i];
                }
            }
            break;
        }
    }

    ValueColumn& floor = table.column(columns::GROUND_FLHT);
    const ValueColumn& elevation = table.column(columns::GROUND_ELEVTN);

    std::vector<size_t> raised;
    std::vector<size_t> without_reference;
    for (size_t row : rows_of_ids(table, request.object_ids)) {
        auto level = as_number(reference[row]);
        if (!level) {
            without_reference.push_back(row);
            continue;
        }

        double target = *level + request.raise_by;
        double ground = as_number(elevation[row]).value_or(0.0);
        auto current = as_number(floor[row]);

        if (!current || *current + ground < target) {
            floor[row] = target - ground;
            raised.push_back(row);
        }
    }

    if (!without_reference.empty()) {
        spdlog::warn("Raise ground floor height: {} assets have no reference level (ids: {})",
                     without_reference.size(),
                     sample_ids(ids_of_rows(table, without_reference)));
    }
    spdlog::info("Raise ground floor height: {} of {} selected assets raised by up to {} {}",
                 raised.size(), request.object_ids.size(), request.raise_by,
                 unit_name(model.unit));
    return table;
}

} // namespace tidemark::exposure
