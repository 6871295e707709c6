/**
 * @file exposure.hpp
 * @brief The exposure model: asset table plus the geometry layers it owns
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 */

#pragma once

#include "core/table.hpp"
#include "core/units.hpp"
#include "geo/layer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tidemark::exposure {

/// Extraction method values
constexpr const char* EXTRACT_CENTROID = "centroid";
constexpr const char* EXTRACT_AREA = "area";

/**
 * @brief Canonical exposure data set
 *
 * `table` holds one row per asset. Each asset geometry lives in exactly one
 * layer of `geoms`, whose attribute table carries the matching `object_id`.
 * All layers share the model CRS.
 */
struct ExposureModel {
    AttributeTable table;
    geo::GeometryLayers geoms;
    std::string crs;
    UnitSystem unit = UnitSystem::Meters;
};

/**
 * @brief Map object_id to table row
 * @throws MissingColumnError if the table has no object_id column
 *
 * Rows with a null id are skipped; for duplicated ids the first row wins.
 */
[[nodiscard]] std::unordered_map<int64_t, size_t> index_by_object_id(const AttributeTable& table);

/**
 * @brief Object ids occurring more than once, each reported once
 */
[[nodiscard]] std::vector<int64_t> duplicate_object_ids(const AttributeTable& table);

/**
 * @brief Warn about duplicated object ids (count and samples)
 * @return true if every id is unique
 */
bool check_unique_object_ids(const AttributeTable& table, const std::string& context);

/**
 * @brief Largest object_id in the table (0 for an empty table)
 */
[[nodiscard]] int64_t max_object_id(const AttributeTable& table);

/**
 * @brief All asset geometries of the model as one layer
 *
 * The result has a single `object_id` attribute and the model CRS. Layers
 * without an `object_id` attribute are rejected.
 * @throws MissingColumnError if a geometry layer lacks object_id
 */
[[nodiscard]] geo::GeometryLayer exposure_geometry(const ExposureModel& model);

/**
 * @brief Add a geometry layer of assets to the model
 *
 * The layer is harmonized onto the model CRS and multi-part polygons are
 * reduced to their largest part. A model without CRS adopts the layer's.
 */
void add_geometry_layer(ExposureModel& model, const geo::GeometryLayer& layer);

/**
 * @brief Aggregation area layer with the attribute holding its labels
 */
struct AggregationArea {
    geo::GeometryLayer layer;   // Zones; the layer name becomes the label name
    std::string attribute;      // Attribute copied into aggregation_label_<name>
};

/**
 * @brief Attach `aggregation_label_<name>` columns by intersection join
 * @return The model table with one label column per area layer
 *
 * Assets covered by no zone keep their current (usually null) label.
 */
[[nodiscard]] AttributeTable assign_aggregation_labels(const ExposureModel& model,
                                                       const std::vector<AggregationArea>& areas);

/**
 * @brief Drop geometries whose object_id no longer has a table row
 */
void prune_geometries(ExposureModel& model);

/**
 * @brief Area of every feature of a layer in a unit system
 *
 * Measured in a local projected CRS (see geo::to_local_projected()).
 * Points and lines have area 0.
 */
[[nodiscard]] std::vector<double> projected_areas(const geo::GeometryLayer& layer, UnitSystem unit);

/**
 * @brief Footprint area of every table row, aligned by object_id
 * @return One entry per row; nullopt for rows without a geometry
 */
[[nodiscard]] std::vector<std::optional<double>> footprint_areas(const ExposureModel& model,
                                                                 UnitSystem unit);

} // namespace tidemark::exposure
