#include "exposure/exposure.hpp"
#include "exposure/spatial_join.hpp"
#include "core/columns.hpp"
#include "core/report.hpp"
#include "geo/crs.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace tidemark::exposure {

std::unordered_map<int64_t, size_t> index_by_object_id(const AttributeTable& table) {
    const ValueColumn& ids = table.column(columns::OBJECT_ID);

    std::unordered_map<int64_t, size_t> index;
    index.reserve(ids.size());
    for (size_t row = 0; row < ids.size(); ++row) {
        if (auto id = as_integer(ids[row])) {
            index.emplace(*id, row);
        }
    }
    return index;
}

std::vector<int64_t> duplicate_object_ids(const AttributeTable& table) {
    if (!table.has_column(columns::OBJECT_ID)) return {};

    std::unordered_set<int64_t> seen;
    std::unordered_set<int64_t> reported;
    std::vector<int64_t> duplicates;
    for (const auto& value : table.column(columns::OBJECT_ID)) {
        auto id = as_integer(value);
        if (!id) continue;
        if (!seen.insert(*id).second && reported.insert(*id).second) {
            duplicates.push_back(*id);
        }
    }
    return duplicates;
}

bool check_unique_object_ids(const AttributeTable& table, const std::string& context) {
    auto duplicates = duplicate_object_ids(table);
    if (duplicates.empty()) return true;

    spdlog::warn("Exposure: {} object ids occur more than once in {} (ids: {})",
                 duplicates.size(), context, sample_ids(duplicates));
    return false;
}

int64_t max_object_id(const AttributeTable& table) {
    if (!table.has_column(columns::OBJECT_ID)) return 0;

    int64_t result = 0;
    for (const auto& value : table.column(columns::OBJECT_ID)) {
        if (auto id = as_integer(value)) {
            result = std::max(result, *id);
        }
    }
    return result;
}

geo::GeometryLayer exposure_geometry(const ExposureModel& model) {
    geo::GeometryLayer combined;
    combined.name = "exposure";
    combined.crs = model.crs;

    ValueColumn ids;
    for (const auto& layer : model.geoms) {
        layer.attributes.require_columns({columns::OBJECT_ID},
                                         "exposure geometry layer '" + layer.name + "'");
        const ValueColumn& layer_ids = layer.attributes.column(columns::OBJECT_ID);

        geo::GeometryLayer aligned = model.crs.empty() ? layer : geo::reproject(layer, model.crs);
        combined.geometries.insert(combined.geometries.end(),
                                   aligned.geometries.begin(), aligned.geometries.end());
        ids.insert(ids.end(), layer_ids.begin(), layer_ids.end());
    }

    combined.attributes = AttributeTable(combined.geometries.size());
    combined.attributes.set_column(columns::OBJECT_ID, std::move(ids));
    return combined;
}

void add_geometry_layer(ExposureModel& model, const geo::GeometryLayer& layer) {
    if (model.crs.empty()) {
        model.crs = layer.crs;
    }

    geo::GeometryLayer reference;
    reference.name = "exposure";
    reference.crs = model.crs;

    geo::GeometryLayer aligned = geo::normalize_to_single_part(geo::harmonize(reference, layer));
    model.geoms.set(std::move(aligned));
}

AttributeTable assign_aggregation_labels(const ExposureModel& model,
                                         const std::vector<AggregationArea>& areas) {
    AttributeTable table = model.table;
    if (areas.empty()) return table;

    geo::GeometryLayer assets = exposure_geometry(model);
    for (const auto& area : areas) {
        SpatialJoinRequest request;
        request.attribute = area.attribute;
        request.method = JoinMethod::Intersection;

        const std::string target = columns::aggregation_label(area.layer.name);
        table = join_into_table(std::move(table), assets, area.layer, request, target);

        size_t labelled = 0;
        for (const auto& value : table.column(target)) {
            if (!is_null(value)) ++labelled;
        }
        spdlog::info("Exposure: {} of {} assets labelled from aggregation layer '{}'",
                     labelled, table.row_count(), area.layer.name);
    }
    return table;
}

void prune_geometries(ExposureModel& model) {
    auto rows = index_by_object_id(model.table);

    for (auto& layer : model.geoms) {
        if (!layer.attributes.has_column(columns::OBJECT_ID)) continue;

        const ValueColumn& ids = layer.attributes.column(columns::OBJECT_ID);
        std::vector<size_t> keep;
        for (size_t i = 0; i < ids.size(); ++i) {
            auto id = as_integer(ids[i]);
            if (id && rows.count(*id) > 0) keep.push_back(i);
        }

        if (keep.size() != layer.size()) {
            spdlog::info("Exposure: removing {} geometries without a table row from layer '{}'",
                         layer.size() - keep.size(), layer.name);
            layer = layer.subset(keep);
        }
    }
}

std::vector<double> projected_areas(const geo::GeometryLayer& layer, UnitSystem unit) {
    geo::GeometryLayer projected = geo::to_local_projected(layer);
    double unit_in_meters = geo::linear_unit_in_meters(projected.crs);

    std::vector<double> areas;
    areas.reserve(projected.size());
    for (const auto& geometry : projected.geometries) {
        double square_meters = geo::area(geometry) * unit_in_meters * unit_in_meters;
        areas.push_back(convert_area(square_meters, UnitSystem::Meters, unit));
    }
    return areas;
}

std::vector<std::optional<double>> footprint_areas(const ExposureModel& model, UnitSystem unit) {
    std::vector<std::optional<double>> result(model.table.row_count());
    auto rows = index_by_object_id(model.table);

    for (const auto& layer : model.geoms) {
        layer.attributes.require_columns({columns::OBJECT_ID},
                                         "exposure geometry layer '" + layer.name + "'");
        const ValueColumn& ids = layer.attributes.column(columns::OBJECT_ID);
        std::vector<double> areas = projected_areas(layer, unit);

        for (size_t i = 0; i < areas.size(); ++i) {
            auto id = as_integer(ids[i]);
            if (!id) continue;
            auto it = rows.find(*id);
            if (it != rows.end()) result[it->second] = areas[i];
        }
    }
    return result;
}

} // namespace tidemark::exposure
