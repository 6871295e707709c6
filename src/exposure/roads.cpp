#include "exposure/roads.hpp"
#include "core/columns.hpp"
#include "core/report.hpp"
#include "geo/crs.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <set>

namespace tidemark::exposure {

std::optional<double> LaneCostTable::lookup(int64_t lanes) const {
    auto it = cost_per_length.find(lanes);
    if (it == cost_per_length.end()) return std::nullopt;
    return it->second;
}

int64_t effective_lanes(const Value& lanes) {
    auto count = as_number(lanes);
    if (!count || *count <= 0.0) return 1;
    return std::max<int64_t>(1, std::llround(*count));
}

AttributeTable assign_road_damage(const ExposureModel& model,
                                  const std::string& layer_name,
                                  const RoadDamageSource& source) {
    AttributeTable table = model.table;
    const geo::GeometryLayer& roads = model.geoms.get(layer_name);
    roads.attributes.require_columns({columns::OBJECT_ID}, "road layer '" + layer_name + "'");

    // Segment lengths in the model unit, by table row
    geo::GeometryLayer projected = geo::to_local_projected(roads);
    double unit_in_meters = geo::linear_unit_in_meters(projected.crs);

    auto rows = index_by_object_id(table);
    const ValueColumn& ids = roads.attributes.column(columns::OBJECT_ID);

    table.ensure_column(columns::SEGMENT_LENGTH);
    ValueColumn& lengths = table.column(columns::SEGMENT_LENGTH);
    std::vector<size_t> road_rows;
    for (size_t i = 0; i < projected.size(); ++i) {
        auto id = as_integer(ids[i]);
        if (!id) continue;
        auto it = rows.find(*id);
        if (it == rows.end()) continue;

        double meters = geo::length(projected.geometries[i]) * unit_in_meters;
        lengths[it->second] = convert_length(meters, UnitSystem::Meters, model.unit);
        road_rows.push_back(it->second);
    }
    spdlog::info("Roads: {} segment lengths measured in {}", road_rows.size(), unit_name(model.unit));

    const std::string target = columns::max_damage(ROAD_DAMAGE_TYPE);

    if (std::holds_alternative<NoRoadDamage>(source)) {
        spdlog::info("Roads: no damage source, {} left unchanged", target);
        return table;
    }

    table.ensure_column(target);
    ValueColumn& damage = table.column(target);

    if (const auto* constant = std::get_if<ConstantRoadDamage>(&source)) {
        for (size_t row : road_rows) {
            damage[row] = constant->value;
        }
        spdlog::info("Roads: constant damage {} for {} segments", constant->value, road_rows.size());
        return table;
    }

    const auto& costs = std::get<LaneCostTable>(source);
    const ValueColumn* lanes = table.has_column(columns::LANES) ? &table.column(columns::LANES)
                                                                : nullptr;
    if (!lanes) {
        spdlog::warn("Roads: no '{}' column, every segment counts as one lane", columns::LANES);
    }

    std::set<std::string> missing;
    std::vector<size_t> unpriced;
    for (size_t row : road_rows) {
        int64_t count = lanes ? effective_lanes((*lanes)[row]) : 1;
        auto cost = costs.lookup(count);
        if (!cost) {
            missing.insert(std::to_string(count));
            unpriced.push_back(row);
            continue;
        }
        double length = convert_length(*as_number(lengths[row]), model.unit, costs.length_unit);
        damage[row] = *cost * length;
    }

    if (!unpriced.empty()) {
        spdlog::warn("Roads: {} segments have a lane count without cost ({}; ids: {})",
                     unpriced.size(), sample_values(missing),
                     sample_ids(ids_of_rows(table, unpriced)));
    }
    spdlog::info("Roads: {} damage for {} of {} segments", target,
                 road_rows.size() - unpriced.size(), road_rows.size());
    return table;
}

} // namespace tidemark::exposure
