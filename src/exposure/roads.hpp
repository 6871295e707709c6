/**
 * @file roads.hpp
 * @brief Segment length and lane-based damage of road assets
 */

#pragma once

#include "core/table.hpp"
#include "core/units.hpp"
#include "exposure/exposure.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace tidemark::exposure {

/// Damage type filled for roads
constexpr const char* ROAD_DAMAGE_TYPE = "structure";

/**
 * @brief Road damage per unit of length, by lane count
 */
struct LaneCostTable {
    std::map<int64_t, double> cost_per_length;
    UnitSystem length_unit = UnitSystem::Feet;     ///< Costs are per m or per ft

    [[nodiscard]] std::optional<double> lookup(int64_t lanes) const;
};

struct NoRoadDamage {};

/**
 * @brief Same damage for every road segment
 */
struct ConstantRoadDamage {
    double value = 0.0;
};

using RoadDamageSource = std::variant<NoRoadDamage, ConstantRoadDamage, LaneCostTable>;

/**
 * @brief Lane count used for cost lookups
 *
 * Missing, zero and non-numeric lane counts read as a single lane.
 */
[[nodiscard]] int64_t effective_lanes(const Value& lanes);

/**
 * @brief Set segment_length and max_damage_structure for a road layer
 * @param model Exposure holding the road geometries
 * @param layer_name Geometry layer with the roads
 * @param source Damage source for the segments
 * @return The model table with the road columns set
 * @throws UserInputError if the layer does not exist
 *
 * Lengths are measured in a local projected CRS and expressed in the
 * model unit. Lane counts absent from a cost table are logged and leave
 * the damage null.
 */
[[nodiscard]] AttributeTable assign_road_damage(const ExposureModel& model,
                                                const std::string& layer_name,
                                                const RoadDamageSource& source);

} // namespace tidemark::exposure
