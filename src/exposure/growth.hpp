/**
 * @file growth.hpp
 * @brief Synthetic development areas carrying a share of existing exposure
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 */

#pragma once

#include "exposure/exposure.hpp"
#include "exposure/ground_floor.hpp"
#include "exposure/vulnerability.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tidemark::exposure {

/// Object type of generated development areas
constexpr const char* NEW_DEVELOPMENT_TYPE = "New development area";

/// Id prefix of blended curves, followed by the damage type
constexpr const char* COMPOSITE_CURVE_PREFIX = "composite_";

/// Per polygon height attribute looked up by default
constexpr const char* DEFAULT_HEIGHT_ATTRIBUTE = "height";

struct CompositeGrowthSpec {
    double percent_growth = 0.0;                    ///< Percent of current total damage
    std::vector<std::string> damage_types;
    HeightReference elevation_reference = HeightReference::Datum;   ///< Datum or Geom
    geo::GeometryLayer areas;                       ///< New development polygons
    double ground_floor_height = 0.0;               ///< Used where a polygon has no height
    std::string height_attribute = DEFAULT_HEIGHT_ATTRIBUTE;

    std::optional<geo::GeometryLayer> reference_layer;  ///< Geom reference
    std::string reference_attribute;

    std::optional<RasterHeight> ground_elevation;   ///< DEM for ground_elevtn, 0 when absent

    std::vector<AggregationArea> aggregation;       ///< Labels inherited by the new assets
};

/**
 * @brief Add one asset per development polygon
 * @param model Exposure receiving the new rows and geometry layer
 * @param curves Library receiving one composite curve per damage type
 * @param spec Growth parameters
 * @throws MissingColumnError if a max_damage column is absent
 * @throws UserInputError if the polygons have no area or the geom
 *         reference layer is missing
 *
 * The new total per damage type is percent_growth / 100 times the sum of
 * the existing max_damage values and is split over the polygons by area.
 *
 * The floor of a new asset sits `height` above datum, or above the
 * reference level for the geom reference. ground_flht is that level minus
 * the ground elevation sampled from `ground_elevation`, never below 0.
 */
void add_composite_growth(ExposureModel& model, CurveLibrary& curves,
                          const CompositeGrowthSpec& spec);

} // namespace tidemark::exposure
