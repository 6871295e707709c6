/**
 * @file ground_floor.hpp
 * @brief Ground floor height and ground elevation of assets
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Fills `ground_flht` or `ground_elevtn` from a default, a constant, a
 * vector layer joined spatially, or a DEM raster, and raises floors to a
 * target level for adaptation measures.
 */

#pragma once

#include "core/table.hpp"
#include "exposure/exposure.hpp"
#include "exposure/spatial_join.hpp"
#include "geo/raster.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tidemark::exposure {

// ============================================================================
// Height sources
// ============================================================================

/**
 * @brief No source given; assets without a value get 0
 */
struct DefaultHeight {};

struct ConstantHeight {
    double value = 0.0;
};

/**
 * @brief Attribute of a vector layer, applied by spatial join
 */
struct LayerHeight {
    geo::GeometryLayer layer;
    SpatialJoinRequest join;
};

/**
 * @brief Zonal statistic of a DEM over each footprint
 */
struct RasterHeight {
    geo::Raster raster;
    geo::ZonalStatistic statistic = geo::ZonalStatistic::Mean;
};

using HeightSource = std::variant<DefaultHeight, ConstantHeight, LayerHeight, RasterHeight>;

/**
 * @brief Resolve ground_flht or ground_elevtn for every asset
 * @param model Exposure with geometries
 * @param column Target column (columns::GROUND_FLHT or columns::GROUND_ELEVTN)
 * @param source Where the values come from
 * @return The model table with `column` set
 * @throws CrsMissingError, JoinMethodUnsupportedError from layer joins
 * @throws MissingColumnError if the layer lacks the joined attribute
 *
 * For rasters, assets the zonal statistic cannot resolve fall back to the
 * cell under their centroid, then to the value of the closest asset that
 * has one. DEM values are converted to the model unit when the raster
 * declares its unit.
 */
[[nodiscard]] AttributeTable assign_height_attribute(const ExposureModel& model,
                                                     const std::string& column,
                                                     const HeightSource& source);

/**
 * @brief Sample a DEM under a layer of footprints
 * @return One value per feature, with the fallbacks of assign_height_attribute()
 */
[[nodiscard]] std::vector<std::optional<double>> sample_raster(const geo::GeometryLayer& features,
                                                               const RasterHeight& source,
                                                               UnitSystem unit);

// ============================================================================
// Raise to level
// ============================================================================

enum class HeightReference {
    Datum,      ///< Target is raise_by above the vertical datum
    Geom,       ///< Target is a reference layer attribute plus raise_by
    Table       ///< Target is a per object_id table value plus raise_by
};

[[nodiscard]] std::optional<HeightReference> parse_height_reference(const std::string& name);

/**
 * @brief Raise-to-level request
 */
struct RaiseRequest {
    double raise_by = 0.0;
    HeightReference reference = HeightReference::Datum;
    std::vector<int64_t> object_ids;                    ///< Assets considered

    std::optional<geo::GeometryLayer> reference_layer;  ///< Geom reference
    std::string reference_attribute;                    ///< Geom reference attribute

    std::optional<AttributeTable> reference_table;      ///< Table reference, keyed by object_id
    std::string reference_column;                       ///< Table reference value column
};

/**
 * @brief Raise ground floors of selected assets to a target level
 * @return The model table with ground_flht updated
 * @throws MissingColumnError if ground_flht, ground_elevtn or a reference
 *         column is absent
 * @throws UserInputError if the reference layer or table is missing
 *
 * Only assets whose `ground_flht + ground_elevtn` lies below the target are
 * raised, by the minimal amount. Floors are never lowered. Assets without
 * a reference value are left untouched and counted in the log.
 */
[[nodiscard]] AttributeTable raise_ground_floor_height(const ExposureModel& model,
                                                       const RaiseRequest& request);

} // namespace tidemark::exposure
