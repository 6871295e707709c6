/**
 * @file exposure_builder.hpp
 * @brief Ordered exposure preparation pipeline
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * ExposureBuilder owns an ExposureModel and its curve library and runs the
 * preparation steps on them. Every step checks the columns produced by the
 * steps it depends on and throws PipelineOrderError when one is missing:
 *
 * @code
 * ExposureBuilder builder(UnitSystem::Feet);
 * builder.setup_asset_locations(buildings);
 * builder.setup_object_types(types);
 * builder.setup_max_damage(damage);
 * builder.setup_ground_floor_height(ConstantHeight{1.0});
 * builder.setup_ground_elevation(RasterHeight{dem});
 * builder.setup_vulnerability(linking, {"structure", "content"});
 * @endcode
 */

#pragma once

#include "exposure/damage_values.hpp"
#include "exposure/exposure.hpp"
#include "exposure/ground_floor.hpp"
#include "exposure/growth.hpp"
#include "exposure/object_types.hpp"
#include "exposure/roads.hpp"
#include "exposure/selection.hpp"
#include "exposure/spatial_join.hpp"
#include "exposure/vulnerability.hpp"
#include <string>
#include <vector>

namespace tidemark::exposure {

/// Object type given to road segments
constexpr const char* ROAD_OBJECT_TYPE = "road";

/// OSM tag copied into the secondary type of roads
constexpr const char* ROAD_CLASS_ATTRIBUTE = "highway";

class ExposureBuilder {
public:
    explicit ExposureBuilder(UnitSystem unit = UnitSystem::Meters);

    /// @name Geometry setup
    /// @{

    /**
     * @brief Start the exposure from a layer of asset locations
     * @param layer Buildings as points or polygons; its attributes become table columns
     * @param extract_method Value of extract_method for these assets
     * @throws CrsMissingError if the layer has no CRS
     *
     * Existing object ids are kept when they are present and unique;
     * otherwise the assets are numbered 1..n.
     */
    void setup_asset_locations(const geo::GeometryLayer& layer,
                               const std::string& extract_method = EXTRACT_CENTROID);

    /**
     * @brief Add road segments as assets, numbered after the current maximum id
     *
     * Roads get primary type "road" and the `highway` class as secondary type.
     */
    void setup_roads(const geo::GeometryLayer& layer, const RoadDamageSource& damage);
    /// @}

    /// @name Attributes
    /// @{
    void setup_object_types(const ObjectTypeRequest& request);

    /**
     * @brief Object types from a land use layer by spatial join
     * @param target Column receiving the joined value (primary or secondary type)
     */
    void setup_object_types_from_layer(const geo::GeometryLayer& land_use,
                                       const SpatialJoinRequest& join,
                                       const std::string& target);

    void setup_aggregation_labels(const std::vector<AggregationArea>& areas);
    void setup_max_damage(const DamageRequest& request);
    void setup_ground_floor_height(const HeightSource& source);
    void setup_ground_elevation(const HeightSource& source);
    void setup_vulnerability(const LinkingTable& linking,
                             const std::vector<std::string>& damage_types);
    /// @}

    /// @name Measures
    /// @{
    void floodproof(const Selection& selection, double floodproof_to,
                    const std::vector<std::string>& damage_types);

    /**
     * @brief Raise floors of the selected assets
     *
     * The ids of `request` are replaced by the selection.
     */
    void raise_ground_floor(const Selection& selection, RaiseRequest request);

    /**
     * @brief Overwrite max damage values from a table keyed by object_id
     *
     * Every max_damage_<type> column of `updates` must already be resolved.
     */
    void update_max_damage(const AttributeTable& updates);

    void add_composite_growth(const CompositeGrowthSpec& spec);
    /// @}

    /// @name Accessors
    /// @{
    [[nodiscard]] const ExposureModel& model() const { return m_model; }
    [[nodiscard]] ExposureModel& model() { return m_model; }
    [[nodiscard]] const CurveLibrary& curves() const { return m_curves; }
    [[nodiscard]] CurveLibrary& curves() { return m_curves; }
    void set_curves(CurveLibrary curves) { m_curves = std::move(curves); }
    /// @}

private:
    /**
     * @brief Throw PipelineOrderError unless `column` exists
     */
    void require(const std::string& step, const std::string& column,
                 const std::string& dependency) const;

    void require_damage_columns(const std::string& step, const std::string& prefix,
                                const std::vector<std::string>& damage_types,
                                const std::string& dependency) const;

    ExposureModel m_model;
    CurveLibrary m_curves;
};

} // namespace tidemark::exposure
