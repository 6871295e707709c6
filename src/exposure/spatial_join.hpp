/**
 * @file spatial_join.hpp
 * @brief Attach reference layer attributes to primary features by location
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Every join returns exactly one value per primary feature, so the
 * cardinality of the primary set is preserved and no row is ever
 * duplicated.
 */

#pragma once

#include "core/table.hpp"
#include "geo/layer.hpp"
#include <optional>
#include <string>

namespace tidemark::exposure {

/// Default search radius of nearest joins, in map units
constexpr double DEFAULT_MAX_DISTANCE = 10.0;

/**
 * @brief Join strategy
 */
enum class JoinMethod {
    Nearest,        ///< Closest representative point within max_distance
    Intersection    ///< Largest overlap (polygons) or containing polygon (points)
};

[[nodiscard]] std::optional<JoinMethod> parse_join_method(const std::string& name);
[[nodiscard]] const char* join_method_name(JoinMethod method);

/**
 * @brief One attribute to copy from a reference layer
 */
struct SpatialJoinRequest {
    std::string attribute;                          ///< Reference attribute to copy
    JoinMethod method = JoinMethod::Nearest;
    double max_distance = DEFAULT_MAX_DISTANCE;     ///< Nearest only, inclusive
};

/**
 * @brief Join one reference attribute onto every primary feature
 * @param primary Features receiving the attribute
 * @param reference Features providing it (harmonized to the primary CRS)
 * @param request Attribute and strategy
 * @return One value per primary feature, null where nothing matched
 * @throws CrsMissingError if either layer has no CRS
 * @throws MissingColumnError if the reference lacks the attribute
 * @throws JoinMethodUnsupportedError for an unsupported geometry combination
 *
 * Nearest: both sides are reduced to representative points; the closest
 * reference within `max_distance` wins, ties go to the lowest reference
 * row. Intersection: for polygons the reference with the largest positive
 * overlap area wins, ties go to the lowest reference row; for points the
 * first containing polygon wins.
 */
[[nodiscard]] ValueColumn join_attribute(const geo::GeometryLayer& primary,
                                         const geo::GeometryLayer& reference,
                                         const SpatialJoinRequest& request);

/**
 * @brief Maximum of a numeric reference attribute over intersecting features
 *
 * A polygon intersects a reference polygon when the overlap area is
 * positive; a point when it lies inside. Non-numeric reference values are
 * ignored.
 */
[[nodiscard]] ValueColumn join_max_intersecting(const geo::GeometryLayer& primary,
                                                const geo::GeometryLayer& reference,
                                                const std::string& attribute);

/**
 * @brief Join a reference attribute and fold it into a table column
 * @param table Table to update (aligned to `primary` by object_id)
 * @param primary Features carrying an object_id attribute
 * @param reference Features providing the value
 * @param request Attribute and strategy
 * @param target Column receiving the values (see merge_attribute())
 * @return The updated table, with the same rows as `table`
 */
[[nodiscard]] AttributeTable join_into_table(AttributeTable table,
                                             const geo::GeometryLayer& primary,
                                             const geo::GeometryLayer& reference,
                                             const SpatialJoinRequest& request,
                                             const std::string& target);

/**
 * @brief Spread per-feature values onto table rows by object_id
 *
 * Rows whose object_id has no feature get null.
 * @throws MissingColumnError if either side lacks object_id
 */
[[nodiscard]] ValueColumn align_to_table(const AttributeTable& table,
                                         const geo::GeometryLayer& features,
                                         const ValueColumn& values);

} // namespace tidemark::exposure
