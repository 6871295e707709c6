#pragma once

#include "exposure/exposure.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tidemark::exposure {

/**
 * @brief How the assets affected by a measure are chosen
 */
enum class SelectionType {
    All,                ///< Every asset (after type filters)
    Ids,                ///< An explicit list of object ids
    AggregationArea,    ///< Assets carrying a given aggregation label
    Polygon             ///< Assets inside the polygons of a layer
};

[[nodiscard]] std::optional<SelectionType> parse_selection_type(const std::string& name);

/**
 * @brief Asset selection for floodproofing, raising and similar measures
 */
struct Selection {
    SelectionType type = SelectionType::All;
    std::vector<std::string> object_types;          ///< Only these primary types (empty = any)
    std::vector<std::string> excluded_types;        ///< Never these primary types
    std::vector<int64_t> ids;                       ///< Ids type
    std::string aggregation;                        ///< AggregationArea: label name
    std::string aggregation_area;                   ///< AggregationArea: label value
    std::optional<geo::GeometryLayer> polygons;     ///< Polygon type
};

/**
 * @brief Object ids of the selected assets, in table order
 * @throws MissingColumnError if a filter needs a column the table lacks
 * @throws UserInputError if a Polygon selection has no polygon layer
 *
 * Ids selections are intersected with the table; ids not present are
 * logged and skipped.
 */
[[nodiscard]] std::vector<int64_t> select_object_ids(const ExposureModel& model,
                                                     const Selection& selection);

/**
 * @brief Table rows of a set of object ids, in table order
 */
[[nodiscard]] std::vector<size_t> rows_of_ids(const AttributeTable& table,
                                              const std::vector<int64_t>& ids);

} // namespace tidemark::exposure
