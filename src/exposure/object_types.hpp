#pragma once

#include "core/table.hpp"
#include <optional>
#include <set>
#include <string>

namespace tidemark::exposure {

/**
 * @brief How raw asset attributes become primary/secondary object types
 */
struct ObjectTypeRequest {
    /// Table column holding the raw type (e.g. an OSM "building" tag)
    std::string source_column;

    /// Optional column copied into secondary_object_type
    std::string secondary_column;

    /**
     * Optional translation from raw type to object type. Must contain
     * `source_column` and primary_object_type, and may contain
     * secondary_object_type. The first row of a duplicated key wins.
     */
    std::optional<AttributeTable> translation;

    /// Value given to assets left without a primary type (off by default)
    std::optional<std::string> unclassified_fill;

    /// Remove assets left without a primary type
    bool drop_unclassified = false;
};

/**
 * @brief Set primary_object_type and secondary_object_type
 * @throws MissingColumnError if the source column or translation columns are absent
 *
 * Unclassified assets are logged with count and sample ids. They are only
 * filled or dropped when the request asks for it.
 */
[[nodiscard]] AttributeTable classify_object_types(AttributeTable table,
                                                   const ObjectTypeRequest& request);

/**
 * @brief Distinct non-null string values of a column
 */
[[nodiscard]] std::set<std::string> distinct_values(const ValueColumn& column);

/**
 * @brief Pick the object type column that best matches a set of known types
 * @param table Exposure table
 * @param known Object types known to a linking or cost table
 * @param context Name of the caller, for the log message
 * @return primary_object_type or secondary_object_type
 * @throws MissingColumnError if neither column exists
 *
 * The column whose distinct values overlap most with `known` wins; ties
 * favour primary_object_type.
 */
[[nodiscard]] std::string choose_type_column(const AttributeTable& table,
                                             const std::set<std::string>& known,
                                             const std::string& context);

} // namespace tidemark::exposure
