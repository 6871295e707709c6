#pragma once

#include "core/table.hpp"
#include <string>

namespace tidemark::exposure {

/**
 * @brief Fold a freshly joined column into a target column
 * @param table Table holding both columns
 * @param target Column to refine (created null-filled when missing)
 * @param source Helper column with the new values (dropped afterwards)
 * @return The table with `target` updated and `source` removed
 * @throws MissingColumnError if `source` does not exist
 *
 * Every row where `source` is non-null overwrites `target`; all other rows
 * keep their current value. Applying the same source twice gives the same
 * result as applying it once.
 */
[[nodiscard]] AttributeTable merge_attribute(AttributeTable table,
                                             const std::string& target,
                                             const std::string& source);

} // namespace tidemark::exposure
