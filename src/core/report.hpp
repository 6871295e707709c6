#pragma once

#include "core/table.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tidemark {

/// Number of identifiers quoted in data quality warnings
constexpr size_t SAMPLE_ID_COUNT = 5;

/**
 * @brief Format the first few ids of a list for a log message
 * @return e.g. "3, 7, 12 (+4 more)"
 */
[[nodiscard]] std::string sample_ids(const std::vector<int64_t>& ids,
                                     size_t count = SAMPLE_ID_COUNT);

/**
 * @brief Format a set of distinct values for a log message
 */
[[nodiscard]] std::string sample_values(const std::set<std::string>& values,
                                        size_t count = SAMPLE_ID_COUNT);

/**
 * @brief Object ids of the given table rows (rows without an id are skipped)
 */
[[nodiscard]] std::vector<int64_t> ids_of_rows(const AttributeTable& table,
                                               const std::vector<size_t>& rows);

} // namespace tidemark
