/**
 * @file table_source.hpp
 * @brief Tabular inputs (CSV, XLSX) and CSV outputs
 */

#pragma once

#include "core/table.hpp"
#include "core/units.hpp"
#include "exposure/roads.hpp"
#include "exposure/vulnerability.hpp"
#include <filesystem>
#include <string>

namespace tidemark::io {

/// Depth column of wide curve tables
constexpr const char* CURVE_DEPTH_COLUMN = "water depth";

/// Columns of vulnerability linking tables
constexpr const char* LINK_OBJECT_TYPE = "object_type";
constexpr const char* LINK_DAMAGE_TYPE = "damage_type";
constexpr const char* LINK_CURVE_ID = "curve_id";

/// Lane column of lane cost tables
constexpr const char* LANE_COLUMN = "lanes";

/**
 * @brief Read a table through GDAL's CSV or XLSX driver
 * @throws ProviderError if the file cannot be opened
 *
 * The CSV separator (comma, semicolon or tab) is detected by the driver and
 * numeric columns are typed automatically. Empty cells are null.
 */
[[nodiscard]] AttributeTable read_table(const std::filesystem::path& path);

/**
 * @brief Vulnerability linking rows from a table
 * @throws MissingColumnError if object_type, damage_type or curve_id is absent
 *
 * Rows with a null cell are skipped.
 */
[[nodiscard]] exposure::LinkingTable parse_linking_table(const AttributeTable& table);

/**
 * @brief Damage curves from a wide table
 * @throws MissingColumnError if the water depth column is absent
 * @throws UserInputError if a curve has decreasing depths
 *
 * Every column besides `water depth` is one curve named after the column.
 * Rows where a curve cell is empty are not part of that curve.
 */
[[nodiscard]] exposure::CurveLibrary parse_curves(const AttributeTable& table);

/**
 * @brief Road costs per unit length by lane count
 * @param cost_column Column holding the costs
 * @param length_unit Length unit of the costs
 * @throws MissingColumnError if lanes or the cost column is absent
 */
[[nodiscard]] exposure::LaneCostTable parse_lane_costs(const AttributeTable& table,
                                                       const std::string& cost_column,
                                                       UnitSystem length_unit);

/**
 * @brief Write a table as comma separated values with a header row
 * @throws ProviderError if the file cannot be written
 */
void write_csv(const std::filesystem::path& path, const AttributeTable& table);

/**
 * @brief Write curves in the wide layout read by parse_curves()
 */
void write_curves(const std::filesystem::path& path, const exposure::CurveLibrary& curves);

} // namespace tidemark::io
