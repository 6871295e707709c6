/**
 * @file ogr_util.hpp
 * @brief Conversions shared by the GDAL/OGR backed providers
 */

#pragma once

#include "core/table.hpp"
#include <string>

class OGRFeature;
class OGRSpatialReference;

namespace tidemark::io {

/**
 * @brief "AUTHORITY:CODE" of a spatial reference, WKT when it has no code
 *
 * Returns an empty string for a null reference.
 */
[[nodiscard]] std::string crs_string(const OGRSpatialReference* srs);

/**
 * @brief Field of a feature as a Value (int64, double or string; unset is null)
 */
[[nodiscard]] Value field_value(const OGRFeature& feature, int index);

} // namespace tidemark::io
