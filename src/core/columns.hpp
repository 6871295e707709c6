/**
 * @file columns.hpp
 * @brief Canonical column names of the exposure table
 */

#pragma once

#include <string>

namespace tidemark::columns {

constexpr const char* OBJECT_ID = "object_id";
constexpr const char* PRIMARY_OBJECT_TYPE = "primary_object_type";
constexpr const char* SECONDARY_OBJECT_TYPE = "secondary_object_type";
constexpr const char* GROUND_FLHT = "ground_flht";
constexpr const char* GROUND_ELEVTN = "ground_elevtn";
constexpr const char* EXTRACT_METHOD = "extract_method";
constexpr const char* SEGMENT_LENGTH = "segment_length";
constexpr const char* LANES = "lanes";

constexpr const char* MAX_DAMAGE_PREFIX = "max_damage_";
constexpr const char* FN_DAMAGE_PREFIX = "fn_damage_";
constexpr const char* AGGREGATION_LABEL_PREFIX = "aggregation_label_";

/// max_damage_<type>
inline std::string max_damage(const std::string& damage_type) {
    return MAX_DAMAGE_PREFIX + damage_type;
}

/// fn_damage_<type>
inline std::string fn_damage(const std::string& damage_type) {
    return FN_DAMAGE_PREFIX + damage_type;
}

/// aggregation_label_<name>
inline std::string aggregation_label(const std::string& name) {
    return AGGREGATION_LABEL_PREFIX + name;
}

} // namespace tidemark::columns
