#pragma once

#include <optional>
#include <string>

namespace tidemark {

/// Feet per meter (1 m = 3.28084 ft)
constexpr double FEET_PER_METER = 3.28084;

/// Length of one international foot in meters
constexpr double METERS_PER_FOOT = 0.3048;

/**
 * @brief Model-wide unit system for lengths, heights and areas
 */
enum class UnitSystem {
    Meters,
    Feet
};

/**
 * @brief Parse a unit name ("m", "meter", "metre", "ft", "foot", "feet", ...)
 * @return The unit, or nullopt for an unknown name
 */
[[nodiscard]] std::optional<UnitSystem> parse_unit(const std::string& name);

[[nodiscard]] const char* unit_name(UnitSystem unit);

/**
 * @brief Factor converting a length from one unit to another
 */
[[nodiscard]] double length_factor(UnitSystem from, UnitSystem to);

[[nodiscard]] inline double convert_length(double value, UnitSystem from, UnitSystem to) {
    if (from == to) return value;
    return from == UnitSystem::Meters ? value * FEET_PER_METER : value / FEET_PER_METER;
}

[[nodiscard]] inline double convert_area(double value, UnitSystem from, UnitSystem to) {
    return convert_length(convert_length(value, from, to), from, to);
}

} // namespace tidemark
