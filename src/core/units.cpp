#include "core/units.hpp"
#include <algorithm>
#include <cctype>

namespace tidemark {

std::optional<UnitSystem> parse_unit(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "m" || lower == "meter" || lower == "meters" ||
        lower == "metre" || lower == "metres")
        return UnitSystem::Meters;
    if (lower == "ft" || lower == "foot" || lower == "feet")
        return UnitSystem::Feet;

    return std::nullopt;
}

const char* unit_name(UnitSystem unit) {
    switch (unit) {
        case UnitSystem::Meters: return "meters";
        case UnitSystem::Feet:   return "feet";
    }
    return "meters";
}

double length_factor(UnitSystem from, UnitSystem to) {
    return convert_length(1.0, from, to);
}

} // namespace tidemark
