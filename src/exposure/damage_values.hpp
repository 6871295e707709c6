/**
 * @file damage_values.hpp
 * @brief Maximum potential damage per asset and damage type
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Resolves `max_damage_<type>` from exactly one source kind: a constant,
 * spatial joins against value layers, a standard cost catalog (JRC or
 * HAZUS), or a user translation table. Catalog and translation values are
 * per unit of area and are multiplied by each asset's footprint area.
 */

#pragma once

#include "core/table.hpp"
#include "core/units.hpp"
#include "exposure/exposure.hpp"
#include "exposure/spatial_join.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace tidemark::exposure {

/// Fixed conversion of 2010 euros to US dollars
constexpr double EUR2010_TO_USD = 1.327;

/// JRC catalog columns
constexpr const char* JRC_COUNTRY = "Country";
constexpr const char* JRC_DEFAULT_COUNTRY = "World";

/// HAZUS catalog columns
constexpr const char* HAZUS_OCCUPANCY = "occupancy";
constexpr const char* HAZUS_STRUCTURE = "structure";
constexpr const char* HAZUS_CONTENT_PERCENT = "content_percent";

// ============================================================================
// Damage value tables
// ============================================================================

/**
 * @brief Resolved unit damage values: object type -> damage type -> value
 */
struct DamageValueTable {
    std::map<std::string, std::map<std::string, double>> values;
    UnitSystem area_unit = UnitSystem::Meters;     ///< Values are per m² or per ft²

    [[nodiscard]] std::optional<double> lookup(const std::string& object_type,
                                               const std::string& damage_type) const;

    [[nodiscard]] std::set<std::string> object_types() const;
};

/**
 * @brief JRC adjustment factors of one building class
 */
struct JrcAdjustment {
    double cost_vs_depreciated = 0.6;   ///< Construction cost vs depreciated value
    double content_inventory = 0.5;     ///< Content value relative to structure
    double undamageable = 0.4;          ///< Undamageable share of the structure
    double material_used = 1.0;         ///< Material factor
};

/**
 * @brief Default JRC factors for residential, commercial and industrial
 */
[[nodiscard]] std::map<std::string, JrcAdjustment> default_jrc_adjustments();

/**
 * @brief Resolve the JRC construction cost catalog for one country
 * @param catalog Table with a Country column and one construction cost
 *        column per building class
 * @param country Country name (case-insensitive); empty selects "World"
 * @param adjustments Factors per building class
 * @param currency_factor Optional multiplier applied to every value
 * @throws MissingColumnError if a catalog column is absent
 * @throws UserInputError if neither the country nor "World" is listed
 *
 * structure = cost × cost_vs_depreciated × (1 − undamageable) × material_used,
 * content = structure × content_inventory, total = structure + content.
 * Values are per m².
 */
[[nodiscard]] DamageValueTable preprocess_jrc(
    const AttributeTable& catalog,
    const std::string& country,
    const std::map<std::string, JrcAdjustment>& adjustments = default_jrc_adjustments(),
    std::optional<double> currency_factor = std::nullopt);

/**
 * @brief Resolve the HAZUS replacement cost catalog
 *
 * content = structure × content_percent / 100, total = structure + content.
 * Values are per ft².
 */
[[nodiscard]] DamageValueTable preprocess_hazus(const AttributeTable& catalog);

// ============================================================================
// Damage sources
// ============================================================================

/**
 * @brief Same value for every asset and damage type
 */
struct ConstantDamage {
    double value = 0.0;
};

/**
 * @brief One value layer per damage type, applied by spatial join
 */
struct LayerDamage {
    struct Entry {
        std::string damage_type;
        geo::GeometryLayer layer;
        SpatialJoinRequest join;
    };
    std::vector<Entry> entries;     ///< Applied in order
};

/**
 * @brief Standard cost catalog
 */
struct CatalogDamage {
    enum class Catalog { Jrc, Hazus };

    Catalog catalog = Catalog::Jrc;
    std::optional<AttributeTable> table;    ///< The catalog itself
    std::string country;                    ///< JRC only
    bool convert_to_usd = false;            ///< JRC only, applies EUR2010_TO_USD
    std::map<std::string, JrcAdjustment> adjustments = default_jrc_adjustments();
};

/**
 * @brief User table mapping object types to a unit value
 */
struct TranslationDamage {
    std::optional<AttributeTable> table;
    std::string source_column;              ///< Column matched against object types
    std::string value_column;               ///< Unit value, per model area unit
};

using DamageSource = std::variant<ConstantDamage, LayerDamage, CatalogDamage, TranslationDamage>;

/**
 * @brief Damage source plus the damage types it fills
 */
struct DamageRequest {
    DamageSource source;
    std::vector<std::string> damage_types;
};

/**
 * @brief Resolve max_damage_<type> for every asset
 * @return The model table with the damage columns set
 * @throws DamageTableRequiredError if a catalog or translation table is missing
 * @throws MissingColumnError if a catalog or translation column is absent
 * @throws CrsMissingError, JoinMethodUnsupportedError from layer joins
 *
 * Assets whose object type is absent from the resolved table are logged and
 * left unchanged. A layer join failing on a missing attribute only skips
 * that damage type.
 */
[[nodiscard]] AttributeTable assign_max_damage(const ExposureModel& model,
                                               const DamageRequest& request);

/**
 * @brief Multiply unit values from a resolved table by footprint area
 *
 * Areas are measured in the unit basis of `values`.
 */
[[nodiscard]] AttributeTable apply_unit_damage(const ExposureModel& model,
                                               const DamageValueTable& values,
                                               const std::vector<std::string>& damage_types);

/**
 * @brief Overwrite max damage values from a table keyed by object_id
 * @param table Exposure table
 * @param updates object_id plus one or more max_damage_<type> columns
 * @return `table` with every non-null update value applied
 * @throws MissingColumnError if either table has no object_id column
 *
 * Other columns of `updates` are ignored. Ids absent from the exposure are
 * logged and skipped.
 */
[[nodiscard]] AttributeTable update_max_damage(AttributeTable table, const AttributeTable& updates);

} // namespace tidemark::exposure
