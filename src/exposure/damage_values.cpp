#include "exposure/damage_values.hpp"
#include "exposure/merge.hpp"
#include "exposure/object_types.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <cctype>

namespace tidemark::exposure {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

/// JRC building class and the catalog column holding its construction cost
const std::pair<const char*, const char*> JRC_COST_COLUMNS[] = {
    {"residential", "Construction Cost Residential (2010 €)"},
    {"commercial", "Construction Cost Commercial (2010 €)"},
    {"industrial", "Construction Cost Industrial (2010 €)"},
};

/**
 * @brief Row of the JRC catalog for a country (case-insensitive)
 */
std::optional<size_t> find_country(const AttributeTable& catalog, const std::string& country) {
    const ValueColumn& countries = catalog.column(JRC_COUNTRY);
    std::string wanted = to_lower(country);
    for (size_t row = 0; row < countries.size(); ++row) {
        auto name = as_string(countries[row]);
        if (name && to_lower(*name) == wanted) return row;
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Damage value tables
// ============================================================================

std::optional<double> DamageValueTable::lookup(const std::string& object_type,
                                               const std::string& damage_type) const {
    auto type_it = values.find(object_type);
    if (type_it == values.end()) return std::nullopt;
    auto value_it = type_it->second.find(damage_type);
    if (value_it == type_it->second.end()) return std::nullopt;
    return value_it->second;
}

std::set<std::string> DamageValueTable::object_types() const {
    std::set<std::string> types;
    for (const auto& [type, damages] : values) {
        types.insert(type);
    }
    return types;
}

std::map<std::string, JrcAdjustment> default_jrc_adjustments() {
    return {
        {"residential", JrcAdjustment{0.6, 0.5, 0.4, 1.0}},
        {"commercial", JrcAdjustment{0.6, 1.0, 0.4, 1.0}},
        {"industrial", JrcAdjustment{0.6, 1.5, 0.4, 1.0}},
    };
}

DamageValueTable preprocess_jrc(const AttributeTable& catalog,
                                const std::string& country,
                                const std::map<std::string, JrcAdjustment>& adjustments,
                                std::optional<double> currency_factor) {
    std::vector<std::string> required = {JRC_COUNTRY};
    for (const auto& [building_class, column] : JRC_COST_COLUMNS) {
        required.push_back(column);
    }
    catalog.require_columns(required, "JRC damage values");

    std::string selected = country;
    if (selected.empty()) {
        spdlog::warn("Damage values: no country given, using JRC '{}' values", JRC_DEFAULT_COUNTRY);
        selected = JRC_DEFAULT_COUNTRY;
    }

    auto row = find_country(catalog, selected);
    if (!row && to_lower(selected) != to_lower(JRC_DEFAULT_COUNTRY)) {
        spdlog::warn("Damage values: country '{}' not in the JRC table, using '{}' values",
                     selected, JRC_DEFAULT_COUNTRY);
        row = find_country(catalog, JRC_DEFAULT_COUNTRY);
    }
    if (!row) {
        throw UserInputError("JRC damage values list neither '" + selected + "' nor '" +
                             JRC_DEFAULT_COUNTRY + "'");
    }

    double factor = currency_factor.value_or(1.0);

    DamageValueTable table;
    table.area_unit = UnitSystem::Meters;
    for (const auto& [building_class, column] : JRC_COST_COLUMNS) {
        auto cost = as_number(catalog.at(column, *row));
        if (!cost) {
            spdlog::warn("Damage values: no JRC {} construction cost for '{}'",
                         building_class, selected);
            continue;
        }

        auto adj_it = adjustments.find(building_class);
        JrcAdjustment adj = adj_it != adjustments.end() ? adj_it->second : JrcAdjustment{};

        double structure = *cost * adj.cost_vs_depreciated * (1.0 - adj.undamageable) *
                           adj.material_used;
        double content = structure * adj.content_inventory;

        auto& values = table.values[building_class];
        values["structure"] = structure * factor;
        values["content"] = content * factor;
        values["total"] = (structure + content) * factor;
    }

    spdlog::info("Damage values: JRC values for '{}' resolved ({} building classes)",
                 selected, table.values.size());
    return table;
}

DamageValueTable preprocess_hazus(const AttributeTable& catalog) {
    catalog.require_columns({HAZUS_OCCUPANCY, HAZUS_STRUCTURE, HAZUS_CONTENT_PERCENT},
                            "HAZUS damage values");

    DamageValueTable table;
    table.area_unit = UnitSystem::Feet;

    size_t skipped = 0;
    for (size_t row = 0; row < catalog.row_count(); ++row) {
        auto occupancy = as_string(catalog.at(HAZUS_OCCUPANCY, row));
        auto structure = as_number(catalog.at(HAZUS_STRUCTURE, row));
        if (!occupancy || !structure) {
            ++skipped;
            continue;
        }

        double percent = as_number(catalog.at(HAZUS_CONTENT_PERCENT, row)).value_or(0.0);
        double content = *structure * (percent / 100.0);

        auto& values = table.values[*occupancy];
        values["structure"] = *structure;
        values["content"] = content;
        values["total"] = *structure + content;
    }

    if (skipped > 0) {
        spdlog::warn("Damage values: skipped {} incomplete HAZUS rows", skipped);
    }
    return table;
}

// ============================================================================
// Resolution
// ============================================================================

AttributeTable apply_unit_damage(const ExposureModel& model,
                                 const DamageValueTable& values,
                                 const std::vector<std::string>& damage_types) {
    AttributeTable table = model.table;
    std::string type_column = choose_type_column(table, values.object_types(), "Damage values");
    const ValueColumn types = table.column(type_column);

    auto areas = footprint_areas(model, values.area_unit);

    for (const auto& damage_type : damage_types) {
        ValueColumn resolved(table.row_count());
        std::set<std::string> missing_types;
        std::vector<size_t> missing_geometry;

        for (size_t row = 0; row < table.row_count(); ++row) {
            auto object_type = as_string(types[row]);
            if (!object_type) continue;

            auto unit_value = values.lookup(*object_type, damage_type);
            if (!unit_value) {
                missing_types.insert(*object_type);
                continue;
            }
            if (!areas[row]) {
                missing_geometry.push_back(row);
                continue;
            }
            resolved[row] = *unit_value * *areas[row];
        }

        if (!missing_types.empty()) {
            spdlog::warn("Damage values: {} object types have no '{}' value: {}",
                         missing_types.size(), damage_type, sample_values(missing_types));
        }
        if (!missing_geometry.empty()) {
            spdlog::warn("Damage values: {} assets have no geometry to measure (ids: {})",
                         missing_geometry.size(),
                         sample_ids(ids_of_rows(table, missing_geometry)));
        }

        const std::string target = columns::max_damage(damage_type);
        const std::string helper = "__resolved_" + target;
        table.set_column(helper, std::move(resolved));
        table = merge_attribute(std::move(table), target, helper);
    }
    return table;
}

namespace {

/**
 * @brief Dispatches a DamageSource to its resolution routine
 */
struct DamageResolver {
    const ExposureModel& model;
    const std::vector<std::string>& damage_types;

    AttributeTable operator()(const ConstantDamage& source) const {
        AttributeTable table = model.table;
        for (const auto& damage_type : damage_types) {
            table.fill_column(columns::max_damage(damage_type), source.value);
        }
        spdlog::info("Damage values: constant {} for {} damage types",
                     source.value, damage_types.size());
        return table;
    }

    AttributeTable operator()(const LayerDamage& source) const {
        AttributeTable table = model.table;
        geo::GeometryLayer assets = exposure_geometry(model);

        for (const auto& entry : source.entries) {
            if (std::find(damage_types.begin(), damage_types.end(), entry.damage_type) ==
                damage_types.end()) {
                spdlog::debug("Damage values: layer '{}' fills unrequested type '{}', skipped",
                              entry.layer.name, entry.damage_type);
                continue;
            }

            // A missing attribute only aborts this damage type
            try {
                table = join_into_table(table, assets, entry.layer, entry.join,
                                        columns::max_damage(entry.damage_type));
            } catch (const MissingColumnError& e) {
                spdlog::error("Damage values: '{}' not assigned from layer '{}': {}",
                              entry.damage_type, entry.layer.name, e.what());
            }
        }
        return table;
    }

    AttributeTable operator()(const CatalogDamage& source) const {
        const char* name = source.catalog == CatalogDamage::Catalog::Jrc ? "jrc" : "hazus";
        if (!source.table) {
            throw DamageTableRequiredError(name);
        }

        DamageValueTable values;
        if (source.catalog == CatalogDamage::Catalog::Jrc) {
            std::optional<double> factor;
            if (source.convert_to_usd) factor = EUR2010_TO_USD;
            values = preprocess_jrc(*source.table, source.country, source.adjustments, factor);
        } else {
            values = preprocess_hazus(*source.table);
        }
        return apply_unit_damage(model, values, damage_types);
    }

    AttributeTable operator()(const TranslationDamage& source) const {
        if (!source.table) {
            throw DamageTableRequiredError("translation");
        }
        const AttributeTable& translation = *source.table;
        translation.require_columns({source.source_column, source.value_column},
                                    "damage translation table");

        DamageValueTable values;
        values.area_unit = model.unit;

        const ValueColumn& keys = translation.column(source.source_column);
        const ValueColumn& unit_values = translation.column(source.value_column);
        for (size_t row = 0; row < translation.row_count(); ++row) {
            auto key = as_string(keys[row]);
            auto value = as_number(unit_values[row]);
            if (!key || !value) continue;

            // First row of a duplicated key wins
            if (values.values.count(*key) > 0) continue;
            for (const auto& damage_type : damage_types) {
                values.values[*key][damage_type] = *value;
            }
        }
        return apply_unit_damage(model, values, damage_types);
    }
};

} // anonymous namespace

AttributeTable assign_max_damage(const ExposureModel& model, const DamageRequest& request) {
    if (request.damage_types.empty()) {
        throw UserInputError("Damage values: no damage types requested");
    }
    return std::visit(DamageResolver{model, request.damage_types}, request.source);
}

// ============================================================================
// Updates
// ============================================================================

AttributeTable update_max_damage(AttributeTable table, const AttributeTable& updates) {
    table.require_columns({columns::OBJECT_ID}, "max damage update");
    updates.require_columns({columns::OBJECT_ID}, "max damage update table");

    std::vector<std::string> damage_columns;
    for (const auto& name : updates.column_names()) {
        if (name.rfind(columns::MAX_DAMAGE_PREFIX, 0) == 0) damage_columns.push_back(name);
    }
    if (damage_columns.empty()) {
        spdlog::warn("Damage values: update table has no {}* columns, nothing updated",
                     columns::MAX_DAMAGE_PREFIX);
        return table;
    }

    // Exposure row of each update row
    auto rows = index_by_object_id(table);
    const ValueColumn& ids = updates.column(columns::OBJECT_ID);
    std::vector<std::optional<size_t>> targets(updates.row_count());
    std::vector<int64_t> unknown;
    for (size_t i = 0; i < updates.row_count(); ++i) {
        auto id = as_integer(ids[i]);
        if (!id) continue;
        auto it = rows.find(*id);
        if (it == rows.end()) {
            unknown.push_back(*id);
            continue;
        }
        targets[i] = it->second;
    }

    for (const auto& column : damage_columns) {
        const ValueColumn& values = updates.column(column);
        ValueColumn incoming(table.row_count());
        for (size_t i = 0; i < targets.size(); ++i) {
            if (targets[i]) incoming[*targets[i]] = values[i];
        }

        const std::string helper = "__update_" + column;
        table.set_column(helper, std::move(incoming));
        table = merge_attribute(std::move(table), column, helper);
    }

    if (!unknown.empty()) {
        spdlog::warn("Damage values: {} update rows refer to unknown assets (ids: {})",
                     unknown.size(), sample_ids(unknown));
    }
    auto matched = std::count_if(targets.begin(), targets.end(),
                                 [](const std::optional<size_t>& row) { return row.has_value(); });
    spdlog::info("Damage values: updated {} for {} assets", fmt::join(damage_columns, ", "),
                 matched);
    return table;
}

} // namespace tidemark::exposure
