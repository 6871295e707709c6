#include "exposure/object_types.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace tidemark::exposure {

std::set<std::string> distinct_values(const ValueColumn& column) {
    std::set<std::string> values;
    for (const auto& value : column) {
        if (auto text = as_string(value)) {
            values.insert(*text);
        }
    }
    return values;
}

namespace {

size_t overlap(const std::set<std::string>& values, const std::set<std::string>& known) {
    size_t count = 0;
    for (const auto& value : values) {
        if (known.count(value) > 0) ++count;
    }
    return count;
}

} // anonymous namespace

std::string choose_type_column(const AttributeTable& table,
                               const std::set<std::string>& known,
                               const std::string& context) {
    bool has_primary = table.has_column(columns::PRIMARY_OBJECT_TYPE);
    bool has_secondary = table.has_column(columns::SECONDARY_OBJECT_TYPE);

    if (!has_primary && !has_secondary) {
        throw MissingColumnError(columns::PRIMARY_OBJECT_TYPE, context);
    }
    if (!has_secondary) return columns::PRIMARY_OBJECT_TYPE;
    if (!has_primary) return columns::SECONDARY_OBJECT_TYPE;

    size_t primary = overlap(distinct_values(table.column(columns::PRIMARY_OBJECT_TYPE)), known);
    size_t secondary = overlap(distinct_values(table.column(columns::SECONDARY_OBJECT_TYPE)), known);

    std::string chosen = secondary > primary ? columns::SECONDARY_OBJECT_TYPE
                                             : columns::PRIMARY_OBJECT_TYPE;
    spdlog::debug("{}: matching on '{}' ({} primary vs {} secondary types known)",
                  context, chosen, primary, secondary);
    return chosen;
}

AttributeTable classify_object_types(AttributeTable table, const ObjectTypeRequest& request) {
    table.require_columns({request.source_column}, "object type classification");
    const ValueColumn raw = table.column(request.source_column);

    ValueColumn primary(table.row_count());
    ValueColumn secondary = table.has_column(columns::SECONDARY_OBJECT_TYPE)
                                ? table.column(columns::SECONDARY_OBJECT_TYPE)
                                : ValueColumn(table.row_count());

    if (request.translation) {
        const AttributeTable& translation = *request.translation;
        translation.require_columns({request.source_column, columns::PRIMARY_OBJECT_TYPE},
                                    "object type translation table");
        bool translates_secondary = translation.has_column(columns::SECONDARY_OBJECT_TYPE);

        std::unordered_map<std::string, size_t> lookup;
        const ValueColumn& keys = translation.column(request.source_column);
        for (size_t row = 0; row < keys.size(); ++row) {
            if (auto key = as_string(keys[row])) {
                lookup.emplace(*key, row);
            }
        }

        for (size_t row = 0; row < raw.size(); ++row) {
            auto key = as_string(raw[row]);
            if (!key) continue;
            auto it = lookup.find(*key);
            if (it == lookup.end()) continue;

            primary[row] = translation.at(columns::PRIMARY_OBJECT_TYPE, it->second);
            if (translates_secondary) {
                secondary[row] = translation.at(columns::SECONDARY_OBJECT_TYPE, it->second);
            }
        }
    } else {
        primary = raw;
    }

    if (!request.secondary_column.empty()) {
        table.require_columns({request.secondary_column}, "object type classification");
        const ValueColumn& column = table.column(request.secondary_column);
        for (size_t row = 0; row < column.size(); ++row) {
            if (!is_null(column[row])) secondary[row] = column[row];
        }
    }

    std::vector<size_t> unclassified;
    for (size_t row = 0; row < primary.size(); ++row) {
        if (is_null(primary[row])) unclassified.push_back(row);
    }

    if (!unclassified.empty() && request.unclassified_fill) {
        for (size_t row : unclassified) {
            primary[row] = *request.unclassified_fill;
        }
        spdlog::warn("Object types: {} unclassified assets set to '{}' (ids: {})",
                     unclassified.size(), *request.unclassified_fill,
                     sample_ids(ids_of_rows(table, unclassified)));
        unclassified.clear();
    }

    table.set_column(columns::PRIMARY_OBJECT_TYPE, std::move(primary));
    table.set_column(columns::SECONDARY_OBJECT_TYPE, std::move(secondary));

    if (unclassified.empty()) return table;

    if (request.drop_unclassified) {
        spdlog::warn("Object types: dropping {} unclassified assets (ids: {})",
                     unclassified.size(), sample_ids(ids_of_rows(table, unclassified)));

        std::vector<size_t> keep;
        size_t next = 0;
        for (size_t row = 0; row < table.row_count(); ++row) {
            if (next < unclassified.size() && unclassified[next] == row) {
                ++next;
                continue;
            }
            keep.push_back(row);
        }
        return table.select_rows(keep);
    }

    spdlog::warn("Object types: {} of {} assets have no primary object type (ids: {})",
                 unclassified.size(), table.row_count(),
                 sample_ids(ids_of_rows(table, unclassified)));
    return table;
}

} // namespace tidemark::exposure
