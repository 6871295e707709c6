#include "io/table_source.hpp"
#include "io/ogr_util.hpp"
#include "core/errors.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace tidemark::io {

namespace {

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

/**
 * @brief Quote a CSV cell when it holds a separator, quote or line break
 */
std::string csv_cell(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) return text;

    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // anonymous namespace

// ============================================================================
// Reading
// ============================================================================

AttributeTable read_table(const std::filesystem::path& path) {
    GDALAllRegister();

    static const char* const CSV_OPTIONS[] = {"AUTODETECT_TYPE=YES", "EMPTY_STRING_AS_NULL=YES",
                                              nullptr};
    static const char* const XLSX_OPTIONS[] = {"HEADERS=FORCE", "FIELD_TYPES=AUTO", nullptr};

    std::string ext = lower_extension(path);
    const char* const* options = ext == ".xlsx" ? XLSX_OPTIONS : CSV_OPTIONS;

    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.string().c_str(),
                                                   GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                                   nullptr, options, nullptr));
    if (!dataset) {
        throw ProviderError("Cannot open table " + path.string());
    }

    OGRLayer* layer = dataset->GetLayer(0);
    if (!layer) {
        throw ProviderError("Table " + path.string() + " has no sheet or layer");
    }

    OGRFeatureDefn* definition = layer->GetLayerDefn();
    const int field_count = definition->GetFieldCount();
    std::vector<ValueColumn> fields(static_cast<size_t>(field_count));

    size_t rows = 0;
    layer->ResetReading();
    OGRFeature* raw = nullptr;
    while ((raw = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feature(raw);
        for (int i = 0; i < field_count; ++i) {
            fields[static_cast<size_t>(i)].push_back(field_value(*feature, i));
        }
        ++rows;
    }

    AttributeTable table(rows);
    for (int i = 0; i < field_count; ++i) {
        table.set_column(definition->GetFieldDefn(i)->GetNameRef(),
                         std::move(fields[static_cast<size_t>(i)]));
    }

    spdlog::debug("Table source: read {} rows and {} columns from {}", rows, field_count,
                  path.filename().string());
    return table;
}

// ============================================================================
// Parsers
// ============================================================================

exposure::LinkingTable parse_linking_table(const AttributeTable& table) {
    table.require_columns({LINK_OBJECT_TYPE, LINK_DAMAGE_TYPE, LINK_CURVE_ID},
                          "vulnerability linking table");

    exposure::LinkingTable linking;
    size_t skipped = 0;
    for (size_t row = 0; row < table.row_count(); ++row) {
        auto object_type = as_string(table.at(LINK_OBJECT_TYPE, row));
        auto damage_type = as_string(table.at(LINK_DAMAGE_TYPE, row));
        auto curve_id = as_string(table.at(LINK_CURVE_ID, row));
        if (!object_type || !damage_type || !curve_id) {
            ++skipped;
            continue;
        }
        linking.push_back({*object_type, *damage_type, *curve_id});
    }

    if (skipped > 0) {
        spdlog::warn("Table source: skipped {} incomplete linking rows", skipped);
    }
    return linking;
}

exposure::CurveLibrary parse_curves(const AttributeTable& table) {
    table.require_columns({CURVE_DEPTH_COLUMN}, "damage curve table");
    const ValueColumn& depths = table.column(CURVE_DEPTH_COLUMN);

    exposure::CurveLibrary curves;
    for (const auto& name : table.column_names()) {
        if (name == CURVE_DEPTH_COLUMN) continue;

        exposure::DamageCurve curve;
        curve.id = name;
        const ValueColumn& fractions = table.column(name);
        for (size_t row = 0; row < table.row_count(); ++row) {
            auto depth = as_number(depths[row]);
            auto fraction = as_number(fractions[row]);
            if (!depth || !fraction) continue;
            curve.depths.push_back(*depth);
            curve.fractions.push_back(*fraction);
        }

        if (curve.empty()) {
            spdlog::warn("Table source: curve '{}' has no points, skipped", name);
            continue;
        }
        curves.add(std::move(curve));
    }

    spdlog::info("Table source: {} damage curves loaded", curves.size());
    return curves;
}

exposure::LaneCostTable parse_lane_costs(const AttributeTable& table,
                                         const std::string& cost_column,
                                         UnitSystem length_unit) {
    table.require_columns({LANE_COLUMN, cost_column}, "lane cost table");

    exposure::LaneCostTable costs;
    costs.length_unit = length_unit;
    for (size_t row = 0; row < table.row_count(); ++row) {
        auto lanes = as_integer(table.at(LANE_COLUMN, row));
        auto cost = as_number(table.at(cost_column, row));
        if (!lanes || !cost) continue;
        costs.cost_per_length.emplace(*lanes, *cost);
    }
    return costs;
}

// ============================================================================
// Writing
// ============================================================================

void write_csv(const std::filesystem::path& path, const AttributeTable& table) {
    std::ofstream out(path);
    if (!out) {
        throw ProviderError("Cannot write " + path.string());
    }

    const auto& names = table.column_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out << ',';
        out << csv_cell(names[i]);
    }
    out << '\n';

    for (size_t row = 0; row < table.row_count(); ++row) {
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out << ',';
            auto text = as_string(table.at(names[i], row));
            if (text) out << csv_cell(*text);
        }
        out << '\n';
    }

    if (!out) {
        throw ProviderError("Failed writing " + path.string());
    }
    spdlog::info("Table source: wrote {} rows to {}", table.row_count(), path.filename().string());
}

void write_curves(const std::filesystem::path& path, const exposure::CurveLibrary& curves) {
    std::set<double> depth_set;
    for (const auto& curve : curves) {
        depth_set.insert(curve.depths.begin(), curve.depths.end());
    }

    std::vector<double> depths(depth_set.begin(), depth_set.end());
    AttributeTable table(depths.size());

    ValueColumn depth_column(depths.begin(), depths.end());
    table.set_column(CURVE_DEPTH_COLUMN, std::move(depth_column));

    for (const auto& curve : curves) {
        ValueColumn fractions(depths.size());
        for (size_t i = 0; i < curve.depths.size(); ++i) {
            auto it = std::lower_bound(depths.begin(), depths.end(), curve.depths[i]);
            fractions[static_cast<size_t>(it - depths.begin())] = curve.fractions[i];
        }
        table.set_column(curve.id, std::move(fractions));
    }
    write_csv(path, table);
}

} // namespace tidemark::io
