#include "exposure/vulnerability.hpp"
#include "exposure/object_types.hpp"
#include "exposure/selection.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <unordered_map>

namespace tidemark::exposure {

// ============================================================================
// DamageCurve Implementation
// ============================================================================

double DamageCurve::evaluate(double depth) const {
    if (depths.empty()) return 0.0;
    if (depth <= depths.front()) return fractions.front();
    if (depth >= depths.back()) return fractions.back();

    auto upper = std::upper_bound(depths.begin(), depths.end(), depth);
    size_t i = static_cast<size_t>(upper - depths.begin());

    double d0 = depths[i - 1];
    double d1 = depths[i];
    double t = (depth - d0) / (d1 - d0);
    return fractions[i - 1] + t * (fractions[i] - fractions[i - 1]);
}

// ============================================================================
// CurveLibrary Implementation
// ============================================================================

const DamageCurve* CurveLibrary::find(const std::string& id) const {
    auto it = std::find_if(m_curves.begin(), m_curves.end(),
                           [&](const DamageCurve& curve) { return curve.id == id; });
    return it != m_curves.end() ? &*it : nullptr;
}

const DamageCurve& CurveLibrary::get(const std::string& id) const {
    const DamageCurve* curve = find(id);
    if (!curve) {
        throw UserInputError("Unknown damage curve '" + id + "'");
    }
    return *curve;
}

void CurveLibrary::add(DamageCurve curve) {
    if (curve.depths.size() != curve.fractions.size()) {
        throw UserInputError("Damage curve '" + curve.id + "' has " +
                             std::to_string(curve.depths.size()) + " depths but " +
                             std::to_string(curve.fractions.size()) + " fractions");
    }
    for (size_t i = 1; i < curve.depths.size(); ++i) {
        if (curve.depths[i] <= curve.depths[i - 1]) {
            throw UserInputError("Damage curve '" + curve.id +
                                 "' depths must be strictly increasing");
        }
    }

    for (auto& existing : m_curves) {
        if (existing.id == curve.id) {
            existing = std::move(curve);
            return;
        }
    }
    m_curves.push_back(std::move(curve));
}

std::vector<std::string> CurveLibrary::ids() const {
    std::vector<std::string> result;
    result.reserve(m_curves.size());
    for (const auto& curve : m_curves) {
        result.push_back(curve.id);
    }
    return result;
}

// ============================================================================
// Linking
// ============================================================================

AttributeTable link_vulnerability(AttributeTable table,
                                  const LinkingTable& linking,
                                  const std::vector<std::string>& damage_types) {
    std::set<std::string> known;
    for (const auto& link : linking) {
        known.insert(link.object_type);
    }

    std::string type_column = choose_type_column(table, known, "Vulnerability");
    const ValueColumn types = table.column(type_column);

    for (const auto& damage_type : damage_types) {
        // First row of a duplicated object type wins
        std::unordered_map<std::string, std::string> curve_of;
        for (const auto& link : linking) {
            if (link.damage_type == damage_type) {
                curve_of.emplace(link.object_type, link.curve_id);
            }
        }

        ValueColumn curves(table.row_count());
        std::set<std::string> missing;
        size_t unmatched = 0;

        for (size_t row = 0; row < types.size(); ++row) {
            auto object_type = as_string(types[row]);
            auto it = object_type ? curve_of.find(*object_type) : curve_of.end();
            if (it != curve_of.end()) {
                curves[row] = it->second;
                continue;
            }
            ++unmatched;
            missing.insert(object_type ? *object_type : std::string("<null>"));
        }

        if (unmatched > 0) {
            spdlog::warn("Vulnerability: {} assets have no '{}' curve for their {} ({})",
                         unmatched, damage_type, type_column, sample_values(missing));
        }
        table.set_column(columns::fn_damage(damage_type), std::move(curves));
    }
    return table;
}

// ============================================================================
// Curve variants
// ============================================================================

std::string floodproof_curve_id(const std::string& curve_id, double floodproof_to) {
    std::string value = fmt::format("{}", floodproof_to);
    if (value.find_first_of(".e") == std::string::npos) {
        value += ".0";
    }
    std::replace(value.begin(), value.end(), '.', '_');
    return curve_id + "_fp_" + value;
}

DamageCurve truncate_curve(const DamageCurve& curve, double floodproof_to, const std::string& id) {
    DamageCurve result;
    result.id = id;

    bool inserted = false;
    for (size_t i = 0; i < curve.depths.size(); ++i) {
        double depth = curve.depths[i];
        if (!inserted && depth >= floodproof_to) {
            if (depth > floodproof_to && floodproof_to > curve.depths.front()) {
                result.depths.push_back(floodproof_to);
                result.fractions.push_back(0.0);
            }
            inserted = true;
        }
        result.depths.push_back(depth);
        result.fractions.push_back(depth <= floodproof_to ? 0.0 : curve.fractions[i]);
    }
    return result;
}

void floodproof(ExposureModel& model,
                CurveLibrary& curves,
                const std::vector<int64_t>& object_ids,
                double floodproof_to,
                const std::vector<std::string>& damage_types) {
    spdlog::info("Floodproofing: {} assets to {} {}", object_ids.size(), floodproof_to,
                 unit_name(model.unit));

    std::vector<size_t> rows = rows_of_ids(model.table, object_ids);

    for (const auto& damage_type : damage_types) {
        const std::string column = columns::fn_damage(damage_type);
        if (!model.table.has_column(column)) {
            throw PipelineOrderError("floodproof", "vulnerability linking of '" + damage_type + "'");
        }
        ValueColumn& assigned = model.table.column(column);

        // One variant per distinct curve in use by the selection
        std::map<std::string, std::string> variants;
        for (size_t row : rows) {
            auto curve_id = as_string(assigned[row]);
            if (!curve_id || variants.count(*curve_id) > 0) continue;

            std::string variant = floodproof_curve_id(*curve_id, floodproof_to);
            if (!curves.contains(variant)) {
                curves.add(truncate_curve(curves.get(*curve_id), floodproof_to, variant));
            }
            variants.emplace(*curve_id, variant);
        }

        for (size_t row : rows) {
            auto curve_id = as_string(assigned[row]);
            if (!curve_id) continue;
            assigned[row] = variants.at(*curve_id);
        }

        spdlog::info("Floodproofing: {} '{}' curves truncated at {}",
                     variants.size(), damage_type, floodproof_to);
    }
}

DamageCurve blend_curves(const CurveLibrary& curves,
                         const std::map<std::string, size_t>& weights,
                         const std::string& id) {
    std::set<double> depth_set;
    size_t total = 0;
    for (const auto& [curve_id, count] : weights) {
        const DamageCurve& curve = curves.get(curve_id);
        depth_set.insert(curve.depths.begin(), curve.depths.end());
        total += count;
    }

    DamageCurve blended;
    blended.id = id;
    if (total == 0) return blended;

    for (double depth : depth_set) {
        double sum = 0.0;
        for (const auto& [curve_id, count] : weights) {
            sum += curves.get(curve_id).evaluate(depth) * static_cast<double>(count);
        }
        blended.depths.push_back(depth);
        blended.fractions.push_back(sum / static_cast<double>(total));
    }
    return blended;
}

} // namespace tidemark::exposure
