/**
 * @file vulnerability.hpp
 * @brief Damage curves, curve linking and curve variants
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 */

#pragma once

#include "core/table.hpp"
#include "exposure/exposure.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tidemark::exposure {

// ============================================================================
// Curves
// ============================================================================

/**
 * @brief Depth to damage fraction function
 *
 * Depths are strictly increasing. Evaluation interpolates linearly and is
 * clamped to the first and last fraction outside the depth range.
 */
struct DamageCurve {
    std::string id;
    std::vector<double> depths;
    std::vector<double> fractions;

    [[nodiscard]] double evaluate(double depth) const;
    [[nodiscard]] bool empty() const { return depths.empty(); }
};

/**
 * @brief Curves available to the exposure, in insertion order
 */
class CurveLibrary {
public:
    using const_iterator = std::vector<DamageCurve>::const_iterator;

    [[nodiscard]] bool contains(const std::string& id) const { return find(id) != nullptr; }
    [[nodiscard]] const DamageCurve* find(const std::string& id) const;

    /**
     * @brief Get a curve by id
     * @throws UserInputError if the curve is unknown
     */
    [[nodiscard]] const DamageCurve& get(const std::string& id) const;

    /**
     * @brief Register a curve, replacing any curve with the same id
     * @throws UserInputError if depths and fractions differ in size or
     *         depths are not strictly increasing
     */
    void add(DamageCurve curve);

    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] size_t size() const { return m_curves.size(); }
    [[nodiscard]] bool empty() const { return m_curves.empty(); }

    const_iterator begin() const { return m_curves.begin(); }
    const_iterator end() const { return m_curves.end(); }

private:
    std::vector<DamageCurve> m_curves;
};

// ============================================================================
// Linking
// ============================================================================

/**
 * @brief One row of a vulnerability linking table
 */
struct VulnerabilityLink {
    std::string object_type;
    std::string damage_type;
    std::string curve_id;
};

using LinkingTable = std::vector<VulnerabilityLink>;

/**
 * @brief Assign fn_damage_<type> for every requested damage type
 * @param table Exposure table with object type columns
 * @param linking Object type / damage type / curve id rows
 * @param damage_types Damage types to link, each independently
 * @return The table with the curve columns set
 *
 * The object type column is chosen by overlap with the linking table
 * (see choose_type_column()). Unmatched assets keep a null curve id and
 * are reported at warning level.
 */
[[nodiscard]] AttributeTable link_vulnerability(AttributeTable table,
                                                const LinkingTable& linking,
                                                const std::vector<std::string>& damage_types);

// ============================================================================
// Curve variants
// ============================================================================

/**
 * @brief Id of the floodproofed variant of a curve ("<id>_fp_<value>", dots as underscores)
 *
 * The value keeps at least one decimal: 1.0 gives "res_fp_1_0".
 */
[[nodiscard]] std::string floodproof_curve_id(const std::string& curve_id, double floodproof_to);

/**
 * @brief Curve without damage below a depth
 *
 * Fractions at depths up to and including `floodproof_to` become 0 and the
 * point (`floodproof_to`, 0) is inserted when missing, so the curve evaluates
 * to 0 for every depth up to `floodproof_to`. Deeper points keep their
 * original fractions.
 */
[[nodiscard]] DamageCurve truncate_curve(const DamageCurve& curve,
                                         double floodproof_to,
                                         const std::string& id);

/**
 * @brief Floodproof selected assets
 * @param model Exposure whose fn_damage columns are repointed
 * @param curves Library receiving the truncated variants
 * @param object_ids Selected assets
 * @param floodproof_to Depth below which damage is prevented
 * @param damage_types Damage types to floodproof
 * @throws PipelineOrderError if a fn_damage column is missing
 * @throws UserInputError if a selected asset uses an unknown curve
 *
 * One variant is registered per distinct curve used by the selection;
 * assets outside the selection keep their curves.
 */
void floodproof(ExposureModel& model,
                CurveLibrary& curves,
                const std::vector<int64_t>& object_ids,
                double floodproof_to,
                const std::vector<std::string>& damage_types);

/**
 * @brief Occurrence-weighted blend of curves
 * @param weights Curve id to number of assets using it
 * @param id Id of the blended curve
 *
 * blended(d) = Σ curve_i(d)·count_i / Σ count_i over the union of depths.
 */
[[nodiscard]] DamageCurve blend_curves(const CurveLibrary& curves,
                                       const std::map<std::string, size_t>& weights,
                                       const std::string& id);

} // namespace tidemark::exposure
