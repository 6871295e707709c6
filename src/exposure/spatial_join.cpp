#include "exposure/spatial_join.hpp"
#include "exposure/exposure.hpp"
#include "exposure/merge.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include "geo/crs.hpp"
#include "geo/spatial_index.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace tidemark::exposure {

std::optional<JoinMethod> parse_join_method(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "nearest" || lower == "sjoin_nearest") return JoinMethod::Nearest;
    if (lower == "intersection" || lower == "intersects" || lower == "sjoin") {
        return JoinMethod::Intersection;
    }
    return std::nullopt;
}

const char* join_method_name(JoinMethod method) {
    switch (method) {
        case JoinMethod::Nearest:      return "nearest";
        case JoinMethod::Intersection: return "intersection";
    }
    return "nearest";
}

namespace {

/**
 * @brief Describe the geometry kinds of a layer ("Point", "Point/Polygon", ...)
 */
std::string layer_kinds(const geo::GeometryLayer& layer) {
    bool has[4] = {false, false, false, false};
    for (const auto& g : layer.geometries) {
        has[static_cast<int>(g.type)] = true;
    }

    std::string text;
    for (auto type : {geo::GeometryType::Point, geo::GeometryType::LineString,
                      geo::GeometryType::Polygon}) {
        if (!has[static_cast<int>(type)]) continue;
        if (!text.empty()) text += "/";
        text += geo::geometry_type_name(type);
    }
    return text.empty() ? "Empty" : text;
}

bool all_polygonal(const geo::GeometryLayer& layer) {
    return std::all_of(layer.geometries.begin(), layer.geometries.end(),
                       [](const geo::Geometry& g) { return g.is_polygon() || g.is_empty(); });
}

/**
 * @brief Reject geometry combinations the intersection strategy cannot handle
 */
void check_intersection_support(const geo::GeometryLayer& primary,
                                const geo::GeometryLayer& reference) {
    bool primary_ok = std::all_of(primary.geometries.begin(), primary.geometries.end(),
                                  [](const geo::Geometry& g) { return !g.is_line(); });

    if (!primary_ok || !all_polygonal(reference)) {
        throw JoinMethodUnsupportedError(
            "Intersection join of " + layer_kinds(primary) + " layer '" + primary.name +
            "' with " + layer_kinds(reference) + " layer '" + reference.name +
            "' is not supported: use polygons with polygons or points with polygons");
    }
}

ValueColumn nearest_join(const geo::GeometryLayer& primary,
                         const geo::GeometryLayer& reference,
                         const ValueColumn& source,
                         double max_distance) {
    std::vector<glm::dvec2> targets;
    std::vector<geo::Envelope> envelopes;
    targets.reserve(reference.size());
    envelopes.reserve(reference.size());
    for (const auto& g : reference.geometries) {
        geo::Envelope env;
        if (!g.is_empty()) {
            targets.push_back(geo::representative_point(g));
            env.expand(targets.back());
        } else {
            targets.push_back(glm::dvec2(0.0));
        }
        envelopes.push_back(env);
    }

    geo::SpatialIndex index;
    index.build(envelopes, max_distance > 0.0 ? max_distance : 0.0);

    ValueColumn result(primary.size());
    std::vector<size_t> unmatched;

    for (size_t row = 0; row < primary.size(); ++row) {
        const auto& geometry = primary.geometries[row];
        if (geometry.is_empty()) {
            unmatched.push_back(row);
            continue;
        }

        glm::dvec2 origin = geo::representative_point(geometry);
        double best_distance = std::numeric_limits<double>::infinity();
        size_t best = reference.size();

        // Candidates come back sorted, so strict < keeps the lowest row on ties
        for (size_t candidate : index.query_radius(origin, max_distance)) {
            double d = glm::length(targets[candidate] - origin);
            if (d <= max_distance && d < best_distance) {
                best_distance = d;
                best = candidate;
            }
        }

        if (best < reference.size()) {
            result[row] = source[best];
        } else {
            unmatched.push_back(row);
        }
    }

    if (!unmatched.empty()) {
        spdlog::warn("Spatial join: {} of {} features of '{}' have no '{}' feature within {} "
                     "units (ids: {})",
                     unmatched.size(), primary.size(), primary.name, reference.name,
                     max_distance, sample_ids(ids_of_rows(primary.attributes, unmatched)));
    }
    return result;
}

ValueColumn intersection_join(const geo::GeometryLayer& primary,
                              const geo::GeometryLayer& reference,
                              const ValueColumn& source) {
    check_intersection_support(primary, reference);

    geo::SpatialIndex index;
    index.build(reference.geometries);

    ValueColumn result(primary.size());
    size_t matched = 0;

    for (size_t row = 0; row < primary.size(); ++row) {
        const auto& geometry = primary.geometries[row];
        if (geometry.is_empty()) continue;

        auto candidates = index.query(geo::envelope(geometry));

        if (geometry.is_point()) {
            for (size_t candidate : candidates) {
                if (geo::contains(reference.geometries[candidate], geometry.point)) {
                    result[row] = source[candidate];
                    ++matched;
                    break;
                }
            }
            continue;
        }

        double best_area = 0.0;
        size_t best = reference.size();
        for (size_t candidate : candidates) {
            double overlap = geo::intersection_area(geometry, reference.geometries[candidate]);
            if (overlap > best_area) {
                best_area = overlap;
                best = candidate;
            }
        }
        if (best < reference.size()) {
            result[row] = source[best];
            ++matched;
        }
    }

    spdlog::debug("Spatial join: {} of {} features of '{}' intersect '{}'",
                  matched, primary.size(), primary.name, reference.name);
    return result;
}

} // anonymous namespace

ValueColumn join_attribute(const geo::GeometryLayer& primary,
                           const geo::GeometryLayer& reference,
                           const SpatialJoinRequest& request) {
    geo::GeometryLayer aligned = geo::harmonize(primary, reference);
    aligned.attributes.require_columns({request.attribute},
                                       "spatial join on layer '" + reference.name + "'");
    const ValueColumn& source = aligned.attributes.column(request.attribute);

    spdlog::debug("Spatial join: '{}' from '{}' onto '{}' ({})", request.attribute,
                  reference.name, primary.name, join_method_name(request.method));

    switch (request.method) {
        case JoinMethod::Nearest:
            return nearest_join(primary, aligned, source, request.max_distance);
        case JoinMethod::Intersection:
            return intersection_join(primary, aligned, source);
    }
    return ValueColumn(primary.size());
}

ValueColumn join_max_intersecting(const geo::GeometryLayer& primary,
                                  const geo::GeometryLayer& reference,
                                  const std::string& attribute) {
    geo::GeometryLayer aligned = geo::harmonize(primary, reference);
    aligned.attributes.require_columns({attribute},
                                       "spatial join on layer '" + reference.name + "'");
    check_intersection_support(primary, aligned);
    const ValueColumn& source = aligned.attributes.column(attribute);

    geo::SpatialIndex index;
    index.build(aligned.geometries);

    ValueColumn result(primary.size());
    for (size_t row = 0; row < primary.size(); ++row) {
        const auto& geometry = primary.geometries[row];
        if (geometry.is_empty()) continue;

        std::optional<double> best;
        for (size_t candidate : index.query(geo::envelope(geometry))) {
            const auto& other = aligned.geometries[candidate];
            bool hit = geometry.is_point() ? geo::contains(other, geometry.point)
                                           : geo::intersection_area(geometry, other) > 0.0;
            if (!hit) continue;

            if (auto value = as_number(source[candidate])) {
                best = best ? std::max(*best, *value) : *value;
            }
        }
        if (best) result[row] = *best;
    }
    return result;
}

ValueColumn align_to_table(const AttributeTable& table,
                           const geo::GeometryLayer& features,
                           const ValueColumn& values) {
    features.attributes.require_columns({columns::OBJECT_ID},
                                        "joining layer '" + features.name + "' to the table");
    auto rows = index_by_object_id(table);
    const ValueColumn& ids = features.attributes.column(columns::OBJECT_ID);

    ValueColumn aligned(table.row_count());
    for (size_t i = 0; i < values.size() && i < ids.size(); ++i) {
        auto id = as_integer(ids[i]);
        if (!id) continue;
        auto it = rows.find(*id);
        if (it != rows.end()) {
            aligned[it->second] = values[i];
        }
    }
    return aligned;
}

AttributeTable join_into_table(AttributeTable table,
                               const geo::GeometryLayer& primary,
                               const geo::GeometryLayer& reference,
                               const SpatialJoinRequest& request,
                               const std::string& target) {
    ValueColumn joined = join_attribute(primary, reference, request);

    const std::string helper = "__joined_" + target;
    table.set_column(helper, align_to_table(table, primary, joined));
    return merge_attribute(std::move(table), target, helper);
}

} // namespace tidemark::exposure
