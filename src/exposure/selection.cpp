#include "exposure/selection.hpp"
#include "core/columns.hpp"
#include "core/errors.hpp"
#include "core/report.hpp"
#include "geo/crs.hpp"
#include "geo/spatial_index.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

namespace tidemark::exposure {

std::optional<SelectionType> parse_selection_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "all") return SelectionType::All;
    if (lower == "ids" || lower == "list") return SelectionType::Ids;
    if (lower == "aggregation_area") return SelectionType::AggregationArea;
    if (lower == "polygon") return SelectionType::Polygon;
    return std::nullopt;
}

std::vector<size_t> rows_of_ids(const AttributeTable& table, const std::vector<int64_t>& ids) {
    std::unordered_set<int64_t> wanted(ids.begin(), ids.end());
    const ValueColumn& column = table.column(columns::OBJECT_ID);

    std::vector<size_t> rows;
    for (size_t row = 0; row < column.size(); ++row) {
        auto id = as_integer(column[row]);
        if (id && wanted.count(*id) > 0) {
            rows.push_back(row);
        }
    }
    return rows;
}

namespace {

/**
 * @brief Object ids of assets lying inside any polygon of a layer
 */
std::unordered_set<int64_t> ids_inside(const ExposureModel& model, const geo::GeometryLayer& polygons) {
    geo::GeometryLayer assets = exposure_geometry(model);
    geo::GeometryLayer zones = geo::harmonize(assets, polygons);

    geo::SpatialIndex index;
    index.build(zones.geometries);

    const ValueColumn& ids = assets.attributes.column(columns::OBJECT_ID);
    std::unordered_set<int64_t> inside;
    for (size_t i = 0; i < assets.size(); ++i) {
        const auto& geometry = assets.geometries[i];
        if (geometry.is_empty()) continue;

        glm::dvec2 point = geo::representative_point(geometry);
        for (size_t zone : index.query(geo::envelope(geometry))) {
            const auto& polygon = zones.geometries[zone];
            bool hit = geometry.is_polygon() ? geo::intersection_area(geometry, polygon) > 0.0
                                             : geo::contains(polygon, point);
            if (hit) {
                if (auto id = as_integer(ids[i])) inside.insert(*id);
                break;
            }
        }
    }
    return inside;
}

} // anonymous namespace

std::vector<int64_t> select_object_ids(const ExposureModel& model, const Selection& selection) {
    const AttributeTable& table = model.table;
    table.require_columns({columns::OBJECT_ID}, "asset selection");

    bool filter_types = !selection.object_types.empty() || !selection.excluded_types.empty();
    if (filter_types) {
        table.require_columns({columns::PRIMARY_OBJECT_TYPE}, "asset selection by object type");
    }

    std::set<std::string> include(selection.object_types.begin(), selection.object_types.end());
    std::set<std::string> exclude(selection.excluded_types.begin(), selection.excluded_types.end());

    std::unordered_set<int64_t> listed;
    std::unordered_set<int64_t> inside;
    const ValueColumn* labels = nullptr;

    switch (selection.type) {
        case SelectionType::All:
            break;
        case SelectionType::Ids:
            listed.insert(selection.ids.begin(), selection.ids.end());
            break;
        case SelectionType::AggregationArea: {
            std::string column = columns::aggregation_label(selection.aggregation);
            table.require_columns({column}, "asset selection by aggregation area");
            labels = &table.column(column);
            break;
        }
        case SelectionType::Polygon:
            if (!selection.polygons) {
                throw UserInputError("Polygon asset selection requires a polygon layer");
            }
            inside = ids_inside(model, *selection.polygons);
            break;
    }

    const ValueColumn& ids = table.column(columns::OBJECT_ID);
    std::vector<int64_t> result;
    std::unordered_set<int64_t> found;

    for (size_t row = 0; row < table.row_count(); ++row) {
        auto id = as_integer(ids[row]);
        if (!id) continue;

        if (filter_types) {
            auto type = as_string(table.at(columns::PRIMARY_OBJECT_TYPE, row));
            std::string key = type ? *type : std::string();
            if (!include.empty() && include.count(key) == 0) continue;
            if (exclude.count(key) > 0) continue;
        }

        switch (selection.type) {
            case SelectionType::All:
                break;
            case SelectionType::Ids:
                if (listed.count(*id) == 0) continue;
                found.insert(*id);
                break;
            case SelectionType::AggregationArea: {
                auto label = as_string((*labels)[row]);
                if (!label || *label != selection.aggregation_area) continue;
                break;
            }
            case SelectionType::Polygon:
                if (inside.count(*id) == 0) continue;
                break;
        }
        result.push_back(*id);
    }

    if (selection.type == SelectionType::Ids) {
        std::vector<int64_t> missing;
        for (int64_t id : selection.ids) {
            if (found.count(id) == 0) missing.push_back(id);
        }
        if (!missing.empty()) {
            spdlog::warn("Selection: {} requested object ids are absent or filtered out (ids: {})",
                         missing.size(), sample_ids(missing));
        }
    }

    spdlog::info("Selection: {} of {} assets selected", result.size(), table.row_count());
    return result;
}

} // namespace tidemark::exposure
