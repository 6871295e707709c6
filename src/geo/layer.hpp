#pragma once

#include "core/table.hpp"
#include "geo/geometry.hpp"
#include <string>
#include <vector>

namespace tidemark::geo {

/**
 * @brief A named set of features: one geometry and one attribute row each
 *
 * `crs` is any definition GDAL accepts ("EPSG:4326", WKT, PROJ string).
 * An empty `crs` means the layer has no coordinate system.
 */
struct GeometryLayer {
    std::string name;
    std::string crs;
    std::vector<Geometry> geometries;
    AttributeTable attributes;

    [[nodiscard]] size_t size() const { return geometries.size(); }
    [[nodiscard]] bool empty() const { return geometries.empty(); }
    [[nodiscard]] bool has_crs() const { return !crs.empty(); }

    [[nodiscard]] Envelope bounds() const {
        Envelope env;
        for (const auto& g : geometries) {
            env.expand(envelope(g));
        }
        return env;
    }

    /// Layer holding only the given features, in the given order
    [[nodiscard]] GeometryLayer subset(const std::vector<size_t>& rows) const {
        GeometryLayer result;
        result.name = name;
        result.crs = crs;
        result.geometries.reserve(rows.size());
        for (size_t row : rows) {
            result.geometries.push_back(geometries.at(row));
        }
        result.attributes = attributes.select_rows(rows);
        return result;
    }
};

/**
 * @brief Ordered mapping from layer name to geometry layer
 *
 * Layers keep their insertion order; replacing a layer keeps its position.
 */
class GeometryLayers {
public:
    using iterator = std::vector<GeometryLayer>::iterator;
    using const_iterator = std::vector<GeometryLayer>::const_iterator;

    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    /**
     * @brief Get a layer by name
     * @throws UserInputError if no layer has that name
     */
    [[nodiscard]] const GeometryLayer& get(const std::string& name) const;
    [[nodiscard]] GeometryLayer& get(const std::string& name);

    [[nodiscard]] const GeometryLayer* find(const std::string& name) const;

    /**
     * @brief Insert a layer, replacing any layer with the same name
     */
    void set(GeometryLayer layer);

    /**
     * @brief Remove a layer (no-op when absent)
     */
    void remove(const std::string& name);

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t size() const { return m_layers.size(); }
    [[nodiscard]] bool empty() const { return m_layers.empty(); }

    iterator begin() { return m_layers.begin(); }
    iterator end() { return m_layers.end(); }
    const_iterator begin() const { return m_layers.begin(); }
    const_iterator end() const { return m_layers.end(); }

private:
    std::vector<GeometryLayer> m_layers;
};

} // namespace tidemark::geo
