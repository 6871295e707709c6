#include "geo/layer.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace tidemark::geo {

const GeometryLayer* GeometryLayers::find(const std::string& name) const {
    auto it = std::find_if(m_layers.begin(), m_layers.end(),
                           [&](const GeometryLayer& layer) { return layer.name == name; });
    return it != m_layers.end() ? &*it : nullptr;
}

const GeometryLayer& GeometryLayers::get(const std::string& name) const {
    const GeometryLayer* layer = find(name);
    if (!layer) {
        throw UserInputError("No geometry layer named '" + name + "'");
    }
    return *layer;
}

GeometryLayer& GeometryLayers::get(const std::string& name) {
    return const_cast<GeometryLayer&>(static_cast<const GeometryLayers&>(*this).get(name));
}

void GeometryLayers::set(GeometryLayer layer) {
    for (auto& existing : m_layers) {
        if (existing.name == layer.name) {
            existing = std::move(layer);
            return;
        }
    }
    m_layers.push_back(std::move(layer));
}

void GeometryLayers::remove(const std::string& name) {
    m_layers.erase(std::remove_if(m_layers.begin(), m_layers.end(),
                                  [&](const GeometryLayer& layer) { return layer.name == name; }),
                   m_layers.end());
}

std::vector<std::string> GeometryLayers::names() const {
    std::vector<std::string> result;
    result.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        result.push_back(layer.name);
    }
    return result;
}

} // namespace tidemark::geo
