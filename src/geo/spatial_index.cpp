#include "geo/spatial_index.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <algorithm>

namespace tidemark::geo {

namespace {

/// Upper bound on cells per axis
constexpr int MAX_GRID_CELLS = 1024;

} // anonymous namespace

void SpatialIndex::build(const std::vector<Envelope>& envelopes, double cell_size) {
    clear();

    for (const auto& env : envelopes) {
        m_bounds.expand(env);
    }

    if (!m_bounds.is_valid()) {
        spdlog::debug("Spatial index: no valid envelopes, index is empty");
        return;
    }

    double width = m_bounds.max_x - m_bounds.min_x;
    double height = m_bounds.max_y - m_bounds.min_y;

    if (cell_size <= 0.0) {
        // Aim for roughly one feature per cell
        double extent = std::max(width, height);
        double per_axis = std::sqrt(static_cast<double>(std::max<size_t>(envelopes.size(), 1)));
        cell_size = extent / per_axis;
    }
    double min_cell = std::max(width, height) / MAX_GRID_CELLS;
    m_cell_size = std::max({cell_size, min_cell, 1e-9});

    m_grid_width = static_cast<int>(std::ceil(width / m_cell_size));
    m_grid_height = static_cast<int>(std::ceil(height / m_cell_size));

    // Ensure at least 1x1 grid
    m_grid_width = std::max(1, m_grid_width);
    m_grid_height = std::max(1, m_grid_height);

    for (size_t i = 0; i < envelopes.size(); ++i) {
        const auto& env = envelopes[i];
        if (!env.is_valid()) continue;

        CellCoord lo = cell_of(glm::dvec2(env.min_x, env.min_y));
        CellCoord hi = cell_of(glm::dvec2(env.max_x, env.max_y));
        for (int y = lo.y; y <= hi.y; ++y) {
            for (int x = lo.x; x <= hi.x; ++x) {
                m_cells[CellCoord{x, y}].push_back(i);
            }
        }
        ++m_count;
    }

    spdlog::debug("Spatial index: {} features in {}x{} grid ({:.3f} units per cell)",
                  m_count, m_grid_width, m_grid_height, m_cell_size);
}

void SpatialIndex::build(const std::vector<Geometry>& geometries, double cell_size) {
    std::vector<Envelope> envelopes;
    envelopes.reserve(geometries.size());
    for (const auto& geometry : geometries) {
        envelopes.push_back(envelope(geometry));
    }
    build(envelopes, cell_size);
}

void SpatialIndex::clear() {
    m_cells.clear();
    m_bounds = Envelope{};
    m_cell_size = 1.0;
    m_grid_width = 0;
    m_grid_height = 0;
    m_count = 0;
}

CellCoord SpatialIndex::cell_of(const glm::dvec2& p) const {
    CellCoord coord;
    coord.x = static_cast<int>(std::floor((p.x - m_bounds.min_x) / m_cell_size));
    coord.y = static_cast<int>(std::floor((p.y - m_bounds.min_y) / m_cell_size));

    // Clamp to grid bounds
    coord.x = std::clamp(coord.x, 0, m_grid_width - 1);
    coord.y = std::clamp(coord.y, 0, m_grid_height - 1);

    return coord;
}

std::vector<size_t> SpatialIndex::query(const Envelope& window) const {
    std::vector<size_t> result;
    if (m_count == 0 || !window.intersects(m_bounds)) return result;

    CellCoord lo = cell_of(glm::dvec2(window.min_x, window.min_y));
    CellCoord hi = cell_of(glm::dvec2(window.max_x, window.max_y));

    for (int y = lo.y; y <= hi.y; ++y) {
        for (int x = lo.x; x <= hi.x; ++x) {
            auto it = m_cells.find(CellCoord{x, y});
            if (it != m_cells.end()) {
                result.insert(result.end(), it->second.begin(), it->second.end());
            }
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<size_t> SpatialIndex::query_radius(const glm::dvec2& center, double radius) const {
    Envelope window;
    window.expand(center);
    return query(window.buffered(radius));
}

} // namespace tidemark::geo
