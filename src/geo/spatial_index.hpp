#pragma once

#include "geo/geometry.hpp"
#include <functional>
#include <unordered_map>
#include <vector>

namespace tidemark::geo {

/**
 * @brief Cell coordinate in a SpatialIndex grid
 */
struct CellCoord {
    int x = 0;
    int y = 0;

    bool operator==(const CellCoord& other) const {
        return x == other.x && y == other.y;
    }
};

} // namespace tidemark::geo

// Hash for CellCoord
namespace std {
template<>
struct hash<tidemark::geo::CellCoord> {
    size_t operator()(const tidemark::geo::CellCoord& c) const {
        return hash<int>()(c.x) ^ (hash<int>()(c.y) << 1);
    }
};
}

namespace tidemark::geo {

/**
 * @brief Uniform grid index over feature envelopes
 *
 * Divides the extent of the indexed features into square cells. Each
 * feature is registered in every cell its envelope overlaps, so a window
 * query only has to test the features of the cells the window touches.
 * Used for the candidate search of spatial joins and nearest-neighbour
 * fallbacks.
 */
class SpatialIndex {
public:
    SpatialIndex() = default;

    /**
     * @brief Build the index
     * @param envelopes One envelope per feature; invalid envelopes are skipped
     * @param cell_size Cell edge length in map units (0 = derived from the data)
     */
    void build(const std::vector<Envelope>& envelopes, double cell_size = 0.0);

    /**
     * @brief Build the index over the envelopes of a geometry list
     */
    void build(const std::vector<Geometry>& geometries, double cell_size = 0.0);

    /**
     * @brief Clear all cells
     */
    void clear();

    /**
     * @brief Features whose envelope may intersect a window
     * @return Feature indices, sorted ascending and unique
     */
    [[nodiscard]] std::vector<size_t> query(const Envelope& window) const;

    /**
     * @brief Features whose envelope lies within a distance of a point
     */
    [[nodiscard]] std::vector<size_t> query_radius(const glm::dvec2& center, double radius) const;

    [[nodiscard]] size_t size() const { return m_count; }
    [[nodiscard]] bool empty() const { return m_count == 0; }
    [[nodiscard]] double cell_size() const { return m_cell_size; }
    [[nodiscard]] const Envelope& bounds() const { return m_bounds; }

private:
    CellCoord cell_of(const glm::dvec2& p) const;

    std::unordered_map<CellCoord, std::vector<size_t>> m_cells;
    Envelope m_bounds;
    double m_cell_size = 1.0;
    int m_grid_width = 0;
    int m_grid_height = 0;
    size_t m_count = 0;
};

} // namespace tidemark::geo
