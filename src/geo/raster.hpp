#pragma once

#include "core/units.hpp"
#include "geo/geometry.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tidemark::geo {

/**
 * @brief Statistic computed over the cells covered by a footprint
 */
enum class ZonalStatistic {
    Mean,
    Min,
    Max,
    Median
};

[[nodiscard]] std::optional<ZonalStatistic> parse_zonal_statistic(const std::string& name);
[[nodiscard]] const char* zonal_statistic_name(ZonalStatistic stat);

/**
 * @brief Single band gridded layer (DEM)
 *
 * North-up grid in GDAL geotransform convention: `origin` is the outer
 * corner of cell (0, 0), `cell_size.y` is negative for the usual top-down
 * row order.
 */
struct Raster {
    std::vector<double> data;           // Cell values (row-major)
    int width = 0;                      // Number of columns
    int height = 0;                     // Number of rows
    glm::dvec2 origin{0.0};             // World position of corner (0,0)
    glm::dvec2 cell_size{1.0, -1.0};    // Map units per cell (signed)
    std::optional<double> nodata;       // Nodata marker, if any
    std::string crs;                    // Coordinate system of the grid
    std::optional<UnitSystem> unit;     // Vertical unit of the values, if declared

    /**
     * @brief Value at grid coordinates
     * @return nullopt outside the grid or for nodata cells
     */
    [[nodiscard]] std::optional<double> at(int x, int y) const;

    /**
     * @brief Set value at grid coordinates
     */
    void set(int x, int y, double value);

    /**
     * @brief Grid cell containing a world position (may lie outside the grid)
     */
    [[nodiscard]] glm::ivec2 world_to_cell(const glm::dvec2& world) const;

    /**
     * @brief World position of a cell center
     */
    [[nodiscard]] glm::dvec2 cell_center(int x, int y) const;

    /**
     * @brief Value of the cell containing a world position (no interpolation)
     */
    [[nodiscard]] std::optional<double> sample_nearest(const glm::dvec2& world) const;

    /**
     * @brief Statistic over the cells whose center lies inside a footprint
     *
     * Points and lines are sampled at their representative point.
     * @return nullopt when no valid cell is covered
     */
    [[nodiscard]] std::optional<double> zonal(const Geometry& footprint,
                                              ZonalStatistic stat = ZonalStatistic::Mean) const;

    /**
     * @brief Check if coordinates are within bounds
     */
    [[nodiscard]] bool in_bounds(int x, int y) const {
        return x >= 0 && x < width && y >= 0 && y < height;
    }

    [[nodiscard]] bool is_nodata(double value) const;
};

} // namespace tidemark::geo
