#include "geo/raster.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace tidemark::geo {

std::optional<ZonalStatistic> parse_zonal_statistic(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "mean") return ZonalStatistic::Mean;
    if (lower == "min") return ZonalStatistic::Min;
    if (lower == "max") return ZonalStatistic::Max;
    if (lower == "median") return ZonalStatistic::Median;
    return std::nullopt;
}

const char* zonal_statistic_name(ZonalStatistic stat) {
    switch (stat) {
        case ZonalStatistic::Mean:   return "mean";
        case ZonalStatistic::Min:    return "min";
        case ZonalStatistic::Max:    return "max";
        case ZonalStatistic::Median: return "median";
    }
    return "mean";
}

bool Raster::is_nodata(double value) const {
    if (std::isnan(value)) return true;
    return nodata && value == *nodata;
}

std::optional<double> Raster::at(int x, int y) const {
    if (!in_bounds(x, y)) return std::nullopt;
    double value = data[static_cast<size_t>(y) * width + x];
    if (is_nodata(value)) return std::nullopt;
    return value;
}

void Raster::set(int x, int y, double value) {
    if (in_bounds(x, y)) {
        data[static_cast<size_t>(y) * width + x] = value;
    }
}

glm::ivec2 Raster::world_to_cell(const glm::dvec2& world) const {
    double grid_x = (world.x - origin.x) / cell_size.x;
    double grid_y = (world.y - origin.y) / cell_size.y;
    return glm::ivec2(static_cast<int>(std::floor(grid_x)),
                      static_cast<int>(std::floor(grid_y)));
}

glm::dvec2 Raster::cell_center(int x, int y) const {
    return glm::dvec2(origin.x + (x + 0.5) * cell_size.x,
                      origin.y + (y + 0.5) * cell_size.y);
}

std::optional<double> Raster::sample_nearest(const glm::dvec2& world) const {
    glm::ivec2 cell = world_to_cell(world);
    return at(cell.x, cell.y);
}

std::optional<double> Raster::zonal(const Geometry& footprint, ZonalStatistic stat) const {
    if (footprint.is_empty() || width <= 0 || height <= 0) return std::nullopt;
    if (!footprint.is_polygon()) {
        return sample_nearest(representative_point(footprint));
    }

    // Restrict the scan to the cells under the footprint envelope
    Envelope env = envelope(footprint);
    glm::ivec2 a = world_to_cell(glm::dvec2(env.min_x, env.min_y));
    glm::ivec2 b = world_to_cell(glm::dvec2(env.max_x, env.max_y));
    int x0 = std::clamp(std::min(a.x, b.x), 0, width - 1);
    int x1 = std::clamp(std::max(a.x, b.x), 0, width - 1);
    int y0 = std::clamp(std::min(a.y, b.y), 0, height - 1);
    int y1 = std::clamp(std::max(a.y, b.y), 0, height - 1);

    std::vector<double> values;
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            auto value = at(x, y);
            if (value && contains(footprint, cell_center(x, y))) {
                values.push_back(*value);
            }
        }
    }

    if (values.empty()) return std::nullopt;

    switch (stat) {
        case ZonalStatistic::Mean: {
            double sum = 0.0;
            for (double v : values) sum += v;
            return sum / static_cast<double>(values.size());
        }
        case ZonalStatistic::Min:
            return *std::min_element(values.begin(), values.end());
        case ZonalStatistic::Max:
            return *std::max_element(values.begin(), values.end());
        case ZonalStatistic::Median: {
            std::sort(values.begin(), values.end());
            size_t mid = values.size() / 2;
            if (values.size() % 2 == 1) return values[mid];
            return (values[mid - 1] + values[mid]) / 2.0;
        }
    }
    return std::nullopt;
}

} // namespace tidemark::geo
