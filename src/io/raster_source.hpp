/**
 * @file raster_source.hpp
 * @brief DEM rasters read through GDAL
 */

#pragma once

#include "geo/raster.hpp"
#include "io/vector_source.hpp"
#include <filesystem>
#include <optional>

namespace tidemark::io {

/**
 * @brief Options of read_raster()
 */
struct RasterReadOptions {
    std::optional<Region> region;       ///< Read only the cells under the region extent
    std::optional<UnitSystem> unit;     ///< Vertical unit; overrides the band unit
};

/**
 * @brief Read band 1 of a raster
 * @throws ProviderError if the file cannot be opened or read, or the
 *         region does not overlap the raster
 *
 * The vertical unit is taken from the options, else from the band unit
 * type when it names metres or feet.
 */
[[nodiscard]] geo::Raster read_raster(const std::filesystem::path& path,
                                      const RasterReadOptions& options = {});

} // namespace tidemark::io
