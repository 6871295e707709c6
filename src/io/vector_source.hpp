/**
 * @file vector_source.hpp
 * @brief Vector layers read and written through GDAL/OGR
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 */

#pragma once

#include "geo/layer.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace tidemark::io {

/**
 * @brief Area of interest of a run
 */
struct Region {
    geo::Geometry area;
    std::string crs;

    /**
     * @brief Region extent in another CRS
     */
    [[nodiscard]] geo::Envelope envelope_in(const std::string& target_crs) const;
};

/**
 * @brief Options of read_vector()
 */
struct VectorReadOptions {
    std::string layer_name;         ///< OGR layer to read; empty reads the first layer
    std::optional<Region> region;   ///< Only features intersecting the region extent
};

/**
 * @brief Read an OGR vector layer
 * @param path Any vector format GDAL opens (GeoPackage, Shapefile, GeoJSON, ...)
 * @throws ProviderError if the file or layer cannot be opened
 *
 * Field types map to int64, double or string; unset fields are null.
 * The layer CRS is given as "AUTHORITY:CODE" when known, WKT otherwise.
 */
[[nodiscard]] geo::GeometryLayer read_vector(const std::filesystem::path& path,
                                             const VectorReadOptions& options = {});

/**
 * @brief Read the area of interest: the first geometry of a vector file
 * @throws ProviderError if the file holds no polygon
 */
[[nodiscard]] Region read_region(const std::filesystem::path& path);

/**
 * @brief Write layers to a GeoPackage, one table per layer
 * @throws ProviderError if the file cannot be created
 *
 * An existing file is replaced.
 */
void write_geopackage(const std::filesystem::path& path, const geo::GeometryLayers& layers);

} // namespace tidemark::io
