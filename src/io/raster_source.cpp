#include "io/raster_source.hpp"
#include "io/ogr_util.hpp"
#include "core/errors.hpp"
#include <gdal_priv.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace tidemark::io {

namespace {

/**
 * @brief Vertical unit named by a band unit type ("m", "metre", "ft", "US survey foot", ...)
 */
std::optional<UnitSystem> band_unit(GDALRasterBand& band) {
    std::string unit = band.GetUnitType();
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (unit == "m" || unit == "metre" || unit == "meter" || unit == "metres" || unit == "meters") {
        return UnitSystem::Meters;
    }
    if (unit == "ft" || unit == "foot" || unit == "feet" || unit == "us survey foot" ||
        unit == "us-ft") {
        return UnitSystem::Feet;
    }
    return std::nullopt;
}

} // anonymous namespace

geo::Raster read_raster(const std::filesystem::path& path, const RasterReadOptions& options) {
    GDALAllRegister();

    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.string().c_str(),
                                                   GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!dataset) {
        throw ProviderError("Cannot open raster " + path.string());
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        throw ProviderError("Raster " + path.string() + " has no band");
    }

    // GDAL geotransform: [x_origin, pixel_width, 0, y_origin, 0, pixel_height]
    double geotransform[6] = {0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    if (dataset->GetGeoTransform(geotransform) != CE_None) {
        spdlog::warn("Raster source: {} has no geotransform, using pixel coordinates",
                     path.filename().string());
    }
    if (geotransform[2] != 0.0 || geotransform[4] != 0.0) {
        throw ProviderError("Raster " + path.string() + " is rotated, which is not supported");
    }

    geo::Raster raster;
    raster.crs = crs_string(dataset->GetSpatialRef());
    raster.cell_size = glm::dvec2(geotransform[1], geotransform[5]);

    // Pixel window
    int x0 = 0;
    int y0 = 0;
    int x1 = dataset->GetRasterXSize();
    int y1 = dataset->GetRasterYSize();
    if (options.region) {
        geo::Envelope window = options.region->envelope_in(raster.crs);
        double ax = (window.min_x - geotransform[0]) / geotransform[1];
        double bx = (window.max_x - geotransform[0]) / geotransform[1];
        double ay = (window.min_y - geotransform[3]) / geotransform[5];
        double by = (window.max_y - geotransform[3]) / geotransform[5];

        x0 = std::max(x0, static_cast<int>(std::floor(std::min(ax, bx))));
        x1 = std::min(x1, static_cast<int>(std::ceil(std::max(ax, bx))));
        y0 = std::max(y0, static_cast<int>(std::floor(std::min(ay, by))));
        y1 = std::min(y1, static_cast<int>(std::ceil(std::max(ay, by))));
        if (x0 >= x1 || y0 >= y1) {
            throw ProviderError("Region does not overlap raster " + path.string());
        }
    }

    raster.width = x1 - x0;
    raster.height = y1 - y0;
    raster.origin = glm::dvec2(geotransform[0] + x0 * geotransform[1],
                               geotransform[3] + y0 * geotransform[5]);
    raster.data.resize(static_cast<size_t>(raster.width) * raster.height);

    if (band->RasterIO(GF_Read, x0, y0, raster.width, raster.height,
                       raster.data.data(), raster.width, raster.height,
                       GDT_Float64, 0, 0) != CE_None) {
        throw ProviderError("Failed to read raster " + path.string());
    }

    int has_nodata = 0;
    double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) raster.nodata = nodata;

    raster.unit = options.unit ? options.unit : band_unit(*band);

    spdlog::info("Raster source: {}x{} cells from {} ({}, unit {})", raster.width, raster.height,
                 path.filename().string(), raster.crs.empty() ? "no CRS" : raster.crs,
                 raster.unit ? unit_name(*raster.unit) : "undeclared");
    return raster;
}

} // namespace tidemark::io
