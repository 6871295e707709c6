/**
 * @file application.hpp
 * @brief Command line runner for Tidemark
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * This file contains the Application class which loads a pipeline
 * configuration, runs the exposure preparation steps and writes the
 * results.
 */

#pragma once

#include "config/pipeline_config.hpp"
#include "exposure/exposure_builder.hpp"
#include "io/osm_source.hpp"
#include "io/vector_source.hpp"
#include <filesystem>
#include <optional>
#include <vector>

/**
 * @namespace tidemark
 * @brief Root namespace for all Tidemark code
 *
 * The tidemark namespace contains the types and functions that prepare
 * flood exposure data: asset locations, object types, damage values,
 * heights, vulnerability links and adaptation measures.
 */
namespace tidemark {

/// Output file names, written to the configured output directory
constexpr const char* EXPOSURE_TABLE_FILE = "exposure.csv";
constexpr const char* EXPOSURE_GEOMS_FILE = "exposure_geoms.gpkg";
constexpr const char* CURVES_FILE = "curves.csv";

/**
 * @brief Runs one exposure preparation from a configuration file
 *
 * The Application drives an ExposureBuilder through the configured
 * steps in dependency order:
 * - asset locations (OSM or a vector file), clipped to the region
 * - object types, maximum damage, roads
 * - aggregation labels, ground floor height, ground elevation
 * - damage curves and vulnerability links
 * - floodproofing, raised floors and composite growth areas
 *
 * @note This class is non-copyable as it owns the exposure being built.
 *
 * Typical usage:
 * @code
 * int main() {
 *     tidemark::Application app;
 *
 *     if (!app.init("config.yaml")) {
 *         return 1;
 *     }
 *
 *     bool ok = app.run();
 *     app.shutdown();
 *
 *     return ok ? 0 : 1;
 * }
 * @endcode
 *
 * @see exposure::ExposureBuilder
 */
class Application {
public:
    Application() = default;
    ~Application() = default;

    /// @name Deleted Copy Operations
    /// @{
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    /// @}

    /**
     * @brief Load the configuration and the region of interest
     *
     * @param config_path YAML configuration file
     * @return true if the configuration is valid
     * @return false if it could not be loaded; the reason is logged
     */
    bool init(const std::filesystem::path& config_path);

    /**
     * @brief Run every configured step and write the outputs
     *
     * @pre init() must have been called and returned true
     * @return true if the exposure was built and written
     * @return false if a step failed; the error is logged
     */
    bool run();

    /**
     * @brief Release the exposure and configuration
     *
     * Safe to call multiple times.
     */
    void shutdown();

    /// @name Accessors
    /// @{
    [[nodiscard]] const config::PipelineConfig& get_config() const { return m_config; }
    [[nodiscard]] const exposure::ExposureBuilder& get_builder() const { return m_builder; }
    [[nodiscard]] bool is_initialized() const { return m_initialized; }
    /// @}

private:
    /// @name Pipeline steps
    /// @{
    void load_assets();
    void load_object_types();
    void load_max_damage();
    void load_roads();
    void load_aggregation();
    void load_heights();
    void load_vulnerability();
    void apply_measures();
    void write_outputs() const;
    /// @}

    /// @name Providers
    /// @{
    [[nodiscard]] geo::GeometryLayer read_layer(const std::string& path,
                                                const std::string& layer) const;
    [[nodiscard]] const io::OsmLayers& osm_layers(const std::string& path, double simplify_tolerance);
    [[nodiscard]] exposure::HeightSource height_source(const config::HeightConfig& height) const;
    [[nodiscard]] exposure::RasterHeight raster_height(const config::HeightConfig& height) const;
    [[nodiscard]] std::vector<exposure::AggregationArea> aggregation_areas() const;
    [[nodiscard]] exposure::Selection selection(const config::SelectionConfig& selection) const;
    /// @}

    config::PipelineConfig m_config;            ///< Loaded configuration
    std::optional<io::Region> m_region;         ///< Region of interest, if configured
    std::optional<io::OsmLayers> m_osm;         ///< OSM layers, read once per run
    std::filesystem::path m_osm_path;           ///< File m_osm was read from
    exposure::ExposureBuilder m_builder;        ///< Exposure under construction
    bool m_initialized = false;                 ///< Flag set by a successful init()
};

} // namespace tidemark
