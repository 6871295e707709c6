#include "core/application.hpp"
#include "core/errors.hpp"
#include "io/raster_source.hpp"
#include "io/table_source.hpp"
#include <spdlog/spdlog.h>

namespace tidemark {

namespace {

exposure::SpatialJoinRequest join_request(const config::JoinConfig& join) {
    exposure::SpatialJoinRequest request;
    request.attribute = join.attribute;
    request.method = join.method;
    request.max_distance = join.max_distance;
    return request;
}

} // anonymous namespace

bool Application::init(const std::filesystem::path& config_path) {
    try {
        m_config = config::load_config(config_path);
        if (!m_config.region.empty()) {
            m_region = io::read_region(m_config.resolve(m_config.region));
            spdlog::info("Region loaded from {}", m_config.region);
        }
    } catch (const Error& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return false;
    }

    m_builder = exposure::ExposureBuilder(m_config.unit);
    spdlog::info("Configuration loaded, working in {}", unit_name(m_config.unit));
    m_initialized = true;
    return true;
}

bool Application::run() {
    if (!m_initialized) {
        spdlog::error("Application::run() called before init()");
        return false;
    }

    try {
        load_assets();
        load_object_types();
        load_max_damage();
        load_roads();
        load_aggregation();
        load_heights();
        load_vulnerability();
        apply_measures();
        write_outputs();
    } catch (const Error& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    spdlog::info("Exposure ready: {} assets in {} geometry layers",
                 m_builder.model().table.row_count(), m_builder.model().geoms.size());
    return true;
}

void Application::shutdown() {
    m_builder = exposure::ExposureBuilder();
    m_osm.reset();
    m_osm_path.clear();
    m_region.reset();
    m_config = config::PipelineConfig();
    m_initialized = false;
}

// ============================================================================
// Providers
// ============================================================================

geo::GeometryLayer Application::read_layer(const std::string& path, const std::string& layer) const {
    io::VectorReadOptions options;
    options.layer_name = layer;
    options.region = m_region;
    return io::read_vector(m_config.resolve(path), options);
}

const io::OsmLayers& Application::osm_layers(const std::string& path, double simplify_tolerance) {
    std::filesystem::path resolved = m_config.resolve(path);
    if (m_osm && m_osm_path == resolved) return *m_osm;

    io::OsmSourceConfig osm_config;
    osm_config.simplify_geometry = simplify_tolerance > 0.0;
    if (osm_config.simplify_geometry) osm_config.simplify_tolerance = simplify_tolerance;
    if (m_region) osm_config.filter_bounds = m_region->envelope_in("EPSG:4326");

    io::OsmSource source;
    source.set_config(osm_config);
    m_osm = source.read(resolved);
    m_osm_path = resolved;
    return *m_osm;
}

exposure::HeightSource Application::height_source(const config::HeightConfig& height) const {
    switch (height.source) {
        case config::HeightConfig::Source::Constant:
            return exposure::ConstantHeight{height.value};

        case config::HeightConfig::Source::Layer:
            return exposure::LayerHeight{read_layer(height.join.path, height.join.layer),
                                         join_request(height.join)};

        case config::HeightConfig::Source::Raster:
            return raster_height(height);

        case config::HeightConfig::Source::Default:
            break;
    }
    return exposure::DefaultHeight{};
}

exposure::RasterHeight Application::raster_height(const config::HeightConfig& height) const {
    io::RasterReadOptions options;
    options.region = m_region;
    options.unit = height.unit;
    return exposure::RasterHeight{io::read_raster(m_config.resolve(height.raster), options),
                                  height.statistic};
}

std::vector<exposure::AggregationArea> Application::aggregation_areas() const {
    std::vector<exposure::AggregationArea> areas;
    for (const auto& entry : m_config.aggregation) {
        exposure::AggregationArea area;
        area.layer = io::read_vector(m_config.resolve(entry.path));
        if (!entry.name.empty()) area.layer.name = entry.name;
        area.attribute = entry.attribute;
        areas.push_back(std::move(area));
    }
    return areas;
}

exposure::Selection Application::selection(const config::SelectionConfig& selection) const {
    exposure::Selection result;
    result.type = selection.type;
    result.object_types = selection.object_types;
    result.excluded_types = selection.excluded_types;
    result.ids = selection.ids;
    result.aggregation = selection.aggregation;
    result.aggregation_area = selection.aggregation_area;
    if (!selection.polygons.empty()) {
        result.polygons = io::read_vector(m_config.resolve(selection.polygons));
    }
    return result;
}

// ============================================================================
// Pipeline steps
// ============================================================================

void Application::load_assets() {
    const auto& assets = m_config.assets;

    geo::GeometryLayer layer;
    if (assets.source == config::AssetLocationConfig::Source::Osm) {
        layer = osm_layers(assets.path, assets.simplify_tolerance).buildings;
    } else {
        layer = read_layer(assets.path, assets.layer);
    }

    if (layer.empty()) {
        throw UserInputError("No asset locations found in " + assets.path);
    }
    m_builder.setup_asset_locations(layer, assets.extract_method);
}

void Application::load_object_types() {
    if (!m_config.object_types) return;
    const auto& types = *m_config.object_types;

    if (types.method == config::ObjectTypeConfig::Method::SpatialJoin) {
        geo::GeometryLayer land_use = read_layer(types.join.path, types.join.layer);
        m_builder.setup_object_types_from_layer(land_use, join_request(types.join), types.target);
        return;
    }

    exposure::ObjectTypeRequest request;
    request.source_column = types.source_column;
    request.secondary_column = types.secondary_column;
    if (!types.translation_table.empty()) {
        request.translation = io::read_table(m_config.resolve(types.translation_table));
    }
    request.unclassified_fill = types.unclassified_fill;
    request.drop_unclassified = types.drop_unclassified;
    m_builder.setup_object_types(request);
}

void Application::load_max_damage() {
    if (!m_config.max_damage) return;
    const auto& damage = *m_config.max_damage;

    exposure::DamageRequest request;
    request.damage_types = m_config.damage_types;

    auto optional_table = [this](const std::string& path) -> std::optional<AttributeTable> {
        if (path.empty()) return std::nullopt;
        return io::read_table(m_config.resolve(path));
    };

    switch (damage.source) {
        case config::MaxDamageConfig::Source::Constant:
            request.source = exposure::ConstantDamage{damage.value};
            break;

        case config::MaxDamageConfig::Source::Layers: {
            exposure::LayerDamage layers;
            for (const auto& entry : damage.layers) {
                layers.entries.push_back({entry.damage_type,
                                          read_layer(entry.join.path, entry.join.layer),
                                          join_request(entry.join)});
            }
            request.source = std::move(layers);
            break;
        }

        case config::MaxDamageConfig::Source::Jrc:
        case config::MaxDamageConfig::Source::Hazus: {
            exposure::CatalogDamage catalog;
            catalog.catalog = damage.source == config::MaxDamageConfig::Source::Jrc
                                  ? exposure::CatalogDamage::Catalog::Jrc
                                  : exposure::CatalogDamage::Catalog::Hazus;
            catalog.table = optional_table(damage.table);
            catalog.country = damage.country;
            catalog.convert_to_usd = damage.convert_to_usd;
            request.source = std::move(catalog);
            break;
        }

        case config::MaxDamageConfig::Source::Translation: {
            exposure::TranslationDamage translation;
            translation.table = optional_table(damage.table);
            translation.source_column = damage.source_column;
            translation.value_column = damage.value_column;
            request.source = std::move(translation);
            break;
        }
    }
    m_builder.setup_max_damage(request);
}

void Application::load_roads() {
    const auto& roads = m_config.roads;
    if (!roads.enabled) return;

    geo::GeometryLayer layer;
    if (roads.source == config::AssetLocationConfig::Source::Osm) {
        const std::string& path = roads.path.empty() ? m_config.assets.path : roads.path;
        layer = osm_layers(path, m_config.assets.simplify_tolerance).roads;
    } else {
        layer = read_layer(roads.path, roads.layer);
    }

    if (layer.empty()) {
        spdlog::warn("Roads: no road segments found, step skipped");
        return;
    }

    exposure::RoadDamageSource damage = exposure::NoRoadDamage{};
    switch (roads.damage) {
        case config::RoadConfig::Damage::Constant:
            damage = exposure::ConstantRoadDamage{roads.constant};
            break;
        case config::RoadConfig::Damage::Lanes:
            damage = io::parse_lane_costs(io::read_table(m_config.resolve(roads.cost_table)),
                                          roads.cost_column, roads.cost_unit);
            break;
        case config::RoadConfig::Damage::None:
            break;
    }
    m_builder.setup_roads(layer, damage);
}

void Application::load_aggregation() {
    if (m_config.aggregation.empty()) return;
    m_builder.setup_aggregation_labels(aggregation_areas());
}

void Application::load_heights() {
    m_builder.setup_ground_floor_height(height_source(m_config.ground_floor_height));
    m_builder.setup_ground_elevation(height_source(m_config.ground_elevation));
}

void Application::load_vulnerability() {
    if (!m_config.vulnerability) return;
    const auto& vulnerability = *m_config.vulnerability;

    m_builder.set_curves(io::parse_curves(io::read_table(m_config.resolve(vulnerability.curves))));
    auto linking = io::parse_linking_table(
        io::read_table(m_config.resolve(vulnerability.linking)));
    m_builder.setup_vulnerability(linking, m_config.damage_types);
}

void Application::apply_measures() {
    for (const auto& update : m_config.max_damage_updates) {
        m_builder.update_max_damage(io::read_table(m_config.resolve(update.path)));
    }

    for (const auto& measure : m_config.floodproof) {
        m_builder.floodproof(selection(measure.selection), measure.floodproof_to,
                             m_config.damage_types);
    }

    for (const auto& measure : m_config.raise) {
        exposure::RaiseRequest request;
        request.raise_by = measure.raise_by;
        request.reference = measure.reference;
        if (measure.reference == exposure::HeightReference::Geom) {
            request.reference_layer = io::read_vector(m_config.resolve(measure.path));
            request.reference_attribute = measure.attribute;
        } else if (measure.reference == exposure::HeightReference::Table) {
            request.reference_table = io::read_table(m_config.resolve(measure.path));
            request.reference_column = measure.attribute;
        }
        m_builder.raise_ground_floor(selection(measure.selection), std::move(request));
    }

    for (const auto& measure : m_config.growth) {
        exposure::CompositeGrowthSpec spec;
        spec.percent_growth = measure.percent_growth;
        spec.damage_types = m_config.damage_types;
        spec.elevation_reference = measure.elevation_reference;
        spec.areas = io::read_vector(m_config.resolve(measure.path));
        spec.ground_floor_height = measure.ground_floor_height;
        spec.height_attribute = measure.height_attribute;
        if (measure.elevation_reference == exposure::HeightReference::Geom) {
            spec.reference_layer = io::read_vector(m_config.resolve(measure.reference_path));
            spec.reference_attribute = measure.reference_attribute;
        }
        if (measure.ground_elevation) {
            spec.ground_elevation = raster_height(*measure.ground_elevation);
        }
        spec.aggregation = aggregation_areas();
        m_builder.add_composite_growth(spec);
    }
}

void Application::write_outputs() const {
    std::filesystem::path output = m_config.resolve(m_config.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(output, ec);
    if (ec) {
        throw ProviderError("Cannot create output directory " + output.string() + ": " +
                            ec.message());
    }

    const auto& model = m_builder.model();
    io::write_csv(output / EXPOSURE_TABLE_FILE, model.table);
    io::write_geopackage(output / EXPOSURE_GEOMS_FILE, model.geoms);
    if (!m_builder.curves().empty()) {
        io::write_curves(output / CURVES_FILE, m_builder.curves());
    }
    spdlog::info("Outputs written to {}", output.string());
}

} // namespace tidemark
