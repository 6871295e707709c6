#include "io/vector_source.hpp"
#include "io/ogr_util.hpp"
#include "core/errors.hpp"
#include "geo/crs.hpp"
#include <gdal_priv.h>
#include <ogr_feature.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>
#include <spdlog/spdlog.h>
#include <memory>

namespace tidemark::io {

namespace {

// ============================================================================
// OGR to Geometry
// ============================================================================

geo::Ring from_ogr_curve(const OGRSimpleCurve* curve) {
    geo::Ring ring;
    if (!curve) return ring;
    ring.reserve(static_cast<size_t>(curve->getNumPoints()));
    for (int i = 0; i < curve->getNumPoints(); ++i) {
        ring.emplace_back(curve->getX(i), curve->getY(i));
    }
    return ring;
}

geo::Polygon from_ogr_polygon(const OGRPolygon* polygon) {
    geo::Polygon result;
    result.outer = from_ogr_curve(polygon->getExteriorRing());
    for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
        result.holes.push_back(from_ogr_curve(polygon->getInteriorRing(i)));
    }
    return result;
}

/**
 * @brief Convert an OGR geometry; unsupported types become Empty
 */
geo::Geometry from_ogr(const OGRGeometry* geometry) {
    geo::Geometry result;
    if (!geometry || geometry->IsEmpty()) return result;

    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPoint: {
            const OGRPoint* point = geometry->toPoint();
            return geo::Geometry::make_point(glm::dvec2(point->getX(), point->getY()));
        }
        case wkbMultiPoint: {
            // First member stands for the feature
            const OGRMultiPoint* multi = geometry->toMultiPoint();
            const OGRPoint* point = multi->getGeometryRef(0);
            return geo::Geometry::make_point(glm::dvec2(point->getX(), point->getY()));
        }
        case wkbLineString:
            return geo::Geometry::make_line(from_ogr_curve(geometry->toLineString()));
        case wkbMultiLineString: {
            const OGRMultiLineString* multi = geometry->toMultiLineString();
            result.type = geo::GeometryType::LineString;
            for (int i = 0; i < multi->getNumGeometries(); ++i) {
                result.lines.push_back(from_ogr_curve(multi->getGeometryRef(i)));
            }
            return result;
        }
        case wkbPolygon:
            result.type = geo::GeometryType::Polygon;
            result.polygons.push_back(from_ogr_polygon(geometry->toPolygon()));
            return result;
        case wkbMultiPolygon: {
            const OGRMultiPolygon* multi = geometry->toMultiPolygon();
            result.type = geo::GeometryType::Polygon;
            for (int i = 0; i < multi->getNumGeometries(); ++i) {
                result.polygons.push_back(from_ogr_polygon(multi->getGeometryRef(i)));
            }
            return result;
        }
        default:
            return result;
    }
}

// ============================================================================
// Geometry to OGR
// ============================================================================

std::unique_ptr<OGRLineString> to_ogr_line(const geo::Ring& line) {
    auto ogr_line = std::make_unique<OGRLineString>();
    for (const auto& p : line) {
        ogr_line->addPoint(p.x, p.y);
    }
    return ogr_line;
}

std::unique_ptr<OGRPolygon> to_ogr_polygon(const geo::Polygon& polygon) {
    auto make_ring = [](const geo::Ring& ring) {
        auto* ogr_ring = new OGRLinearRing();
        for (const auto& p : ring) {
            ogr_ring->addPoint(p.x, p.y);
        }
        ogr_ring->closeRings();
        return ogr_ring;
    };

    auto ogr_polygon = std::make_unique<OGRPolygon>();
    ogr_polygon->addRingDirectly(make_ring(polygon.outer));
    for (const auto& hole : polygon.holes) {
        ogr_polygon->addRingDirectly(make_ring(hole));
    }
    return ogr_polygon;
}

std::unique_ptr<OGRGeometry> to_ogr(const geo::Geometry& geometry) {
    switch (geometry.type) {
        case geo::GeometryType::Point:
            return std::make_unique<OGRPoint>(geometry.point.x, geometry.point.y);

        case geo::GeometryType::LineString: {
            if (geometry.lines.size() == 1) return to_ogr_line(geometry.lines.front());
            auto multi = std::make_unique<OGRMultiLineString>();
            for (const auto& line : geometry.lines) {
                multi->addGeometryDirectly(to_ogr_line(line).release());
            }
            return multi;
        }

        case geo::GeometryType::Polygon: {
            if (geometry.polygons.size() == 1) return to_ogr_polygon(geometry.polygons.front());
            auto multi = std::make_unique<OGRMultiPolygon>();
            for (const auto& polygon : geometry.polygons) {
                multi->addGeometryDirectly(to_ogr_polygon(polygon).release());
            }
            return multi;
        }

        case geo::GeometryType::Empty:
            break;
    }
    return nullptr;
}

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Narrowest OGR field type holding every value of a column
 */
OGRFieldType field_type(const ValueColumn& values) {
    OGRFieldType type = OFTInteger64;
    for (const auto& value : values) {
        if (std::holds_alternative<std::string>(value)) return OFTString;
        if (std::holds_alternative<double>(value)) type = OFTReal;
    }
    return type;
}

} // anonymous namespace

// ============================================================================
// Region
// ============================================================================

geo::Envelope Region::envelope_in(const std::string& target_crs) const {
    if (crs.empty() || target_crs.empty() || geo::same_crs(crs, target_crs)) {
        return geo::envelope(area);
    }
    geo::CrsTransformer transformer(crs, target_crs);
    return geo::envelope(transformer.transform(area));
}

// ============================================================================
// Reading
// ============================================================================

geo::GeometryLayer read_vector(const std::filesystem::path& path, const VectorReadOptions& options) {
    GDALAllRegister();

    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.string().c_str(),
                                                   GDAL_OF_VECTOR | GDAL_OF_READONLY));
    if (!dataset) {
        throw ProviderError("Cannot open vector file " + path.string());
    }

    OGRLayer* ogr_layer = options.layer_name.empty()
                              ? dataset->GetLayer(0)
                              : dataset->GetLayerByName(options.layer_name.c_str());
    if (!ogr_layer) {
        throw ProviderError("No layer '" + options.layer_name + "' in " + path.string());
    }

    geo::GeometryLayer layer;
    layer.name = options.layer_name.empty() ? path.stem().string() : options.layer_name;
    layer.crs = crs_string(ogr_layer->GetSpatialRef());

    if (options.region) {
        geo::Envelope window = options.region->envelope_in(layer.crs);
        ogr_layer->SetSpatialFilterRect(window.min_x, window.min_y, window.max_x, window.max_y);
    }

    OGRFeatureDefn* definition = ogr_layer->GetLayerDefn();
    const int field_count = definition->GetFieldCount();
    std::vector<ValueColumn> fields(static_cast<size_t>(field_count));

    size_t unsupported = 0;
    ogr_layer->ResetReading();
    OGRFeature* raw = nullptr;
    while ((raw = ogr_layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feature(raw);

        geo::Geometry geometry = from_ogr(feature->GetGeometryRef());
        if (geometry.is_empty()) ++unsupported;
        layer.geometries.push_back(std::move(geometry));

        for (int i = 0; i < field_count; ++i) {
            fields[static_cast<size_t>(i)].push_back(field_value(*feature, i));
        }
    }

    layer.attributes = AttributeTable(layer.geometries.size());
    for (int i = 0; i < field_count; ++i) {
        layer.attributes.set_column(definition->GetFieldDefn(i)->GetNameRef(),
                                    std::move(fields[static_cast<size_t>(i)]));
    }

    if (unsupported > 0) {
        spdlog::warn("Vector source: {} features of '{}' have an empty or unsupported geometry",
                     unsupported, layer.name);
    }
    spdlog::info("Vector source: read {} features from {} ({})", layer.size(),
                 path.filename().string(), layer.crs.empty() ? "no CRS" : layer.crs);
    return layer;
}

Region read_region(const std::filesystem::path& path) {
    geo::GeometryLayer layer = read_vector(path);
    for (const auto& geometry : layer.geometries) {
        if (geometry.is_polygon()) {
            return Region{geometry, layer.crs};
        }
    }
    throw ProviderError("Region file " + path.string() + " holds no polygon");
}

// ============================================================================
// Writing
// ============================================================================

void write_geopackage(const std::filesystem::path& path, const geo::GeometryLayers& layers) {
    GDALAllRegister();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GPKG");
    if (!driver) {
        throw ProviderError("GDAL has no GPKG driver");
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);

    GDALDatasetUniquePtr dataset(driver->Create(path.string().c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        throw ProviderError("Cannot create " + path.string());
    }

    for (const auto& layer : layers) {
        OGRSpatialReference srs;
        bool has_srs = layer.has_crs() && srs.SetFromUserInput(layer.crs.c_str()) == OGRERR_NONE;
        if (has_srs) srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        OGRLayer* ogr_layer = dataset->CreateLayer(layer.name.c_str(), has_srs ? &srs : nullptr,
                                                   wkbUnknown, nullptr);
        if (!ogr_layer) {
            throw ProviderError("Cannot create layer '" + layer.name + "' in " + path.string());
        }

        const auto& names = layer.attributes.column_names();
        std::vector<OGRFieldType> types;
        for (const auto& name : names) {
            OGRFieldDefn field(name.c_str(), field_type(layer.attributes.column(name)));
            if (ogr_layer->CreateField(&field) != OGRERR_NONE) {
                throw ProviderError("Cannot create field '" + name + "' in layer '" + layer.name + "'");
            }
            types.push_back(field.GetType());
        }

        for (size_t row = 0; row < layer.size(); ++row) {
            OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(ogr_layer->GetLayerDefn()));

            for (size_t i = 0; i < names.size(); ++i) {
                const Value& value = layer.attributes.at(names[i], row);
                int index = static_cast<int>(i);
                if (is_null(value)) {
                    feature->SetFieldNull(index);
                } else if (types[i] == OFTInteger64) {
                    feature->SetField(index, static_cast<GIntBig>(*as_integer(value)));
                } else if (types[i] == OFTReal) {
                    feature->SetField(index, *as_number(value));
                } else {
                    feature->SetField(index, to_display(value).c_str());
                }
            }

            if (auto geometry = to_ogr(layer.geometries[row])) {
                feature->SetGeometryDirectly(geometry.release());
            }
            if (ogr_layer->CreateFeature(feature.get()) != OGRERR_NONE) {
                throw ProviderError("Cannot write feature " + std::to_string(row) + " of layer '" +
                                    layer.name + "'");
            }
        }
        spdlog::info("Vector source: wrote {} features to layer '{}' of {}", layer.size(),
                     layer.name, path.filename().string());
    }
}

} // namespace tidemark::io
