#include "core/columns.hpp"
#include "core/errors.hpp"
#include "exposure/ground_floor.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace tidemark;
using namespace tidemark::exposure;

namespace {

constexpr const char* CRS = "EPSG:32631";

geo::Geometry square(double x, double y, double size) {
    return geo::Geometry::make_polygon(
        {{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}});
}

/// 4x4 grid of 1 unit cells, origin (0, 4), cell value = column index
geo::Raster ramp_dem() {
    geo::Raster raster;
    raster.width = 4;
    raster.height = 4;
    raster.origin = glm::dvec2(0.0, 4.0);
    raster.cell_size = glm::dvec2(1.0, -1.0);
    raster.data.resize(16);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            raster.set(x, y, static_cast<double>(x));
        }
    }
    return raster;
}

geo::GeometryLayer footprints() {
    geo::GeometryLayer layer;
    layer.name = "buildings";
    layer.geometries = {
        square(0, 0, 2),                           // covers columns 0 and 1
        square(2.1, 2.1, 0.2),                     // no cell center inside
        geo::Geometry::make_point({10.0, 10.0}),   // outside the grid
    };
    layer.attributes.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}});
    return layer;
}

ExposureModel raised_model() {
    ExposureModel model;
    model.table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}, int64_t{4}});
    model.table.set_column(columns::GROUND_FLHT, {0.5, 3.0, Value{}, 0.0});
    model.table.set_column(columns::GROUND_ELEVTN, {1.0, 1.0, 1.0, Value{}});
    return model;
}

/// raised_model() with four 10 m footprints in a row
ExposureModel raised_model_with_footprints() {
    ExposureModel model = raised_model();
    model.crs = CRS;

    geo::GeometryLayer layer;
    layer.name = "buildings";
    layer.crs = CRS;
    for (int i = 0; i < 4; ++i) {
        layer.geometries.push_back(square(500000 + 20.0 * i, 5800000, 10));
    }
    layer.attributes.set_column(columns::OBJECT_ID,
                                {int64_t{1}, int64_t{2}, int64_t{3}, int64_t{4}});
    model.geoms.set(layer);
    return model;
}

} // anonymous namespace

// ============================================================================
// Height sources
// ============================================================================

TEST(GroundFloorTest, DefaultAndConstant) {
    ExposureModel model;
    model.table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});

    AttributeTable defaulted = assign_height_attribute(model, columns::GROUND_FLHT, DefaultHeight{});
    EXPECT_DOUBLE_EQ(*as_number(defaulted.at(columns::GROUND_FLHT, 1)), 0.0);

    AttributeTable constant =
        assign_height_attribute(model, columns::GROUND_FLHT, ConstantHeight{1.5});
    EXPECT_DOUBLE_EQ(*as_number(constant.at(columns::GROUND_FLHT, 0)), 1.5);
    EXPECT_DOUBLE_EQ(*as_number(constant.at(columns::GROUND_FLHT, 1)), 1.5);
}

TEST(GroundFloorTest, DefaultKeepsExistingValues) {
    ExposureModel model;
    model.table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}});
    model.table.set_column(columns::GROUND_FLHT, {1.2, Value{}, 0.4});

    AttributeTable table = assign_height_attribute(model, columns::GROUND_FLHT, DefaultHeight{});
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 0)), 1.2);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 1)), 0.0);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 2)), 0.4);
}

TEST(GroundFloorTest, RasterSamplingFallbacks) {
    RasterHeight source{ramp_dem(), geo::ZonalStatistic::Mean};
    auto values = sample_raster(footprints(), source, UnitSystem::Meters);

    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(*values[0], 0.5);
    EXPECT_DOUBLE_EQ(*values[1], 2.0);   // centroid cell
    EXPECT_DOUBLE_EQ(*values[2], 2.0);   // copied from the closest sampled feature
}

TEST(GroundFloorTest, OutsideFeaturesCopyTheNearestSampledValue) {
    geo::GeometryLayer layer;
    layer.name = "buildings";
    layer.geometries = {
        geo::Geometry::make_point({0.5, 3.5}),     // column 0
        geo::Geometry::make_point({3.5, 0.5}),     // column 3
        geo::Geometry::make_point({-10.0, 3.5}),   // closest to the first
        geo::Geometry::make_point({10.0, 0.5}),    // closest to the second
        geo::Geometry::make_point({12.0, 12.0}),   // equally far from both
    };
    layer.attributes.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3},
                                                     int64_t{4}, int64_t{5}});

    RasterHeight source{ramp_dem(), geo::ZonalStatistic::Mean};
    auto values = sample_raster(layer, source, UnitSystem::Meters);

    ASSERT_EQ(values.size(), 5u);
    EXPECT_DOUBLE_EQ(*values[0], 0.0);
    EXPECT_DOUBLE_EQ(*values[1], 3.0);
    EXPECT_DOUBLE_EQ(*values[2], 0.0);
    EXPECT_DOUBLE_EQ(*values[3], 3.0);
    EXPECT_DOUBLE_EQ(*values[4], 0.0);   // tie goes to the lower row
}

TEST(GroundFloorTest, RasterValuesConvertedToModelUnit) {
    RasterHeight source{ramp_dem(), geo::ZonalStatistic::Max};
    source.raster.unit = UnitSystem::Meters;

    auto values = sample_raster(footprints(), source, UnitSystem::Feet);
    EXPECT_NEAR(*values[0], convert_length(1.0, UnitSystem::Meters, UnitSystem::Feet), 1e-9);
}

TEST(GroundFloorTest, EmptyRasterLeavesValuesUnset) {
    RasterHeight source;
    auto values = sample_raster(footprints(), source, UnitSystem::Meters);
    for (const auto& value : values) {
        EXPECT_FALSE(value);
    }
}

TEST(GroundFloorTest, RasterKeepsExistingValuesWhereUnresolved) {
    ExposureModel model;
    model.table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});
    model.table.set_column(columns::GROUND_ELEVTN, {7.0, 8.0});

    geo::GeometryLayer layer;
    layer.name = "buildings";
    layer.geometries = {square(0, 0, 2), square(100, 100, 2)};
    layer.attributes.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});
    model.geoms.set(layer);

    geo::Raster dem = ramp_dem();
    dem.nodata = -1.0;
    std::fill(dem.data.begin(), dem.data.end(), -1.0);

    AttributeTable table =
        assign_height_attribute(model, columns::GROUND_ELEVTN, RasterHeight{dem});
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_ELEVTN, 0)), 7.0);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_ELEVTN, 1)), 8.0);
    EXPECT_FALSE(table.has_column("__sampled_ground_elevtn"));
}

// ============================================================================
// Raise to level
// ============================================================================

TEST(RaiseGroundFloorTest, RaisesOnlyBelowTarget) {
    ExposureModel model = raised_model();

    RaiseRequest request;
    request.raise_by = 2.0;
    request.reference = HeightReference::Datum;
    request.object_ids = {1, 2, 3, 4};

    AttributeTable table = raise_ground_floor_height(model, request);
    const ValueColumn& floor = table.column(columns::GROUND_FLHT);

    EXPECT_DOUBLE_EQ(*as_number(floor[0]), 1.0);   // 0.5 + 1.0 < 2.0
    EXPECT_DOUBLE_EQ(*as_number(floor[1]), 3.0);   // already above, never lowered
    EXPECT_DOUBLE_EQ(*as_number(floor[2]), 1.0);   // unknown floor counts as needing a raise
    EXPECT_DOUBLE_EQ(*as_number(floor[3]), 2.0);   // unknown elevation counts as 0
}

TEST(RaiseGroundFloorTest, UnselectedAssetsUntouched) {
    ExposureModel model = raised_model();

    RaiseRequest request;
    request.raise_by = 5.0;
    request.object_ids = {2};

    AttributeTable table = raise_ground_floor_height(model, request);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 0)), 0.5);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 1)), 4.0);
}

TEST(RaiseGroundFloorTest, TableReference) {
    ExposureModel model = raised_model();

    AttributeTable levels;
    levels.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});
    levels.set_column("design_level", {3.0, 1.0});

    RaiseRequest request;
    request.raise_by = 0.5;
    request.reference = HeightReference::Table;
    request.object_ids = {1, 2, 3};
    request.reference_table = levels;
    request.reference_column = "design_level";

    AttributeTable table = raise_ground_floor_height(model, request);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 0)), 2.5);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::GROUND_FLHT, 1)), 3.0);
    EXPECT_TRUE(is_null(table.at(columns::GROUND_FLHT, 2)));   // no reference level
}

TEST(RaiseGroundFloorTest, GeomReferenceTakesHighestIntersectingLevel) {
    ExposureModel model = raised_model_with_footprints();

    geo::GeometryLayer levels;
    levels.name = "design_levels";
    levels.crs = CRS;
    levels.geometries = {square(499995, 5799995, 20),    // building 1
                         square(500005, 5799995, 10),    // building 1, higher level
                         square(500021, 5800001, 5)};    // building 2
    levels.attributes = AttributeTable(3);
    levels.attributes.set_column("level", {2.0, 3.5, 1.0});

    RaiseRequest request;
    request.raise_by = 0.5;
    request.reference = HeightReference::Geom;
    request.object_ids = {1, 2, 3, 4};
    request.reference_layer = levels;
    request.reference_attribute = "level";

    AttributeTable table = raise_ground_floor_height(model, request);
    const ValueColumn& floor = table.column(columns::GROUND_FLHT);

    EXPECT_DOUBLE_EQ(*as_number(floor[0]), 3.0);   // 3.5 + 0.5 - elevation 1.0
    EXPECT_DOUBLE_EQ(*as_number(floor[1]), 3.0);   // already above 1.5
    EXPECT_TRUE(is_null(floor[2]));                // outside every level polygon
    EXPECT_DOUBLE_EQ(*as_number(floor[3]), 0.0);   // outside every level polygon
}

TEST(RaiseGroundFloorTest, MissingReferenceInputs) {
    ExposureModel model = raised_model();

    RaiseRequest request;
    request.raise_by = 1.0;
    request.object_ids = {1};

    request.reference = HeightReference::Table;
    EXPECT_THROW((void)raise_ground_floor_height(model, request), UserInputError);

    request.reference = HeightReference::Geom;
    EXPECT_THROW((void)raise_ground_floor_height(model, request), UserInputError);

    model.table.drop_column(columns::GROUND_ELEVTN);
    request.reference = HeightReference::Datum;
    EXPECT_THROW((void)raise_ground_floor_height(model, request), MissingColumnError);
}

TEST(RaiseGroundFloorTest, ParseReference) {
    EXPECT_EQ(parse_height_reference("DATUM"), HeightReference::Datum);
    EXPECT_EQ(parse_height_reference("geom"), HeightReference::Geom);
    EXPECT_FALSE(parse_height_reference("sea"));
}
