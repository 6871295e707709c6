#include "core/errors.hpp"
#include "geo/crs.hpp"
#include "geo/geometry.hpp"
#include "geo/layer.hpp"
#include "geo/raster.hpp"
#include "geo/spatial_index.hpp"
#include <gtest/gtest.h>

using namespace tidemark;
using namespace tidemark::geo;

namespace {

Geometry square(double x, double y, double size) {
    return Geometry::make_polygon({{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}});
}

Raster ramp_raster() {
    // 4x4 cells of 1 unit, origin at (0, 4), values = column index
    Raster raster;
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

} // anonymous namespace

// ============================================================================
// Geometry
// ============================================================================

TEST(GeometryTest, RingAreaAndWinding) {
    Ring ring = {{0, 0}, {0, 2}, {2, 2}, {2, 0}};
    EXPECT_TRUE(is_clockwise(ring));
    EXPECT_DOUBLE_EQ(ring_area(ring), -4.0);

    ensure_ccw(ring);
    EXPECT_FALSE(is_clockwise(ring));
    EXPECT_DOUBLE_EQ(ring_area(ring), 4.0);
}

TEST(GeometryTest, PolygonAreaSubtractsHoles) {
    Geometry polygon = Geometry::make_polygon({{0, 0}, {10, 0}, {10, 10}, {0, 10}},
                                              {{{2, 2}, {4, 2}, {4, 4}, {2, 4}}});
    EXPECT_DOUBLE_EQ(area(polygon), 96.0);
    EXPECT_FALSE(contains(polygon, glm::dvec2(3, 3)));
    EXPECT_TRUE(contains(polygon, glm::dvec2(6, 6)));
}

TEST(GeometryTest, RepresentativePoints) {
    EXPECT_EQ(representative_point(Geometry::make_point({3, 4})), glm::dvec2(3, 4));

    glm::dvec2 c = representative_point(square(0, 0, 2));
    EXPECT_NEAR(c.x, 1.0, 1e-12);
    EXPECT_NEAR(c.y, 1.0, 1e-12);

    glm::dvec2 m = representative_point(Geometry::make_line({{0, 0}, {4, 0}}));
    EXPECT_NEAR(m.x, 2.0, 1e-12);
}

TEST(GeometryTest, LargestPartKeepsBiggestPolygon) {
    Geometry multi;
    multi.type = GeometryType::Polygon;
    multi.polygons.push_back(square(0, 0, 1).polygons.front());
    multi.polygons.push_back(square(5, 5, 3).polygons.front());

    Geometry single = largest_part(multi);
    ASSERT_EQ(single.polygons.size(), 1u);
    EXPECT_DOUBLE_EQ(area(single), 9.0);
}

TEST(GeometryTest, LineLengthAndSimplify) {
    Geometry line = Geometry::make_line({{0, 0}, {3, 0}, {3, 4}});
    EXPECT_DOUBLE_EQ(length(line), 7.0);

    Ring nearly_straight = {{0, 0}, {1, 0.01}, {2, 0}};
    EXPECT_EQ(simplify(nearly_straight, 0.1).size(), 2u);
}

// ============================================================================
// Spatial index
// ============================================================================

TEST(SpatialIndexTest, WindowQueryReturnsOverlappingFeatures) {
    std::vector<Geometry> geometries = {square(0, 0, 1), square(10, 10, 1), square(20, 0, 1)};
    SpatialIndex index;
    index.build(geometries);

    Envelope window;
    window.expand(glm::dvec2(9, 9));
    window.expand(glm::dvec2(12, 12));

    auto hits = index.query(window);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits.front(), 1u);
}

// ============================================================================
// Raster
// ============================================================================

TEST(RasterTest, CellLookup) {
    Raster raster = ramp_raster();
    EXPECT_EQ(raster.world_to_cell(glm::dvec2(2.5, 3.5)), glm::ivec2(2, 0));
    EXPECT_DOUBLE_EQ(*raster.sample_nearest(glm::dvec2(2.5, 3.5)), 2.0);
    EXPECT_FALSE(raster.sample_nearest(glm::dvec2(-1.0, 1.0)));
}

TEST(RasterTest, ZonalStatistics) {
    Raster raster = ramp_raster();
    Geometry footprint = square(0, 0, 2);   // columns 0 and 1, rows 2 and 3

    EXPECT_DOUBLE_EQ(*raster.zonal(footprint, ZonalStatistic::Mean), 0.5);
    EXPECT_DOUBLE_EQ(*raster.zonal(footprint, ZonalStatistic::Min), 0.0);
    EXPECT_DOUBLE_EQ(*raster.zonal(footprint, ZonalStatistic::Max), 1.0);
    EXPECT_DOUBLE_EQ(*raster.zonal(footprint, ZonalStatistic::Median), 0.5);
}

TEST(RasterTest, NodataCellsAreSkipped) {
    Raster raster = ramp_raster();
    raster.nodata = -9999.0;
    raster.set(1, 2, -9999.0);
    raster.set(1, 3, -9999.0);

    EXPECT_DOUBLE_EQ(*raster.zonal(square(0, 0, 2)), 0.0);
}

TEST(RasterTest, FootprintWithoutCellCentersHasNoValue) {
    Raster raster = ramp_raster();
    EXPECT_FALSE(raster.zonal(square(0.1, 0.1, 0.2)));
}

TEST(RasterTest, ParseStatistic) {
    EXPECT_EQ(parse_zonal_statistic("MEDIAN"), ZonalStatistic::Median);
    EXPECT_FALSE(parse_zonal_statistic("mode"));
}

// ============================================================================
// CRS and layers
// ============================================================================

TEST(CrsTest, UtmZoneFromLongitude) {
    EXPECT_EQ(utm_crs(glm::dvec2(4.9, 52.37)), "EPSG:32631");
    EXPECT_EQ(utm_crs(glm::dvec2(-43.2, -22.9)), "EPSG:32723");
}

TEST(CrsTest, HarmonizeRequiresBothSystems) {
    GeometryLayer left;
    left.name = "exposure";
    left.crs = "EPSG:32631";

    GeometryLayer right;
    right.name = "land_use";

    EXPECT_THROW((void)harmonize(left, right), CrsMissingError);
    EXPECT_THROW((void)harmonize(right, left), CrsMissingError);
}

TEST(CrsTest, HarmonizeKeepsMatchingLayer) {
    GeometryLayer left;
    left.crs = "EPSG:32631";

    GeometryLayer right;
    right.crs = "EPSG:32631";
    right.geometries.push_back(Geometry::make_point({100.0, 200.0}));

    GeometryLayer result = harmonize(left, right);
    EXPECT_EQ(result.geometries.front().point, glm::dvec2(100.0, 200.0));
}

TEST(LayerTest, ReplacingKeepsPosition) {
    GeometryLayers layers;
    GeometryLayer a;
    a.name = "buildings";
    GeometryLayer b;
    b.name = "roads";
    layers.set(a);
    layers.set(b);

    a.crs = "EPSG:32631";
    layers.set(a);

    ASSERT_EQ(layers.names().size(), 2u);
    EXPECT_EQ(layers.names().front(), "buildings");
    EXPECT_EQ(layers.get("buildings").crs, "EPSG:32631");
    EXPECT_THROW((void)layers.get("land_use"), UserInputError);
}
