#include "core/columns.hpp"
#include "core/errors.hpp"
#include "exposure/spatial_join.hpp"
#include <gtest/gtest.h>

using namespace tidemark;
using namespace tidemark::exposure;

namespace {

constexpr const char* CRS = "EPSG:32631";

geo::Geometry square(double x, double y, double size) {
    return geo::Geometry::make_polygon(
        {{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}});
}

geo::GeometryLayer point_layer(const std::string& name, const std::vector<glm::dvec2>& points) {
    geo::GeometryLayer layer;
    layer.name = name;
    layer.crs = CRS;
    ValueColumn ids;
    for (size_t i = 0; i < points.size(); ++i) {
        layer.geometries.push_back(geo::Geometry::make_point(points[i]));
        ids.push_back(static_cast<int64_t>(i + 1));
    }
    layer.attributes = AttributeTable(points.size());
    layer.attributes.set_column(columns::OBJECT_ID, ids);
    return layer;
}

geo::GeometryLayer zone_layer(const std::vector<geo::Geometry>& zones, ValueColumn values) {
    geo::GeometryLayer layer;
    layer.name = "zones";
    layer.crs = CRS;
    layer.geometries = zones;
    layer.attributes.set_column("value", std::move(values));
    return layer;
}

} // anonymous namespace

// ============================================================================
// Nearest
// ============================================================================

TEST(SpatialJoinTest, OneValuePerPrimaryFeature) {
    auto assets = point_layer("assets", {{0, 0}, {100, 0}, {200, 0}});
    auto reference = point_layer("reference", {{1, 0}, {1, 1}, {101, 0}});
    reference.attributes.set_column("value", {1.0, 2.0, 3.0});

    ValueColumn joined = join_attribute(assets, reference, {"value", JoinMethod::Nearest, 10.0});

    ASSERT_EQ(joined.size(), assets.size());
    EXPECT_DOUBLE_EQ(*as_number(joined[0]), 1.0);
    EXPECT_DOUBLE_EQ(*as_number(joined[1]), 3.0);
    EXPECT_TRUE(is_null(joined[2]));
}

TEST(SpatialJoinTest, NearestBeyondMaxDistanceIsNull) {
    auto assets = point_layer("assets", {{0, 0}});
    auto reference = point_layer("reference", {{15, 0}});
    reference.attributes.set_column("value", {4.0});

    ValueColumn joined = join_attribute(assets, reference, {"value", JoinMethod::Nearest, 10.0});
    EXPECT_TRUE(is_null(joined[0]));
}

TEST(SpatialJoinTest, MaxDistanceIsInclusive) {
    auto assets = point_layer("assets", {{0, 0}});
    auto reference = point_layer("reference", {{10, 0}});
    reference.attributes.set_column("value", {4.0});

    ValueColumn joined = join_attribute(assets, reference, {"value", JoinMethod::Nearest, 10.0});
    EXPECT_DOUBLE_EQ(*as_number(joined[0]), 4.0);
}

TEST(SpatialJoinTest, TiesGoToLowestReferenceRow) {
    auto assets = point_layer("assets", {{0, 0}});
    auto reference = point_layer("reference", {{5, 0}, {-5, 0}});
    reference.attributes.set_column("value", {std::string("first"), std::string("second")});

    ValueColumn joined = join_attribute(assets, reference, {"value", JoinMethod::Nearest, 10.0});
    EXPECT_EQ(std::get<std::string>(joined[0]), "first");
}

// ============================================================================
// Intersection
// ============================================================================

TEST(SpatialJoinTest, PointTakesContainingPolygon) {
    auto assets = point_layer("assets", {{5, 5}, {15, 5}, {50, 50}});
    auto zones = zone_layer({square(0, 0, 10), square(10, 0, 10)},
                            {std::string("north"), std::string("south")});

    ValueColumn joined = join_attribute(assets, zones, {"value", JoinMethod::Intersection, 0.0});
    EXPECT_EQ(std::get<std::string>(joined[0]), "north");
    EXPECT_EQ(std::get<std::string>(joined[1]), "south");
    EXPECT_TRUE(is_null(joined[2]));
}

TEST(SpatialJoinTest, PolygonTakesLargestOverlap) {
    geo::GeometryLayer assets;
    assets.name = "assets";
    assets.crs = CRS;
    assets.geometries.push_back(square(8, 0, 4));     // 2 units in each zone
    assets.geometries.push_back(square(7, 0, 4));     // 3 units in zone a, 1 in zone b
    assets.attributes.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});

    auto zones = zone_layer({square(0, 0, 10), square(10, 0, 10)},
                            {std::string("a"), std::string("b")});

    ValueColumn joined = join_attribute(assets, zones, {"value", JoinMethod::Intersection, 0.0});
    EXPECT_EQ(std::get<std::string>(joined[0]), "a");    // equal overlap, lowest row wins
    EXPECT_EQ(std::get<std::string>(joined[1]), "a");
}

TEST(SpatialJoinTest, LinesAreNotSupportedByIntersection) {
    geo::GeometryLayer roads;
    roads.name = "roads";
    roads.crs = CRS;
    roads.geometries.push_back(geo::Geometry::make_line({{0, 0}, {10, 0}}));
    roads.attributes.set_column(columns::OBJECT_ID, {int64_t{1}});

    auto zones = zone_layer({square(0, 0, 10)}, {std::string("a")});
    EXPECT_THROW((void)join_attribute(roads, zones, {"value", JoinMethod::Intersection, 0.0}),
                 JoinMethodUnsupportedError);
}

// ============================================================================
// Errors and table helpers
// ============================================================================

TEST(SpatialJoinTest, MissingCrsIsRejected) {
    auto assets = point_layer("assets", {{0, 0}});
    auto reference = point_layer("reference", {{1, 0}});
    reference.crs.clear();
    reference.attributes.set_column("value", {1.0});

    EXPECT_THROW((void)join_attribute(assets, reference, {"value"}), CrsMissingError);
}

TEST(SpatialJoinTest, MissingAttributeIsRejected) {
    auto assets = point_layer("assets", {{0, 0}});
    auto reference = point_layer("reference", {{1, 0}});
    EXPECT_THROW((void)join_attribute(assets, reference, {"value"}), MissingColumnError);
}

TEST(SpatialJoinTest, MaxIntersectingTakesLargestValue) {
    auto assets = point_layer("assets", {{5, 5}, {50, 50}});
    auto zones = zone_layer({square(0, 0, 10), square(2, 2, 6)}, {1.5, 3.0});

    ValueColumn levels = join_max_intersecting(assets, zones, "value");
    EXPECT_DOUBLE_EQ(*as_number(levels[0]), 3.0);
    EXPECT_TRUE(is_null(levels[1]));
}

TEST(SpatialJoinTest, JoinIntoTableKeepsUnmatchedValues) {
    auto assets = point_layer("assets", {{0, 0}, {100, 0}});
    auto reference = point_layer("reference", {{1, 0}});
    reference.attributes.set_column("value", {std::string("residential")});

    AttributeTable table;
    table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});
    table.set_column(columns::PRIMARY_OBJECT_TYPE,
                     {std::string("unknown"), std::string("commercial")});

    table = join_into_table(table, assets, reference, {"value"}, columns::PRIMARY_OBJECT_TYPE);

    EXPECT_EQ(std::get<std::string>(table.at(columns::PRIMARY_OBJECT_TYPE, 0)), "residential");
    EXPECT_EQ(std::get<std::string>(table.at(columns::PRIMARY_OBJECT_TYPE, 1)), "commercial");
    EXPECT_EQ(table.column_count(), 2u);
}

TEST(SpatialJoinTest, ParseMethodNames) {
    EXPECT_EQ(parse_join_method("sjoin_nearest"), JoinMethod::Nearest);
    EXPECT_EQ(parse_join_method("Intersection"), JoinMethod::Intersection);
    EXPECT_FALSE(parse_join_method("within"));
}
