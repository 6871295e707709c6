#include "core/columns.hpp"
#include "core/errors.hpp"
#include "exposure/damage_values.hpp"
#include <gtest/gtest.h>

using namespace tidemark;
using namespace tidemark::exposure;

namespace {

constexpr const char* CRS = "EPSG:32631";

geo::Geometry square(double x, double y, double size) {
    return geo::Geometry::make_polygon(
        {{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}});
}

/// Two 10 x 10 m buildings: a house and a shop
ExposureModel two_buildings() {
    ExposureModel model;
    model.crs = CRS;
    model.table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});
    model.table.set_column(columns::PRIMARY_OBJECT_TYPE,
                           {std::string("residential"), std::string("commercial")});

    geo::GeometryLayer layer;
    layer.name = "buildings";
    layer.crs = CRS;
    layer.geometries = {square(500000, 5800000, 10), square(500100, 5800000, 10)};
    layer.attributes.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}});
    model.geoms.set(layer);
    return model;
}

AttributeTable jrc_catalog() {
    AttributeTable catalog;
    catalog.set_column(JRC_COUNTRY, {std::string("World"), std::string("Netherlands")});
    catalog.set_column("Construction Cost Residential (2010 €)", {500.0, 1000.0});
    catalog.set_column("Construction Cost Commercial (2010 €)", {600.0, 1200.0});
    catalog.set_column("Construction Cost Industrial (2010 €)", {400.0, 800.0});
    return catalog;
}

} // anonymous namespace

// ============================================================================
// Catalogs
// ============================================================================

TEST(DamageValuesTest, JrcAdjustedValues) {
    DamageValueTable values = preprocess_jrc(jrc_catalog(), "netherlands");

    // 1000 x 0.6 x (1 - 0.4) x 1.0
    EXPECT_NEAR(*values.lookup("residential", "structure"), 360.0, 1e-9);
    EXPECT_NEAR(*values.lookup("residential", "content"), 180.0, 1e-9);
    EXPECT_NEAR(*values.lookup("residential", "total"), 540.0, 1e-9);
    EXPECT_NEAR(*values.lookup("commercial", "content"), 432.0, 1e-9);
    EXPECT_EQ(values.area_unit, UnitSystem::Meters);
}

TEST(DamageValuesTest, JrcUnknownCountryFallsBackToWorld) {
    DamageValueTable values = preprocess_jrc(jrc_catalog(), "Atlantis");
    EXPECT_NEAR(*values.lookup("residential", "structure"), 180.0, 1e-9);

    DamageValueTable unnamed = preprocess_jrc(jrc_catalog(), "");
    EXPECT_NEAR(*unnamed.lookup("residential", "structure"), 180.0, 1e-9);
}

TEST(DamageValuesTest, JrcCurrencyConversion) {
    DamageValueTable values = preprocess_jrc(jrc_catalog(), "Netherlands",
                                             default_jrc_adjustments(), EUR2010_TO_USD);
    EXPECT_NEAR(*values.lookup("residential", "structure"), 360.0 * EUR2010_TO_USD, 1e-9);
}

TEST(DamageValuesTest, JrcWithoutWorldRowThrows) {
    AttributeTable catalog = jrc_catalog().select_rows({1});
    EXPECT_THROW((void)preprocess_jrc(catalog, "Belgium"), UserInputError);
}

TEST(DamageValuesTest, HazusContentPercent) {
    AttributeTable catalog;
    catalog.set_column(HAZUS_OCCUPANCY, {std::string("RES1"), std::string("COM1")});
    catalog.set_column(HAZUS_STRUCTURE, {100.0, 80.0});
    catalog.set_column(HAZUS_CONTENT_PERCENT, {50.0, 100.0});

    DamageValueTable values = preprocess_hazus(catalog);
    EXPECT_DOUBLE_EQ(*values.lookup("RES1", "content"), 50.0);
    EXPECT_DOUBLE_EQ(*values.lookup("COM1", "total"), 160.0);
    EXPECT_EQ(values.area_unit, UnitSystem::Feet);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(DamageValuesTest, ConstantFillsEveryType) {
    ExposureModel model = two_buildings();
    DamageRequest request{ConstantDamage{25.0}, {"structure", "content"}};

    AttributeTable table = assign_max_damage(model, request);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::max_damage("structure"), 0)), 25.0);
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::max_damage("content"), 1)), 25.0);
}

TEST(DamageValuesTest, JrcMultipliesByFootprint) {
    ExposureModel model = two_buildings();
    CatalogDamage catalog;
    catalog.table = jrc_catalog();
    catalog.country = "Netherlands";

    AttributeTable table = assign_max_damage(model, {catalog, {"structure"}});
    EXPECT_NEAR(*as_number(table.at(columns::max_damage("structure"), 0)), 36000.0, 1e-6);
    EXPECT_NEAR(*as_number(table.at(columns::max_damage("structure"), 1)), 43200.0, 1e-6);
}

TEST(DamageValuesTest, HazusUsesSquareFeet) {
    ExposureModel model = two_buildings();
    model.table.set_column(columns::PRIMARY_OBJECT_TYPE,
                           {std::string("RES1"), std::string("UNKNOWN")});

    AttributeTable catalog;
    catalog.set_column(HAZUS_OCCUPANCY, {std::string("RES1")});
    catalog.set_column(HAZUS_STRUCTURE, {100.0});
    catalog.set_column(HAZUS_CONTENT_PERCENT, {50.0});

    CatalogDamage source;
    source.catalog = CatalogDamage::Catalog::Hazus;
    source.table = catalog;

    AttributeTable table = assign_max_damage(model, {source, {"structure"}});
    double square_feet = convert_area(100.0, UnitSystem::Meters, UnitSystem::Feet);
    EXPECT_NEAR(*as_number(table.at(columns::max_damage("structure"), 0)), 100.0 * square_feet,
                1e-6);
    EXPECT_TRUE(is_null(table.at(columns::max_damage("structure"), 1)));
}

TEST(DamageValuesTest, ResolvingTwiceIsIdempotent) {
    ExposureModel model = two_buildings();
    CatalogDamage catalog;
    catalog.table = jrc_catalog();
    DamageRequest request{catalog, {"structure", "content"}};

    model.table = assign_max_damage(model, request);
    AttributeTable once = model.table;
    model.table = assign_max_damage(model, request);

    EXPECT_EQ(once.column_names(), model.table.column_names());
    EXPECT_EQ(once.column(columns::max_damage("content")),
              model.table.column(columns::max_damage("content")));
}

TEST(DamageValuesTest, TranslationTableValues) {
    ExposureModel model = two_buildings();

    AttributeTable translation;
    translation.set_column("type", {std::string("residential"), std::string("residential")});
    translation.set_column("value", {10.0, 99.0});

    TranslationDamage source;
    source.table = translation;
    source.source_column = "type";
    source.value_column = "value";

    AttributeTable table = assign_max_damage(model, {source, {"content"}});
    EXPECT_NEAR(*as_number(table.at(columns::max_damage("content"), 0)), 1000.0, 1e-6);
    EXPECT_TRUE(is_null(table.at(columns::max_damage("content"), 1)));
}

TEST(DamageValuesTest, CatalogWithoutTableThrows) {
    ExposureModel model = two_buildings();
    EXPECT_THROW((void)assign_max_damage(model, {CatalogDamage{}, {"structure"}}),
                 DamageTableRequiredError);
    EXPECT_THROW((void)assign_max_damage(model, {TranslationDamage{}, {"structure"}}),
                 DamageTableRequiredError);
}

TEST(DamageValuesTest, LayerMissingAttributeSkipsOnlyThatType) {
    ExposureModel model = two_buildings();

    geo::GeometryLayer values;
    values.name = "values";
    values.crs = CRS;
    values.geometries = {geo::Geometry::make_point({500005, 5800005})};
    values.attributes.set_column("structure_value", {750.0});

    LayerDamage source;
    source.entries.push_back({"structure", values, {"structure_value", JoinMethod::Nearest, 10.0}});
    source.entries.push_back({"content", values, {"content_value", JoinMethod::Nearest, 10.0}});

    AttributeTable table = assign_max_damage(model, {source, {"structure", "content"}});
    EXPECT_DOUBLE_EQ(*as_number(table.at(columns::max_damage("structure"), 0)), 750.0);
    EXPECT_TRUE(is_null(table.at(columns::max_damage("structure"), 1)));
    EXPECT_FALSE(table.has_column(columns::max_damage("content")));
}

// ============================================================================
// Updates
// ============================================================================

TEST(DamageValuesTest, UpdateOverwritesListedAssetsOnly) {
    AttributeTable table;
    table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}});
    table.set_column(columns::max_damage("structure"), {100.0, 200.0, 300.0});
    table.set_column(columns::max_damage("content"), {10.0, 20.0, 30.0});

    // Asset 1 bought out, asset 3 grows, asset 9 does not exist
    AttributeTable updates;
    updates.set_column(columns::OBJECT_ID, {int64_t{3}, int64_t{1}, int64_t{9}});
    updates.set_column(columns::max_damage("structure"), {330.0, 0.0, 1.0});
    updates.set_column(columns::max_damage("content"), {Value{}, 0.0, 1.0});
    updates.set_column("note", {std::string("growth"), std::string("buyout"), Value{}});

    AttributeTable updated = update_max_damage(table, updates);
    const ValueColumn& structure = updated.column(columns::max_damage("structure"));
    const ValueColumn& content = updated.column(columns::max_damage("content"));

    EXPECT_DOUBLE_EQ(*as_number(structure[0]), 0.0);
    EXPECT_DOUBLE_EQ(*as_number(structure[1]), 200.0);
    EXPECT_DOUBLE_EQ(*as_number(structure[2]), 330.0);
    EXPECT_DOUBLE_EQ(*as_number(content[0]), 0.0);
    EXPECT_DOUBLE_EQ(*as_number(content[2]), 30.0);    // null keeps the current value

    EXPECT_FALSE(updated.has_column("note"));
    EXPECT_EQ(updated.column_names().size(), 3u);
}

TEST(DamageValuesTest, UpdateNeedsObjectIds) {
    AttributeTable table;
    table.set_column(columns::OBJECT_ID, {int64_t{1}});
    table.set_column(columns::max_damage("structure"), {100.0});

    AttributeTable updates;
    updates.set_column(columns::max_damage("structure"), {5.0});
    EXPECT_THROW((void)update_max_damage(table, updates), MissingColumnError);

    // Nothing to apply without damage columns
    AttributeTable ids_only;
    ids_only.set_column(columns::OBJECT_ID, {int64_t{1}});
    AttributeTable unchanged = update_max_damage(table, ids_only);
    EXPECT_DOUBLE_EQ(*as_number(unchanged.at(columns::max_damage("structure"), 0)), 100.0);
}
