#include "core/columns.hpp"
#include "core/errors.hpp"
#include "exposure/object_types.hpp"
#include <gtest/gtest.h>

using namespace tidemark;
using namespace tidemark::exposure;

namespace {

AttributeTable buildings() {
    AttributeTable table;
    table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}});
    table.set_column("building", {std::string("house"), std::string("shop"), Value{}});
    table.set_column("amenity", {Value{}, std::string("cafe"), Value{}});
    return table;
}

AttributeTable translation() {
    AttributeTable table;
    table.set_column("building", {std::string("house"), std::string("shop"), std::string("house")});
    table.set_column(columns::PRIMARY_OBJECT_TYPE,
                     {std::string("residential"), std::string("commercial"),
                      std::string("industrial")});
    return table;
}

} // anonymous namespace

TEST(ObjectTypesTest, RawColumnWithoutTranslation) {
    ObjectTypeRequest request;
    request.source_column = "building";

    AttributeTable table = classify_object_types(buildings(), request);
    EXPECT_EQ(std::get<std::string>(table.at(columns::PRIMARY_OBJECT_TYPE, 0)), "house");
    EXPECT_TRUE(is_null(table.at(columns::PRIMARY_OBJECT_TYPE, 2)));
    EXPECT_EQ(table.row_count(), 3u);
}

TEST(ObjectTypesTest, TranslationFirstDuplicateWins) {
    ObjectTypeRequest request;
    request.source_column = "building";
    request.translation = translation();

    AttributeTable table = classify_object_types(buildings(), request);
    EXPECT_EQ(std::get<std::string>(table.at(columns::PRIMARY_OBJECT_TYPE, 0)), "residential");
    EXPECT_EQ(std::get<std::string>(table.at(columns::PRIMARY_OBJECT_TYPE, 1)), "commercial");
}

TEST(ObjectTypesTest, SecondaryColumnIsCopied) {
    ObjectTypeRequest request;
    request.source_column = "building";
    request.secondary_column = "amenity";

    AttributeTable table = classify_object_types(buildings(), request);
    EXPECT_TRUE(is_null(table.at(columns::SECONDARY_OBJECT_TYPE, 0)));
    EXPECT_EQ(std::get<std::string>(table.at(columns::SECONDARY_OBJECT_TYPE, 1)), "cafe");
}

TEST(ObjectTypesTest, UnclassifiedAreKeptByDefault) {
    ObjectTypeRequest request;
    request.source_column = "building";
    request.translation = translation();

    AttributeTable table = classify_object_types(buildings(), request);
    EXPECT_EQ(table.row_count(), 3u);
    EXPECT_TRUE(is_null(table.at(columns::PRIMARY_OBJECT_TYPE, 2)));
}

TEST(ObjectTypesTest, UnclassifiedFill) {
    ObjectTypeRequest request;
    request.source_column = "building";
    request.unclassified_fill = std::string("residential");

    AttributeTable table = classify_object_types(buildings(), request);
    EXPECT_EQ(std::get<std::string>(table.at(columns::PRIMARY_OBJECT_TYPE, 2)), "residential");
}

TEST(ObjectTypesTest, DropUnclassified) {
    ObjectTypeRequest request;
    request.source_column = "building";
    request.drop_unclassified = true;

    AttributeTable table = classify_object_types(buildings(), request);
    ASSERT_EQ(table.row_count(), 2u);
    EXPECT_EQ(std::get<int64_t>(table.at(columns::OBJECT_ID, 1)), 2);
}

TEST(ObjectTypesTest, MissingSourceColumn) {
    ObjectTypeRequest request;
    request.source_column = "landuse";
    EXPECT_THROW((void)classify_object_types(buildings(), request), MissingColumnError);
}

TEST(ObjectTypesTest, ChooseColumnWithMostKnownTypes) {
    AttributeTable table;
    table.set_column(columns::PRIMARY_OBJECT_TYPE, {std::string("RES"), std::string("COM")});
    table.set_column(columns::SECONDARY_OBJECT_TYPE, {std::string("RES1"), std::string("COM1")});

    EXPECT_EQ(choose_type_column(table, {"RES1", "COM1"}, "test"), columns::SECONDARY_OBJECT_TYPE);
    EXPECT_EQ(choose_type_column(table, {"RES", "RES1"}, "test"), columns::PRIMARY_OBJECT_TYPE);

    AttributeTable empty(2);
    EXPECT_THROW((void)choose_type_column(empty, {"RES"}, "test"), MissingColumnError);
}
