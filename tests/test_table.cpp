#include "core/errors.hpp"
#include "core/report.hpp"
#include "core/table.hpp"
#include "core/units.hpp"
#include "exposure/merge.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace tidemark;

// ============================================================================
// Values
// ============================================================================

TEST(ValueTest, NullAndNaN) {
    EXPECT_TRUE(is_null(Value{}));
    EXPECT_TRUE(is_null(Value{std::numeric_limits<double>::quiet_NaN()}));
    EXPECT_FALSE(is_null(Value{0.0}));
    EXPECT_FALSE(is_null(Value{std::string()}));
}

TEST(ValueTest, NumbersFromStrings) {
    EXPECT_DOUBLE_EQ(*as_number(Value{std::string(" 3.5 ")}), 3.5);
    EXPECT_FALSE(as_number(Value{std::string("residential")}));
    EXPECT_EQ(*as_integer(Value{2.9}), 2);
    EXPECT_FALSE(as_integer(Value{}));
}

TEST(ValueTest, WholeDoublesPrintAsIntegers) {
    EXPECT_EQ(*as_string(Value{2.0}), "2");
    EXPECT_EQ(*as_string(Value{int64_t{2}}), "2");
    EXPECT_EQ(*as_string(Value{0.5}), "0.5");
    EXPECT_FALSE(as_string(Value{}));
    EXPECT_EQ(to_display(Value{}), "null");
}

// ============================================================================
// AttributeTable
// ============================================================================

TEST(AttributeTableTest, FirstColumnSetsRowCount) {
    AttributeTable table;
    table.set_column("a", {int64_t{1}, int64_t{2}, int64_t{3}});
    EXPECT_EQ(table.row_count(), 3u);
    EXPECT_THROW(table.set_column("b", {int64_t{1}}), UserInputError);
}

TEST(AttributeTableTest, ColumnOrderIsKept) {
    AttributeTable table(2);
    table.fill_column("z", 1.0);
    table.fill_column("a", 2.0);
    table.fill_column("z", 3.0);

    ASSERT_EQ(table.column_names().size(), 2u);
    EXPECT_EQ(table.column_names()[0], "z");
    EXPECT_EQ(table.column_names()[1], "a");
    EXPECT_DOUBLE_EQ(std::get<double>(table.at("z", 1)), 3.0);
}

TEST(AttributeTableTest, MissingColumnNamesTheColumn) {
    AttributeTable table(1);
    try {
        table.require_columns({"object_id"}, "test");
        FAIL() << "expected MissingColumnError";
    } catch (const MissingColumnError& e) {
        EXPECT_EQ(e.column(), "object_id");
    }
}

TEST(AttributeTableTest, AppendRowsUnionsColumns) {
    AttributeTable first;
    first.set_column("a", {int64_t{1}});
    AttributeTable second;
    second.set_column("b", {std::string("x"), std::string("y")});

    first.append_rows(second);

    EXPECT_EQ(first.row_count(), 3u);
    EXPECT_TRUE(is_null(first.at("a", 1)));
    EXPECT_TRUE(is_null(first.at("b", 0)));
    EXPECT_EQ(std::get<std::string>(first.at("b", 2)), "y");
}

TEST(AttributeTableTest, SelectAndRename) {
    AttributeTable table;
    table.set_column("id", {int64_t{10}, int64_t{20}, int64_t{30}});

    AttributeTable picked = table.select_rows({2, 0});
    EXPECT_EQ(std::get<int64_t>(picked.at("id", 0)), 30);

    picked.rename_column("id", "object_id");
    EXPECT_FALSE(picked.has_column("id"));
    EXPECT_EQ(std::get<int64_t>(picked.at("object_id", 1)), 10);
}

// ============================================================================
// Merge
// ============================================================================

TEST(MergeTest, NonNullSourceOverwrites) {
    AttributeTable table;
    table.set_column("height", {1.0, 2.0, Value{}});
    table.set_column("__joined", {Value{}, 5.0, 7.0});

    AttributeTable merged = exposure::merge_attribute(table, "height", "__joined");

    EXPECT_FALSE(merged.has_column("__joined"));
    EXPECT_DOUBLE_EQ(*as_number(merged.at("height", 0)), 1.0);
    EXPECT_DOUBLE_EQ(*as_number(merged.at("height", 1)), 5.0);
    EXPECT_DOUBLE_EQ(*as_number(merged.at("height", 2)), 7.0);
}

TEST(MergeTest, CreatesMissingTarget) {
    AttributeTable table;
    table.set_column("__joined", {Value{}, 5.0});

    AttributeTable merged = exposure::merge_attribute(table, "height", "__joined");
    EXPECT_TRUE(is_null(merged.at("height", 0)));
    EXPECT_DOUBLE_EQ(*as_number(merged.at("height", 1)), 5.0);
}

TEST(MergeTest, SameSourceTwiceIsIdempotent) {
    AttributeTable table;
    table.set_column("height", {1.0, Value{}});

    AttributeTable once = table;
    once.set_column("__joined", {Value{}, 4.0});
    once = exposure::merge_attribute(once, "height", "__joined");

    AttributeTable twice = once;
    twice.set_column("__joined", {Value{}, 4.0});
    twice = exposure::merge_attribute(twice, "height", "__joined");

    EXPECT_EQ(once.column("height"), twice.column("height"));
}

TEST(MergeTest, MissingSourceThrows) {
    AttributeTable table(1);
    EXPECT_THROW((void)exposure::merge_attribute(table, "height", "__joined"), MissingColumnError);
}

// ============================================================================
// Units and reporting
// ============================================================================

TEST(UnitsTest, ParseNames) {
    EXPECT_EQ(parse_unit("Feet"), UnitSystem::Feet);
    EXPECT_EQ(parse_unit("m"), UnitSystem::Meters);
    EXPECT_FALSE(parse_unit("yards"));
}

TEST(UnitsTest, Conversions) {
    EXPECT_NEAR(convert_length(1.0, UnitSystem::Meters, UnitSystem::Feet), 3.28084, 1e-12);
    EXPECT_NEAR(convert_area(1.0, UnitSystem::Meters, UnitSystem::Feet), 3.28084 * 3.28084, 1e-9);
    EXPECT_NEAR(convert_length(convert_length(12.5, UnitSystem::Feet, UnitSystem::Meters),
                               UnitSystem::Meters, UnitSystem::Feet),
                12.5, 1e-9);
    EXPECT_DOUBLE_EQ(length_factor(UnitSystem::Feet, UnitSystem::Feet), 1.0);
}

TEST(ReportTest, SampleIdsTruncates) {
    EXPECT_EQ(sample_ids({}), "none");
    EXPECT_EQ(sample_ids({1, 2, 3}), "1, 2, 3");
    EXPECT_EQ(sample_ids({1, 2, 3, 4, 5, 6, 7}), "1, 2, 3, 4, 5 (+2 more)");
}
