#include "core/columns.hpp"
#include "core/errors.hpp"
#include "exposure/vulnerability.hpp"
#include <gtest/gtest.h>

using namespace tidemark;
using namespace tidemark::exposure;

namespace {

DamageCurve linear_curve(const std::string& id) {
    return DamageCurve{id, {0.0, 1.0, 2.0, 3.0}, {0.0, 0.2, 0.6, 1.0}};
}

ExposureModel linked_model() {
    ExposureModel model;
    model.table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}});
    model.table.set_column(columns::PRIMARY_OBJECT_TYPE,
                           {std::string("residential"), std::string("residential"),
                            std::string("commercial")});
    model.table.set_column(columns::fn_damage("structure"),
                           {std::string("res"), std::string("res"), std::string("com")});
    return model;
}

} // anonymous namespace

// ============================================================================
// Curves
// ============================================================================

TEST(DamageCurveTest, InterpolatesAndClamps) {
    DamageCurve curve = linear_curve("res");
    EXPECT_DOUBLE_EQ(curve.evaluate(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(1.5), 0.4);
    EXPECT_DOUBLE_EQ(curve.evaluate(2.0), 0.6);
    EXPECT_DOUBLE_EQ(curve.evaluate(10.0), 1.0);
}

TEST(CurveLibraryTest, RejectsMalformedCurves) {
    CurveLibrary curves;
    EXPECT_THROW(curves.add(DamageCurve{"bad", {0.0, 1.0}, {0.0}}), UserInputError);
    EXPECT_THROW(curves.add(DamageCurve{"bad", {0.0, 0.0}, {0.0, 1.0}}), UserInputError);
    EXPECT_TRUE(curves.empty());
}

TEST(CurveLibraryTest, AddReplacesById) {
    CurveLibrary curves;
    curves.add(linear_curve("res"));
    curves.add(DamageCurve{"res", {0.0, 1.0}, {0.5, 0.5}});

    ASSERT_EQ(curves.size(), 1u);
    EXPECT_DOUBLE_EQ(curves.get("res").evaluate(0.0), 0.5);
    EXPECT_THROW((void)curves.get("com"), UserInputError);
}

// ============================================================================
// Linking
// ============================================================================

TEST(LinkVulnerabilityTest, EachDamageTypeLinkedIndependently) {
    AttributeTable table;
    table.set_column(columns::OBJECT_ID, {int64_t{1}, int64_t{2}, int64_t{3}});
    table.set_column(columns::PRIMARY_OBJECT_TYPE,
                     {std::string("residential"), std::string("commercial"), Value{}});

    LinkingTable linking = {
        {"residential", "structure", "res_s"},
        {"residential", "content", "res_c"},
        {"commercial", "structure", "com_s"},
        {"residential", "structure", "ignored"},
    };

    table = link_vulnerability(table, linking, {"structure", "content"});

    EXPECT_EQ(std::get<std::string>(table.at(columns::fn_damage("structure"), 0)), "res_s");
    EXPECT_EQ(std::get<std::string>(table.at(columns::fn_damage("structure"), 1)), "com_s");
    EXPECT_TRUE(is_null(table.at(columns::fn_damage("structure"), 2)));
    EXPECT_EQ(std::get<std::string>(table.at(columns::fn_damage("content"), 0)), "res_c");
    EXPECT_TRUE(is_null(table.at(columns::fn_damage("content"), 1)));
}

TEST(LinkVulnerabilityTest, MatchesOnSecondaryTypesWhenTheyFitBetter) {
    AttributeTable table;
    table.set_column(columns::PRIMARY_OBJECT_TYPE, {std::string("RES"), std::string("COM")});
    table.set_column(columns::SECONDARY_OBJECT_TYPE, {std::string("RES1"), std::string("COM4")});

    LinkingTable linking = {{"RES1", "structure", "a"}, {"COM4", "structure", "b"}};
    table = link_vulnerability(table, linking, {"structure"});

    EXPECT_EQ(std::get<std::string>(table.at(columns::fn_damage("structure"), 1)), "b");
}

// ============================================================================
// Floodproofing
// ============================================================================

TEST(FloodproofTest, VariantIdFormat) {
    EXPECT_EQ(floodproof_curve_id("res", 1.0), "res_fp_1_0");
    EXPECT_EQ(floodproof_curve_id("res", 0.5), "res_fp_0_5");
    EXPECT_EQ(floodproof_curve_id("res", 2.25), "res_fp_2_25");
}

TEST(FloodproofTest, TruncationZeroesShallowDepths) {
    DamageCurve truncated = truncate_curve(linear_curve("res"), 1.5, "res_fp_1_5");

    std::vector<double> depths = {0.0, 1.0, 1.5, 2.0, 3.0};
    std::vector<double> fractions = {0.0, 0.0, 0.0, 0.6, 1.0};
    EXPECT_EQ(truncated.depths, depths);
    EXPECT_EQ(truncated.fractions, fractions);

    // Water below the floodproof level does no damage
    for (double depth : {0.5, 1.2, 1.4, 1.49, 1.5}) {
        EXPECT_DOUBLE_EQ(truncated.evaluate(depth), 0.0) << "depth " << depth;
    }
    EXPECT_NEAR(truncated.evaluate(1.75), 0.3, 1e-12);
    EXPECT_DOUBLE_EQ(truncated.evaluate(2.5), linear_curve("res").evaluate(2.5));
}

TEST(FloodproofTest, TruncationAtExistingDepthAddsNoPoint) {
    DamageCurve truncated = truncate_curve(linear_curve("res"), 2.0, "res_fp_2_0");
    EXPECT_EQ(truncated.depths.size(), 4u);
    EXPECT_DOUBLE_EQ(truncated.fractions[1], 0.0);
    EXPECT_DOUBLE_EQ(truncated.fractions[2], 0.0);
    EXPECT_DOUBLE_EQ(truncated.evaluate(1.9), 0.0);
    EXPECT_NEAR(truncated.evaluate(2.5), 0.5, 1e-12);
}

TEST(FloodproofTest, TruncationBeyondLastDepthRemovesAllDamage) {
    DamageCurve truncated = truncate_curve(linear_curve("res"), 4.0, "res_fp_4_0");
    EXPECT_EQ(truncated.depths.size(), 4u);
    EXPECT_DOUBLE_EQ(truncated.evaluate(3.5), 0.0);
    EXPECT_DOUBLE_EQ(truncated.evaluate(10.0), 0.0);
}

TEST(FloodproofTest, OnlySelectedAssetsAreRepointed) {
    ExposureModel model = linked_model();
    CurveLibrary curves;
    curves.add(linear_curve("res"));
    curves.add(linear_curve("com"));

    floodproof(model, curves, {1, 3}, 1.0, {"structure"});

    const auto& assigned = model.table.column(columns::fn_damage("structure"));
    EXPECT_EQ(std::get<std::string>(assigned[0]), "res_fp_1_0");
    EXPECT_EQ(std::get<std::string>(assigned[1]), "res");
    EXPECT_EQ(std::get<std::string>(assigned[2]), "com_fp_1_0");

    EXPECT_EQ(curves.size(), 4u);
    EXPECT_DOUBLE_EQ(curves.get("res_fp_1_0").evaluate(0.5), 0.0);
    EXPECT_DOUBLE_EQ(curves.get("res").evaluate(0.5), 0.1);
}

TEST(FloodproofTest, RequiresLinkedCurves) {
    ExposureModel model = linked_model();
    CurveLibrary curves;
    curves.add(linear_curve("res"));
    curves.add(linear_curve("com"));

    EXPECT_THROW(floodproof(model, curves, {1}, 1.0, {"content"}), PipelineOrderError);
}

// ============================================================================
// Blending
// ============================================================================

TEST(BlendCurvesTest, WeightedByCountOverUnionOfDepths) {
    CurveLibrary curves;
    curves.add(DamageCurve{"a", {0.0, 2.0}, {0.0, 1.0}});
    curves.add(DamageCurve{"b", {0.0, 1.0}, {0.5, 0.5}});

    DamageCurve blended = blend_curves(curves, {{"a", 3}, {"b", 1}}, "composite_structure");

    std::vector<double> depths = {0.0, 1.0, 2.0};
    EXPECT_EQ(blended.depths, depths);
    EXPECT_DOUBLE_EQ(blended.fractions[0], (0.0 * 3 + 0.5) / 4.0);
    EXPECT_DOUBLE_EQ(blended.fractions[1], (0.5 * 3 + 0.5) / 4.0);
    EXPECT_DOUBLE_EQ(blended.fractions[2], (1.0 * 3 + 0.5) / 4.0);
}
