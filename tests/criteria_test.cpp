/**
 * @file criteria_test.cpp
 * @brief minimum thickness, drop panel and DDM/EFM applicability checks uwu
 */
#include <algorithm>
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "fsa/criteria/validator.hpp"
#include "support/scenario_builder.hpp"

using testing::DoubleNear;
using testing::ElementsAre;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto find_rule(const fsa::criteria::Applicability &applicability, std::string_view name)
    -> const fsa::criteria::ApplicabilityRule *
{
    const auto it = std::ranges::find_if(applicability.rules,
                                         [name](const fsa::criteria::ApplicabilityRule &r) { return r.name == name; });
    return it == applicability.rules.end() ? nullptr : &*it;
}

[[nodiscard]] auto rule_names(const fsa::criteria::Applicability &applicability) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (const auto &rule : applicability.rules)
    {
        names.push_back(rule.name);
    }
    return names;
}

} // namespace

TEST(ThicknessDenominator, FollowsTable)
{
    static_assert(fsa::criteria::thickness_denominator(false, false, false) == 33.0);
    EXPECT_DOUBLE_EQ(fsa::criteria::thickness_denominator(false, true, false), 36.0);
    EXPECT_DOUBLE_EQ(fsa::criteria::thickness_denominator(true, false, false), 30.0);
    EXPECT_DOUBLE_EQ(fsa::criteria::thickness_denominator(true, false, true), 33.0);
    EXPECT_DOUBLE_EQ(fsa::criteria::thickness_denominator(true, true, false), 33.0);
    EXPECT_DOUBLE_EQ(fsa::criteria::thickness_denominator(true, true, true), 36.0);
    // interior panels ignore the edge beam flag
    EXPECT_DOUBLE_EQ(fsa::criteria::thickness_denominator(false, false, true), 33.0);
}

TEST(MinimumThickness, InteriorFlatPlatePasses)
{
    const auto record = fsa::test_support::prepare();
    const auto check  = fsa::criteria::check_min_thickness(record);
    const double fy_factor = 0.8 + (record.materials.fy_mpa / 1400.0);
    EXPECT_THAT(check.ln_long, DoubleNear(5.5, 1.0e-9));
    EXPECT_DOUBLE_EQ(check.denominator, 33.0);
    EXPECT_THAT(check.fy_factor, DoubleNear(fy_factor, 1.0e-12));
    EXPECT_THAT(check.required_h, DoubleNear(5.5 * fy_factor / 33.0, 1.0e-9));
    EXPECT_DOUBLE_EQ(check.absolute_min, 0.125);
    EXPECT_TRUE(check.passed);
    EXPECT_EQ(check.case_name, "Interior panel, no drop panel");
}

TEST(MinimumThickness, ThinExteriorPlateFails)
{
    auto options         = fsa::test_support::edge_options();
    options.thickness_cm = 15.0;
    const auto record    = fsa::test_support::prepare(options);
    const auto check     = fsa::criteria::check_min_thickness(record);
    EXPECT_DOUBLE_EQ(check.denominator, 30.0);
    EXPECT_FALSE(check.passed);
    EXPECT_GT(check.required_h, check.provided_h);
    EXPECT_EQ(check.case_name, "Exterior panel, no drop panel, no edge beam");
}

/**
 * @test short spans fall back to the absolute minimum; equality counts as a pass
 */
TEST(MinimumThickness, AbsoluteMinimumGovernsShortSpans)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.l1_left = options.l1_right = options.l2_top = options.l2_bottom = 3.0;
    options.c1_cm = options.c2_cm = 30.0;
    options.thickness_cm          = 12.5;
    options.cover_cm              = 2.5;
    const auto record             = fsa::test_support::prepare(options);
    const auto check              = fsa::criteria::check_min_thickness(record);
    EXPECT_DOUBLE_EQ(check.required_h, 0.125);
    EXPECT_TRUE(check.passed);
}

TEST(MinimumThickness, DropPanelLowersAbsoluteMinimum)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.drop_panel = fsa::test_support::DropPanelSpec{};
    const auto record  = fsa::test_support::prepare(options);
    const auto check   = fsa::criteria::check_min_thickness(record);
    EXPECT_DOUBLE_EQ(check.absolute_min, 0.10);
    EXPECT_DOUBLE_EQ(check.denominator, 36.0);
    EXPECT_EQ(check.case_name, "Interior panel, with drop panel");
}

TEST(DropPanelCheck, EmptyWithoutDropPanel)
{
    const auto record = fsa::test_support::prepare();
    EXPECT_TRUE(fsa::criteria::check_drop_panel(record).empty());
}

/**
 * @test depth exactly h/4 and widths exactly L/3 pass with a zero margin
 */
TEST(DropPanelCheck, BoundaryEqualityPasses)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.thickness_cm = 20.0;
    options.drop_panel   = fsa::test_support::DropPanelSpec{5.0, 2.0, 2.0};
    const auto record    = fsa::test_support::prepare(options);
    const auto checks    = fsa::criteria::check_drop_panel(record);
    ASSERT_EQ(checks.size(), 3U);
    EXPECT_EQ(checks[0].label, "Depth");
    EXPECT_EQ(checks[1].label, "Width W1");
    EXPECT_EQ(checks[2].label, "Width W2");
    for (const auto &check : checks)
    {
        EXPECT_TRUE(check.passed) << check.label;
        EXPECT_DOUBLE_EQ(check.margin, 0.0) << check.label;
    }
}

TEST(DropPanelCheck, UndersizedDropFailsWithNegativeMargin)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.drop_panel = fsa::test_support::DropPanelSpec{4.0, 1.5, 2.5};
    const auto record  = fsa::test_support::prepare(options);
    const auto checks  = fsa::criteria::check_drop_panel(record);
    ASSERT_EQ(checks.size(), 3U);
    EXPECT_FALSE(checks[0].passed);
    EXPECT_LT(checks[0].margin, 0.0);
    EXPECT_FALSE(checks[1].passed);
    EXPECT_THAT(checks[1].margin, DoubleNear(-0.5, 1.0e-9));
    EXPECT_TRUE(checks[2].passed);
    EXPECT_THAT(checks[2].margin, DoubleNear(0.5, 1.0e-9));
}

/**
 * @test edge column: the drop runs from the slab edge, so L/6 + c1/2 along l1 is enough
 */
TEST(DropPanelCheck, EdgeColumnMeasuresOpenSideFromSlabEdge)
{
    auto options       = fsa::test_support::edge_options();
    options.drop_panel = fsa::test_support::DropPanelSpec{10.0, 1.25, 2.0};
    const auto record  = fsa::test_support::prepare(options);
    const auto checks  = fsa::criteria::check_drop_panel(record);
    ASSERT_EQ(checks.size(), 3U);

    EXPECT_THAT(checks[1].required, DoubleNear(1.25, 1.0e-9));
    EXPECT_TRUE(checks[1].passed);
    EXPECT_THAT(checks[1].margin, DoubleNear(0.0, 1.0e-9));

    // both transverse spans exist: full 2 L/6 across the column
    EXPECT_THAT(checks[2].required, DoubleNear(2.0, 1.0e-9));
    EXPECT_TRUE(checks[2].passed);

    options.drop_panel    = fsa::test_support::DropPanelSpec{10.0, 1.2, 2.0};
    const auto short_drop = fsa::criteria::check_drop_panel(fsa::test_support::prepare(options));
    ASSERT_EQ(short_drop.size(), 3U);
    EXPECT_FALSE(short_drop[1].passed);
    EXPECT_THAT(short_drop[1].margin, DoubleNear(-0.05, 1.0e-9));
}

TEST(DropPanelCheck, CornerColumnHasOpenSidesBothWays)
{
    auto options       = fsa::test_support::corner_options();
    options.drop_panel = fsa::test_support::DropPanelSpec{10.0, 1.25, 1.25};
    const auto record  = fsa::test_support::prepare(options);
    const auto checks  = fsa::criteria::check_drop_panel(record);
    ASSERT_EQ(checks.size(), 3U);
    for (const auto &check : checks)
    {
        EXPECT_TRUE(check.passed) << check.label;
    }
    EXPECT_THAT(checks[1].required, DoubleNear(1.25, 1.0e-9));
    EXPECT_THAT(checks[2].required, DoubleNear(1.25, 1.0e-9));
}

TEST(DdmApplicability, RegularInteriorBayIsApplicable)
{
    const auto record = fsa::test_support::prepare();
    const auto result = fsa::criteria::check_ddm_applicability(record);
    EXPECT_TRUE(result.applicable);
    EXPECT_THAT(rule_names(result),
                ElementsAre("panel_ratio", "load_ratio", "l1_successive_spans", "l2_successive_spans"));
}

/**
 * @test every rule is evaluated even after the first one fails
 */
TEST(DdmApplicability, ReportsEveryViolatedRule)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.l2_top    = 13.0;
    options.l2_bottom = 13.0;
    options.l1_left   = 3.5;
    options.live_kgm2 = 2000.0;
    const auto record = fsa::test_support::prepare(options);
    const auto result = fsa::criteria::check_ddm_applicability(record);
    EXPECT_FALSE(result.applicable);

    const auto *panel = find_rule(result, "panel_ratio");
    ASSERT_NE(panel, nullptr);
    EXPECT_FALSE(panel->passed);
    EXPECT_THAT(panel->value, DoubleNear(13.0 / 6.0, 1.0e-12));
    EXPECT_THAT(panel->message, HasSubstr("> 2.0"));

    const auto *load = find_rule(result, "load_ratio");
    ASSERT_NE(load, nullptr);
    EXPECT_FALSE(load->passed);

    const auto *l1 = find_rule(result, "l1_successive_spans");
    ASSERT_NE(l1, nullptr);
    EXPECT_FALSE(l1->passed);
    EXPECT_THAT(l1->value, DoubleNear(2.5 / 6.0, 1.0e-12));

    const auto *l2 = find_rule(result, "l2_successive_spans");
    ASSERT_NE(l2, nullptr);
    EXPECT_TRUE(l2->passed);
}

TEST(DdmApplicability, SpanDifferenceOfExactlyOneThirdPasses)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.l1_left   = 4.0;
    const auto record = fsa::test_support::prepare(options);
    const auto *rule  = find_rule(fsa::criteria::check_ddm_applicability(record), "l1_successive_spans");
    ASSERT_NE(rule, nullptr);
    EXPECT_TRUE(rule->passed);
}

TEST(DdmApplicability, EdgeColumnSkipsMissingSuccessiveSpanRule)
{
    const auto record = fsa::test_support::prepare(fsa::test_support::edge_options());
    const auto result = fsa::criteria::check_ddm_applicability(record);
    EXPECT_THAT(rule_names(result), ElementsAre("panel_ratio", "load_ratio", "l2_successive_spans"));
}

TEST(DdmApplicability, LiveLoadWithoutDeadLoadIsInfiniteRatio)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.dead_kgm2        = 0.0;
    options.live_kgm2        = 100.0;
    options.auto_self_weight = false;
    const auto record        = fsa::test_support::prepare(options);
    const auto *rule         = find_rule(fsa::criteria::check_ddm_applicability(record), "load_ratio");
    ASSERT_NE(rule, nullptr);
    EXPECT_TRUE(std::isinf(rule->value));
    EXPECT_FALSE(rule->passed);
}

TEST(ValidateCriteria, BundlesEveryCheck)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.drop_panel = fsa::test_support::DropPanelSpec{};
    const auto record  = fsa::test_support::prepare(options);
    const auto report  = fsa::criteria::validate_criteria(record);
    EXPECT_TRUE(report.min_thickness.passed);
    EXPECT_EQ(report.drop_panel.size(), 3U);
    EXPECT_TRUE(report.ddm.applicable);
    EXPECT_TRUE(report.efm.applicable);
    ASSERT_EQ(report.efm.rules.size(), 1U);
    EXPECT_TRUE(report.efm.rules.front().passed);
}
