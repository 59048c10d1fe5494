/**
 * @file flexure_test.cpp
 * @brief Rn -> rho -> As closed form, minimum steel floor and the Fail path uwu
 */
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <numbers>
#include <vector>

#include "fsa/ddm/flexure.hpp"
#include "support/scenario_builder.hpp"

using testing::DoubleNear;
using testing::HasSubstr;
using testing::StartsWith;

namespace
{

constexpr double kKscToPa = 98066.5;

[[nodiscard]] auto make_params() -> fsa::ddm::FlexureParams
{
    fsa::ddm::FlexureParams params{};
    params.fc_pa           = 240.0 * kKscToPa;
    params.fy_pa           = 4000.0 * kKscToPa;
    params.rho_min         = fsa::ddm::min_steel_ratio(4000.0);
    params.cover           = 0.03;
    params.bar_area        = std::numbers::pi * 0.012 * 0.012 / 4.0;
    params.bar_diameter_mm = 12.0;
    return params;
}

} // namespace

TEST(MinimumSteel, RatioByGrade)
{
    static_assert(fsa::ddm::min_steel_ratio(3000.0) == 0.0020);
    EXPECT_DOUBLE_EQ(fsa::ddm::min_steel_ratio(4000.0), 0.0018);
    EXPECT_DOUBLE_EQ(fsa::ddm::min_steel_ratio(5000.0), 0.0018);
}

/**
 * @test zero moment lands exactly on rho_min b h
 */
TEST(RequiredSteel, ZeroMomentReturnsExactMinimum)
{
    const auto params = make_params();
    const auto demand = fsa::ddm::required_steel(0.0, 3.0, 0.2, params);
    ASSERT_TRUE(demand.has_value()) << demand.error().message;
    EXPECT_DOUBLE_EQ(demand->as_calc, 0.0);
    EXPECT_DOUBLE_EQ(demand->as_required, params.rho_min * 3.0 * 0.2);
    EXPECT_TRUE(demand->min_governs);

    const auto section = fsa::ddm::design_section(fsa::ddm::MomentComponent::Positive, fsa::ddm::StripKind::Middle,
                                                  0.0, 3.0, 0.2, params);
    EXPECT_EQ(section.status, fsa::ddm::RebarStatus::MinSteel);
    EXPECT_DOUBLE_EQ(section.as_required, params.rho_min * 3.0 * 0.2);
}

TEST(RequiredSteel, MatchesClosedForm)
{
    const auto   params = make_params();
    const double mu     = 50.0e3;
    const double d      = 0.2 - 0.03;
    const double rn     = mu / (0.9 * 3.0 * d * d);
    const double rho    = (0.85 * params.fc_pa / params.fy_pa) * (1.0 - std::sqrt(1.0 - (2.0 * rn / (0.85 * params.fc_pa))));

    const auto demand = fsa::ddm::required_steel(mu, 3.0, 0.2, params);
    ASSERT_TRUE(demand.has_value()) << demand.error().message;
    EXPECT_THAT(demand->rn, DoubleNear(rn, 1.0e-6));
    EXPECT_THAT(demand->rho, DoubleNear(rho, 1.0e-12));
    EXPECT_THAT(demand->as_calc, DoubleNear(rho * 3.0 * d, 1.0e-12));
    EXPECT_FALSE(demand->min_governs);
    EXPECT_DOUBLE_EQ(demand->as_required, demand->as_calc);
}

TEST(RequiredSteel, SignOfMomentIsIgnored)
{
    const auto params   = make_params();
    const auto positive = fsa::ddm::required_steel(40.0e3, 2.5, 0.2, params);
    const auto negative = fsa::ddm::required_steel(-40.0e3, 2.5, 0.2, params);
    ASSERT_TRUE(positive.has_value());
    ASSERT_TRUE(negative.has_value());
    EXPECT_DOUBLE_EQ(positive->as_required, negative->as_required);
}

/**
 * @test As grows strictly with Mu while Rn stays under the ceiling
 */
TEST(RequiredSteel, MonotonicInMomentBelowCeiling)
{
    const auto params = make_params();
    double     previous_calc     = -1.0;
    double     previous_required = -1.0;
    for (double mu = 0.0; mu <= 400.0e3; mu += 10.0e3)
    {
        const auto demand = fsa::ddm::required_steel(mu, 3.0, 0.2, params);
        ASSERT_TRUE(demand.has_value()) << "Mu = " << mu << ": " << demand.error().message;
        EXPECT_GT(demand->as_calc, previous_calc) << "Mu = " << mu;
        EXPECT_GE(demand->as_required, previous_required) << "Mu = " << mu;
        previous_calc     = demand->as_calc;
        previous_required = demand->as_required;
    }
}

TEST(RequiredSteel, RnAboveCeilingFails)
{
    const auto   params  = make_params();
    const double d       = 0.17;
    const double ceiling = 0.35 * params.fc_pa;
    const double mu      = 1.01 * ceiling * 0.9 * 3.0 * d * d;

    const auto demand = fsa::ddm::required_steel(mu, 3.0, 0.2, params);
    ASSERT_FALSE(demand.has_value());
    EXPECT_THAT(demand.error().message, HasSubstr("exceeds 0.35 f'c"));
    EXPECT_THAT(demand.error().limit, DoubleNear(ceiling, 1.0e-6));
    EXPECT_GT(demand.error().rn, demand.error().limit);
}

TEST(RequiredSteel, SectionWithoutDepthFails)
{
    const auto params = make_params();
    EXPECT_FALSE(fsa::ddm::required_steel(1.0e3, 0.0, 0.2, params).has_value());
    const auto no_depth = fsa::ddm::required_steel(1.0e3, 1.0, 0.02, params);
    ASSERT_FALSE(no_depth.has_value());
    EXPECT_THAT(no_depth.error().message, HasSubstr("no capacity"));
}

/**
 * @test a failed section is still a complete record: Fail, As = 0, reason kept
 */
TEST(DesignSection, FailureBecomesStatusNotException)
{
    const auto params  = make_params();
    const auto section = fsa::ddm::design_section(fsa::ddm::MomentComponent::NegativeInterior,
                                                  fsa::ddm::StripKind::Column, 5.0e6, 1.0, 0.2, params);
    EXPECT_EQ(section.status, fsa::ddm::RebarStatus::Fail);
    EXPECT_DOUBLE_EQ(section.as_required, 0.0);
    EXPECT_EQ(section.bars.text, "section inadequate - increase thickness");
    EXPECT_THAT(section.note, HasSubstr("Rn"));
    EXPECT_THAT(section.depth, DoubleNear(0.17, 1.0e-12));
    EXPECT_EQ(fsa::ddm::to_string(section.status), "Fail");
}

TEST(DesignSection, OkSectionGetsBarSuggestion)
{
    const auto params  = make_params();
    const auto section = fsa::ddm::design_section(fsa::ddm::MomentComponent::NegativeInterior,
                                                  fsa::ddm::StripKind::Column, 80.0e3, 3.0, 0.2, params);
    EXPECT_EQ(section.status, fsa::ddm::RebarStatus::Ok);
    EXPECT_GT(section.as_required, params.rho_min * 3.0 * 0.2);
    EXPECT_THAT(section.bars.text, StartsWith("DB12 @ "));
    EXPECT_GT(section.bars.count, 0);
    EXPECT_GE(section.bars.count * params.bar_area, section.as_required * (1.0 - 1.0e-9));
}

TEST(SuggestBars, SpacingCappedAtTwiceThickness)
{
    const auto params     = make_params();
    const auto suggestion = fsa::ddm::suggest_bars(1.0e-5, 3.0, 0.15, params);
    EXPECT_LE(suggestion.spacing, 0.30 + 1.0e-12);
    EXPECT_GE(suggestion.spacing, 0.28);
    EXPECT_GE(static_cast<double>(suggestion.count) * suggestion.spacing, 3.0 - 1.0e-9);
}

TEST(SuggestBars, SpacingNeverExceedsFortyFiveCentimetres)
{
    const auto params     = make_params();
    const auto suggestion = fsa::ddm::suggest_bars(1.0e-5, 3.0, 0.40, params);
    EXPECT_LE(suggestion.spacing, 0.45 + 1.0e-12);
}

TEST(SuggestBars, NothingToPlace)
{
    const auto params = make_params();
    EXPECT_EQ(fsa::ddm::suggest_bars(0.0, 3.0, 0.2, params).text, "n/a");
    EXPECT_EQ(fsa::ddm::suggest_bars(1.0e-4, 0.0, 0.2, params).text, "n/a");
}

TEST(FlexureParams, BuiltFromRecord)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.fy_grade        = "SD30";
    options.bar_diameter_mm = 16.0;
    const auto record       = fsa::test_support::prepare(options);
    const auto params       = fsa::ddm::make_flexure_params(record);
    EXPECT_DOUBLE_EQ(params.rho_min, 0.0020);
    EXPECT_DOUBLE_EQ(params.fc_pa, record.materials.fc_pa);
    EXPECT_THAT(params.bar_diameter_mm, DoubleNear(16.0, 1.0e-9));
    EXPECT_THAT(params.cover, DoubleNear(0.03, 1.0e-12));
}
