/**
 * @file efm_test.cpp
 * @brief Equivalent Frame Method stiffness terms and distribution factors uwu
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fsa/common/math.hpp"
#include "fsa/efm/stiffness.hpp"
#include "support/scenario_builder.hpp"

using testing::DoubleNear;

namespace
{

constexpr double kEc = 25.0e9;

[[nodiscard]] auto relative(double expected) -> double
{
    return 1.0e-12 * (expected < 0.0 ? -expected : expected);
}

} // namespace

TEST(SlabStiffness, FourEIOverL)
{
    EXPECT_DOUBLE_EQ(fsa::efm::slab_stiffness(kEc, 0.004, 6.0), 4.0 * kEc * 0.004 / 6.0);
    EXPECT_DOUBLE_EQ(fsa::efm::slab_stiffness(kEc, 0.004, 0.0), 0.0);
}

TEST(TorsionalArm, ClosedFormAndDegenerateArm)
{
    const double c     = 0.002;
    const double shape = 1.0 - (0.5 / 6.0);
    EXPECT_THAT(fsa::efm::torsional_arm_stiffness(kEc, c, 6.0, 0.5),
                DoubleNear(9.0 * kEc * c / (6.0 * shape * shape * shape), relative(9.0 * kEc * c / 6.0)));

    // column as wide as the panel: nothing left to twist
    EXPECT_DOUBLE_EQ(fsa::efm::torsional_arm_stiffness(kEc, c, 0.5, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(fsa::efm::torsional_arm_stiffness(kEc, c, 0.4, 0.5), 0.0);
}

/**
 * @test springs in series: 1/Kec = 1/Sum_Kc + 1/Kt
 */
TEST(EquivalentColumn, SeriesCombination)
{
    EXPECT_THAT(fsa::efm::equivalent_column_stiffness(3.0, 6.0), DoubleNear(2.0, 1.0e-12));
    EXPECT_THAT(fsa::efm::equivalent_column_stiffness(5.0, 5.0), DoubleNear(2.5, 1.0e-12));
    EXPECT_LT(fsa::efm::equivalent_column_stiffness(100.0, 1.0), 1.0);
}

TEST(EquivalentColumn, ZeroEitherSideIsFullyFlexible)
{
    EXPECT_DOUBLE_EQ(fsa::efm::equivalent_column_stiffness(0.0, 6.0), 0.0);
    EXPECT_DOUBLE_EQ(fsa::efm::equivalent_column_stiffness(3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(fsa::efm::equivalent_column_stiffness(0.0, 0.0), 0.0);
}

TEST(DistributionFactors, SumToOne)
{
    const auto df = fsa::efm::distribution_factors(3.0, 1.0);
    EXPECT_DOUBLE_EQ(df.slab, 0.75);
    EXPECT_DOUBLE_EQ(df.column, 0.25);
    EXPECT_DOUBLE_EQ(df.slab + df.column, 1.0);
}

TEST(DistributionFactors, ZeroSumGivesZeroFactors)
{
    const auto df = fsa::efm::distribution_factors(0.0, 0.0);
    EXPECT_DOUBLE_EQ(df.slab, 0.0);
    EXPECT_DOUBLE_EQ(df.column, 0.0);
}

/**
 * @test interior joint: two torsional arms, slab strip h x c1 as the member
 */
TEST(RunEfm, InteriorJointStiffnesses)
{
    const auto record = fsa::test_support::prepare();
    const auto set    = fsa::efm::run_efm(record);

    EXPECT_DOUBLE_EQ(set.ec, record.materials.ec_pa);
    EXPECT_THAT(set.is, DoubleNear(6.0 * 0.2 * 0.2 * 0.2 / 12.0, 1.0e-12));
    EXPECT_THAT(set.ks, DoubleNear(4.0 * set.ec * set.is / 6.0, relative(set.ks)));
    EXPECT_DOUBLE_EQ(set.ic, record.columns.ic);
    EXPECT_DOUBLE_EQ(set.sum_kc, set.kc_up + set.kc_lo);
    EXPECT_GT(set.kc_up, 0.0);

    EXPECT_THAT(set.c, DoubleNear(fsa::common::torsion_constant(0.2, 0.5), 1.0e-15));
    EXPECT_EQ(set.torsion_arms, 2);
    const double one_arm = fsa::efm::torsional_arm_stiffness(set.ec, set.c, 6.0, 0.5);
    EXPECT_THAT(set.kt, DoubleNear(2.0 * one_arm, relative(set.kt)));
    EXPECT_THAT(set.kec, DoubleNear(1.0 / ((1.0 / set.sum_kc) + (1.0 / set.kt)), relative(set.kec)));

    EXPECT_THAT(set.df_slab + set.df_col, DoubleNear(1.0, 1.0e-12));
    EXPECT_GT(set.df_slab, 0.0);
    EXPECT_GT(set.df_col, 0.0);
    EXPECT_LT(set.kec, set.sum_kc);
}

/**
 * @test unequal transverse spans: each arm is evaluated over its own length
 */
TEST(RunEfm, UnequalTransverseSpansSumPerArm)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.l2_top    = 4.0;
    options.l2_bottom = 8.0;
    const auto set    = fsa::efm::run_efm(fsa::test_support::prepare(options));

    EXPECT_EQ(set.torsion_arms, 2);
    const double expected = fsa::efm::torsional_arm_stiffness(set.ec, set.c, 4.0, 0.5) +
                            fsa::efm::torsional_arm_stiffness(set.ec, set.c, 8.0, 0.5);
    EXPECT_THAT(set.kt, DoubleNear(expected, relative(expected)));

    // the mean span undershoots because the arm stiffness is convex in l2
    const double at_mean = 2.0 * fsa::efm::torsional_arm_stiffness(set.ec, set.c, 6.0, 0.5);
    EXPECT_GT(set.kt, 1.1 * at_mean);
    EXPECT_THAT(set.kec, DoubleNear(1.0 / ((1.0 / set.sum_kc) + (1.0 / set.kt)), relative(set.kec)));
}

TEST(RunEfm, CornerJointHasOneTorsionalArm)
{
    const auto interior = fsa::efm::run_efm(fsa::test_support::prepare());
    const auto corner   = fsa::efm::run_efm(fsa::test_support::prepare(fsa::test_support::corner_options()));
    EXPECT_EQ(corner.torsion_arms, 1);
    EXPECT_LT(corner.kt, interior.kt);
}

TEST(RunEfm, RoofJointHasNoUpperColumn)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.joint     = "roof";
    const auto set    = fsa::efm::run_efm(fsa::test_support::prepare(options));
    EXPECT_DOUBLE_EQ(set.kc_up, 0.0);
    EXPECT_DOUBLE_EQ(set.sum_kc, set.kc_lo);
    EXPECT_THAT(set.df_slab + set.df_col, DoubleNear(1.0, 1.0e-12));
}

/**
 * @test a stiffer torsional member pushes more of the joint moment into the columns
 */
TEST(RunEfm, EdgeBeamIsTheTorsionalMember)
{
    auto options   = fsa::test_support::edge_options();
    const auto flat = fsa::efm::run_efm(fsa::test_support::prepare(options));

    options.edge_beam = fsa::test_support::EdgeBeamSpec{30.0, 60.0};
    const auto record = fsa::test_support::prepare(options);
    const auto beam   = fsa::efm::run_efm(record);

    EXPECT_THAT(beam.c, DoubleNear(fsa::common::torsion_constant(0.3, 0.6), 1.0e-15));
    EXPECT_DOUBLE_EQ(fsa::efm::torsional_member_constant(record), beam.c);
    EXPECT_GT(beam.kt, flat.kt);
    EXPECT_GT(beam.df_col, flat.df_col);
}
