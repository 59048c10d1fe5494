/**
 * @file stiffness.hpp
 * @brief Equivalent Frame Method member stiffnesses + joint distribution factors uwu
 *
 * EFM here stops at the stiffness stage: slab Ks, columns Kc, torsional
 * member Kt, the series-spring equivalent column Kec and the two distribution
 * factors at the joint. zero stiffness anywhere means "fully flexible" and
 * never a division error.
 *
 * @author LukeFrankio
 * @date 2025-11-07
 * @version 1.0
 */
#pragma once

#include "fsa/geometry/prepare.hpp"

namespace fsa::efm
{

/**
 * @brief every stiffness term at the joint (SI units)
 */
struct StiffnessSet
{
    double ec{};           ///< concrete modulus [Pa]
    double is{};           ///< gross slab inertia over l2 [m^4]
    double ic{};           ///< column inertia [m^4]
    double c{};            ///< torsional constant of the transverse member [m^4]
    double ks{};           ///< 4 Ec Is / l1 [N.m/rad]
    double kc_up{};        ///< upper column, 0 at a roof joint
    double kc_lo{};
    double sum_kc{};
    int    torsion_arms{}; ///< transverse members framing into the joint
    double kt{};           ///< sum of the arms, each over its own l2 span
    double kec{};          ///< equivalent column
    double df_slab{};
    double df_col{};
};

struct DistributionFactors
{
    double slab{};
    double column{};
};

/**
 * @brief far-end-fixed slab stiffness 4 Ec Is / l1
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto slab_stiffness(double ec, double is, double l1) noexcept -> double;

/**
 * @brief stiffness of one torsional arm 9 Ec C / (l2 (1 - c2/l2)^3)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return 0 when l2 <= c2 (the arm has no length)
 */
[[nodiscard]] auto torsional_arm_stiffness(double ec, double c, double l2, double c2) noexcept -> double;

/**
 * @brief series combination 1/Kec = 1/Sum_Kc + 1/Kt, 0 if either side is 0
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto equivalent_column_stiffness(double sum_kc, double kt) noexcept -> double;

/**
 * @brief DF_slab = Ks / (Ks + Kec), DF_col = Kec / (Ks + Kec); both 0 when the sum is 0
 */
[[nodiscard]] auto distribution_factors(double ks, double kec) noexcept -> DistributionFactors;

/**
 * @brief torsional constant of the member framing transversely into the joint
 *
 * edge beam section when there is one, otherwise a slab strip h_slab x c1
 */
[[nodiscard]] auto torsional_member_constant(const geometry::NormalizedRecord &record) noexcept -> double;

/**
 * @brief run the EFM stiffness pipeline
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param record normalized scenario from geometry::prepare_geometry
 * @return complete StiffnessSet
 */
[[nodiscard]] auto run_efm(const geometry::NormalizedRecord &record) -> StiffnessSet;

} // namespace fsa::efm
