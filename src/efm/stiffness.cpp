/**
 * @file stiffness.cpp
 * @brief EFM stiffness pipeline implementation uwu
 */
#include "fsa/efm/stiffness.hpp"

#include <initializer_list>

#include "fsa/common/math.hpp"

namespace fsa::efm
{

auto slab_stiffness(double ec, double is, double l1) noexcept -> double
{
    return common::safe_divide(4.0 * ec * is, l1);
}

auto torsional_arm_stiffness(double ec, double c, double l2, double c2) noexcept -> double
{
    if (l2 <= c2)
    {
        return 0.0;
    }
    const double shape = 1.0 - (c2 / l2);
    return (9.0 * ec * c) / (l2 * shape * shape * shape);
}

auto equivalent_column_stiffness(double sum_kc, double kt) noexcept -> double
{
    if (sum_kc <= 0.0 || kt <= 0.0)
    {
        return 0.0;
    }
    return 1.0 / ((1.0 / sum_kc) + (1.0 / kt));
}

auto distribution_factors(double ks, double kec) noexcept -> DistributionFactors
{
    const double total = ks + kec;
    if (total <= 0.0)
    {
        return {};
    }
    return DistributionFactors{ks / total, kec / total};
}

auto torsional_member_constant(const geometry::NormalizedRecord &record) noexcept -> double
{
    const auto &panel = record.panel;
    if (panel.has_edge_beam)
    {
        return common::torsion_constant(panel.edge_beam_width, panel.edge_beam_depth);
    }
    return common::torsion_constant(record.geometry.h_slab, record.geometry.c1);
}

auto run_efm(const geometry::NormalizedRecord &record) -> StiffnessSet
{
    const auto &geom = record.geometry;
    const auto &cols = record.columns;

    StiffnessSet set{};
    set.ec = record.materials.ec_pa;
    set.is = common::rectangle_inertia(geom.l2, geom.h_slab);
    set.ic = cols.ic;
    set.c  = torsional_member_constant(record);
    set.ks = slab_stiffness(set.ec, set.is, geom.l1);

    set.kc_up  = cols.kc_up;
    set.kc_lo  = cols.kc_lo;
    set.sum_kc = cols.sum_kc;

    // one arm per transverse span actually framing into the joint, each with its own length
    set.torsion_arms = geom.l2_span_count();
    for (const double span : {geom.l2_top, geom.l2_bottom})
    {
        if (span > 0.0)
        {
            set.kt += torsional_arm_stiffness(set.ec, set.c, span, geom.c2);
        }
    }
    set.kec          = equivalent_column_stiffness(set.sum_kc, set.kt);

    const auto df = distribution_factors(set.ks, set.kec);
    set.df_slab   = df.slab;
    set.df_col    = df.column;
    return set;
}

} // namespace fsa::efm
