/**
 * @file coefficients.cpp
 * @brief longitudinal + transverse DDM tables uwu
 */
#include "fsa/ddm/coefficients.hpp"

#include <algorithm>

#include "fsa/common/math.hpp"

namespace fsa::ddm
{
namespace
{

constexpr double kBetaTLimit = 2.5;

// flat plate exterior share at beta_t >= 2.5 once l2/l1 reaches 2.0
constexpr double kExteriorRestrainedAtRatioTwo = 0.80;

// ACI 8.10.5 row for alpha_f1 l2/l1 >= 1.0
[[nodiscard]] auto beam_row(double l2_l1) noexcept -> double
{
    if (l2_l1 <= 1.0)
    {
        return common::lerp(l2_l1, 0.5, 0.90, 1.0, 0.75);
    }
    return common::lerp(l2_l1, 1.0, 0.75, 2.0, 0.45);
}

[[nodiscard]] auto interior_negative(double l2_l1, double alpha_term) noexcept -> double
{
    return common::lerp(alpha_term, 0.0, 0.75, 1.0, beam_row(l2_l1));
}

// exterior negative share once beta_t reaches 2.5: 75 % up to l2/l1 = 1, rising to 80 % at 2
[[nodiscard]] auto exterior_restrained(double l2_l1, double alpha_term) noexcept -> double
{
    const double flat = l2_l1 <= 1.0 ? 0.75 : common::lerp(l2_l1, 1.0, 0.75, 2.0, kExteriorRestrainedAtRatioTwo);
    return common::lerp(alpha_term, 0.0, flat, 1.0, beam_row(l2_l1));
}

} // namespace

auto to_string(MomentComponent component) -> std::string_view
{
    switch (component)
    {
    case MomentComponent::NegativeExterior:
        return "neg_ext";
    case MomentComponent::Positive:
        return "pos";
    case MomentComponent::NegativeInterior:
        return "neg_int";
    }
    return "pos";
}

auto select_coefficients(const geometry::PanelCase &panel) noexcept -> LongitudinalCoefficients
{
    if (!panel.is_end_span())
    {
        return {0.65, 0.35, 0.65, "Interior span"};
    }
    if (panel.fully_restrained_edge)
    {
        return {0.65, 0.35, 0.65, "End span (exterior edge fully restrained)"};
    }
    if (panel.has_edge_beam)
    {
        return {0.30, 0.50, 0.70, "End span (edge beam)"};
    }
    return {0.26, 0.52, 0.70, "End span (flat plate, no edge beam)"};
}

auto get_col_strip_percent(StripTable table, double l2_l1, double alpha_f1, double beta_t) noexcept -> double
{
    const double ratio      = common::clamp_between(l2_l1, 0.5, 2.0);
    const double alpha_term = common::clamp_between(std::max(alpha_f1, 0.0) * ratio, 0.0, 1.0);

    switch (table)
    {
    case StripTable::InteriorNegative:
        return interior_negative(ratio, alpha_term);
    case StripTable::Positive:
        return common::lerp(alpha_term, 0.0, 0.60, 1.0, beam_row(ratio));
    case StripTable::ExteriorNegative: {
        const double at_full_restraint = exterior_restrained(ratio, alpha_term);
        return common::lerp(beta_t, 0.0, 1.0, kBetaTLimit, at_full_restraint);
    }
    }
    return 0.0;
}

auto compute_beta_t(const geometry::NormalizedRecord &record) noexcept -> double
{
    const auto &panel = record.panel;
    if (!panel.has_edge_beam)
    {
        return 0.0;
    }
    const double c  = common::torsion_constant(panel.edge_beam_width, panel.edge_beam_depth);
    const double is = common::rectangle_inertia(record.geometry.l2, record.geometry.h_slab);
    return common::safe_divide(c, 2.0 * is);
}

auto clamp_clear_span(double l1, double ln_actual) noexcept -> ClearSpan
{
    const double floor_value = 0.65 * l1;
    if (ln_actual < floor_value)
    {
        return ClearSpan{ln_actual, floor_value, true};
    }
    return ClearSpan{ln_actual, ln_actual, false};
}

} // namespace fsa::ddm
