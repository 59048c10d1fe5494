/**
 * @file engine.cpp
 * @brief Direct Design Method pipeline implementation uwu
 */
#include "fsa/ddm/engine.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "fsa/common/math.hpp"
#include "fsa/criteria/validator.hpp"

namespace fsa::ddm
{
namespace
{

constexpr double kKilo = 1.0e3;

// thickness used for a strip section: column strip negative sections sit in the drop
[[nodiscard]] auto section_thickness(const geometry::Geometry &geom, MomentComponent component, StripKind strip)
    -> double
{
    const bool negative = component != MomentComponent::Positive;
    if (geom.has_drop && negative && strip == StripKind::Column)
    {
        return geom.h_drop;
    }
    return geom.h_slab;
}

[[nodiscard]] auto exterior_negative_share(const geometry::NormalizedRecord &record, double l2_l1, double beta_t)
    -> double
{
    // an interior span's "exterior" support is just another interior support
    if (!record.panel.is_end_span() || record.panel.fully_restrained_edge)
    {
        return get_col_strip_percent(StripTable::InteriorNegative, l2_l1, 0.0, 0.0);
    }
    return get_col_strip_percent(StripTable::ExteriorNegative, l2_l1, 0.0, beta_t);
}

void append_criteria_warnings(const geometry::NormalizedRecord &record, std::vector<std::string> &warnings)
{
    const auto applicability = criteria::check_ddm_applicability(record);
    for (const auto &rule : applicability.rules)
    {
        if (!rule.passed)
        {
            warnings.push_back(std::format("DDM limit violated: {}", rule.message));
        }
    }

    const auto thickness = criteria::check_min_thickness(record);
    if (!thickness.passed)
    {
        warnings.push_back(std::format("slab thickness {:.1f} cm < ACI minimum {:.1f} cm ({}); check deflections",
                                       thickness.provided_h * 100.0, thickness.required_h * 100.0,
                                       thickness.case_name));
    }
}

} // namespace

auto split_moment(MomentComponent component, double coefficient, double mo, double cs_pct) noexcept -> MomentShare
{
    MomentShare share{};
    share.component   = component;
    share.coefficient = coefficient;
    share.total       = coefficient * mo;
    share.cs_pct      = common::clamp_between(cs_pct, 0.0, 1.0);
    share.cs          = share.total * share.cs_pct;
    share.ms          = share.total - share.cs;
    return share;
}

auto strip_widths(const geometry::Geometry &geom) noexcept -> StripWidths
{
    StripWidths widths{};
    widths.column = std::min(0.5 * std::min(geom.l1, geom.l2), geom.l2);
    widths.middle = std::max(geom.l2 - widths.column, 0.0);
    return widths;
}

auto run_ddm(const geometry::NormalizedRecord &record) -> DdmResult
{
    const auto &geom = record.geometry;

    DdmResult result{};
    result.wu         = record.loads.wu_pa;
    result.clear_span = clamp_clear_span(geom.l1, geom.ln);
    if (result.clear_span.clamped)
    {
        result.notes.push_back(std::format("clear span {:.3f} m < 0.65 L1; using Ln = {:.3f} m",
                                           result.clear_span.actual, result.clear_span.used));
    }
    if (record.cantilever.moment_left > 0.0 || record.cantilever.moment_right > 0.0)
    {
        result.notes.push_back(std::format(
            "cantilever balancing moments L = {:.1f} kN.m, R = {:.1f} kN.m are informational and not applied",
            record.cantilever.moment_left / kKilo, record.cantilever.moment_right / kKilo));
    }

    // longitudinal distribution
    result.coefficients = select_coefficients(record.panel);
    result.moments.mo   = static_moment(result.wu, geom.l2, result.clear_span.used);

    // transverse distribution (flat plate: alpha_f1 = 0)
    result.l2_l1  = common::safe_divide(geom.l2, geom.l1, 1.0);
    result.beta_t = compute_beta_t(record);

    const double mo = result.moments.mo;
    result.moments.neg_ext = split_moment(MomentComponent::NegativeExterior, result.coefficients.neg_ext, mo,
                                          exterior_negative_share(record, result.l2_l1, result.beta_t));
    result.moments.pos     = split_moment(MomentComponent::Positive, result.coefficients.pos, mo,
                                          get_col_strip_percent(StripTable::Positive, result.l2_l1, 0.0, 0.0));
    result.moments.neg_int = split_moment(MomentComponent::NegativeInterior, result.coefficients.neg_int, mo,
                                          get_col_strip_percent(StripTable::InteriorNegative, result.l2_l1, 0.0, 0.0));

    // flexural design per strip location
    result.strips       = strip_widths(geom);
    const auto params   = make_flexure_params(record);
    result.rebar.reserve(6U);
    for (const auto &share : result.moments.components())
    {
        for (const auto strip : {StripKind::Column, StripKind::Middle})
        {
            const bool   column = strip == StripKind::Column;
            const double mu     = column ? share.cs : share.ms;
            const double width  = column ? result.strips.column : result.strips.middle;
            auto section = design_section(share.component, strip, mu, width,
                                          section_thickness(geom, share.component, strip), params);
            if (section.status == RebarStatus::Fail)
            {
                result.warnings.push_back(std::format("flexure fails at {} {} strip: {}", to_string(share.component),
                                                      to_string(strip), section.note));
            }
            result.rebar.push_back(std::move(section));
        }
    }

    // punching shear
    result.shear = check_punching(record);
    for (const auto &check : result.shear)
    {
        if (check.status == ShearStatus::Fail)
        {
            result.warnings.push_back(std::format("punching shear fails at {}: Vu = {:.1f} kN > phiVc = {:.1f} kN",
                                                  to_string(check.section), check.vu / kKilo,
                                                  check.phi_vc / kKilo));
        }
    }

    append_criteria_warnings(record, result.warnings);
    return result;
}

} // namespace fsa::ddm
