/**
 * @file flexure.cpp
 * @brief closed-form flexural design for DDM strips uwu
 */
#include "fsa/ddm/flexure.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace fsa::ddm
{
namespace
{

constexpr double kRnCeiling  = 0.35;  // x f'c
constexpr double kMaxSpacing = 0.45;  // [m]
constexpr double kSpacingStep = 0.01; // round spacing down to whole cm

[[nodiscard]] auto fail(std::string message, double rn, double limit) -> std::expected<SteelDemand, FlexureError>
{
    return std::unexpected(FlexureError{std::move(message), rn, limit});
}

} // namespace

auto to_string(RebarStatus status) -> std::string_view
{
    switch (status)
    {
    case RebarStatus::Ok:
        return "OK";
    case RebarStatus::MinSteel:
        return "MinSteel";
    case RebarStatus::Fail:
        return "Fail";
    }
    return "Fail";
}

auto to_string(StripKind strip) -> std::string_view
{
    switch (strip)
    {
    case StripKind::Column:
        return "column";
    case StripKind::Middle:
        return "middle";
    }
    return "column";
}

auto make_flexure_params(const geometry::NormalizedRecord &record) -> FlexureParams
{
    FlexureParams params{};
    params.fc_pa           = record.materials.fc_pa;
    params.fy_pa           = record.materials.fy_pa;
    params.rho_min         = min_steel_ratio(record.materials.fy_ksc);
    params.cover           = record.detailing.cover;
    params.bar_area        = record.detailing.bar_area;
    params.bar_diameter_mm = record.detailing.bar_diameter / record.units.mm_to_m;
    return params;
}

auto required_steel(double mu, double width, double thickness, const FlexureParams &params)
    -> std::expected<SteelDemand, FlexureError>
{
    const double d = thickness - params.cover;
    if (width <= 0.0 || d <= 0.0)
    {
        return fail(std::format("section has no capacity (b = {:.3f} m, d = {:.3f} m)", width, d), 0.0, 0.0);
    }

    SteelDemand demand{};
    demand.rn = std::abs(mu) / (params.phi * width * d * d);

    const double ceiling = kRnCeiling * params.fc_pa;
    if (demand.rn > ceiling)
    {
        return fail(std::format("Rn = {:.2f} MPa exceeds 0.35 f'c = {:.2f} MPa", demand.rn / 1.0e6, ceiling / 1.0e6),
                    demand.rn, ceiling);
    }

    const double radicand = 1.0 - (2.0 * demand.rn / (0.85 * params.fc_pa));
    if (radicand < 0.0)
    {
        return fail("negative radicand in the rho quadratic (section over-stressed)", demand.rn, ceiling);
    }

    demand.rho         = (0.85 * params.fc_pa / params.fy_pa) * (1.0 - std::sqrt(radicand));
    demand.as_calc     = demand.rho * width * d;
    demand.as_min      = params.rho_min * width * thickness;
    demand.min_governs = demand.as_min > demand.as_calc;
    demand.as_required = demand.min_governs ? demand.as_min : demand.as_calc;
    return demand;
}

auto suggest_bars(double as_required, double width, double thickness, const FlexureParams &params) -> BarSuggestion
{
    BarSuggestion suggestion{};
    const auto    bar_name    = std::format("DB{:.0f}", params.bar_diameter_mm);
    const double  max_spacing = std::min(2.0 * thickness, kMaxSpacing);
    if (as_required <= 0.0 || params.bar_area <= 0.0 || width <= 0.0)
    {
        suggestion.text = "n/a";
        return suggestion;
    }

    double spacing = std::min(params.bar_area * width / as_required, max_spacing);
    spacing        = std::floor(spacing / kSpacingStep) * kSpacingStep;
    if (spacing < kSpacingStep)
    {
        spacing = kSpacingStep;
    }
    suggestion.spacing = spacing;
    suggestion.count   = std::max(1, static_cast<int>(std::ceil(width / spacing)));
    suggestion.text    = std::format("{} @ {:.2f} m ({} bars)", bar_name, spacing, suggestion.count);
    return suggestion;
}

auto design_section(MomentComponent location, StripKind strip, double mu, double width, double thickness,
                    const FlexureParams &params) -> RebarSection
{
    RebarSection section{};
    section.location  = location;
    section.strip     = strip;
    section.mu        = mu;
    section.width     = width;
    section.thickness = thickness;
    section.depth     = thickness - params.cover;

    const auto demand = required_steel(mu, width, thickness, params);
    if (!demand)
    {
        section.rn          = demand.error().rn;
        section.as_required = 0.0;
        section.status      = RebarStatus::Fail;
        section.bars.text   = "section inadequate - increase thickness";
        section.note        = demand.error().message;
        return section;
    }

    section.rn          = demand->rn;
    section.as_required = demand->as_required;
    section.status      = demand->min_governs ? RebarStatus::MinSteel : RebarStatus::Ok;
    section.bars        = suggest_bars(section.as_required, width, thickness, params);
    return section;
}

} // namespace fsa::ddm
