/**
 * @file validator.cpp
 * @brief ACI 318 design criteria checks implementation uwu
 */
#include "fsa/criteria/validator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace fsa::criteria
{
namespace
{

constexpr double kTolerance      = 1.0e-9;
constexpr double kMaxPanelRatio  = 2.0;
constexpr double kMaxLoadRatio   = 2.0;
constexpr double kMaxSpanDiff    = 1.0 / 3.0;

[[nodiscard]] auto describe_case(bool exterior, bool has_drop, bool has_edge_beam) -> std::string
{
    const std::string_view panel = exterior ? "Exterior panel" : "Interior panel";
    const std::string_view drop  = has_drop ? "with drop panel" : "no drop panel";
    if (!exterior)
    {
        return std::format("{}, {}", panel, drop);
    }
    return std::format("{}, {}, {}", panel, drop, has_edge_beam ? "with edge beam" : "no edge beam");
}

// drop must reach L/6 past the column centreline on every side that has a span;
// an open (slab edge) side is measured from the edge, so it adds half the column
[[nodiscard]] auto required_drop_width(double near_span, double far_span, double column) noexcept -> double
{
    if (near_span > 0.0 && far_span > 0.0)
    {
        return 2.0 * std::max(near_span, far_span) / 6.0;
    }
    return (std::max(near_span, far_span) / 6.0) + (column / 2.0);
}

[[nodiscard]] auto make_dimension(std::string label, double provided, double required) -> DimensionCheck
{
    DimensionCheck check{};
    check.label    = std::move(label);
    check.provided = provided;
    check.required = required;
    check.margin   = provided - required;
    check.passed   = provided + kTolerance >= required;
    if (std::abs(check.margin) < kTolerance)
    {
        check.margin = 0.0;
    }
    return check;
}

[[nodiscard]] auto successive_span_rule(std::string name, std::string_view direction, double span_a, double span_b)
    -> ApplicabilityRule
{
    ApplicabilityRule rule{};
    rule.name             = std::move(name);
    rule.limit            = kMaxSpanDiff;
    const double longer   = std::max(span_a, span_b);
    rule.value            = longer > 0.0 ? std::abs(span_a - span_b) / longer : 0.0;
    rule.passed           = rule.value <= kMaxSpanDiff + kTolerance;
    rule.message          = rule.passed
                                ? std::format("{} span difference {:.1f}% <= 33% (pass)", direction, rule.value * 100.0)
                                : std::format("{} span difference {:.1f}% > 33% of the longer span", direction,
                                              rule.value * 100.0);
    return rule;
}

} // namespace

auto check_min_thickness(const geometry::NormalizedRecord &record) -> ThicknessCheck
{
    const auto &geom     = record.geometry;
    const bool  exterior = record.panel.location != config::PanelLocation::Interior;

    ThicknessCheck check{};
    check.provided_h   = geom.h_slab;
    check.ln_long      = std::max(geom.l1 - geom.c1, geom.l2 - geom.c2);
    check.denominator  = thickness_denominator(exterior, geom.has_drop, record.panel.has_edge_beam);
    check.fy_factor    = 0.8 + (record.materials.fy_mpa / 1400.0);
    check.absolute_min = geom.has_drop ? 0.10 : 0.125;
    check.required_h   = std::max(check.ln_long * check.fy_factor / check.denominator, check.absolute_min);
    check.passed       = check.provided_h + kTolerance >= check.required_h;
    check.case_name    = describe_case(exterior, geom.has_drop, record.panel.has_edge_beam);
    return check;
}

auto check_drop_panel(const geometry::NormalizedRecord &record) -> std::vector<DimensionCheck>
{
    const auto &geom = record.geometry;
    if (!geom.has_drop)
    {
        return {};
    }
    return {make_dimension("Depth", geom.drop_projection, geom.h_slab / 4.0),
            make_dimension("Width W1", geom.drop_w1, required_drop_width(geom.l1_left, geom.l1_right, geom.c1)),
            make_dimension("Width W2", geom.drop_w2, required_drop_width(geom.l2_top, geom.l2_bottom, geom.c2))};
}

auto check_ddm_applicability(const geometry::NormalizedRecord &record) -> Applicability
{
    const auto   &geom = record.geometry;
    Applicability result{};

    {
        ApplicabilityRule rule{};
        rule.name          = "panel_ratio";
        rule.limit         = kMaxPanelRatio;
        const double long_side  = std::max(geom.l1, geom.l2);
        const double short_side = std::min(geom.l1, geom.l2);
        rule.value         = short_side > 0.0 ? long_side / short_side : 0.0;
        rule.passed        = rule.value <= kMaxPanelRatio + kTolerance;
        rule.message       = rule.passed ? std::format("Panel ratio long/short {:.2f} <= 2.0 (pass)", rule.value)
                                         : std::format("Panel ratio long/short {:.2f} > 2.0", rule.value);
        result.rules.push_back(std::move(rule));
    }

    {
        ApplicabilityRule rule{};
        rule.name  = "load_ratio";
        rule.limit = kMaxLoadRatio;
        const auto &loads = record.loads;
        if (loads.dead_pa > 0.0)
        {
            rule.value = loads.live_pa / loads.dead_pa;
        }
        else
        {
            rule.value = loads.live_pa > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
        }
        rule.passed  = rule.value <= kMaxLoadRatio + kTolerance;
        rule.message = rule.passed ? std::format("Load ratio LL/DL {:.2f} <= 2.0 (pass)", rule.value)
                                   : std::format("Load ratio LL/DL {:.2f} > 2.0", rule.value);
        result.rules.push_back(std::move(rule));
    }

    if (geom.l1_span_count() == 2)
    {
        result.rules.push_back(successive_span_rule("l1_successive_spans", "L1", geom.l1_left, geom.l1_right));
    }
    if (geom.l2_span_count() == 2)
    {
        result.rules.push_back(successive_span_rule("l2_successive_spans", "L2", geom.l2_top, geom.l2_bottom));
    }

    result.applicable = std::ranges::all_of(result.rules, [](const ApplicabilityRule &r) { return r.passed; });
    return result;
}

auto check_efm_applicability(const geometry::NormalizedRecord & /*record*/) -> Applicability
{
    Applicability result{};
    result.rules.push_back(ApplicabilityRule{"general", true, 0.0, 0.0, "EFM is applicable for this geometry"});
    return result;
}

auto validate_criteria(const geometry::NormalizedRecord &record) -> CriteriaReport
{
    return CriteriaReport{check_min_thickness(record), check_drop_panel(record), check_ddm_applicability(record),
                          check_efm_applicability(record)};
}

} // namespace fsa::criteria
