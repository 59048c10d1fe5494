/**
 * @file validator.hpp
 * @brief ACI 318 design-criteria checks (thickness, drop panel, DDM limits) uwu
 *
 * every check here is a pure diagnostic: it never throws and never bails early.
 * each result carries the verdict *and* the numbers used to reach it so the
 * report layer can show the work (required vs provided, the denominator
 * picked from Table 8.3.1.1, the ratio that blew the DDM limit, ...).
 * failing one DDM rule never suppresses evaluation of the others.
 *
 * @author LukeFrankio
 * @date 2025-11-06
 * @version 1.0
 */
#pragma once

#include <string>
#include <vector>

#include "fsa/geometry/prepare.hpp"

namespace fsa::criteria
{

/**
 * @brief minimum slab thickness verdict per ACI Table 8.3.1.1
 */
struct ThicknessCheck
{
    bool        passed{};       ///< provided >= required
    double      required_h{};   ///< governing minimum thickness [m]
    double      provided_h{};   ///< slab thickness [m]
    double      ln_long{};      ///< longer clear span used [m]
    double      denominator{};  ///< 30 / 33 / 36
    double      fy_factor{};    ///< 0.8 + fy/1400
    double      absolute_min{}; ///< 0.10 m with drop, 0.125 m without
    std::string case_name;      ///< e.g. "Exterior panel, no drop panel, no edge beam"
};

/**
 * @brief one dimensional requirement (provided vs required)
 */
struct DimensionCheck
{
    std::string label;     ///< "Depth", "Width W1", "Width W2"
    bool        passed{};
    double      provided{}; ///< [m]
    double      required{}; ///< [m]
    double      margin{};   ///< provided - required [m], 0 on the boundary
};

/**
 * @brief one applicability rule and its outcome
 */
struct ApplicabilityRule
{
    std::string name;     ///< short rule id, e.g. "panel_ratio"
    bool        passed{};
    double      value{};  ///< evaluated ratio
    double      limit{};  ///< ACI limit
    std::string message;  ///< human-readable verdict
};

/**
 * @brief overall applicability verdict + every rule evaluated
 */
struct Applicability
{
    bool                           applicable{true};
    std::vector<ApplicabilityRule> rules;
};

/**
 * @brief everything validate_criteria produces in one bundle
 */
struct CriteriaReport
{
    ThicknessCheck              min_thickness;
    std::vector<DimensionCheck> drop_panel; ///< empty when no drop panel
    Applicability               ddm;
    Applicability               efm;
};

/**
 * @brief Table 8.3.1.1 denominator for a panel case
 *
 * ✨ PURE FUNCTION ✨
 *
 * | | no drop | drop |
 * |---|---|---|
 * | exterior, no edge beam | 30 | 33 |
 * | exterior, edge beam | 33 | 36 |
 * | interior | 33 | 36 |
 *
 * @param exterior panel at an edge or corner column
 * @param has_drop drop panel present
 * @param has_edge_beam edge beam present (ignored for interior panels)
 */
[[nodiscard]] constexpr auto thickness_denominator(bool exterior, bool has_drop, bool has_edge_beam) noexcept
    -> double
{
    const double base = has_drop ? 36.0 : 33.0;
    if (exterior && !has_edge_beam)
    {
        return base - 3.0;
    }
    return base;
}

/**
 * @brief minimum thickness check
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto check_min_thickness(const geometry::NormalizedRecord &record) -> ThicknessCheck;

/**
 * @brief drop panel depth (>= h/4) and width (>= L/6 past the centreline each way) checks
 *
 * ✨ PURE FUNCTION ✨
 *
 * with spans on both sides the width must be 2 max(L)/6; at a slab edge the
 * drop starts at the edge, so one span gives L/6 + c/2.
 *
 * @return three checks (depth, W1, W2), or an empty list without a drop panel
 *
 * @note boundary equality counts as a pass; a 1e-9 m tolerance absorbs
 *       cm -> m round-off so "exactly h/4" typed in cm still passes
 */
[[nodiscard]] auto check_drop_panel(const geometry::NormalizedRecord &record) -> std::vector<DimensionCheck>;

/**
 * @brief Direct Design Method limits (panel ratio, LL/DL, successive spans)
 *
 * ✨ PURE FUNCTION ✨
 *
 * successive-span rules are only listed for a direction where both adjacent
 * spans exist (so a corner column never reports them).
 */
[[nodiscard]] auto check_ddm_applicability(const geometry::NormalizedRecord &record) -> Applicability;

/**
 * @brief EFM is applicable to any flat slab geometry; reports one info rule
 */
[[nodiscard]] auto check_efm_applicability(const geometry::NormalizedRecord &record) -> Applicability;

/**
 * @brief runs every check above
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto validate_criteria(const geometry::NormalizedRecord &record) -> CriteriaReport;

} // namespace fsa::criteria
