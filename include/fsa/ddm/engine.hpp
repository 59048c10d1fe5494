/**
 * @file engine.hpp
 * @brief the Direct Design Method pipeline in one pure call uwu
 *
 * `run_ddm` glues the whole DDM story together:
 *
 * 1. clear span with the 0.65 L1 floor, static moment Mo = wu l2 ln^2 / 8
 * 2. longitudinal coefficients by panel case
 * 3. column strip / middle strip split (beta_t driven for the exterior support)
 * 4. flexural design of all six strip locations
 * 5. punching shear at the column face (+ drop panel face)
 *
 * applicability problems, thin slabs, failed sections and failed shear checks
 * become warning strings; the result is always complete and well-formed, even
 * when every single section fails. nothing here throws.
 *
 * @author LukeFrankio
 * @date 2025-11-06
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto record = fsa::geometry::prepare_geometry(scenario);
 * if (record) {
 *     const auto ddm = fsa::ddm::run_ddm(*record);
 *     // ddm.moments.mo [N.m], ddm.rebar has 6 sections, ddm.shear 1-2 checks
 * }
 * @endcode
 */
#pragma once

#include <array>
#include <string>
#include <vector>

#include "fsa/ddm/coefficients.hpp"
#include "fsa/ddm/flexure.hpp"
#include "fsa/ddm/punching.hpp"
#include "fsa/geometry/prepare.hpp"

namespace fsa::ddm
{

/**
 * @brief one longitudinal component and its column/middle strip split
 */
struct MomentShare
{
    MomentComponent component{MomentComponent::Positive};
    double          coefficient{}; ///< fraction of Mo
    double          total{};       ///< coefficient * Mo [N.m]
    double          cs_pct{};      ///< column strip fraction in [0, 1]
    double          cs{};          ///< column strip moment [N.m]
    double          ms{};          ///< middle strip moment [N.m], total - cs
};

/**
 * @brief static moment + its three distributed components
 */
struct MomentSet
{
    double      mo{}; ///< total static moment [N.m]
    MomentShare neg_ext;
    MomentShare pos;
    MomentShare neg_int;

    [[nodiscard]] auto components() const -> std::array<MomentShare, 3> { return {neg_ext, pos, neg_int}; }
};

/**
 * @brief strip widths used for design [m]
 */
struct StripWidths
{
    double column{};
    double middle{};
};

/**
 * @brief complete DDM output (read-only)
 */
struct DdmResult
{
    ClearSpan                     clear_span;
    double                        wu{};    ///< factored area load [Pa]
    double                        l2_l1{}; ///< span ratio used in the strip tables
    double                        beta_t{};
    LongitudinalCoefficients      coefficients;
    MomentSet                     moments;
    StripWidths                   strips;
    std::vector<RebarSection>     rebar;    ///< 6 sections: 3 components x {column, middle}
    std::vector<ShearCheckResult> shear;    ///< column face (+ drop panel face)
    std::vector<std::string>      notes;    ///< informational (Ln floor, cantilevers)
    std::vector<std::string>      warnings; ///< applicability, thickness, flexure, shear
};

/**
 * @brief split a component total into column + middle strip shares
 *
 * ✨ PURE FUNCTION ✨
 *
 * cs_pct is clamped to [0, 1] and ms is computed as total - cs so the two
 * shares always add back up to the total exactly.
 */
[[nodiscard]] auto split_moment(MomentComponent component, double coefficient, double mo, double cs_pct) noexcept
    -> MomentShare;

/**
 * @brief column strip = half the shorter span (bounded by l2), middle = rest
 */
[[nodiscard]] auto strip_widths(const geometry::Geometry &geom) noexcept -> StripWidths;

/**
 * @brief run the Direct Design Method pipeline
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param record normalized scenario from geometry::prepare_geometry
 * @return complete DdmResult; failures live in statuses + warnings
 */
[[nodiscard]] auto run_ddm(const geometry::NormalizedRecord &record) -> DdmResult;

} // namespace fsa::ddm
