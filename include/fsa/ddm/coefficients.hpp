/**
 * @file coefficients.hpp
 * @brief ACI 318 DDM moment coefficient tables + column strip interpolation uwu
 *
 * two tables live here. the longitudinal one (ACI 8.10.4) splits the static
 * moment Mo into exterior negative, positive and interior negative parts by
 * panel case. the transverse one (ACI 8.10.5) says how much of each part the
 * column strip grabs, with a nested interpolation on beta_t and l2/l1 for the
 * exterior negative moment. this nested lerp is the spiciest bit of the whole
 * engine, so it goes through common::lerp and nothing else ✨
 *
 * @author LukeFrankio
 * @date 2025-11-06
 * @version 1.0
 */
#pragma once

#include <cstdint>
#include <string_view>

#include "fsa/geometry/prepare.hpp"

namespace fsa::ddm
{

/**
 * @brief longitudinal moment component along the span
 */
enum class MomentComponent : std::uint8_t
{
    NegativeExterior = 0U,
    Positive         = 1U,
    NegativeInterior = 2U
};

/**
 * @brief which ACI 8.10.5 column-strip table to read
 */
enum class StripTable : std::uint8_t
{
    InteriorNegative = 0U,
    ExteriorNegative = 1U,
    Positive         = 2U
};

/**
 * @brief (neg_ext, pos, neg_int) triple + a label for the report
 */
struct LongitudinalCoefficients
{
    double           neg_ext{};
    double           pos{};
    double           neg_int{};
    std::string_view description;
};

/**
 * @brief clear span after the 0.65 L1 floor
 */
struct ClearSpan
{
    double actual{};  ///< l1 - c1 [m]
    double used{};    ///< max(actual, 0.65 l1) [m]
    bool   clamped{}; ///< true when the floor governed
};

[[nodiscard]] auto to_string(MomentComponent component) -> std::string_view;

/**
 * @brief longitudinal coefficients for a panel case
 *
 * ✨ PURE FUNCTION ✨
 *
 * | Case | neg_ext | pos | neg_int |
 * |---|---|---|---|
 * | interior span | 0.65 | 0.35 | 0.65 |
 * | end span, exterior edge fully restrained | 0.65 | 0.35 | 0.65 |
 * | end span, edge beam | 0.30 | 0.50 | 0.70 |
 * | end span, no edge beam | 0.26 | 0.52 | 0.70 |
 */
[[nodiscard]] auto select_coefficients(const geometry::PanelCase &panel) noexcept -> LongitudinalCoefficients;

/**
 * @brief column strip share (0..1) per ACI 8.10.5 with clamped nested lerp
 *
 * ✨ PURE FUNCTION ✨
 *
 * - beam row (alpha_f1 l2/l1 >= 1): 90 / 75 / 45 % at l2/l1 = 0.5 / 1.0 / 2.0
 * - interior negative: 75 % at alpha = 0, lerp toward the beam row
 * - positive: 60 % at alpha = 0, lerp toward the beam row
 * - exterior negative: 100 % at beta_t = 0, lerp toward the restrained value
 *   at beta_t = 2.5; that value is 75 % up to l2/l1 = 1.0 and rises linearly
 *   to 80 % at l2/l1 = 2.0 (alpha = 0), lerp toward the beam row otherwise
 *
 * every input is clamped to its table range, so nothing extrapolates.
 *
 * @param table which ACI table to read
 * @param l2_l1 transverse/longitudinal span ratio
 * @param alpha_f1 beam-to-slab stiffness ratio (0 for flat plates)
 * @param beta_t torsional stiffness ratio of the edge member
 * @return column strip fraction in [0, 1]
 */
[[nodiscard]] auto get_col_strip_percent(StripTable table, double l2_l1, double alpha_f1, double beta_t) noexcept
    -> double;

/**
 * @brief torsional stiffness ratio beta_t = C / (2 Is) of the edge beam
 *
 * ✨ PURE FUNCTION ✨
 *
 * returns 0 when the panel has no edge beam. C uses the beam section only
 * (x <= y taken from width/depth), Is = L2 h^3 / 12.
 */
[[nodiscard]] auto compute_beta_t(const geometry::NormalizedRecord &record) noexcept -> double;

/**
 * @brief applies the ACI 0.65 L1 clear span floor
 */
[[nodiscard]] auto clamp_clear_span(double l1, double ln_actual) noexcept -> ClearSpan;

/**
 * @brief total static moment Mo = wu l2 ln^2 / 8
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto static_moment(double wu, double l2, double ln) noexcept -> double
{
    return wu * l2 * ln * ln / 8.0;
}

} // namespace fsa::ddm
