/**
 * @file flexure.hpp
 * @brief per-strip flexural design: Rn -> rho -> As with explicit Fail path uwu
 *
 * the closed-form quadratic for rho has two ways to go sideways: Rn above the
 * empirical 0.35 f'c ceiling, or a negative radicand. instead of letting a NaN
 * sneak through (or catching a math-domain exception like some kind of
 * barbarian), `required_steel` returns std::expected: a SteelDemand on
 * success, a FlexureError saying exactly why on failure. `design_section` then
 * folds that into a RebarSection whose status is OK / MinSteel / Fail, so the
 * pipeline always hands back a complete result set ✨
 *
 * @author LukeFrankio
 * @date 2025-11-06
 * @version 1.0
 */
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "fsa/ddm/coefficients.hpp"

namespace fsa::ddm
{

enum class RebarStatus : std::uint8_t
{
    Ok       = 0U,
    MinSteel = 1U,
    Fail     = 2U
};

enum class StripKind : std::uint8_t
{
    Column = 0U,
    Middle = 1U
};

/**
 * @brief design constants shared by every section of one run
 */
struct FlexureParams
{
    double fc_pa{};             ///< f'c [Pa]
    double fy_pa{};             ///< fy [Pa]
    double rho_min{0.0018};     ///< shrinkage/temperature minimum on b h
    double phi{0.9};            ///< tension-controlled strength reduction
    double cover{0.03};         ///< h - d [m]
    double bar_area{};          ///< area of the suggested bar [m^2]
    double bar_diameter_mm{12.0};
};

/**
 * @brief successful flexural demand (before status classification)
 */
struct SteelDemand
{
    double rn{};          ///< Mu / (phi b d^2) [Pa]
    double rho{};         ///< required reinforcement ratio on b d
    double as_calc{};     ///< rho b d [m^2]
    double as_min{};      ///< rho_min b h [m^2]
    double as_required{}; ///< max(as_calc, as_min) [m^2]
    bool   min_governs{}; ///< as_min > as_calc
};

/**
 * @brief why a section could not be designed
 */
struct FlexureError
{
    std::string message;
    double      rn{};    ///< Rn that tripped the failure [Pa]
    double      limit{}; ///< the ceiling it was compared against [Pa]
};

/**
 * @brief representative bar + spacing suggestion for a strip
 */
struct BarSuggestion
{
    int         count{};   ///< bars across the strip width
    double      spacing{}; ///< centre-to-centre [m]
    std::string text;      ///< e.g. "DB12 @ 0.20 m (15 bars)"
};

/**
 * @brief designed strip section (never mutated after creation)
 */
struct RebarSection
{
    MomentComponent location{MomentComponent::Positive};
    StripKind       strip{StripKind::Column};
    double          mu{};          ///< design moment [N.m]
    double          width{};       ///< strip width b [m]
    double          thickness{};   ///< section thickness h [m]
    double          depth{};       ///< effective depth d [m]
    double          rn{};          ///< [Pa]
    double          as_required{}; ///< [m^2], 0 on Fail
    RebarStatus     status{RebarStatus::Ok};
    BarSuggestion   bars;
    std::string     note;          ///< failure reason when status == Fail
};

[[nodiscard]] auto to_string(RebarStatus status) -> std::string_view;
[[nodiscard]] auto to_string(StripKind strip) -> std::string_view;

/**
 * @brief minimum steel ratio: 0.0020 for grades below SD40, 0.0018 otherwise
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto min_steel_ratio(double fy_ksc) noexcept -> double
{
    return fy_ksc < 4000.0 ? 0.0020 : 0.0018;
}

/**
 * @brief make the flexure parameter pack from the normalized record
 */
[[nodiscard]] auto make_flexure_params(const geometry::NormalizedRecord &record) -> FlexureParams;

/**
 * @brief closed-form required steel for one section
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param mu design moment [N.m] (sign ignored, magnitude designed)
 * @param width strip width b [m]
 * @param thickness section thickness h [m]
 * @param params shared design constants
 * @return SteelDemand, or FlexureError when Rn > 0.35 f'c, the radicand goes
 *         negative, or the section has no width/effective depth
 */
[[nodiscard]] auto required_steel(double mu, double width, double thickness, const FlexureParams &params)
    -> std::expected<SteelDemand, FlexureError>;

/**
 * @brief bar count + spacing for an area, spacing capped at min(2h, 45 cm)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto suggest_bars(double as_required, double width, double thickness, const FlexureParams &params)
    -> BarSuggestion;

/**
 * @brief design one strip location, folding failures into RebarStatus::Fail
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto design_section(MomentComponent location, StripKind strip, double mu, double width,
                                  double thickness, const FlexureParams &params) -> RebarSection;

} // namespace fsa::ddm
