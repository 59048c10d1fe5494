/**
 * @file units.hpp
 * @brief immutable unit conversion pack (kg, ksc, cm -> SI) uwu
 *
 * the engine works in SI internally (m, N, Pa) while engineers type inputs in
 * the Thai/metric-technical flavour: cm for thicknesses, ksc (kg/cm^2) for
 * strengths, kg/m^2 for loads. instead of a global mutable units singleton,
 * every conversion constant lives in this value type and gets passed into the
 * geometry preparer explicitly. tests can swap in a custom pack without any
 * hidden cross-module coupling ✨
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 */
#pragma once

#include <cmath>

namespace fsa::common
{

/**
 * @brief conversion constants + concrete unit weight, frozen at construction
 *
 * ✨ PURE FUNCTION ✨ (plain aggregate, constexpr constructible)
 */
struct UnitsConfig
{
    double gravity{9.80665};            ///< standard gravity [m/s^2], also kgf -> N
    double cm_to_m{0.01};               ///< centimetre -> metre
    double mm_to_m{0.001};              ///< millimetre -> metre
    double ksc_to_pa{98066.5};          ///< kg/cm^2 -> Pa
    double ksc_to_mpa{0.0980665};       ///< kg/cm^2 -> MPa
    double mpa_to_pa{1.0e6};            ///< MPa -> Pa
    double concrete_density{2400.0};    ///< normal-weight concrete [kg/m^3]

    /// kg (mass-force) -> N
    [[nodiscard]] constexpr auto kg_to_n(double kg) const noexcept -> double { return kg * gravity; }

    /// N -> kg (mass-force), handy for reporting kg.m moments
    [[nodiscard]] constexpr auto n_to_kg(double newton) const noexcept -> double { return newton / gravity; }
};

/**
 * @brief the default pack everybody should use unless a test says otherwise
 */
inline constexpr UnitsConfig kDefaultUnits{};

/**
 * @brief ACI secant modulus Ec = 4700 sqrt(fc') in MPa
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param fc_mpa specified compressive strength [MPa]
 * @return Ec [MPa]
 */
[[nodiscard]] inline auto concrete_modulus_mpa(double fc_mpa) noexcept -> double
{
    if (fc_mpa <= 0.0)
    {
        return 0.0;
    }
    return 4700.0 * std::sqrt(fc_mpa);
}

} // namespace fsa::common
