/**
 * @file punching.hpp
 * @brief two-way (punching) shear at the column face and drop panel face uwu
 *
 * critical perimeters sit d/2 away from the loaded area. interior columns get
 * the full four-sided perimeter, edge columns three sides, corner columns two.
 * concrete capacity is the ACI three-way minimum in ksc flavour, converted to
 * SI at the end. failures are values (ShearStatus::Fail), never exceptions.
 *
 * @author LukeFrankio
 * @date 2025-11-06
 * @version 1.0
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "fsa/geometry/prepare.hpp"

namespace fsa::ddm
{

enum class ShearStatus : std::uint8_t
{
    Pass = 0U,
    Fail = 1U
};

enum class CriticalSection : std::uint8_t
{
    ColumnFace    = 0U, ///< d/2 from the column, d through the drop if present
    DropPanelFace = 1U  ///< d/2 from the drop edge, slab effective depth
};

/**
 * @brief critical perimeter dimensions
 */
struct Perimeter
{
    double b1{}; ///< side parallel to l1 [m]
    double b2{}; ///< side parallel to l2 [m]
    double bo{}; ///< length of the perimeter [m]
};

/**
 * @brief one punching shear check (per critical perimeter)
 */
struct ShearCheckResult
{
    CriticalSection section{CriticalSection::ColumnFace};
    double          d{};       ///< effective depth [m]
    Perimeter       perimeter;
    double          beta{};    ///< long/short side of the loaded area
    double          alpha_s{}; ///< 40 / 30 / 20
    double          vc{};      ///< nominal concrete stress [Pa]
    double          vu{};      ///< factored shear [N]
    double          phi_vc{};  ///< 0.75 vc bo d [N]
    double          ratio{};   ///< vu / phi_vc
    ShearStatus     status{ShearStatus::Pass};
};

[[nodiscard]] auto to_string(ShearStatus status) -> std::string_view;
[[nodiscard]] auto to_string(CriticalSection section) -> std::string_view;

/**
 * @brief alpha_s by column location (40 interior, 30 edge, 20 corner)
 */
[[nodiscard]] constexpr auto alpha_s_for(config::PanelLocation location) noexcept -> double
{
    switch (location)
    {
    case config::PanelLocation::Interior:
        return 40.0;
    case config::PanelLocation::Edge:
        return 30.0;
    case config::PanelLocation::Corner:
        return 20.0;
    }
    return 40.0;
}

/**
 * @brief perimeter at d/2 around an a1 x a2 loaded area for a column location
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto critical_perimeter(config::PanelLocation location, double a1, double a2, double d) noexcept
    -> Perimeter;

/**
 * @brief ACI two-way concrete stress in ksc
 *
 * ✨ PURE FUNCTION ✨
 *
 * vc = min(1.06 sqrt(fc), 0.53 (1 + 2/beta) sqrt(fc), 0.265 (alpha_s d/bo + 2) sqrt(fc))
 *
 * @param fc_ksc f'c [ksc]
 * @param beta long/short side ratio of the loaded area (>= 1)
 * @param alpha_s location constant
 * @param d effective depth [m]
 * @param bo perimeter length [m]
 * @return vc [ksc]
 */
[[nodiscard]] auto concrete_shear_stress_ksc(double fc_ksc, double beta, double alpha_s, double d, double bo) noexcept
    -> double;

/**
 * @brief punching checks at the column face and, with a drop, at its edge
 *
 * ✨ PURE FUNCTION ✨
 *
 * Vu = wu (tributary area - area inside the perimeter), tributary area from
 * half of each adjacent span.
 */
[[nodiscard]] auto check_punching(const geometry::NormalizedRecord &record) -> std::vector<ShearCheckResult>;

} // namespace fsa::ddm
