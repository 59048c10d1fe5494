/**
 * @file prepare.hpp
 * @brief raw scenario -> normalized SI record (geometry, materials, loads) uwu
 *
 * this is the one and only boundary where human units (cm, ksc, kg/m^2) turn
 * into SI, and the one place where raw inputs get rejected. after
 * `prepare_geometry` succeeds every downstream engine (criteria, DDM, EFM)
 * consumes the same immutable NormalizedRecord and never re-validates. the
 * record also carries column stiffness inputs (k factors, Ic, Kc) and the
 * cantilever balancing moments, the latter as informational metadata only.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note built for GCC 15.2+, C++26
 */
#pragma once

#include <expected>
#include <string>
#include <vector>

#include "fsa/common/units.hpp"
#include "fsa/config/config.hpp"

namespace fsa::geometry {

/**
 * @brief preparation error info with context breadcrumbs
 */
struct PrepareError {
    std::string message;
    std::vector<std::string> context;
};

/**
 * @brief plan + section geometry in metres
 */
struct Geometry {
    double l1_left{};          ///< span left of the column [m] (0 when absent)
    double l1_right{};         ///< span right of the column [m]
    double l2_top{};           ///< transverse span above [m]
    double l2_bottom{};        ///< transverse span below [m]
    double l1{};               ///< design span along the analysis direction [m]
    double l2{};               ///< transverse frame width [m]
    double ln{};               ///< geometric clear span l1 - c1 [m] (not floored)
    double trib_l1{};          ///< tributary length for shear along l1 [m]
    double trib_l2{};          ///< tributary length for shear along l2 [m]
    double c1{};               ///< column size along l1 [m]
    double c2{};               ///< column size along l2 [m]
    double h_slab{};           ///< slab thickness [m]
    bool has_drop{};           ///< drop panel present
    double h_drop{};           ///< total thickness at the drop (slab + projection) [m], = h_slab without drop
    double drop_projection{};  ///< drop projection below soffit [m]
    double drop_w1{};          ///< drop width along l1 [m]
    double drop_w2{};          ///< drop width along l2 [m]

    /// number of adjacent l1 spans actually present (1 or 2)
    [[nodiscard]] auto l1_span_count() const noexcept -> int
    {
        return (l1_left > 0.0 ? 1 : 0) + (l1_right > 0.0 ? 1 : 0);
    }

    /// number of adjacent l2 spans actually present (1 or 2)
    [[nodiscard]] auto l2_span_count() const noexcept -> int
    {
        return (l2_top > 0.0 ? 1 : 0) + (l2_bottom > 0.0 ? 1 : 0);
    }
};

/**
 * @brief panel case selecting the ACI coefficient row (immutable once built)
 */
struct PanelCase {
    config::PanelLocation location{config::PanelLocation::Interior};
    bool has_edge_beam{};
    double edge_beam_width{};        ///< [m]
    double edge_beam_depth{};        ///< [m]
    bool fully_restrained_edge{};

    /// edge + corner columns sit at the end of the span in the analysis direction
    [[nodiscard]] auto is_end_span() const noexcept -> bool
    {
        return location != config::PanelLocation::Interior;
    }
};

/**
 * @brief strengths in every flavour the ACI formulas want
 */
struct Materials {
    double fc_ksc{};
    double fc_mpa{};
    double fc_pa{};
    double fy_ksc{};
    double fy_mpa{};
    double fy_pa{};
    double ec_mpa{};   ///< 4700 sqrt(fc') [MPa]
    double ec_pa{};    ///< same modulus in Pa
};

/**
 * @brief area loads [Pa]
 */
struct Loads {
    double self_weight_pa{};        ///< 0 when auto self weight is off
    double superimposed_dead_pa{};
    double dead_pa{};               ///< self weight + superimposed, unfactored
    double live_pa{};               ///< unfactored
    double factor_dead{};
    double factor_live{};
    double wu_pa{};                 ///< LF_dead * dead + LF_live * live
};

/**
 * @brief column segments + slope-deflection stiffness at the joint
 */
struct ColumnStiffness {
    config::JointType joint{config::JointType::Intermediate};
    double h_up{};        ///< upper storey height [m], 0 at a roof joint
    double h_lo{};        ///< lower storey height [m]
    config::FarEnd far_end_up{config::FarEnd::Fixed};
    config::FarEnd far_end_lo{config::FarEnd::Fixed};
    double k_up{};        ///< 4 fixed / 3 pinned
    double k_lo{};
    double ic{};          ///< c2 * c1^3 / 12 [m^4]
    double kc_up{};       ///< k Ec Ic / h [N.m/rad]
    double kc_lo{};
    double sum_kc{};
};

/**
 * @brief cantilever overhangs + their balancing moments (informational only)
 */
struct Cantilever {
    double left_m{};
    double right_m{};
    double moment_left{};   ///< w_u L2 Lc^2 / 2 [N.m]
    double moment_right{};
};

/**
 * @brief detailing constants for the flexural design
 */
struct Detailing {
    double cover{};          ///< [m]
    double bar_diameter{};   ///< [m]
    double bar_area{};       ///< [m^2]
};

/**
 * @brief the normalized metric record every engine consumes
 */
struct NormalizedRecord {
    Geometry geometry;
    PanelCase panel;
    Materials materials;
    Loads loads;
    ColumnStiffness columns;
    Cantilever cantilever;
    Detailing detailing;
    common::UnitsConfig units;
};

/**
 * @brief column stiffness factor for a far-end restraint (4 fixed, 3 pinned)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto stiffness_factor(config::FarEnd far_end) noexcept -> double
{
    return far_end == config::FarEnd::Pinned ? 3.0 : 4.0;
}

/**
 * @brief normalize a raw scenario into the SI record
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - it only reads the scenario + units pack and builds a fresh record
 * - input problems come back as PrepareError values, nothing throws
 *
 * @param[in] scenario raw inputs as loaded from YAML (or built in code)
 * @param[in] units conversion constants to use
 * @return NormalizedRecord or PrepareError describing the first bad input
 *
 * @note span layout rules: interior needs all four spans, edge needs exactly
 *       one l1 span and both l2 spans, corner needs exactly one span in each
 *       direction. columns must be narrower than every present span.
 */
[[nodiscard]] auto prepare_geometry(const config::Scenario& scenario,
                                    const common::UnitsConfig& units = common::kDefaultUnits)
    -> std::expected<NormalizedRecord, PrepareError>;

}  // namespace fsa::geometry
