/**
 * @file punching.cpp
 * @brief punching shear perimeters + ACI capacity uwu
 */
#include "fsa/ddm/punching.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "fsa/common/math.hpp"

namespace fsa::ddm
{
namespace
{

constexpr double kPhiShear = 0.75;

[[nodiscard]] auto evaluate(const geometry::NormalizedRecord &record, CriticalSection section, double a1, double a2,
                            double d) -> ShearCheckResult
{
    const auto location = record.panel.location;

    ShearCheckResult result{};
    result.section   = section;
    result.d         = d;
    result.perimeter = critical_perimeter(location, a1, a2, d);
    result.beta      = std::max(a1, a2) / std::min(a1, a2);
    result.alpha_s   = alpha_s_for(location);

    const double vc_ksc = concrete_shear_stress_ksc(record.materials.fc_ksc, result.beta, result.alpha_s, d,
                                                    result.perimeter.bo);
    result.vc     = vc_ksc * record.units.ksc_to_pa;
    result.phi_vc = kPhiShear * result.vc * result.perimeter.bo * d;

    const double tributary = record.geometry.trib_l1 * record.geometry.trib_l2;
    const double inside    = result.perimeter.b1 * result.perimeter.b2;
    result.vu              = record.loads.wu_pa * std::max(tributary - inside, 0.0);
    result.ratio           = common::safe_divide(result.vu, result.phi_vc, std::numeric_limits<double>::infinity());
    result.status          = result.vu <= result.phi_vc ? ShearStatus::Pass : ShearStatus::Fail;
    return result;
}

} // namespace

auto to_string(ShearStatus status) -> std::string_view
{
    return status == ShearStatus::Pass ? "Pass" : "Fail";
}

auto to_string(CriticalSection section) -> std::string_view
{
    return section == CriticalSection::ColumnFace ? "column face" : "drop panel face";
}

auto critical_perimeter(config::PanelLocation location, double a1, double a2, double d) noexcept -> Perimeter
{
    Perimeter p{};
    switch (location)
    {
    case config::PanelLocation::Interior:
        p.b1 = a1 + d;
        p.b2 = a2 + d;
        p.bo = 2.0 * (p.b1 + p.b2);
        break;
    case config::PanelLocation::Edge:
        p.b1 = a1 + (d / 2.0);
        p.b2 = a2 + d;
        p.bo = (2.0 * p.b1) + p.b2;
        break;
    case config::PanelLocation::Corner:
        p.b1 = a1 + (d / 2.0);
        p.b2 = a2 + (d / 2.0);
        p.bo = p.b1 + p.b2;
        break;
    }
    return p;
}

auto concrete_shear_stress_ksc(double fc_ksc, double beta, double alpha_s, double d, double bo) noexcept -> double
{
    if (fc_ksc <= 0.0 || bo <= 0.0)
    {
        return 0.0;
    }
    const double root     = std::sqrt(fc_ksc);
    const double beta_eff = std::max(beta, 1.0);
    const double v1       = 1.06 * root;
    const double v2       = 0.53 * (1.0 + (2.0 / beta_eff)) * root;
    const double v3       = 0.265 * ((alpha_s * d / bo) + 2.0) * root;
    return std::min({v1, v2, v3});
}

auto check_punching(const geometry::NormalizedRecord &record) -> std::vector<ShearCheckResult>
{
    const auto &geom  = record.geometry;
    const double cover = record.detailing.cover;

    std::vector<ShearCheckResult> checks;
    checks.reserve(2U);
    checks.push_back(evaluate(record, CriticalSection::ColumnFace, geom.c1, geom.c2, geom.h_drop - cover));
    if (geom.has_drop)
    {
        checks.push_back(
            evaluate(record, CriticalSection::DropPanelFace, geom.drop_w1, geom.drop_w2, geom.h_slab - cover));
    }
    return checks;
}

} // namespace fsa::ddm
