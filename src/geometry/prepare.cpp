/**
 * @file prepare.cpp
 * @brief raw scenario normalization: units, loads, column stiffness uwu
 */
#include "fsa/geometry/prepare.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

#include "fsa/common/math.hpp"

namespace fsa::geometry
{
namespace
{

using Result = std::expected<NormalizedRecord, PrepareError>;

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> Result
{
    return std::unexpected(PrepareError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto check_positive(double value, std::string_view label, std::vector<std::string> ctx)
    -> std::expected<void, PrepareError>
{
    if (!std::isfinite(value) || value <= 0.0)
    {
        return std::unexpected(PrepareError{std::format("{} must be > 0 (got {})", label, value), std::move(ctx)});
    }
    return {};
}

[[nodiscard]] auto check_non_negative(double value, std::string_view label, std::vector<std::string> ctx)
    -> std::expected<void, PrepareError>
{
    if (!std::isfinite(value) || value < 0.0)
    {
        return std::unexpected(PrepareError{std::format("{} must be >= 0 (got {})", label, value), std::move(ctx)});
    }
    return {};
}

[[nodiscard]] auto check_span_layout(const config::Scenario &scenario) -> std::expected<void, PrepareError>
{
    const auto &spans = scenario.spans;
    for (const auto &[value, key] : {std::pair{spans.l1_left, "l1_left"},
                                     std::pair{spans.l1_right, "l1_right"},
                                     std::pair{spans.l2_top, "l2_top"},
                                     std::pair{spans.l2_bottom, "l2_bottom"}})
    {
        if (auto ok = check_non_negative(value, std::format("spans.{}", key), {"spans", key}); !ok)
        {
            return ok;
        }
    }

    const int l1_count = (spans.l1_left > 0.0 ? 1 : 0) + (spans.l1_right > 0.0 ? 1 : 0);
    const int l2_count = (spans.l2_top > 0.0 ? 1 : 0) + (spans.l2_bottom > 0.0 ? 1 : 0);
    const auto location = config::to_string(scenario.panel.location);

    int want_l1 = 2;
    int want_l2 = 2;
    switch (scenario.panel.location)
    {
    case config::PanelLocation::Interior:
        break;
    case config::PanelLocation::Edge:
        want_l1 = 1;
        break;
    case config::PanelLocation::Corner:
        want_l1 = 1;
        want_l2 = 1;
        break;
    }
    if (l1_count != want_l1)
    {
        return std::unexpected(PrepareError{
            std::format("{} column needs {} l1 span(s), got {}", location, want_l1, l1_count), {"spans"}});
    }
    if (l2_count != want_l2)
    {
        return std::unexpected(PrepareError{
            std::format("{} column needs {} l2 span(s), got {}", location, want_l2, l2_count), {"spans"}});
    }
    return {};
}

} // namespace

auto prepare_geometry(const config::Scenario &scenario, const common::UnitsConfig &units) -> Result
{
    // materials + loads
    if (auto ok = check_positive(scenario.materials.fc_ksc, "materials.fc_ksc", {"materials", "fc_ksc"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.materials.fy_ksc, "materials.fy_ksc", {"materials", "fy_ksc"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_non_negative(scenario.loads.dead_kgm2, "loads.dead_kgm2", {"loads", "dead_kgm2"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_non_negative(scenario.loads.live_kgm2, "loads.live_kgm2", {"loads", "live_kgm2"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.loads.factor_dead, "loads.factors.dead", {"loads", "factors", "dead"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.loads.factor_live, "loads.factors.live", {"loads", "factors", "live"}); !ok)
    {
        return std::unexpected(ok.error());
    }

    // section sizes
    if (auto ok = check_positive(scenario.slab.thickness_cm, "slab.thickness_cm", {"slab", "thickness_cm"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.column.c1_cm, "column.c1_cm", {"column", "c1_cm"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.column.c2_cm, "column.c2_cm", {"column", "c2_cm"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.column.lower.height_m, "column.lower.height_m",
                                 {"column", "lower", "height_m"});
        !ok)
    {
        return std::unexpected(ok.error());
    }
    const bool is_roof = scenario.column.joint == config::JointType::Roof;
    if (!is_roof)
    {
        if (auto ok = check_positive(scenario.column.upper.height_m, "column.upper.height_m",
                                     {"column", "upper", "height_m"});
            !ok)
        {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = check_positive(scenario.design.cover_cm, "design.cover_cm", {"design", "cover_cm"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_positive(scenario.design.bar_diameter_mm, "design.bar_diameter_mm",
                                 {"design", "bar_diameter_mm"});
        !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_span_layout(scenario); !ok)
    {
        return std::unexpected(ok.error());
    }

    NormalizedRecord record{};
    record.units = units;

    // geometry
    auto &geom     = record.geometry;
    geom.l1_left   = scenario.spans.l1_left;
    geom.l1_right  = scenario.spans.l1_right;
    geom.l2_top    = scenario.spans.l2_top;
    geom.l2_bottom = scenario.spans.l2_bottom;
    geom.c1        = scenario.column.c1_cm * units.cm_to_m;
    geom.c2        = scenario.column.c2_cm * units.cm_to_m;
    geom.h_slab    = scenario.slab.thickness_cm * units.cm_to_m;
    geom.l1        = std::max(geom.l1_left, geom.l1_right);
    geom.l2        = (geom.l2_top + geom.l2_bottom) / static_cast<double>(geom.l2_span_count());
    geom.ln        = geom.l1 - geom.c1;
    geom.trib_l1   = (geom.l1_left + geom.l1_right) / 2.0;
    geom.trib_l2   = (geom.l2_top + geom.l2_bottom) / 2.0;

    for (const double span : {geom.l1_left, geom.l1_right})
    {
        if (span > 0.0 && geom.c1 >= span)
        {
            return make_error(std::format("column c1 ({} m) must be smaller than the l1 span ({} m)", geom.c1, span),
                              {"column", "c1_cm"});
        }
    }
    for (const double span : {geom.l2_top, geom.l2_bottom})
    {
        if (span > 0.0 && geom.c2 >= span)
        {
            return make_error(std::format("column c2 ({} m) must be smaller than the l2 span ({} m)", geom.c2, span),
                              {"column", "c2_cm"});
        }
    }

    geom.h_drop = geom.h_slab;
    if (const auto &drop = scenario.slab.drop_panel; drop.has_value())
    {
        if (auto ok = check_positive(drop->depth_cm, "slab.drop_panel.depth_cm", {"slab", "drop_panel", "depth_cm"});
            !ok)
        {
            return std::unexpected(ok.error());
        }
        if (auto ok = check_positive(drop->width1_m, "slab.drop_panel.width1_m", {"slab", "drop_panel", "width1_m"});
            !ok)
        {
            return std::unexpected(ok.error());
        }
        if (auto ok = check_positive(drop->width2_m, "slab.drop_panel.width2_m", {"slab", "drop_panel", "width2_m"});
            !ok)
        {
            return std::unexpected(ok.error());
        }
        if (drop->width1_m < geom.c1 || drop->width2_m < geom.c2)
        {
            return make_error("drop panel must be at least as wide as the column", {"slab", "drop_panel"});
        }
        geom.has_drop        = true;
        geom.drop_projection = drop->depth_cm * units.cm_to_m;
        geom.h_drop          = geom.h_slab + geom.drop_projection;
        geom.drop_w1         = drop->width1_m;
        geom.drop_w2         = drop->width2_m;
    }

    if (2.0 * scenario.design.cover_cm * units.cm_to_m >= geom.h_slab)
    {
        return make_error("design.cover_cm leaves no effective depth in the slab", {"design", "cover_cm"});
    }

    // panel case
    auto &panel                 = record.panel;
    panel.location              = scenario.panel.location;
    panel.fully_restrained_edge = scenario.panel.fully_restrained_edge;
    if (const auto &beam = scenario.panel.edge_beam; beam.has_value())
    {
        if (scenario.panel.location == config::PanelLocation::Interior)
        {
            return make_error("edge beam is only valid for edge/corner columns", {"panel", "edge_beam"});
        }
        if (auto ok = check_positive(beam->width_cm, "panel.edge_beam.width_cm", {"panel", "edge_beam", "width_cm"});
            !ok)
        {
            return std::unexpected(ok.error());
        }
        if (auto ok = check_positive(beam->depth_cm, "panel.edge_beam.depth_cm", {"panel", "edge_beam", "depth_cm"});
            !ok)
        {
            return std::unexpected(ok.error());
        }
        panel.has_edge_beam   = true;
        panel.edge_beam_width = beam->width_cm * units.cm_to_m;
        panel.edge_beam_depth = beam->depth_cm * units.cm_to_m;
    }
    if (panel.fully_restrained_edge && !panel.is_end_span())
    {
        return make_error("fully_restrained_edge only applies to edge/corner columns",
                          {"panel", "fully_restrained_edge"});
    }

    // materials
    auto &mat  = record.materials;
    mat.fc_ksc = scenario.materials.fc_ksc;
    mat.fc_mpa = mat.fc_ksc * units.ksc_to_mpa;
    mat.fc_pa  = mat.fc_ksc * units.ksc_to_pa;
    mat.fy_ksc = scenario.materials.fy_ksc;
    mat.fy_mpa = mat.fy_ksc * units.ksc_to_mpa;
    mat.fy_pa  = mat.fy_ksc * units.ksc_to_pa;
    mat.ec_mpa = common::concrete_modulus_mpa(mat.fc_mpa);
    mat.ec_pa  = mat.ec_mpa * units.mpa_to_pa;

    // loads
    auto &loads                = record.loads;
    loads.self_weight_pa       = scenario.loads.auto_self_weight ? geom.h_slab * units.concrete_density * units.gravity
                                                                 : 0.0;
    loads.superimposed_dead_pa = units.kg_to_n(scenario.loads.dead_kgm2);
    loads.dead_pa              = loads.self_weight_pa + loads.superimposed_dead_pa;
    loads.live_pa              = units.kg_to_n(scenario.loads.live_kgm2);
    loads.factor_dead          = scenario.loads.factor_dead;
    loads.factor_live          = scenario.loads.factor_live;
    loads.wu_pa                = (loads.factor_dead * loads.dead_pa) + (loads.factor_live * loads.live_pa);

    // column stiffness at the joint
    auto &cols      = record.columns;
    cols.joint      = scenario.column.joint;
    cols.h_up       = is_roof ? 0.0 : scenario.column.upper.height_m;
    cols.h_lo       = scenario.column.lower.height_m;
    cols.far_end_up = scenario.column.upper.far_end;
    cols.far_end_lo = scenario.column.lower.far_end;
    cols.k_up       = is_roof ? 0.0 : stiffness_factor(cols.far_end_up);
    cols.k_lo       = stiffness_factor(cols.far_end_lo);
    cols.ic         = common::rectangle_inertia(geom.c2, geom.c1);
    cols.kc_up      = cols.h_up > 0.0 ? (cols.k_up * mat.ec_pa * cols.ic) / cols.h_up : 0.0;
    cols.kc_lo      = cols.h_lo > 0.0 ? (cols.k_lo * mat.ec_pa * cols.ic) / cols.h_lo : 0.0;
    cols.sum_kc     = cols.kc_up + cols.kc_lo;

    // cantilevers (balancing moments are reported, never fed back into DDM/EFM)
    if (auto ok = check_non_negative(scenario.cantilever.left_m, "cantilever.left_m", {"cantilever", "left_m"}); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_non_negative(scenario.cantilever.right_m, "cantilever.right_m", {"cantilever", "right_m"});
        !ok)
    {
        return std::unexpected(ok.error());
    }
    if (scenario.cantilever.left_m > 0.0 && geom.l1_left > 0.0)
    {
        return make_error("left cantilever needs an open left side (l1_left = 0)", {"cantilever", "left_m"});
    }
    if (scenario.cantilever.right_m > 0.0 && geom.l1_right > 0.0)
    {
        return make_error("right cantilever needs an open right side (l1_right = 0)", {"cantilever", "right_m"});
    }
    auto &cant             = record.cantilever;
    const double line_load = loads.wu_pa * geom.l2;
    cant.left_m            = scenario.cantilever.left_m;
    cant.right_m           = scenario.cantilever.right_m;
    cant.moment_left       = line_load * cant.left_m * cant.left_m / 2.0;
    cant.moment_right      = line_load * cant.right_m * cant.right_m / 2.0;

    // detailing
    auto &det        = record.detailing;
    det.cover        = scenario.design.cover_cm * units.cm_to_m;
    det.bar_diameter = scenario.design.bar_diameter_mm * units.mm_to_m;
    det.bar_area     = std::numbers::pi * det.bar_diameter * det.bar_diameter / 4.0;

    return record;
}

} // namespace fsa::geometry
