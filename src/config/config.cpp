/**
 * @file config.cpp
 * @brief implementation of the YAML scenario loader with bougie validation uwu
 *
 * this translation unit backs config.hpp with the full YAML parsing pipeline.
 * it leans on yaml-cpp 0.8.0+, wraps everything in std::expected, and emits
 * error breadcrumbs so humans can fix typos without doom scrolling logs.
 */
#include "fsa/config/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace fsa::config
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> ScenarioResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto lowercase(std::string_view text) -> std::string
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] auto with_key(std::vector<std::string> ctx, std::string_view key) -> std::vector<std::string>
{
    ctx.emplace_back(key);
    return ctx;
}

/// required numeric scalar under `key`
[[nodiscard]] auto read_double(const YAML::Node &parent, std::string_view key, const std::vector<std::string> &ctx)
    -> std::expected<double, ConfigError>
{
    const auto node = parent[std::string(key)];
    if (!node || node.IsNull())
    {
        return std::unexpected(ConfigError{std::format("missing required field '{}'", key), with_key(ctx, key)});
    }
    if (!node.IsScalar())
    {
        return std::unexpected(ConfigError{std::format("'{}' must be a numeric scalar", key), with_key(ctx, key)});
    }
    try
    {
        return node.as<double>();
    }
    catch (const YAML::Exception &)
    {
        return std::unexpected(
            ConfigError{std::format("'{}' must be numeric, got '{}'", key, node.Scalar()), with_key(ctx, key)});
    }
}

/// optional numeric scalar, `fallback` when absent
[[nodiscard]] auto read_double_or(const YAML::Node &parent, std::string_view key, double fallback,
                                  const std::vector<std::string> &ctx) -> std::expected<double, ConfigError>
{
    const auto node = parent[std::string(key)];
    if (!node || node.IsNull())
    {
        return fallback;
    }
    return read_double(parent, key, ctx);
}

[[nodiscard]] auto read_bool_or(const YAML::Node &parent, std::string_view key, bool fallback,
                                const std::vector<std::string> &ctx) -> std::expected<bool, ConfigError>
{
    const auto node = parent[std::string(key)];
    if (!node || node.IsNull())
    {
        return fallback;
    }
    try
    {
        return node.as<bool>();
    }
    catch (const YAML::Exception &)
    {
        return std::unexpected(ConfigError{std::format("'{}' must be a boolean", key), with_key(ctx, key)});
    }
}

[[nodiscard]] auto read_string(const YAML::Node &parent, std::string_view key, const std::vector<std::string> &ctx)
    -> std::expected<std::string, ConfigError>
{
    const auto node = parent[std::string(key)];
    if (!node || !node.IsScalar())
    {
        return std::unexpected(ConfigError{std::format("missing required field '{}'", key), with_key(ctx, key)});
    }
    return node.Scalar();
}

[[nodiscard]] auto require_map(const YAML::Node &root, std::string_view key) -> std::expected<YAML::Node, ConfigError>
{
    const auto node = root[std::string(key)];
    if (!node || !node.IsMap())
    {
        return std::unexpected(ConfigError{std::format("missing '{}' section", key), {std::string(key)}});
    }
    return node;
}

[[nodiscard]] auto parse_materials(const YAML::Node &root) -> std::expected<MaterialInputs, ConfigError>
{
    auto section = require_map(root, "materials");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    const std::vector<std::string> ctx{"materials"};
    MaterialInputs                 mat{};
    auto                           fc = read_double(*section, "fc_ksc", ctx);
    if (!fc)
    {
        return std::unexpected(fc.error());
    }
    mat.fc_ksc = *fc;

    const auto grade_node = (*section)["fy_grade"];
    if (grade_node && grade_node.IsScalar())
    {
        const auto fy = grade_to_fy_ksc(grade_node.Scalar());
        if (!fy)
        {
            return std::unexpected(ConfigError{std::format("unknown steel grade '{}' (expected SD30/SD40/SD50)",
                                                           grade_node.Scalar()),
                                               {"materials", "fy_grade"}});
        }
        mat.fy_ksc = *fy;
        return mat;
    }
    const auto fy_node = (*section)["fy_ksc"];
    if (!fy_node || fy_node.IsNull())
    {
        return std::unexpected(ConfigError{"materials needs either 'fy_grade' or 'fy_ksc'", {"materials", "fy_ksc"}});
    }
    auto fy = read_double(*section, "fy_ksc", ctx);
    if (!fy)
    {
        return std::unexpected(fy.error());
    }
    mat.fy_ksc = *fy;
    return mat;
}

[[nodiscard]] auto parse_loads(const YAML::Node &root) -> std::expected<LoadInputs, ConfigError>
{
    auto section = require_map(root, "loads");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    const std::vector<std::string> ctx{"loads"};
    LoadInputs                     loads{};

    auto dead = read_double(*section, "dead_kgm2", ctx);
    if (!dead)
    {
        return std::unexpected(dead.error());
    }
    auto live = read_double(*section, "live_kgm2", ctx);
    if (!live)
    {
        return std::unexpected(live.error());
    }
    loads.dead_kgm2 = *dead;
    loads.live_kgm2 = *live;

    const auto factors = (*section)["factors"];
    if (factors && factors.IsMap())
    {
        const std::vector<std::string> fctx{"loads", "factors"};
        auto                           lf_dead = read_double_or(factors, "dead", loads.factor_dead, fctx);
        if (!lf_dead)
        {
            return std::unexpected(lf_dead.error());
        }
        auto lf_live = read_double_or(factors, "live", loads.factor_live, fctx);
        if (!lf_live)
        {
            return std::unexpected(lf_live.error());
        }
        loads.factor_dead = *lf_dead;
        loads.factor_live = *lf_live;
    }

    auto auto_sw = read_bool_or(*section, "auto_self_weight", loads.auto_self_weight, ctx);
    if (!auto_sw)
    {
        return std::unexpected(auto_sw.error());
    }
    loads.auto_self_weight = *auto_sw;
    return loads;
}

[[nodiscard]] auto parse_panel(const YAML::Node &root) -> std::expected<PanelInputs, ConfigError>
{
    auto section = require_map(root, "panel");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    const std::vector<std::string> ctx{"panel"};
    PanelInputs                    panel{};

    auto location_text = read_string(*section, "location", ctx);
    if (!location_text)
    {
        return std::unexpected(location_text.error());
    }
    const auto location = parse_location(*location_text);
    if (!location)
    {
        return std::unexpected(ConfigError{
            std::format("panel.location must be interior/edge/corner, got '{}'", *location_text),
            {"panel", "location"}});
    }
    panel.location = *location;

    const auto beam_node = (*section)["edge_beam"];
    if (beam_node && !beam_node.IsNull())
    {
        if (!beam_node.IsMap())
        {
            return std::unexpected(ConfigError{"panel.edge_beam must be a map", {"panel", "edge_beam"}});
        }
        const std::vector<std::string> bctx{"panel", "edge_beam"};
        auto                           width = read_double(beam_node, "width_cm", bctx);
        if (!width)
        {
            return std::unexpected(width.error());
        }
        auto depth = read_double(beam_node, "depth_cm", bctx);
        if (!depth)
        {
            return std::unexpected(depth.error());
        }
        panel.edge_beam = EdgeBeamInputs{*width, *depth};
    }

    auto restrained = read_bool_or(*section, "fully_restrained_edge", false, ctx);
    if (!restrained)
    {
        return std::unexpected(restrained.error());
    }
    panel.fully_restrained_edge = *restrained;
    return panel;
}

[[nodiscard]] auto parse_spans(const YAML::Node &root) -> std::expected<SpanInputs, ConfigError>
{
    auto section = require_map(root, "spans");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    const std::vector<std::string> ctx{"spans"};
    SpanInputs                     spans{};
    const std::array<std::pair<std::string_view, double *>, 4> fields{{{"l1_left", &spans.l1_left},
                                                                       {"l1_right", &spans.l1_right},
                                                                       {"l2_top", &spans.l2_top},
                                                                       {"l2_bottom", &spans.l2_bottom}}};
    for (const auto &[key, target] : fields)
    {
        auto value = read_double_or(*section, key, 0.0, ctx);
        if (!value)
        {
            return std::unexpected(value.error());
        }
        *target = *value;
    }
    return spans;
}

[[nodiscard]] auto parse_slab(const YAML::Node &root) -> std::expected<SlabInputs, ConfigError>
{
    auto section = require_map(root, "slab");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    const std::vector<std::string> ctx{"slab"};
    SlabInputs                     slab{};
    auto                           thickness = read_double(*section, "thickness_cm", ctx);
    if (!thickness)
    {
        return std::unexpected(thickness.error());
    }
    slab.thickness_cm = *thickness;

    const auto drop_node = (*section)["drop_panel"];
    if (drop_node && !drop_node.IsNull())
    {
        if (!drop_node.IsMap())
        {
            return std::unexpected(ConfigError{"slab.drop_panel must be a map", {"slab", "drop_panel"}});
        }
        const std::vector<std::string> dctx{"slab", "drop_panel"};
        DropPanelInputs                drop{};
        auto                           depth = read_double(drop_node, "depth_cm", dctx);
        if (!depth)
        {
            return std::unexpected(depth.error());
        }
        auto w1 = read_double(drop_node, "width1_m", dctx);
        if (!w1)
        {
            return std::unexpected(w1.error());
        }
        auto w2 = read_double(drop_node, "width2_m", dctx);
        if (!w2)
        {
            return std::unexpected(w2.error());
        }
        drop.depth_cm   = *depth;
        drop.width1_m   = *w1;
        drop.width2_m   = *w2;
        slab.drop_panel = drop;
    }
    return slab;
}

[[nodiscard]] auto parse_segment(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<ColumnSegment, ConfigError>
{
    if (!node || !node.IsMap())
    {
        return std::unexpected(ConfigError{"column segment must be a map", std::move(ctx)});
    }
    ColumnSegment segment{};
    auto          height = read_double(node, "height_m", ctx);
    if (!height)
    {
        return std::unexpected(height.error());
    }
    segment.height_m = *height;

    const auto far_node = node["far_end"];
    if (far_node && far_node.IsScalar())
    {
        const auto far_end = parse_far_end(far_node.Scalar());
        if (!far_end)
        {
            return std::unexpected(ConfigError{std::format("far_end must be fixed/pinned, got '{}'", far_node.Scalar()),
                                               with_key(ctx, "far_end")});
        }
        segment.far_end = *far_end;
    }
    return segment;
}

[[nodiscard]] auto parse_column(const YAML::Node &root) -> std::expected<ColumnInputs, ConfigError>
{
    auto section = require_map(root, "column");
    if (!section)
    {
        return std::unexpected(section.error());
    }
    const std::vector<std::string> ctx{"column"};
    ColumnInputs                   column{};

    auto c1 = read_double(*section, "c1_cm", ctx);
    if (!c1)
    {
        return std::unexpected(c1.error());
    }
    auto c2 = read_double(*section, "c2_cm", ctx);
    if (!c2)
    {
        return std::unexpected(c2.error());
    }
    column.c1_cm = *c1;
    column.c2_cm = *c2;

    const auto joint_node = (*section)["joint"];
    if (joint_node && joint_node.IsScalar())
    {
        const auto joint = parse_joint(joint_node.Scalar());
        if (!joint)
        {
            return std::unexpected(ConfigError{
                std::format("column.joint must be intermediate/roof, got '{}'", joint_node.Scalar()),
                {"column", "joint"}});
        }
        column.joint = *joint;
    }

    if (column.joint == JointType::Intermediate)
    {
        auto upper = parse_segment((*section)["upper"], {"column", "upper"});
        if (!upper)
        {
            return std::unexpected(upper.error());
        }
        column.upper = *upper;
    }

    auto lower = parse_segment((*section)["lower"], {"column", "lower"});
    if (!lower)
    {
        return std::unexpected(lower.error());
    }
    column.lower = *lower;
    return column;
}

[[nodiscard]] auto parse_cantilever(const YAML::Node &root) -> std::expected<CantileverInputs, ConfigError>
{
    CantileverInputs cant{};
    const auto       section = root["cantilever"];
    if (!section || section.IsNull())
    {
        return cant;
    }
    if (!section.IsMap())
    {
        return std::unexpected(ConfigError{"cantilever must be a map", {"cantilever"}});
    }
    const std::vector<std::string> ctx{"cantilever"};
    auto                           left = read_double_or(section, "left_m", 0.0, ctx);
    if (!left)
    {
        return std::unexpected(left.error());
    }
    auto right = read_double_or(section, "right_m", 0.0, ctx);
    if (!right)
    {
        return std::unexpected(right.error());
    }
    cant.left_m  = *left;
    cant.right_m = *right;
    return cant;
}

[[nodiscard]] auto parse_design(const YAML::Node &root) -> std::expected<DesignSettings, ConfigError>
{
    DesignSettings design{};
    const auto     section = root["design"];
    if (!section || section.IsNull())
    {
        return design;
    }
    if (!section.IsMap())
    {
        return std::unexpected(ConfigError{"design must be a map", {"design"}});
    }
    const std::vector<std::string> ctx{"design"};
    auto                           cover = read_double_or(section, "cover_cm", design.cover_cm, ctx);
    if (!cover)
    {
        return std::unexpected(cover.error());
    }
    auto bar = read_double_or(section, "bar_diameter_mm", design.bar_diameter_mm, ctx);
    if (!bar)
    {
        return std::unexpected(bar.error());
    }
    design.cover_cm        = *cover;
    design.bar_diameter_mm = *bar;
    return design;
}

} // namespace

auto grade_to_fy_ksc(std::string_view grade) -> std::optional<double>
{
    const auto key = lowercase(grade);
    if (key == "sd30")
    {
        return 3000.0;
    }
    if (key == "sd40")
    {
        return 4000.0;
    }
    if (key == "sd50")
    {
        return 5000.0;
    }
    return std::nullopt;
}

auto parse_location(std::string_view text) -> std::optional<PanelLocation>
{
    const auto key = lowercase(text);
    if (key == "interior")
    {
        return PanelLocation::Interior;
    }
    if (key == "edge")
    {
        return PanelLocation::Edge;
    }
    if (key == "corner")
    {
        return PanelLocation::Corner;
    }
    return std::nullopt;
}

auto parse_far_end(std::string_view text) -> std::optional<FarEnd>
{
    const auto key = lowercase(text);
    if (key == "fixed")
    {
        return FarEnd::Fixed;
    }
    if (key == "pinned")
    {
        return FarEnd::Pinned;
    }
    return std::nullopt;
}

auto parse_joint(std::string_view text) -> std::optional<JointType>
{
    const auto key = lowercase(text);
    if (key == "intermediate")
    {
        return JointType::Intermediate;
    }
    if (key == "roof")
    {
        return JointType::Roof;
    }
    return std::nullopt;
}

auto to_string(PanelLocation location) -> std::string_view
{
    switch (location)
    {
    case PanelLocation::Interior:
        return "Interior";
    case PanelLocation::Edge:
        return "Edge";
    case PanelLocation::Corner:
        return "Corner";
    }
    return "Interior";
}

auto to_string(FarEnd far_end) -> std::string_view
{
    switch (far_end)
    {
    case FarEnd::Fixed:
        return "Fixed";
    case FarEnd::Pinned:
        return "Pinned";
    }
    return "Fixed";
}

auto to_string(JointType joint) -> std::string_view
{
    switch (joint)
    {
    case JointType::Intermediate:
        return "Intermediate";
    case JointType::Roof:
        return "Roof";
    }
    return "Intermediate";
}

auto load_scenario_from_file(const std::filesystem::path &path) -> ScenarioResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_scenario_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(std::format("unable to open scenario file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_scenario_from_string(std::string_view yaml_text) -> ScenarioResult
{
    try
    {
        const auto node = YAML::Load(std::string(yaml_text));
        return parse_scenario_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_scenario_node(const YAML::Node &root) -> ScenarioResult
{
    if (!root || !root.IsMap())
    {
        return make_error("scenario root must be a mapping", {});
    }

    Scenario scenario{};

    auto materials = parse_materials(root);
    if (!materials)
    {
        return std::unexpected(materials.error());
    }
    scenario.materials = *materials;

    auto loads = parse_loads(root);
    if (!loads)
    {
        return std::unexpected(loads.error());
    }
    scenario.loads = *loads;

    auto panel = parse_panel(root);
    if (!panel)
    {
        return std::unexpected(panel.error());
    }
    scenario.panel = *panel;

    auto spans = parse_spans(root);
    if (!spans)
    {
        return std::unexpected(spans.error());
    }
    scenario.spans = *spans;

    auto slab = parse_slab(root);
    if (!slab)
    {
        return std::unexpected(slab.error());
    }
    scenario.slab = *slab;

    auto column = parse_column(root);
    if (!column)
    {
        return std::unexpected(column.error());
    }
    scenario.column = *column;

    auto cantilever = parse_cantilever(root);
    if (!cantilever)
    {
        return std::unexpected(cantilever.error());
    }
    scenario.cantilever = *cantilever;

    auto design = parse_design(root);
    if (!design)
    {
        return std::unexpected(design.error());
    }
    scenario.design = *design;

    return scenario;
}

} // namespace fsa::config
