/**
 * @file config.hpp
 * @brief YAML-powered flat slab scenario loader that absolutely slaps uwu
 *
 * this header defines the raw input model for FlatSlab-ACI. one scenario file
 * describes one slab-column joint: materials, loads, panel location, spans on
 * each side of the column, slab + drop panel, column sizes with their far-end
 * conditions, optional cantilevers, and a couple of detailing knobs. the loader
 * parses YAML 1.2 into strongly typed C++26 structs and bubbles up ergonomic
 * errors via std::expected. nothing here is converted to SI yet; that is the
 * geometry preparer's job, so values stay in the units engineers actually type
 * (cm, m, ksc, kg/m^2).
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note requires GCC 15.2+ with -std=c++2c (aka C++26) for std::expected
 * @note yaml-cpp 0.8.0+ powers parsing but we stay dependency-light elsewhere
 *
 * example (basic usage):
 * @code
 * using fsa::config::load_scenario_from_file;
 * auto scenario = load_scenario_from_file("tests/data/interior_panel.yaml");
 * if (!scenario) {
 *     std::print(stderr, "config error: {}\n", scenario.error().message);
 *     return EXIT_FAILURE;
 * }
 * // scenario->spans.l1_right is now the right-hand span in metres uwu
 * @endcode
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace YAML
{
class Node;
} // namespace YAML

namespace fsa::config
{

/**
 * @brief where the column sits in plan (selects the ACI coefficient row)
 *
 * ✨ PURE FUNCTION ✨
 */
enum class PanelLocation : std::uint8_t
{
    Interior = 0U, ///< four slab panels around the column
    Edge     = 1U, ///< three panels, slab edge perpendicular to l1
    Corner   = 2U  ///< two panels
};

/**
 * @brief far-end restraint of a column segment (slope-deflection k factor)
 */
enum class FarEnd : std::uint8_t
{
    Fixed  = 0U, ///< 4EI/L
    Pinned = 1U  ///< 3EI/L
};

/**
 * @brief joint type: roof joints have no upper column
 */
enum class JointType : std::uint8_t
{
    Intermediate = 0U,
    Roof         = 1U
};

/**
 * @brief config error payload with context breadcrumbs for days
 *
 * the loader never throws; instead it returns std::expected with this error
 * struct. context strings form a breadcrumb trail (e.g., "column", "upper",
 * "far_end") so YAML typos are painless to chase down.
 */
struct ConfigError
{
    std::string              message; ///< spicy human-readable error message uwu
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief concrete + steel strengths exactly as typed
 */
struct MaterialInputs
{
    double fc_ksc; ///< f'c [ksc]
    double fy_ksc; ///< fy [ksc] (SD30 = 3000, SD40 = 4000, SD50 = 5000)
};

/**
 * @brief service loads + factors (superimposed dead and live)
 */
struct LoadInputs
{
    double dead_kgm2{0.0};         ///< superimposed dead load [kg/m^2]
    double live_kgm2{0.0};         ///< live load [kg/m^2]
    double factor_dead{1.4};       ///< LF_dead
    double factor_live{1.7};       ///< LF_live
    bool   auto_self_weight{true}; ///< add h_slab * rho * g to the dead load
};

/**
 * @brief spandrel beam cross section along the slab edge
 */
struct EdgeBeamInputs
{
    double width_cm; ///< beam web width [cm]
    double depth_cm; ///< overall beam depth [cm]
};

/**
 * @brief panel case: plan location + exterior edge condition
 */
struct PanelInputs
{
    PanelLocation                 location{PanelLocation::Interior};
    std::optional<EdgeBeamInputs> edge_beam{};             ///< only legal for edge/corner
    bool                          fully_restrained_edge{}; ///< exterior edge cast into a stiff wall
};

/**
 * @brief centre-to-centre spans on each side of the column [m], 0 when absent
 */
struct SpanInputs
{
    double l1_left{0.0};   ///< analysis direction, left side
    double l1_right{0.0};  ///< analysis direction, right side
    double l2_top{0.0};    ///< transverse, top side
    double l2_bottom{0.0}; ///< transverse, bottom side
};

/**
 * @brief drop panel: projection below the slab and total plan widths
 */
struct DropPanelInputs
{
    double depth_cm; ///< projection below slab soffit [cm]
    double width1_m; ///< total width along l1 [m]
    double width2_m; ///< total width along l2 [m]
};

struct SlabInputs
{
    double                         thickness_cm{0.0};
    std::optional<DropPanelInputs> drop_panel{};
};

/**
 * @brief one storey column segment above or below the joint
 */
struct ColumnSegment
{
    double height_m{0.0};
    FarEnd far_end{FarEnd::Fixed};
};

struct ColumnInputs
{
    double        c1_cm{0.0}; ///< size along the analysis direction [cm]
    double        c2_cm{0.0}; ///< transverse size [cm]
    JointType     joint{JointType::Intermediate};
    ColumnSegment upper{};    ///< ignored for roof joints
    ColumnSegment lower{};
};

/**
 * @brief overhang lengths [m], 0 means no cantilever on that side
 */
struct CantileverInputs
{
    double left_m{0.0};
    double right_m{0.0};
};

/**
 * @brief detailing knobs with ACI-ish defaults
 */
struct DesignSettings
{
    double cover_cm{3.0};         ///< clear cover to bar centroid [cm]
    double bar_diameter_mm{12.0}; ///< bar used for the spacing suggestion
};

/**
 * @brief main raw input object bundling one slab-column scenario
 */
struct Scenario
{
    MaterialInputs   materials;
    LoadInputs       loads;
    PanelInputs      panel;
    SpanInputs       spans;
    SlabInputs       slab;
    ColumnInputs     column;
    CantileverInputs cantilever;
    DesignSettings   design;
};

/**
 * @brief convenience alias for the loader result type (std::expected wrapper)
 */
using ScenarioResult = std::expected<Scenario, ConfigError>;

/**
 * @brief maps Thai deformed bar grade names to fy in ksc
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param grade "SD30", "SD40" or "SD50"
 * @return fy [ksc] or std::nullopt for unknown grades
 */
[[nodiscard]] auto grade_to_fy_ksc(std::string_view grade) -> std::optional<double>;

/**
 * @brief parses "interior" / "edge" / "corner" (case-insensitive)
 */
[[nodiscard]] auto parse_location(std::string_view text) -> std::optional<PanelLocation>;

/**
 * @brief parses "fixed" / "pinned" (case-insensitive)
 */
[[nodiscard]] auto parse_far_end(std::string_view text) -> std::optional<FarEnd>;

/**
 * @brief parses "intermediate" / "roof" (case-insensitive)
 */
[[nodiscard]] auto parse_joint(std::string_view text) -> std::optional<JointType>;

[[nodiscard]] auto to_string(PanelLocation location) -> std::string_view;
[[nodiscard]] auto to_string(FarEnd far_end) -> std::string_view;
[[nodiscard]] auto to_string(JointType joint) -> std::string_view;

/**
 * @brief parses a YAML scenario from a file path with aggressive validation
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * this helper is impure because:
 * - hits the file system to read YAML
 * - may throw yaml-cpp exceptions internally (captured into expected)
 *
 * @param[in] path filesystem location of YAML document
 * @return ScenarioResult containing the parsed Scenario or a ConfigError
 *
 * @note only schema-level checks happen here (presence, types, enum names).
 *       physical plausibility (positive spans, column narrower than the panel)
 *       is the geometry preparer's business.
 */
[[nodiscard]] auto load_scenario_from_file(const std::filesystem::path &path) -> ScenarioResult;

/**
 * @brief parses a YAML scenario directly from a string buffer (test-friendly)
 *
 * ⚠️ IMPURE FUNCTION (depends on yaml-cpp's global state when parsing)
 */
[[nodiscard]] auto load_scenario_from_string(std::string_view yaml_text) -> ScenarioResult;

/**
 * @brief low-level parser for already-loaded YAML nodes (advanced usage)
 */
[[nodiscard]] auto parse_scenario_node(const YAML::Node &root) -> ScenarioResult;

} // namespace fsa::config
