/**
 * @file slab_report.cpp
 * @brief command line front end: scenario YAML in, ACI flat slab report out uwu
 *
 * usage: `slab_report <scenario.yaml> [export_dir]`
 *
 * loads the scenario, prepares the normalized record, then runs the design
 * criteria, the Direct Design Method and the EFM stiffness pipeline and prints
 * everything with std::print. with an export directory the rebar, shear and
 * stiffness tables also land there as CSV. only config/input problems make the
 * process exit non-zero; engineering failures are part of the report.
 *
 * @note targets the usual GCC 15.2 + C++26 toolchain per repo defaults
 */

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>
#include <vector>

#include "fsa/config/config.hpp"
#include "fsa/criteria/validator.hpp"
#include "fsa/ddm/engine.hpp"
#include "fsa/efm/stiffness.hpp"
#include "fsa/geometry/prepare.hpp"
#include "fsa/post/report_writer.hpp"

namespace
{

/**
 * @brief join breadcrumb context as "a.b.c" for error output
 */
[[nodiscard]] auto join_context(const std::vector<std::string> &context) -> std::string
{
    std::string joined;
    for (const auto &part : context)
    {
        if (!joined.empty())
        {
            joined += '.';
        }
        joined += part;
    }
    return joined;
}

[[nodiscard]] auto pass_fail(bool passed) -> const char *
{
    return passed ? "PASS" : "FAIL";
}

void print_criteria(const fsa::criteria::CriteriaReport &report)
{
    const auto &thk = report.min_thickness;
    std::print("== Design criteria ==\n");
    std::print("minimum thickness ({}): ln = {:.3f} m, h_min = {:.1f} cm, provided {:.1f} cm [{}]\n", thk.case_name,
               thk.ln_long, thk.required_h * 100.0, thk.provided_h * 100.0, pass_fail(thk.passed));
    for (const auto &dim : report.drop_panel)
    {
        std::print("drop panel {}: {:.3f} m >= {:.3f} m (margin {:.3f}) [{}]\n", dim.label, dim.provided,
                   dim.required, dim.margin, pass_fail(dim.passed));
    }
    std::print("DDM applicable: {}\n", report.ddm.applicable ? "yes" : "no");
    for (const auto &rule : report.ddm.rules)
    {
        std::print("  - {}\n", rule.message);
    }
    for (const auto &rule : report.efm.rules)
    {
        std::print("EFM: {}\n", rule.message);
    }
}

void print_ddm(const fsa::ddm::DdmResult &ddm, const fsa::common::UnitsConfig &units)
{
    std::print("\n== Direct Design Method ==\n");
    std::print("wu = {:.1f} kg/m^2, Ln = {:.3f} m, l2/l1 = {:.3f}, beta_t = {:.3f}\n", units.n_to_kg(ddm.wu),
               ddm.clear_span.used, ddm.l2_l1, ddm.beta_t);
    std::print("Mo = {:.1f} kN.m ({:.1f} kg.m), {}\n", ddm.moments.mo / 1.0e3, units.n_to_kg(ddm.moments.mo),
               ddm.coefficients.description);
    std::print("strips: column {:.3f} m, middle {:.3f} m\n", ddm.strips.column, ddm.strips.middle);
    for (const auto &share : ddm.moments.components())
    {
        std::print("  {:8} coef {:.2f}  M = {:8.2f} kN.m  CS {:5.1f}% = {:8.2f}  MS = {:8.2f}\n",
                   fsa::ddm::to_string(share.component), share.coefficient, share.total / 1.0e3,
                   share.cs_pct * 100.0, share.cs / 1.0e3, share.ms / 1.0e3);
    }

    std::print("\nreinforcement:\n");
    for (const auto &section : ddm.rebar)
    {
        std::print("  {:8} {:6} Mu = {:8.2f} kN.m  As = {:6.2f} cm^2  {:8}  {}\n",
                   fsa::ddm::to_string(section.location), fsa::ddm::to_string(section.strip), section.mu / 1.0e3,
                   section.as_required * 1.0e4, fsa::ddm::to_string(section.status), section.bars.text);
    }

    std::print("\npunching shear:\n");
    for (const auto &check : ddm.shear)
    {
        std::print("  {:15} d = {:.3f} m  bo = {:.3f} m  Vu = {:8.2f} kN  phiVc = {:8.2f} kN  [{}]\n",
                   fsa::ddm::to_string(check.section), check.d, check.perimeter.bo, check.vu / 1.0e3,
                   check.phi_vc / 1.0e3, fsa::ddm::to_string(check.status));
    }

    for (const auto &note : ddm.notes)
    {
        std::print("note: {}\n", note);
    }
    for (const auto &warning : ddm.warnings)
    {
        std::print("warning: {}\n", warning);
    }
}

void print_efm(const fsa::efm::StiffnessSet &efm)
{
    std::print("\n== Equivalent Frame Method stiffness ==\n");
    std::print("Ec = {:.4e} Pa, Is = {:.4e} m^4, Ic = {:.4e} m^4, C = {:.4e} m^4\n", efm.ec, efm.is, efm.ic, efm.c);
    std::print("Ks = {:.4e}, Kc up/lo = {:.4e} / {:.4e}, Sum Kc = {:.4e}\n", efm.ks, efm.kc_up, efm.kc_lo,
               efm.sum_kc);
    std::print("Kt = {:.4e} ({} arm(s)), Kec = {:.4e}\n", efm.kt, efm.torsion_arms, efm.kec);
    std::print("DF slab = {:.4f}, DF column = {:.4f}\n", efm.df_slab, efm.df_col);
}

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2 || argc > 3)
    {
        std::print(stderr, "usage: slab_report <scenario.yaml> [export_dir]\n");
        return EXIT_FAILURE;
    }

    const std::filesystem::path scenario_path{argv[1]};
    auto scenario = fsa::config::load_scenario_from_file(scenario_path);
    if (!scenario)
    {
        std::print(stderr, "config error: {} [{}]\n", scenario.error().message,
                   join_context(scenario.error().context));
        return EXIT_FAILURE;
    }

    auto record = fsa::geometry::prepare_geometry(*scenario);
    if (!record)
    {
        std::print(stderr, "input error: {} [{}]\n", record.error().message, join_context(record.error().context));
        return EXIT_FAILURE;
    }

    std::print("Flat slab report for {} ({} column)\n", scenario_path.string(),
               fsa::config::to_string(record->panel.location));

    const auto criteria = fsa::criteria::validate_criteria(*record);
    const auto ddm      = fsa::ddm::run_ddm(*record);
    const auto efm      = fsa::efm::run_efm(*record);

    print_criteria(criteria);
    print_ddm(ddm, record->units);
    print_efm(efm);

    if (argc == 3)
    {
        const fsa::post::ReportWriter writer{std::filesystem::path{argv[2]}};
        if (auto written = writer.write_all(ddm, efm); !written)
        {
            std::print(stderr, "export error: {} [{}]\n", written.error().message,
                       join_context(written.error().context));
            return EXIT_FAILURE;
        }
        std::print("\nCSV tables written to {}\n", writer.root().string());
    }

    return EXIT_SUCCESS;
}
