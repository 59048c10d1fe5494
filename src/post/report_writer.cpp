/**
 * @file report_writer.cpp
 * @brief implementation of the CSV report writer uwu
 */
#include "fsa/post/report_writer.hpp"

#include <fstream>
#include <sstream>
#include <initializer_list>
#include <system_error>
#include <utility>

namespace fsa::post
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> ReportError
{
    ReportError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

[[nodiscard]] auto make_stream() -> std::ostringstream
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss.precision(6);
    return oss;
}

} // namespace

ReportWriter::ReportWriter(std::filesystem::path root) : root_{std::move(root)}
{
}

auto ReportWriter::write_file(const std::string &name, const std::string &content) const
    -> std::expected<void, ReportError>
{
    if (!root_.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            return std::unexpected(make_error("failed to create export directory: " + ec.message(), {root_.string()}));
        }
    }

    const auto path = root_ / name;
    std::ofstream file(path, std::ios::trunc);
    if (!file)
    {
        return std::unexpected(make_error("failed to open " + name, {path.string()}));
    }
    file << content;
    if (!file)
    {
        return std::unexpected(make_error("failed to write " + name, {path.string()}));
    }
    return {};
}

auto ReportWriter::write_rebar(const ddm::DdmResult &ddm) const -> std::expected<void, ReportError>
{
    auto oss = make_stream();
    oss << "location,strip,mu_knm,width_m,thickness_m,depth_m,rn_mpa,as_cm2,status,bars\n";
    for (const auto &section : ddm.rebar)
    {
        oss << ddm::to_string(section.location) << ',' << ddm::to_string(section.strip) << ','
            << section.mu / 1.0e3 << ',' << section.width << ',' << section.thickness << ',' << section.depth << ','
            << section.rn / 1.0e6 << ',' << section.as_required * 1.0e4 << ',' << ddm::to_string(section.status)
            << ',' << '"' << section.bars.text << '"' << '\n';
    }
    return write_file("rebar.csv", oss.str());
}

auto ReportWriter::write_shear(const ddm::DdmResult &ddm) const -> std::expected<void, ReportError>
{
    auto oss = make_stream();
    oss << "section,d_m,b1_m,b2_m,bo_m,beta,alpha_s,vu_kn,phi_vc_kn,ratio,status\n";
    for (const auto &check : ddm.shear)
    {
        oss << ddm::to_string(check.section) << ',' << check.d << ',' << check.perimeter.b1 << ','
            << check.perimeter.b2 << ',' << check.perimeter.bo << ',' << check.beta << ',' << check.alpha_s << ','
            << check.vu / 1.0e3 << ',' << check.phi_vc / 1.0e3 << ',' << check.ratio << ','
            << ddm::to_string(check.status) << '\n';
    }
    return write_file("shear.csv", oss.str());
}

auto ReportWriter::write_stiffness(const efm::StiffnessSet &efm) const -> std::expected<void, ReportError>
{
    auto oss = make_stream();
    oss.setf(std::ios::scientific, std::ios::floatfield);
    oss << "quantity,value\n";
    oss << "ec," << efm.ec << '\n';
    oss << "is," << efm.is << '\n';
    oss << "ic," << efm.ic << '\n';
    oss << "c," << efm.c << '\n';
    oss << "ks," << efm.ks << '\n';
    oss << "kc_up," << efm.kc_up << '\n';
    oss << "kc_lo," << efm.kc_lo << '\n';
    oss << "sum_kc," << efm.sum_kc << '\n';
    oss << "torsion_arms," << efm.torsion_arms << '\n';
    oss << "kt," << efm.kt << '\n';
    oss << "kec," << efm.kec << '\n';
    oss << "df_slab," << efm.df_slab << '\n';
    oss << "df_col," << efm.df_col << '\n';
    return write_file("stiffness.csv", oss.str());
}

auto ReportWriter::write_all(const ddm::DdmResult &ddm, const efm::StiffnessSet &efm) const
    -> std::expected<void, ReportError>
{
    if (auto ok = write_rebar(ddm); !ok)
    {
        return ok;
    }
    if (auto ok = write_shear(ddm); !ok)
    {
        return ok;
    }
    return write_stiffness(efm);
}

} // namespace fsa::post
