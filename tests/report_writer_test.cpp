/**
 * @file report_writer_test.cpp
 * @brief CSV tables land on disk with the expected shape uwu
 */
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "fsa/ddm/engine.hpp"
#include "fsa/efm/stiffness.hpp"
#include "fsa/post/report_writer.hpp"
#include "support/scenario_builder.hpp"

namespace
{

[[nodiscard]] auto read_lines(const std::filesystem::path &path) -> std::vector<std::string>
{
    std::ifstream            file(path);
    std::vector<std::string> lines{};
    std::string              line{};
    while (std::getline(file, line))
    {
        lines.push_back(line);
    }
    return lines;
}

TEST(ReportWriterTests, WritesAllThreeTables)
{
    fsa::test_support::ScenarioBuilderOptions options{};
    options.drop_panel = fsa::test_support::DropPanelSpec{};
    const auto record  = fsa::test_support::prepare(options);
    const auto ddm     = fsa::ddm::run_ddm(record);
    const auto efm     = fsa::efm::run_efm(record);

    const auto out_dir = std::filesystem::temp_directory_path() / "fsa_report_test" / "nested";
    std::filesystem::remove_all(out_dir);
    const fsa::post::ReportWriter writer(out_dir);
    const auto status = writer.write_all(ddm, efm);
    ASSERT_TRUE(status.has_value()) << status.error().message;

    const auto rebar = read_lines(out_dir / "rebar.csv");
    ASSERT_EQ(rebar.size(), 7U);
    EXPECT_EQ(rebar.front(), "location,strip,mu_knm,width_m,thickness_m,depth_m,rn_mpa,as_cm2,status,bars");
    EXPECT_EQ(rebar[1].rfind("neg_ext,column,", 0), 0U);
    EXPECT_NE(rebar[1].find("\"DB12 @ "), std::string::npos);

    const auto shear = read_lines(out_dir / "shear.csv");
    ASSERT_EQ(shear.size(), 3U);
    EXPECT_EQ(shear.front(), "section,d_m,b1_m,b2_m,bo_m,beta,alpha_s,vu_kn,phi_vc_kn,ratio,status");
    EXPECT_EQ(shear[1].rfind("column face,", 0), 0U);
    EXPECT_EQ(shear[2].rfind("drop panel face,", 0), 0U);

    const auto stiffness = read_lines(out_dir / "stiffness.csv");
    ASSERT_EQ(stiffness.size(), 14U);
    EXPECT_EQ(stiffness.front(), "quantity,value");
    EXPECT_EQ(stiffness[9], "torsion_arms,2");
    EXPECT_EQ(stiffness.back().rfind("df_col,", 0), 0U);

    EXPECT_EQ(writer.root(), out_dir);
}

TEST(ReportWriterTests, RootThatIsAFileIsAnError)
{
    const auto base = std::filesystem::temp_directory_path() / "fsa_report_test";
    std::filesystem::create_directories(base);
    const auto blocker = base / "not_a_directory";
    {
        std::ofstream file(blocker, std::ios::trunc);
        file << "occupied\n";
    }

    const auto record = fsa::test_support::prepare();
    const fsa::post::ReportWriter writer(blocker);
    const auto status = writer.write_shear(fsa::ddm::run_ddm(record));
    ASSERT_FALSE(status.has_value());
    EXPECT_FALSE(status.error().message.empty());
    EXPECT_FALSE(status.error().context.empty());
}

} // namespace
