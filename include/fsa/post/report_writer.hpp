/**
 * @file report_writer.hpp
 * @brief CSV export of the DDM + EFM result tables uwu
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "fsa/ddm/engine.hpp"
#include "fsa/efm/stiffness.hpp"

namespace fsa::post
{

struct ReportError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief writes rebar.csv, shear.csv and stiffness.csv into one directory
 */
class ReportWriter
{
public:
    explicit ReportWriter(std::filesystem::path root);

    [[nodiscard]] auto write_rebar(const ddm::DdmResult &ddm) const -> std::expected<void, ReportError>;
    [[nodiscard]] auto write_shear(const ddm::DdmResult &ddm) const -> std::expected<void, ReportError>;
    [[nodiscard]] auto write_stiffness(const efm::StiffnessSet &efm) const -> std::expected<void, ReportError>;

    /// all three tables, stops at the first failure
    [[nodiscard]] auto write_all(const ddm::DdmResult &ddm, const efm::StiffnessSet &efm) const
        -> std::expected<void, ReportError>;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path & { return root_; }

private:
    [[nodiscard]] auto write_file(const std::string &name, const std::string &content) const
        -> std::expected<void, ReportError>;

    std::filesystem::path root_{};
};

} // namespace fsa::post
