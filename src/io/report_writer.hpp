/**
 * @file report_writer.hpp
 * @brief Запись отчёта о прогоне в Markdown и JSON
 */

#pragma once

#include "model/run_report.hpp"
#include <filesystem>
#include <string>

namespace csvnorm::io {

struct ReportWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

/**
 * @brief Записать report.json и report.md в указанный каталог.
 */
ReportWriteResult writeRunReport(
    const csvnorm::model::RunReport& report,
    const std::filesystem::path& output_dir
);

/// JSON-представление отчёта (отступ 2)
[[nodiscard]] std::string runReportToJson(const csvnorm::model::RunReport& report);

[[nodiscard]] std::string runReportToMarkdown(const csvnorm::model::RunReport& report);

} // namespace csvnorm::io
