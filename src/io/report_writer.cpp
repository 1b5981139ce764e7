/**
 * @file report_writer.cpp
 * @brief Запись отчёта о прогоне
 */

#include "report_writer.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace csvnorm::io {
namespace {

using namespace csvnorm::model;

// Вертикальная черта ломает таблицу Markdown
std::string escapeTableCell(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') {
            out += "\\|";
        } else {
            out += c;
        }
    }
    return out;
}

std::string buildMarkdown(const RunReport& report) {
    std::ostringstream out;
    const auto& stats = report.stats;

    out << "# Отчёт о нормализации CSV\n\n";
    out << "- Версия приложения: " << report.meta.app_version << "\n";
    out << "- Платформа: " << report.meta.platform << "\n";
    out << "- Схема отчёта: " << report.meta.schema_version << "\n";
    out << "- Входной пояс: " << report.meta.input_time_zone << "\n";
    out << "- Выходной пояс: " << report.meta.output_time_zone << "\n";
    out << "- Время: " << report.meta.timestamp << "\n\n";

    out << "## Сводка\n";
    out << "- Прочитано строк: " << stats.rows_read << "\n";
    out << "- Записано строк: " << stats.rows_written << "\n";
    out << "- Отброшено строк: " << stats.rows_dropped << "\n";
    out << "- Пустых строк: " << stats.blank_lines << "\n";
    out << "- Строк заголовка: " << stats.header_rows << "\n\n";

    if (!stats.dropped_by_reason.empty()) {
        out << "## Причины отбраковки\n";
        out << "| Причина | Количество |\n";
        out << "|---------|------------|\n";
        for (const auto& [reason, count] : stats.dropped_by_reason) {
            out << "| " << dropReasonToString(reason) << " | " << count << " |\n";
        }
        out << "\n";
    }

    if (!stats.drops.empty()) {
        out << "## Отброшенные строки\n";
        out << "| Строка | Причина | Детали |\n";
        out << "|--------|---------|--------|\n";
        for (const auto& drop : stats.drops) {
            out << "| " << drop.line << " | " << dropReasonToString(drop.reason)
                << " | " << escapeTableCell(drop.detail) << " |\n";
        }
        if (stats.drops.size() < stats.rows_dropped) {
            out << "\nПоказаны первые " << stats.drops.size() << " из " << stats.rows_dropped << ".\n";
        }
    }

    return out.str();
}

nlohmann::json buildJson(const RunReport& report) {
    nlohmann::json j;
    const auto& stats = report.stats;

    j["schema_version"] = report.meta.schema_version;
    j["meta"] = {
        {"app_version", report.meta.app_version},
        {"platform", report.meta.platform},
        {"timestamp", report.meta.timestamp},
        {"input_time_zone", report.meta.input_time_zone},
        {"output_time_zone", report.meta.output_time_zone}
    };

    nlohmann::json by_reason = nlohmann::json::object();
    for (const auto& [reason, count] : stats.dropped_by_reason) {
        by_reason[std::string(dropReasonToString(reason))] = count;
    }

    j["summary"] = {
        {"rows_read", stats.rows_read},
        {"rows_written", stats.rows_written},
        {"rows_dropped", stats.rows_dropped},
        {"blank_lines", stats.blank_lines},
        {"header_rows", stats.header_rows},
        {"dropped_by_reason", by_reason}
    };

    j["drops"] = nlohmann::json::array();
    for (const auto& drop : stats.drops) {
        j["drops"].push_back({
            {"line", drop.line},
            {"reason", std::string(dropReasonToString(drop.reason))},
            {"detail", drop.detail}
        });
    }

    return j;
}

} // namespace

std::string runReportToJson(const RunReport& report) {
    return buildJson(report).dump(2);
}

std::string runReportToMarkdown(const RunReport& report) {
    return buildMarkdown(report);
}

ReportWriteResult writeRunReport(
    const RunReport& report,
    const std::filesystem::path& output_dir
) {
    std::filesystem::create_directories(output_dir);
    ReportWriteResult result;

    auto json_path = output_dir / "report.json";
    auto md_path = output_dir / "report.md";

    atomicWrite(json_path, runReportToJson(report));
    atomicWrite(md_path, runReportToMarkdown(report));

    result.json_path = json_path;
    result.markdown_path = md_path;
    return result;
}

} // namespace csvnorm::io
