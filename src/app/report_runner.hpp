/**
 * @file report_runner.hpp
 * @brief Сборка и запись отчёта о прогоне
 */

#pragma once

#include "model/run_report.hpp"
#include "model/settings.hpp"
#include <filesystem>

namespace csvnorm::app {

/**
 * @brief Собрать отчёт: метаданные сборки и окружения + статистика прогона
 */
[[nodiscard]] csvnorm::model::RunReport buildRunReport(
    const csvnorm::model::SanitizerSettings& settings,
    const csvnorm::model::RunStatistics& stats
);

/**
 * @brief Собрать и записать report.json и report.md
 * @return 0 при успехе, 1 при ошибке записи (сообщение уже выведено в stderr)
 */
int writeReportCommand(
    const csvnorm::model::SanitizerSettings& settings,
    const csvnorm::model::RunStatistics& stats,
    const std::filesystem::path& output_dir
);

} // namespace csvnorm::app
