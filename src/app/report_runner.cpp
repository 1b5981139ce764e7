/**
 * @file report_runner.cpp
 * @brief Сборка и запись отчёта о прогоне
 */

#include "report_runner.hpp"
#include "io/report_writer.hpp"
#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace csvnorm::app {
namespace {

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

std::string detectPlatform() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

} // namespace

csvnorm::model::RunReport buildRunReport(
    const csvnorm::model::SanitizerSettings& settings,
    const csvnorm::model::RunStatistics& stats
) {
    csvnorm::model::RunReport report;
    report.meta.app_version = CSVNORM_VERSION;
    report.meta.platform = detectPlatform();
    report.meta.timestamp = isoTimestampNow();
    report.meta.input_time_zone = settings.input_time_zone;
    report.meta.output_time_zone = settings.effectiveOutputZone();
    report.stats = stats;
    return report;
}

int writeReportCommand(
    const csvnorm::model::SanitizerSettings& settings,
    const csvnorm::model::RunStatistics& stats,
    const std::filesystem::path& output_dir
) {
    try {
        auto result = io::writeRunReport(buildRunReport(settings, stats), output_dir);
        if (!settings.quiet) {
            std::cerr << "Отчёт сохранён: " << result.json_path.string()
                      << ", " << result.markdown_path.string() << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка записи отчёта: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace csvnorm::app
