/**
 * @file run_report.hpp
 * @brief Статистика прогона и отчёт о нормализации потока
 */

#pragma once

#include "row_outcome.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace csvnorm::model {

/**
 * @brief Отброшенная строка (для отчёта)
 */
struct DropSample {
    size_t line = 0;         ///< Номер физической строки (с 1)
    DropReason reason = DropReason::WrongFieldCount;
    std::string detail;
};

/**
 * @brief Счётчики одного прогона
 */
struct RunStatistics {
    size_t rows_read = 0;       ///< Непустые строки, переданные на обработку
    size_t rows_written = 0;    ///< Выведенные строки данных
    size_t rows_dropped = 0;    ///< Отброшенные строки
    size_t blank_lines = 0;     ///< Пропущенные пустые строки
    size_t header_rows = 0;     ///< Распознанные строки заголовка
    std::map<DropReason, size_t> dropped_by_reason;
    std::vector<DropSample> drops;   ///< Первые N отброшенных строк

    void recordDrop(size_t line, DropReason reason, const std::string& detail, size_t max_samples) {
        ++rows_dropped;
        ++dropped_by_reason[reason];
        if (drops.size() < max_samples) {
            drops.push_back({line, reason, detail});
        }
    }
};

struct RunMeta {
    std::string schema_version = "1.0.0";
    std::string app_version;
    std::string platform;
    std::string timestamp;
    std::string input_time_zone;
    std::string output_time_zone;
};

struct RunReport {
    RunMeta meta;
    RunStatistics stats;
};

} // namespace csvnorm::model
