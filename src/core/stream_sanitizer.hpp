/**
 * @file stream_sanitizer.hpp
 * @brief Построчная нормализация потока CSV
 */

#pragma once

#include "row_sanitizer.hpp"
#include "model/run_report.hpp"
#include <iosfwd>

namespace csvnorm::core {

using csvnorm::model::RunStatistics;

/**
 * @brief Однопроходная обработка потока: одна строка на входе, не более одной на выходе
 *
 * Строки обрабатываются независимо и в исходном порядке. Отброшенные строки
 * не попадают в выходной поток; предупреждения пишутся в diag.
 */
class StreamSanitizer {
public:
    /**
     * @throws TimeZoneError Если пояс из настроек неизвестен
     */
    explicit StreamSanitizer(const SanitizerSettings& settings);

    explicit StreamSanitizer(RowSanitizer rows);

    /**
     * @brief Обработать весь входной поток
     *
     * @param in Входные байты, одна запись на строку (LF или CRLF)
     * @param out Нормализованные строки, каждая с завершающим \n
     * @param diag Поток диагностики (nullptr: без диагностики)
     * @return Статистика прогона
     */
    RunStatistics run(std::istream& in, std::ostream& out, std::ostream* diag = nullptr) const;

    [[nodiscard]] const RowSanitizer& rows() const noexcept { return rows_; }

private:
    RowSanitizer rows_;
};

} // namespace csvnorm::core
