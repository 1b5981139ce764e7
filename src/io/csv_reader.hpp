/**
 * @file csv_reader.hpp
 * @brief Разбор строки CSV на поля
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace csvnorm::io {

/**
 * @brief Ошибка токенизации строки
 */
enum class TokenizeError {
    None,
    UnterminatedQuote,   ///< Строка закончилась внутри кавычек
    MalformedQuote       ///< После закрывающей кавычки не разделитель
};

/**
 * @brief Результат разбора строки CSV
 */
struct TokenizeResult {
    std::vector<std::string> fields;
    TokenizeError error = TokenizeError::None;
    size_t error_offset = 0;   ///< Байтовое смещение ошибки в строке

    [[nodiscard]] bool ok() const noexcept { return error == TokenizeError::None; }
};

/**
 * @brief Разбор одной строки CSV
 *
 * Правила:
 * - поле, начинающееся с кавычки, читается до парной кавычки;
 *   разделители внутри — часть значения, "" — экранированная кавычка;
 * - после закрывающей кавычки допустим только разделитель или конец строки;
 * - кавычка в середине поля без кавычек — обычный символ;
 * - значения не обрезаются.
 *
 * @param line Строка без завершающего перевода строки (корректный UTF-8)
 * @param delimiter Разделитель полей
 */
[[nodiscard]] TokenizeResult tokenizeRecord(std::string_view line, char delimiter = ',');

/**
 * @brief Текстовое описание ошибки токенизации
 */
[[nodiscard]] std::string_view tokenizeErrorToString(TokenizeError error) noexcept;

} // namespace csvnorm::io
