/**
 * @file text_utils.hpp
 * @brief Восстановление и нормализация UTF-8 строк
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace csvnorm::io {

/// U+FFFD REPLACEMENT CHARACTER в кодировке UTF-8
constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

/**
 * @brief Восстановление UTF-8
 *
 * Каждая некорректная последовательность (максимальный допустимый префикс
 * или одиночный байт) заменяется одним символом U+FFFD. Overlong-формы,
 * суррогаты и кодовые точки выше U+10FFFF считаются некорректными.
 * Никогда не завершается ошибкой.
 */
[[nodiscard]] std::string repairUtf8(std::string_view input);

/**
 * @brief Проверка, корректности UTF-8
 */
[[nodiscard]] bool isValidUtf8(std::string_view input) noexcept;

/**
 * @brief Количество символов U+FFFD в строке
 */
[[nodiscard]] size_t countReplacements(std::string_view input) noexcept;

/**
 * @brief Перевод строки в нижний регистр (ASCII, Latin-1, Latin Extended-A, греческий, кириллица)
 */
[[nodiscard]] std::string utf8ToLower(std::string_view input);

/**
 * @brief Перевод строки в верхний регистр (ASCII, Latin-1, Latin Extended-A, греческий, кириллица)
 *
 * Не зависит от локали. Идемпотентен: utf8ToUpper(utf8ToUpper(s)) == utf8ToUpper(s).
 */
[[nodiscard]] std::string utf8ToUpper(std::string_view input);

/**
 * @brief Удаление пробелов и табуляций по краям
 */
[[nodiscard]] std::string_view trimView(std::string_view str) noexcept;

/**
 * @brief Удаление UTF-8 BOM в начале строки
 */
[[nodiscard]] std::string_view stripBom(std::string_view str) noexcept;

} // namespace csvnorm::io
