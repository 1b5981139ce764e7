/**
 * @file field_normalizers.hpp
 * @brief Нормализация текстовых полей (имя, адрес, ZIP, примечания)
 */

#pragma once

#include <string>
#include <string_view>

namespace csvnorm::core {

/**
 * @brief Имя в верхнем регистре (не зависит от локали, идемпотентно)
 */
[[nodiscard]] std::string normalizeName(std::string_view text);

/**
 * @brief Текст без изменений (адрес, примечания)
 */
[[nodiscard]] std::string normalizeText(std::string_view text);

/**
 * @brief Почтовый индекс
 *
 * Без изменений; при pad == true значение из 1-4 цифр
 * дополняется нулями слева до 5 символов. Корректность индекса не проверяется.
 */
[[nodiscard]] std::string normalizeZip(std::string_view text, bool pad = false);

} // namespace csvnorm::core
