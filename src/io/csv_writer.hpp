/**
 * @file csv_writer.hpp
 * @brief Сериализация полей в строку CSV
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace csvnorm::io {

/**
 * @brief Экранирование одного поля
 *
 * Поле заключается в кавычки, только если содержит разделитель,
 * кавычку, \n или \r. Кавычки внутри удваиваются.
 */
[[nodiscard]] std::string encodeField(std::string_view field, char delimiter = ',');

/**
 * @brief Сборка строки CSV из полей (без завершающего перевода строки)
 */
[[nodiscard]] std::string joinRecord(const std::vector<std::string>& fields, char delimiter = ',');

} // namespace csvnorm::io
