/**
 * @file duration.hpp
 * @brief Разбор длительностей H:MM:SS в секунды
 */

#pragma once

#include "model/row_outcome.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace csvnorm::core {

using csvnorm::model::FieldResult;

/**
 * @brief Разбор длительности H:MM:SS[.ffffff]
 *
 * Все три компонента — неотрицательные целые до 9 цифр без ограничения
 * диапазона ("1:75:00" = 8100 с). Дробная часть секунд до 6 цифр читается
 * как десятичная дробь (".5" = 0.5 с).
 *
 * @return Длительность с точностью до микросекунды либо std::nullopt
 */
[[nodiscard]] std::optional<std::chrono::microseconds> parseDuration(std::string_view text);

/**
 * @brief Форматирование длительности в секундах
 *
 * Без precision: целое значение без точки ("5012"), дробное до 6 знаков
 * без хвостовых нулей ("5012.25"). С precision ровно precision знаков,
 * округление половины вверх.
 */
[[nodiscard]] std::string formatSeconds(std::chrono::microseconds duration,
                                        std::optional<int> precision = std::nullopt);

/**
 * @brief Нормализация поля длительности
 * @return Число секунд либо отказ BadDuration
 */
[[nodiscard]] FieldResult normalizeDuration(std::string_view text, std::optional<int> precision = std::nullopt);

} // namespace csvnorm::core
