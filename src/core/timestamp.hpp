/**
 * @file timestamp.hpp
 * @brief Нормализация метки времени в ISO 8601 с явным смещением
 */

#pragma once

#include "time_zone.hpp"
#include "model/row_outcome.hpp"
#include <date/date.h>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace csvnorm::core {

using csvnorm::model::FieldResult;

/**
 * @brief Разобранная метка времени M/D/YY H:MM:SS AM|PM [ZONE]
 */
struct ParsedTimestamp {
    date::local_seconds local;                           ///< Локальное время
    std::optional<std::chrono::seconds> explicit_offset; ///< Смещение из явного пояса в строке
};

/**
 * @brief Разбор метки времени без перевода в UTC
 *
 * Год из двух цифр (00..68 → 20xx, 69..99 → 19xx), час 1..12,
 * AM/PM без учёта регистра, 12 AM → 00, 12 PM → 12.
 *
 * @return std::nullopt, если строка не соответствует формату
 */
[[nodiscard]] std::optional<ParsedTimestamp> parseTimestamp(std::string_view text);

/**
 * @brief Смещение для аббревиатуры или числового обозначения пояса
 *
 * Z, UTC, GMT, ±HH:MM, ±HHMM, ±HH, PST, PDT, MST, MDT, CST, CDT, EST, EDT, AKST, AKDT, HST.
 */
[[nodiscard]] std::optional<std::chrono::seconds> parseZoneToken(std::string_view token);

/**
 * @brief ISO 8601 YYYY-MM-DDTHH:MM:SS±HH:MM
 */
[[nodiscard]] std::string formatIso8601(date::local_seconds local, std::chrono::seconds offset);

/**
 * @brief Нормализатор метки времени
 *
 * Пояс по умолчанию передаётся явно при создании.
 */
class TimestampNormalizer {
public:
    TimestampNormalizer(TimeZone input_zone,
                        std::optional<TimeZone> output_zone = std::nullopt,
                        AmbiguityPolicy policy = AmbiguityPolicy::PreferStandard);

    /**
     * @brief Нормализация поля метки времени
     * @return ISO 8601 либо отказ BadTimestamp
     */
    [[nodiscard]] FieldResult normalize(std::string_view text) const;

    /// Момент UTC для корректной метки времени
    [[nodiscard]] std::optional<date::sys_seconds> toUtc(std::string_view text) const;

    [[nodiscard]] const TimeZone& inputZone() const noexcept { return input_zone_; }
    [[nodiscard]] const TimeZone& outputZone() const noexcept { return output_zone_; }

private:
    TimeZone input_zone_;
    TimeZone output_zone_;
    AmbiguityPolicy policy_;
};

} // namespace csvnorm::core
