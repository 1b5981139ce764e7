/**
 * @file time_zone.hpp
 * @brief Часовые пояса на базе базы IANA (библиотека date/tz)
 *
 * Пояс задаётся явно и передаётся в нормализатор меток времени —
 * переменная окружения TZ и localtime()/mktime() не используются.
 */

#pragma once

#include "model/settings.hpp"
#include <date/date.h>
#include <date/tz.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace csvnorm::core {

using csvnorm::model::AmbiguityPolicy;

/**
 * @brief Ошибка поиска часового пояса
 */
class TimeZoneError : public std::runtime_error {
public:
    explicit TimeZoneError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Смещение в формате ±HH:MM (восточнее UTC положительное)
 */
[[nodiscard]] std::string formatUtcOffset(std::chrono::seconds offset);

/**
 * @brief Часовой пояс: зона IANA либо постоянное смещение
 *
 * Объект не владеет зоной: date::time_zone живёт в базе date::get_tzdb().
 */
class TimeZone {
public:
    explicit TimeZone(const date::time_zone* zone);

    /// Пояс с постоянным смещением
    [[nodiscard]] static TimeZone fixed(std::string name, std::chrono::seconds offset);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Смещение от UTC для момента времени
    [[nodiscard]] std::chrono::seconds offsetAt(date::sys_seconds utc) const;

    /**
     * @brief Перевод локального времени в UTC
     *
     * Неоднозначное время (повтор часа) разрешается политикой policy.
     * Несуществующее время (пропуск часа) трактуется по стандартному смещению.
     */
    [[nodiscard]] date::sys_seconds toUtc(date::local_seconds local, AmbiguityPolicy policy) const;

    /// Есть ли летнее время в заданном году
    [[nodiscard]] bool observesDaylightSaving(date::year year) const;

private:
    TimeZone(std::string name, std::chrono::seconds offset);

    std::string name_;
    const date::time_zone* zone_ = nullptr;
    std::chrono::seconds fixed_offset_{0};
};

/**
 * @brief Поиск пояса по имени
 *
 * Принимает имена и ссылки базы IANA (America/Los_Angeles, US/Pacific, UTC, ...)
 * и краткие псевдонимы PT, MT, CT, ET, Pacific, Z (без учёта регистра).
 *
 * @throws TimeZoneError Если пояс неизвестен или база недоступна
 */
[[nodiscard]] TimeZone resolveTimeZone(std::string_view name);

/**
 * @brief Имена поясов базы IANA (без ссылок)
 * @throws TimeZoneError Если база недоступна
 */
[[nodiscard]] std::vector<std::string> knownTimeZoneNames();

} // namespace csvnorm::core
