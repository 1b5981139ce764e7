/**
 * @file settings.hpp
 * @brief Настройки нормализации
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace csvnorm::model {

/// Часовой пояс по умолчанию для меток времени без явного пояса
constexpr const char* kDefaultTimeZone = "America/Los_Angeles";

/**
 * @brief Разрешение неоднозначного локального времени (повтор часа при переходе на зимнее время)
 */
enum class AmbiguityPolicy {
    PreferStandard,   ///< Стандартное (зимнее) время
    PreferDaylight    ///< Летнее время
};

/**
 * @brief Обработка строки заголовка (первое поле "Timestamp")
 */
enum class HeaderPolicy {
    Pass,   ///< Вывести заголовок без нормализации
    Drop,   ///< Пропустить заголовок
    None    ///< Не распознавать заголовок, обрабатывать как данные
};

/**
 * @brief Полный набор настроек нормализатора
 */
struct SanitizerSettings {
    std::string input_time_zone = kDefaultTimeZone;    ///< Пояс входных меток времени
    std::optional<std::string> output_time_zone;       ///< Пояс вывода (по умолчанию = входной)
    AmbiguityPolicy ambiguity = AmbiguityPolicy::PreferStandard;
    HeaderPolicy header = HeaderPolicy::Pass;
    bool pad_zip = false;                    ///< Дополнять цифровой ZIP нулями до 5 знаков
    bool recompute_total = false;            ///< TotalDuration = FooDuration + BarDuration
    std::optional<int> duration_precision;   ///< Фиксированное число знаков после точки
    char delimiter = ',';                    ///< Разделитель полей
    bool quiet = false;                      ///< Не писать диагностику в stderr
    size_t max_drop_samples = 100;           ///< Сколько отброшенных строк хранить для отчёта

    [[nodiscard]] const std::string& effectiveOutputZone() const noexcept {
        return output_time_zone.has_value() ? *output_time_zone : input_time_zone;
    }
};

} // namespace csvnorm::model
