/**
 * @file record.hpp
 * @brief Запись CSV фиксированной структуры (8 колонок)
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace csvnorm::model {

/// Количество колонок во входной и выходной записи
constexpr size_t kColumnCount = 8;

/**
 * @brief Колонки записи в фиксированном порядке
 */
enum class Column : size_t {
    Timestamp = 0,   ///< Метка времени M/D/YY H:MM:SS AM|PM
    Address,         ///< Адрес (без изменений)
    Zip,             ///< Почтовый индекс (без изменений)
    FullName,        ///< Полное имя (в верхний регистр)
    FooDuration,     ///< Длительность H:MM:SS
    BarDuration,     ///< Длительность H:MM:SS
    TotalDuration,   ///< Суммарная длительность H:MM:SS
    Notes            ///< Примечания (без изменений)
};

/**
 * @brief Имя колонки для диагностики и заголовка
 */
[[nodiscard]] constexpr std::string_view columnName(Column column) noexcept {
    switch (column) {
        case Column::Timestamp: return "Timestamp";
        case Column::Address: return "Address";
        case Column::Zip: return "ZIP";
        case Column::FullName: return "FullName";
        case Column::FooDuration: return "FooDuration";
        case Column::BarDuration: return "BarDuration";
        case Column::TotalDuration: return "TotalDuration";
        case Column::Notes: return "Notes";
    }
    return "???";
}

/**
 * @brief Поля записи, индексируемые колонкой
 *
 * Используется и для исходных (после восстановления UTF-8),
 * и для нормализованных значений.
 */
struct FieldSet {
    std::array<std::string, kColumnCount> fields;

    [[nodiscard]] std::string& operator[](Column column) noexcept {
        return fields[static_cast<size_t>(column)];
    }

    [[nodiscard]] const std::string& operator[](Column column) const noexcept {
        return fields[static_cast<size_t>(column)];
    }
};

/// Запись после токенизации, до нормализации
struct RawRecord : FieldSet {};

/// Запись, все поля которой приведены к каноническому виду
struct NormalizedRecord : FieldSet {};

} // namespace csvnorm::model
