/**
 * @file row_sanitizer.hpp
 * @brief Проверка и сборка строки: токенизация, нормализация полей, сериализация
 */

#pragma once

#include "timestamp.hpp"
#include "model/record.hpp"
#include "model/row_outcome.hpp"
#include "model/settings.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csvnorm::core {

using csvnorm::model::Column;
using csvnorm::model::DropReason;
using csvnorm::model::NormalizedRecord;
using csvnorm::model::RawRecord;
using csvnorm::model::RowOutcome;
using csvnorm::model::SanitizerSettings;

/**
 * @brief Результат нормализации записи: запись целиком либо первая ошибка
 */
struct RecordResult {
    std::optional<NormalizedRecord> record;
    DropReason reason = DropReason::BadTimestamp;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return record.has_value(); }
};

/**
 * @brief Строка заголовка: ровно 8 полей, первое поле в точности "Timestamp"
 *
 * Регистр и пробелы значимы. Позицию строки в потоке проверяет вызывающий.
 */
[[nodiscard]] bool isHeaderRow(const std::vector<std::string>& fields);

/**
 * @brief Нормализатор строки
 *
 * Строка атомарна: если хотя бы одно поле не разбирается, строка
 * отбрасывается целиком. Объект не хранит состояния между строками.
 */
class RowSanitizer {
public:
    /**
     * @brief Создание по настройкам (пояса ищутся по имени)
     * @throws TimeZoneError Если пояс неизвестен
     */
    explicit RowSanitizer(const SanitizerSettings& settings);

    /**
     * @brief Создание с явно заданным нормализатором меток времени
     */
    RowSanitizer(const SanitizerSettings& settings, TimestampNormalizer timestamps);

    /**
     * @brief Обработка строки с уже восстановленной кодировкой
     *
     * @param repaired_line Строка без перевода строки
     * @param first_row Первая непустая строка потока: только она может быть заголовком
     */
    [[nodiscard]] RowOutcome process(std::string_view repaired_line, bool first_row = false) const;

    /**
     * @brief Обработка сырых байтов: восстановление UTF-8 и process()
     */
    [[nodiscard]] RowOutcome processBytes(std::string_view raw_line, bool first_row = false) const;

    /**
     * @brief Нормализация всех 8 полей с остановкой на первой ошибке
     */
    [[nodiscard]] RecordResult normalizeRecord(const RawRecord& raw) const;

    [[nodiscard]] const SanitizerSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] const TimestampNormalizer& timestamps() const noexcept { return timestamps_; }

private:
    [[nodiscard]] model::FieldResult normalizeField(Column column, std::string_view value) const;

    SanitizerSettings settings_;
    TimestampNormalizer timestamps_;
};

} // namespace csvnorm::core
