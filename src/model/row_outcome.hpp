/**
 * @file row_outcome.hpp
 * @brief Результат обработки поля и строки
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace csvnorm::model {

/**
 * @brief Причина отбрасывания строки
 */
enum class DropReason {
    WrongFieldCount,    ///< Количество полей не равно 8
    UnterminatedQuote,  ///< Незакрытая или некорректная кавычка
    BadTimestamp,       ///< Метка времени не разбирается
    BadDuration         ///< Длительность не разбирается
};

[[nodiscard]] inline std::string_view dropReasonToString(DropReason reason) noexcept {
    switch (reason) {
    case DropReason::WrongFieldCount: return "wrong_field_count";
    case DropReason::UnterminatedQuote: return "unterminated_quote";
    case DropReason::BadTimestamp: return "bad_timestamp";
    case DropReason::BadDuration: return "bad_duration";
    }
    return "unknown";
}

/**
 * @brief Результат нормализации одного поля
 *
 * Либо нормализованное значение, либо причина отказа.
 */
struct FieldResult {
    std::optional<std::string> value;
    DropReason reason = DropReason::BadTimestamp;
    std::string detail;

    [[nodiscard]] static FieldResult success(std::string normalized) {
        FieldResult result;
        result.value = std::move(normalized);
        return result;
    }

    [[nodiscard]] static FieldResult failure(DropReason why, std::string message) {
        FieldResult result;
        result.reason = why;
        result.detail = std::move(message);
        return result;
    }

    [[nodiscard]] bool ok() const noexcept { return value.has_value(); }
};

/**
 * @brief Результат обработки строки целиком
 */
struct RowOutcome {
    enum class Kind {
        Emitted,   ///< Строка нормализована, в line готовая строка CSV
        Header,    ///< Строка заголовка, в line перекодированный заголовок
        Dropped    ///< Строка отброшена
    };

    Kind kind = Kind::Dropped;
    std::string line;
    DropReason reason = DropReason::WrongFieldCount;
    std::string detail;

    [[nodiscard]] static RowOutcome emitted(std::string csv_line) {
        RowOutcome outcome;
        outcome.kind = Kind::Emitted;
        outcome.line = std::move(csv_line);
        return outcome;
    }

    [[nodiscard]] static RowOutcome header(std::string csv_line) {
        RowOutcome outcome;
        outcome.kind = Kind::Header;
        outcome.line = std::move(csv_line);
        return outcome;
    }

    [[nodiscard]] static RowOutcome dropped(DropReason why, std::string message) {
        RowOutcome outcome;
        outcome.kind = Kind::Dropped;
        outcome.reason = why;
        outcome.detail = std::move(message);
        return outcome;
    }

    [[nodiscard]] bool isDropped() const noexcept { return kind == Kind::Dropped; }
};

} // namespace csvnorm::model
