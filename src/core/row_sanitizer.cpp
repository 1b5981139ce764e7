/**
 * @file row_sanitizer.cpp
 * @brief Проверка и сборка строки
 */

#include "row_sanitizer.hpp"
#include "duration.hpp"
#include "field_normalizers.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/text_utils.hpp"
#include <utility>

namespace csvnorm::core {

using csvnorm::model::FieldResult;
using csvnorm::model::kColumnCount;

namespace {

TimestampNormalizer makeTimestampNormalizer(const SanitizerSettings& settings) {
    std::optional<TimeZone> output_zone;
    if (settings.output_time_zone.has_value()) {
        output_zone = resolveTimeZone(*settings.output_time_zone);
    }
    return TimestampNormalizer(resolveTimeZone(settings.input_time_zone), output_zone, settings.ambiguity);
}

} // namespace

bool isHeaderRow(const std::vector<std::string>& fields) {
    return fields.size() == kColumnCount && fields.front() == model::columnName(Column::Timestamp);
}

RowSanitizer::RowSanitizer(const SanitizerSettings& settings)
    : settings_(settings)
    , timestamps_(makeTimestampNormalizer(settings)) {}

RowSanitizer::RowSanitizer(const SanitizerSettings& settings, TimestampNormalizer timestamps)
    : settings_(settings)
    , timestamps_(std::move(timestamps)) {}

FieldResult RowSanitizer::normalizeField(Column column, std::string_view value) const {
    switch (column) {
        case Column::Timestamp:
            return timestamps_.normalize(value);
        case Column::FullName:
            return FieldResult::success(normalizeName(value));
        case Column::Zip:
            return FieldResult::success(normalizeZip(value, settings_.pad_zip));
        case Column::FooDuration:
        case Column::BarDuration:
        case Column::TotalDuration:
            return normalizeDuration(value, settings_.duration_precision);
        case Column::Address:
        case Column::Notes:
            return FieldResult::success(normalizeText(value));
    }
    return FieldResult::success(normalizeText(value));
}

RecordResult RowSanitizer::normalizeRecord(const RawRecord& raw) const {
    RecordResult result;
    NormalizedRecord normalized;

    for (size_t i = 0; i < kColumnCount; ++i) {
        const auto column = static_cast<Column>(i);
        FieldResult field = normalizeField(column, raw[column]);
        if (!field.ok()) {
            result.reason = field.reason;
            result.detail = std::string(model::columnName(column)) + ": " + field.detail;
            return result;
        }
        normalized[column] = std::move(*field.value);
    }

    if (settings_.recompute_total) {
        // Оба значения уже проверены выше
        const auto foo = *parseDuration(raw[Column::FooDuration]);
        const auto bar = *parseDuration(raw[Column::BarDuration]);
        normalized[Column::TotalDuration] = formatSeconds(foo + bar, settings_.duration_precision);
    }

    result.record = std::move(normalized);
    return result;
}

RowOutcome RowSanitizer::process(std::string_view repaired_line, bool first_row) const {
    auto tokens = io::tokenizeRecord(repaired_line, settings_.delimiter);
    if (!tokens.ok()) {
        return RowOutcome::dropped(
            DropReason::UnterminatedQuote,
            std::string(io::tokenizeErrorToString(tokens.error)) +
                " (позиция " + std::to_string(tokens.error_offset) + ")"
        );
    }

    if (first_row && settings_.header != model::HeaderPolicy::None && isHeaderRow(tokens.fields)) {
        return RowOutcome::header(io::joinRecord(tokens.fields, settings_.delimiter));
    }

    if (tokens.fields.size() != kColumnCount) {
        return RowOutcome::dropped(
            DropReason::WrongFieldCount,
            "ожидалось " + std::to_string(kColumnCount) + " полей, получено " +
                std::to_string(tokens.fields.size())
        );
    }

    RawRecord raw;
    for (size_t i = 0; i < kColumnCount; ++i) {
        raw.fields[i] = std::move(tokens.fields[i]);
    }

    auto result = normalizeRecord(raw);
    if (!result.ok()) {
        return RowOutcome::dropped(result.reason, result.detail);
    }

    const auto& record = *result.record;
    std::vector<std::string> out(record.fields.begin(), record.fields.end());
    return RowOutcome::emitted(io::joinRecord(out, settings_.delimiter));
}

RowOutcome RowSanitizer::processBytes(std::string_view raw_line, bool first_row) const {
    return process(io::repairUtf8(raw_line), first_row);
}

} // namespace csvnorm::core
