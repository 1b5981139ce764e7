/**
 * @file timestamp.cpp
 * @brief Нормализация метки времени в ISO 8601 с явным смещением
 */

#include "timestamp.hpp"
#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace csvnorm::core {

using csvnorm::model::DropReason;

namespace {

bool isBlank(char c) noexcept {
    return c == ' ' || c == '\t';
}

std::vector<std::string_view> splitTokens(std::string_view text) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isBlank(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !isBlank(text[i])) ++i;
        if (i > start) {
            tokens.push_back(text.substr(start, i - start));
        }
    }
    return tokens;
}

std::vector<std::string_view> splitOn(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Только ASCII-цифры, длина в [min_len; max_len]
std::optional<int> parseDigits(std::string_view text, size_t min_len, size_t max_len) {
    if (text.size() < min_len || text.size() > max_len) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Смещения в часах
const std::array<std::pair<std::string_view, int>, 14> kZoneAbbreviations = {{
    {"UTC", 0}, {"GMT", 0}, {"Z", 0},
    {"PST", -8}, {"PDT", -7},
    {"MST", -7}, {"MDT", -6},
    {"CST", -6}, {"CDT", -5},
    {"EST", -5}, {"EDT", -4},
    {"AKST", -9}, {"AKDT", -8},
    {"HST", -10},
}};

} // namespace

std::optional<std::chrono::seconds> parseZoneToken(std::string_view token) {
    for (const auto& [abbr, hours] : kZoneAbbreviations) {
        if (equalsIgnoreCase(abbr, token)) {
            return std::chrono::hours{hours};
        }
    }

    if (token.size() < 2 || (token[0] != '+' && token[0] != '-')) {
        return std::nullopt;
    }
    const int sign = (token[0] == '-') ? -1 : 1;
    std::string_view rest = token.substr(1);

    std::optional<int> hours;
    std::optional<int> minutes = 0;
    if (rest.size() == 5 && rest[2] == ':') {
        hours = parseDigits(rest.substr(0, 2), 2, 2);
        minutes = parseDigits(rest.substr(3), 2, 2);
    } else if (rest.size() == 4) {
        hours = parseDigits(rest.substr(0, 2), 2, 2);
        minutes = parseDigits(rest.substr(2), 2, 2);
    } else {
        hours = parseDigits(rest, 1, 2);
    }

    if (!hours || !minutes || *hours > 23 || *minutes > 59) {
        return std::nullopt;
    }
    return std::chrono::seconds{sign * (*hours * 3600 + *minutes * 60)};
}

std::optional<ParsedTimestamp> parseTimestamp(std::string_view text) {
    const auto tokens = splitTokens(text);
    if (tokens.size() != 3 && tokens.size() != 4) {
        return std::nullopt;
    }

    // Дата M/D/YY
    const auto date = splitOn(tokens[0], '/');
    if (date.size() != 3) {
        return std::nullopt;
    }
    const auto month = parseDigits(date[0], 1, 2);
    const auto day = parseDigits(date[1], 1, 2);
    const auto year2 = parseDigits(date[2], 2, 2);
    if (!month || !day || !year2) {
        return std::nullopt;
    }
    const int year = (*year2 < 69) ? 2000 + *year2 : 1900 + *year2;
    const date::year_month_day ymd{
        date::year{year},
        date::month{static_cast<unsigned>(*month)},
        date::day{static_cast<unsigned>(*day)}
    };
    if (!ymd.ok()) {
        return std::nullopt;
    }

    // Время H:MM:SS (12-часовой формат)
    const auto time = splitOn(tokens[1], ':');
    if (time.size() != 3) {
        return std::nullopt;
    }
    const auto hour12 = parseDigits(time[0], 1, 2);
    const auto minute = parseDigits(time[1], 1, 2);
    const auto second = parseDigits(time[2], 1, 2);
    if (!hour12 || !minute || !second) {
        return std::nullopt;
    }
    if (*hour12 < 1 || *hour12 > 12 || *minute > 59 || *second > 59) {
        return std::nullopt;
    }

    int hour = 0;
    if (equalsIgnoreCase(tokens[2], "AM")) {
        hour = (*hour12 == 12) ? 0 : *hour12;
    } else if (equalsIgnoreCase(tokens[2], "PM")) {
        hour = (*hour12 == 12) ? 12 : *hour12 + 12;
    } else {
        return std::nullopt;
    }

    ParsedTimestamp parsed;
    parsed.local = date::local_days{ymd} + std::chrono::hours{hour} +
                   std::chrono::minutes{*minute} + std::chrono::seconds{*second};

    if (tokens.size() == 4) {
        parsed.explicit_offset = parseZoneToken(tokens[3]);
        if (!parsed.explicit_offset) {
            return std::nullopt;
        }
    }

    return parsed;
}

std::string formatIso8601(date::local_seconds local, std::chrono::seconds offset) {
    return date::format("%Y-%m-%dT%H:%M:%S", local) + formatUtcOffset(offset);
}

TimestampNormalizer::TimestampNormalizer(
    TimeZone input_zone,
    std::optional<TimeZone> output_zone,
    AmbiguityPolicy policy
)
    : input_zone_(input_zone)
    , output_zone_(output_zone.has_value() ? std::move(*output_zone) : std::move(input_zone))
    , policy_(policy) {}

std::optional<date::sys_seconds> TimestampNormalizer::toUtc(std::string_view text) const {
    const auto parsed = parseTimestamp(text);
    if (!parsed) {
        return std::nullopt;
    }
    if (parsed->explicit_offset.has_value()) {
        return date::sys_seconds{parsed->local.time_since_epoch() - *parsed->explicit_offset};
    }
    return input_zone_.toUtc(parsed->local, policy_);
}

FieldResult TimestampNormalizer::normalize(std::string_view text) const {
    const auto utc = toUtc(text);
    if (!utc) {
        return FieldResult::failure(
            DropReason::BadTimestamp,
            "метка времени не соответствует формату M/D/YY H:MM:SS AM|PM: \"" + std::string(text) + "\""
        );
    }

    const auto offset = output_zone_.offsetAt(*utc);
    const date::local_seconds local{utc->time_since_epoch() + offset};
    return FieldResult::success(formatIso8601(local, offset));
}

} // namespace csvnorm::core
