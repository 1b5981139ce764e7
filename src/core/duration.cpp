/**
 * @file duration.cpp
 * @brief Разбор длительностей H:MM:SS в секунды
 */

#include "duration.hpp"
#include "io/text_utils.hpp"
#include <cstdint>

namespace csvnorm::core {

using csvnorm::model::DropReason;

namespace {

// 9 цифр в каждом компоненте: сумма в микросекундах помещается в int64
constexpr size_t kMaxComponentDigits = 9;
constexpr size_t kMaxFractionDigits = 6;
constexpr int64_t kMicrosPerSecond = 1'000'000;

std::optional<int64_t> parseDigits(std::string_view text, size_t min_len, size_t max_len) {
    if (text.size() < min_len || text.size() > max_len) {
        return std::nullopt;
    }
    int64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

int64_t powerOfTen(int exponent) noexcept {
    int64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

// Дробная часть ровно digits знаков, с ведущими нулями
std::string padFraction(int64_t value, int digits) {
    std::string text = std::to_string(value);
    if (static_cast<int>(text.size()) < digits) {
        text.insert(0, static_cast<size_t>(digits) - text.size(), '0');
    }
    return text;
}

} // namespace

std::optional<std::chrono::microseconds> parseDuration(std::string_view text) {
    const std::string_view trimmed = io::trimView(text);

    const size_t first = trimmed.find(':');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t second = trimmed.find(':', first + 1);
    if (second == std::string_view::npos || trimmed.find(':', second + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    const auto hours = parseDigits(trimmed.substr(0, first), 1, kMaxComponentDigits);
    const auto minutes = parseDigits(trimmed.substr(first + 1, second - first - 1), 1, kMaxComponentDigits);
    if (!hours || !minutes) {
        return std::nullopt;
    }

    std::string_view seconds_part = trimmed.substr(second + 1);
    std::string_view fraction_part;
    const size_t dot = seconds_part.find('.');
    if (dot != std::string_view::npos) {
        fraction_part = seconds_part.substr(dot + 1);
        seconds_part = seconds_part.substr(0, dot);
        if (fraction_part.empty()) {
            return std::nullopt;
        }
    }

    const auto seconds = parseDigits(seconds_part, 1, kMaxComponentDigits);
    if (!seconds) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (!fraction_part.empty()) {
        const auto fraction = parseDigits(fraction_part, 1, kMaxFractionDigits);
        if (!fraction) {
            return std::nullopt;
        }
        micros = *fraction * powerOfTen(static_cast<int>(kMaxFractionDigits - fraction_part.size()));
    }

    const int64_t whole = *hours * 3600 + *minutes * 60 + *seconds;
    return std::chrono::microseconds{whole * kMicrosPerSecond + micros};
}

std::string formatSeconds(std::chrono::microseconds duration, std::optional<int> precision) {
    int64_t whole = duration.count() / kMicrosPerSecond;
    int64_t micros = duration.count() % kMicrosPerSecond;

    if (!precision.has_value()) {
        std::string result = std::to_string(whole);
        if (micros == 0) {
            return result;
        }
        std::string fraction = padFraction(micros, static_cast<int>(kMaxFractionDigits));
        while (fraction.back() == '0') {
            fraction.pop_back();
        }
        return result + "." + fraction;
    }

    const int digits = *precision;
    std::string fraction;
    if (digits < static_cast<int>(kMaxFractionDigits)) {
        const int64_t scale = powerOfTen(static_cast<int>(kMaxFractionDigits) - digits);
        int64_t rounded = (micros + scale / 2) / scale;
        if (rounded == powerOfTen(digits)) {
            ++whole;
            rounded = 0;
        }
        if (digits > 0) {
            fraction = padFraction(rounded, digits);
        }
    } else {
        fraction = padFraction(micros, static_cast<int>(kMaxFractionDigits));
        fraction.append(static_cast<size_t>(digits) - kMaxFractionDigits, '0');
    }

    std::string result = std::to_string(whole);
    if (!fraction.empty()) {
        result += "." + fraction;
    }
    return result;
}

FieldResult normalizeDuration(std::string_view text, std::optional<int> precision) {
    const auto duration = parseDuration(text);
    if (!duration) {
        return FieldResult::failure(
            DropReason::BadDuration,
            "длительность не соответствует формату H:MM:SS: \"" + std::string(text) + "\""
        );
    }
    return FieldResult::success(formatSeconds(*duration, precision));
}

} // namespace csvnorm::core
