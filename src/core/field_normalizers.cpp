/**
 * @file field_normalizers.cpp
 * @brief Нормализация текстовых полей
 */

#include "field_normalizers.hpp"
#include "io/text_utils.hpp"
#include <algorithm>

namespace csvnorm::core {

std::string normalizeName(std::string_view text) {
    return io::utf8ToUpper(text);
}

std::string normalizeText(std::string_view text) {
    return std::string(text);
}

std::string normalizeZip(std::string_view text, bool pad) {
    constexpr size_t kZipLength = 5;

    const bool all_digits = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });

    if (!pad || !all_digits || text.size() >= kZipLength) {
        return std::string(text);
    }
    return std::string(kZipLength - text.size(), '0') + std::string(text);
}

} // namespace csvnorm::core
