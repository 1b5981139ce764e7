/**
 * @file text_utils.cpp
 * @brief Восстановление и нормализация UTF-8 строк
 */

#include "text_utils.hpp"

namespace csvnorm::io {

namespace {

void appendUtf8(char32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct DecodedRune {
    char32_t codepoint = 0xFFFD;
    size_t length = 1;
    bool valid = false;
};

/**
 * Декодирование одной кодовой точки начиная с offset.
 *
 * Для некорректной последовательности length равно длине максимального
 * допустимого префикса (минимум 1 байт), valid == false.
 */
DecodedRune decodeUtf8(std::string_view input, size_t offset) {
    DecodedRune rune{};
    if (offset >= input.size()) {
        return rune;
    }

    unsigned char c0 = static_cast<unsigned char>(input[offset]);
    if (c0 < 0x80) {
        rune.codepoint = c0;
        rune.valid = true;
        return rune;
    }

    size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    char32_t cp = 0;

    if (c0 >= 0xC2 && c0 <= 0xDF) {
        need = 1;
        cp = c0 & 0x1F;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        need = 2;
        cp = c0 & 0x0F;
        if (c0 == 0xE0) lo = 0xA0;        // overlong
        else if (c0 == 0xED) hi = 0x9F;   // суррогаты
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        need = 3;
        cp = c0 & 0x07;
        if (c0 == 0xF0) lo = 0x90;        // overlong
        else if (c0 == 0xF4) hi = 0x8F;   // > U+10FFFF
    } else {
        // Одиночный байт продолжения, C0/C1 или F5..FF
        return rune;
    }

    for (size_t k = 0; k < need; ++k) {
        size_t pos = offset + 1 + k;
        if (pos >= input.size()) {
            rune.length = 1 + k;
            return rune;
        }
        unsigned char c = static_cast<unsigned char>(input[pos]);
        unsigned char min = (k == 0) ? lo : 0x80;
        unsigned char max = (k == 0) ? hi : 0xBF;
        if (c < min || c > max) {
            rune.length = 1 + k;
            return rune;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    rune.codepoint = cp;
    rune.length = need + 1;
    rune.valid = true;
    return rune;
}

char32_t toLowerCp(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 32;
    }
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) { // À-Þ, кроме ×
        return cp + 0x20;
    }
    if (cp == 0x178) { // Ÿ
        return 0xFF;
    }
    if (cp == 0x130) { // İ
        return U'i';
    }
    if ((cp >= 0x100 && cp <= 0x137 && cp % 2 == 0) ||
        (cp >= 0x139 && cp <= 0x148 && cp % 2 == 1) ||
        (cp >= 0x14A && cp <= 0x177 && cp % 2 == 0) ||
        (cp >= 0x179 && cp <= 0x17D && cp % 2 == 1)) {
        return cp + 1;
    }
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) { // Α-Ω
        return cp + 0x20;
    }
    if (cp == 0x386) return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A) return cp + 0x25;
    if (cp == 0x38C) return 0x3CC;
    if (cp == 0x38E || cp == 0x38F) return cp + 0x3F;
    if (cp >= 0x410 && cp <= 0x42F) { // А-Я
        return cp + 0x20;
    }
    if (cp >= 0x400 && cp <= 0x40F) { // Ѐ-Џ, включая Ё
        return cp + 0x50;
    }
    return cp;
}

char32_t toUpperCp(char32_t cp) {
    if (cp >= U'a' && cp <= U'z') {
        return cp - 32;
    }
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) { // à-þ, кроме ÷
        return cp - 0x20;
    }
    if (cp == 0xFF) { // ÿ
        return 0x178;
    }
    if (cp == 0xB5) { // µ
        return 0x39C;
    }
    if (cp == 0x131) { // ı
        return U'I';
    }
    if (cp == 0x17F) { // ſ
        return U'S';
    }
    if ((cp >= 0x100 && cp <= 0x137 && cp % 2 == 1) ||
        (cp >= 0x139 && cp <= 0x148 && cp % 2 == 0) ||
        (cp >= 0x14A && cp <= 0x177 && cp % 2 == 1) ||
        (cp >= 0x17A && cp <= 0x17E && cp % 2 == 0)) {
        return cp - 1;
    }
    if (cp == 0x3C2) { // ς
        return 0x3A3;
    }
    if (cp >= 0x3B1 && cp <= 0x3C9) { // α-ω
        return cp - 0x20;
    }
    if (cp == 0x3AC) return 0x386;
    if (cp >= 0x3AD && cp <= 0x3AF) return cp - 0x25;
    if (cp == 0x3CC) return 0x38C;
    if (cp == 0x3CD || cp == 0x3CE) return cp - 0x3F;
    if (cp >= 0x430 && cp <= 0x44F) { // а-я
        return cp - 0x20;
    }
    if (cp >= 0x450 && cp <= 0x45F) { // ѐ-џ, включая ё
        return cp - 0x50;
    }
    return cp;
}

template <typename Converter>
std::string convertCase(std::string_view input, Converter fn) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size();) {
        auto rune = decodeUtf8(input, i);
        fn(rune.codepoint, out);
        i += rune.length;
    }

    return out;
}

} // namespace

std::string repairUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size();) {
        auto rune = decodeUtf8(input, i);
        if (rune.valid) {
            out.append(input.substr(i, rune.length));
        } else {
            out.append(kReplacementCharacter);
        }
        i += rune.length;
    }

    return out;
}

bool isValidUtf8(std::string_view input) noexcept {
    for (size_t i = 0; i < input.size();) {
        auto rune = decodeUtf8(input, i);
        if (!rune.valid) {
            return false;
        }
        i += rune.length;
    }
    return true;
}

size_t countReplacements(std::string_view input) noexcept {
    size_t count = 0;
    for (size_t pos = input.find(kReplacementCharacter); pos != std::string_view::npos;
         pos = input.find(kReplacementCharacter, pos + kReplacementCharacter.size())) {
        ++count;
    }
    return count;
}

std::string utf8ToLower(std::string_view input) {
    return convertCase(input, [](char32_t cp, std::string& out) {
        appendUtf8(toLowerCp(cp), out);
    });
}

std::string utf8ToUpper(std::string_view input) {
    return convertCase(input, [](char32_t cp, std::string& out) {
        if (cp == 0xDF) { // ß → SS
            out += "SS";
            return;
        }
        appendUtf8(toUpperCp(cp), out);
    });
}

std::string_view trimView(std::string_view str) noexcept {
    size_t start = 0;
    while (start < str.size() && (str[start] == ' ' || str[start] == '\t')) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && (str[end - 1] == ' ' || str[end - 1] == '\t')) {
        --end;
    }
    return str.substr(start, end - start);
}

std::string_view stripBom(std::string_view str) noexcept {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return str.substr(3);
    }
    return str;
}

} // namespace csvnorm::io
