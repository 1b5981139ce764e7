/**
 * @file csv_reader.cpp
 * @brief Разбор строки CSV на поля
 */

#include "csv_reader.hpp"

namespace csvnorm::io {

TokenizeResult tokenizeRecord(std::string_view line, char delimiter) {
    TokenizeResult result;
    std::string current;
    current.reserve(line.size());

    size_t i = 0;
    while (true) {
        current.clear();

        if (i < line.size() && line[i] == '"') {
            // Поле в кавычках
            size_t quote_start = i;
            ++i;
            bool closed = false;
            while (i < line.size()) {
                char c = line[i];
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        current += '"';
                        i += 2;
                        continue;
                    }
                    closed = true;
                    ++i;
                    break;
                }
                current += c;
                ++i;
            }

            if (!closed) {
                result.error = TokenizeError::UnterminatedQuote;
                result.error_offset = quote_start;
                result.fields.clear();
                return result;
            }

            if (i < line.size() && line[i] != delimiter) {
                result.error = TokenizeError::MalformedQuote;
                result.error_offset = i;
                result.fields.clear();
                return result;
            }
        } else {
            while (i < line.size() && line[i] != delimiter) {
                current += line[i];
                ++i;
            }
        }

        result.fields.push_back(current);

        if (i >= line.size()) {
            break;
        }
        ++i; // разделитель
    }

    return result;
}

std::string_view tokenizeErrorToString(TokenizeError error) noexcept {
    switch (error) {
        case TokenizeError::None: return "нет ошибки";
        case TokenizeError::UnterminatedQuote: return "незакрытая кавычка";
        case TokenizeError::MalformedQuote: return "символ после закрывающей кавычки";
    }
    return "???";
}

} // namespace csvnorm::io
