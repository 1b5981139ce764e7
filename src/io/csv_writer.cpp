/**
 * @file csv_writer.cpp
 * @brief Сериализация полей в строку CSV
 */

#include "csv_writer.hpp"

namespace csvnorm::io {

namespace {

bool needsQuoting(std::string_view field, char delimiter) noexcept {
    for (char c : field) {
        if (c == delimiter || c == '"' || c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

std::string encodeField(std::string_view field, char delimiter) {
    if (!needsQuoting(field, delimiter)) {
        return std::string(field);
    }

    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string joinRecord(const std::vector<std::string>& fields, char delimiter) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += delimiter;
        line += encodeField(fields[i], delimiter);
    }
    return line;
}

} // namespace csvnorm::io
