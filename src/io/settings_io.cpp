/**
 * @file settings_io.cpp
 * @brief Реализация чтения и записи настроек
 */

#include "settings_io.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace csvnorm::io {

using json = nlohmann::json;
using csvnorm::model::AmbiguityPolicy;
using csvnorm::model::HeaderPolicy;

namespace {

constexpr int kMaxDurationPrecision = 9;

std::string requireString(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw SettingsError(std::string("Ключ '") + key + "' должен быть строкой");
    }
    return value.get<std::string>();
}

bool requireBool(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_boolean()) {
        throw SettingsError(std::string("Ключ '") + key + "' должен быть true или false");
    }
    return value.get<bool>();
}

long long requireInteger(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw SettingsError(std::string("Ключ '") + key + "' должен быть целым числом");
    }
    return value.get<long long>();
}

char delimiterFromString(const std::string& text) {
    if (text.size() != 1) {
        throw SettingsError("Разделитель должен быть одним ASCII-символом: '" + text + "'");
    }
    const char c = text.front();
    if (c == '"' || c == '\n' || c == '\r' || static_cast<unsigned char>(c) >= 0x80) {
        throw SettingsError("Недопустимый разделитель: '" + text + "'");
    }
    return c;
}

SanitizerSettings settingsFromJsonInternal(const json& j) {
    if (!j.is_object()) {
        throw SettingsError("Неверный формат файла настроек: ожидался JSON-объект");
    }

    if (j.contains("schema")) {
        const auto schema = requireString(j, "schema");
        if (schema != SETTINGS_FORMAT_ID) {
            throw SettingsError("Неизвестный формат настроек: " + schema);
        }
    }

    SanitizerSettings s;

    if (j.contains("input_time_zone")) {
        s.input_time_zone = requireString(j, "input_time_zone");
        if (s.input_time_zone.empty()) {
            throw SettingsError("Ключ 'input_time_zone' не может быть пустым");
        }
    }
    if (j.contains("output_time_zone") && !j.at("output_time_zone").is_null()) {
        s.output_time_zone = requireString(j, "output_time_zone");
    }
    if (j.contains("ambiguous_time")) {
        s.ambiguity = parseAmbiguityPolicy(requireString(j, "ambiguous_time"));
    }
    if (j.contains("header")) {
        s.header = parseHeaderPolicy(requireString(j, "header"));
    }
    if (j.contains("pad_zip")) {
        s.pad_zip = requireBool(j, "pad_zip");
    }
    if (j.contains("recompute_total")) {
        s.recompute_total = requireBool(j, "recompute_total");
    }
    if (j.contains("duration_precision") && !j.at("duration_precision").is_null()) {
        const auto precision = requireInteger(j, "duration_precision");
        if (precision < 0 || precision > kMaxDurationPrecision) {
            throw SettingsError("Ключ 'duration_precision' должен быть в диапазоне 0.." +
                                std::to_string(kMaxDurationPrecision));
        }
        s.duration_precision = static_cast<int>(precision);
    }
    if (j.contains("delimiter")) {
        s.delimiter = delimiterFromString(requireString(j, "delimiter"));
    }
    if (j.contains("quiet")) {
        s.quiet = requireBool(j, "quiet");
    }
    if (j.contains("max_drop_samples")) {
        const auto samples = requireInteger(j, "max_drop_samples");
        if (samples < 0) {
            throw SettingsError("Ключ 'max_drop_samples' не может быть отрицательным");
        }
        s.max_drop_samples = static_cast<size_t>(samples);
    }

    return s;
}

} // anonymous namespace

AmbiguityPolicy parseAmbiguityPolicy(std::string_view text) {
    if (text == "standard") return AmbiguityPolicy::PreferStandard;
    if (text == "daylight") return AmbiguityPolicy::PreferDaylight;
    throw SettingsError("Неизвестная политика неоднозначного времени: " + std::string(text) +
                        " (ожидалось standard или daylight)");
}

HeaderPolicy parseHeaderPolicy(std::string_view text) {
    if (text == "pass") return HeaderPolicy::Pass;
    if (text == "drop") return HeaderPolicy::Drop;
    if (text == "none") return HeaderPolicy::None;
    throw SettingsError("Неизвестная политика заголовка: " + std::string(text) +
                        " (ожидалось pass, drop или none)");
}

const char* ambiguityPolicyToString(AmbiguityPolicy policy) noexcept {
    return policy == AmbiguityPolicy::PreferDaylight ? "daylight" : "standard";
}

const char* headerPolicyToString(HeaderPolicy policy) noexcept {
    switch (policy) {
        case HeaderPolicy::Pass: return "pass";
        case HeaderPolicy::Drop: return "drop";
        case HeaderPolicy::None: return "none";
    }
    return "pass";
}

SanitizerSettings loadSettings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw SettingsError("Не удалось открыть файл настроек: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw SettingsError("Ошибка парсинга JSON (" + path.string() + "): " + std::string(e.what()));
    }

    return settingsFromJsonInternal(j);
}

SanitizerSettings settingsFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw SettingsError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return settingsFromJsonInternal(j);
}

std::string settingsToJson(const SanitizerSettings& s, int indent) {
    json j;
    j["schema"] = SETTINGS_FORMAT_ID;
    j["input_time_zone"] = s.input_time_zone;
    j["output_time_zone"] = s.output_time_zone.has_value() ? json(*s.output_time_zone) : json(nullptr);
    j["ambiguous_time"] = ambiguityPolicyToString(s.ambiguity);
    j["header"] = headerPolicyToString(s.header);
    j["pad_zip"] = s.pad_zip;
    j["recompute_total"] = s.recompute_total;
    j["duration_precision"] = s.duration_precision.has_value() ? json(*s.duration_precision) : json(nullptr);
    j["delimiter"] = std::string(1, s.delimiter);
    j["quiet"] = s.quiet;
    j["max_drop_samples"] = s.max_drop_samples;
    return j.dump(indent);
}

} // namespace csvnorm::io
