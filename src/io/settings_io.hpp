/**
 * @file settings_io.hpp
 * @brief Чтение и запись настроек нормализатора (JSON)
 */

#pragma once

#include "model/settings.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace csvnorm::io {

using csvnorm::model::SanitizerSettings;

/// Идентификатор формата файла настроек
constexpr const char* SETTINGS_FORMAT_ID = "csvnorm-settings";

/**
 * @brief Ошибка чтения или проверки настроек
 */
class SettingsError : public std::runtime_error {
public:
    explicit SettingsError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка настроек из файла
 *
 * Отсутствующие ключи получают значения по умолчанию, неизвестные ключи
 * игнорируются.
 *
 * @param path Путь к JSON-файлу
 * @return Настройки
 * @throws SettingsError При ошибке чтения, парсинга или неверном значении
 */
[[nodiscard]] SanitizerSettings loadSettings(const std::filesystem::path& path);

/**
 * @brief Разбор настроек из JSON-строки
 * @throws SettingsError При ошибке парсинга или неверном значении
 */
[[nodiscard]] SanitizerSettings settingsFromJson(const std::string& json);

/**
 * @brief Сериализация настроек в JSON (с отступами)
 */
[[nodiscard]] std::string settingsToJson(const SanitizerSettings& settings, int indent = 2);

/**
 * @brief Разбор значения политики неоднозначного времени ("standard" / "daylight")
 * @throws SettingsError Для другого значения
 */
[[nodiscard]] model::AmbiguityPolicy parseAmbiguityPolicy(std::string_view text);

/**
 * @brief Разбор политики заголовка ("pass" / "drop" / "none")
 * @throws SettingsError Для другого значения
 */
[[nodiscard]] model::HeaderPolicy parseHeaderPolicy(std::string_view text);

[[nodiscard]] const char* ambiguityPolicyToString(model::AmbiguityPolicy policy) noexcept;
[[nodiscard]] const char* headerPolicyToString(model::HeaderPolicy policy) noexcept;

} // namespace csvnorm::io
