/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace csvnorm::io {

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Прочитать файл целиком
 * @throws std::runtime_error Если файл не открывается
 */
[[nodiscard]] std::string readWholeFile(const std::filesystem::path& path);

} // namespace csvnorm::io
