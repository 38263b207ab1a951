/**
 * @file file_utils.hpp
 * @brief Чтение и запись текстовых файлов
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace caesar::io {

/**
 * @brief Прочитать файл целиком с ограничением размера
 *
 * @throws std::runtime_error если файл не читается или больше max_size байт;
 *         сообщение содержит путь к файлу
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path, std::size_t max_size);

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace caesar::io
