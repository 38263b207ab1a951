/**
 * @file transform.hpp
 * @brief Преобразование шифра Цезаря
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Каждая латинская буква сдвигается циклически внутри своего регистра,
 * все остальные символы (цифры, пунктуация, нелатинские алфавиты)
 * копируются без изменений. Операции тотальны: любой текст и любой
 * сдвиг допустимы, сдвиг нормализуется по модулю 26.
 */

#pragma once

#include "model/cipher_config.hpp"
#include <string>
#include <string_view>

namespace caesar::core {

using namespace caesar::model;

/**
 * @brief Сдвиг одной кодовой точки
 *
 * @param cp Исходный символ
 * @param normalized_shift Сдвиг, уже приведённый к [0, 25]
 * @return Сдвинутая буква или cp без изменений для небукв
 */
[[nodiscard]] char32_t shiftCodepoint(char32_t cp, ShiftAmount normalized_shift) noexcept;

/**
 * @brief Сдвиг последовательности кодовых точек
 *
 * Результат имеет ту же длину, вход не изменяется.
 */
[[nodiscard]] std::u32string shiftText(std::u32string_view text, ShiftAmount amount);

/**
 * @brief Сдвиг UTF-8 текста
 *
 * Текст разбирается по кодовым точкам; многобайтовые символы
 * и некорректные байты копируются побайтно без изменений.
 */
[[nodiscard]] std::string shiftText(std::string_view text, ShiftAmount amount);

/**
 * @brief Шифрование (сдвиг вперёд)
 *
 * @code
 * encrypt("Hello", 3) == "Khoor"
 * @endcode
 */
[[nodiscard]] std::string encrypt(std::string_view text, ShiftAmount shift);

/**
 * @brief Дешифрование: шифрование с обратным сдвигом
 *
 * Обращение выполняется над нормализованным сдвигом, поэтому
 * минимальное значение ShiftAmount не переполняется.
 */
[[nodiscard]] std::string decrypt(std::string_view text, ShiftAmount shift);

[[nodiscard]] std::u32string encrypt(std::u32string_view text, ShiftAmount shift);
[[nodiscard]] std::u32string decrypt(std::u32string_view text, ShiftAmount shift);

} // namespace caesar::core
