/**
 * @file utf8.hpp
 * @brief Декодирование и кодирование UTF-8 по кодовым точкам
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace caesar::core {

/**
 * @brief Одна декодированная кодовая точка
 *
 * Для некорректной последовательности codepoint равен первому байту,
 * length == 1: такой байт считается отдельным символом.
 */
struct DecodedRune {
    char32_t codepoint = 0;
    std::size_t length = 1;
};

/**
 * @brief Декодировать кодовую точку, начинающуюся с offset
 */
[[nodiscard]] DecodedRune decodeUtf8(std::string_view input, std::size_t offset) noexcept;

/**
 * @brief Дописать кодовую точку в UTF-8
 */
void appendUtf8(char32_t cp, std::string& out);

/**
 * @brief Число символов (кодовых точек) в UTF-8 строке
 */
[[nodiscard]] std::size_t utf8Length(std::string_view input) noexcept;

/// Символ замены для некорректных байтов при переводе в UTF-32
inline constexpr char32_t kReplacementCharacter = 0xFFFD;

/**
 * @brief UTF-8 -> UTF-32
 *
 * Некорректный байт становится U+FFFD, поэтому для такого ввода
 * преобразование необратимо. Побайтно сохраняет ввод только shiftText.
 */
[[nodiscard]] std::u32string utf8ToUtf32(std::string_view input);
[[nodiscard]] std::string utf32ToUtf8(std::u32string_view input);

} // namespace caesar::core
