/**
 * @file text_utils.hpp
 * @brief Утилиты для обработки строк пользовательского ввода
 */

#pragma once

#include <string>
#include <string_view>

namespace caesar::io {

/**
 * @brief Обрезать пробельные символы ASCII (включая \r, \n) с обеих сторон
 */
[[nodiscard]] std::string_view trimWhitespace(std::string_view input) noexcept;

/**
 * @brief Перевод строки в нижний регистр (только ASCII, остальное без изменений)
 */
[[nodiscard]] std::string asciiToLower(std::string_view input);

} // namespace caesar::io
