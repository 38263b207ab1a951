/**
 * @file cipher_config.hpp
 * @brief Константы шифра Цезаря и параметры по умолчанию
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Все настраиваемые значения собраны здесь, модули не хранят
 * собственных «магических» чисел.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace caesar::model {

/**
 * @brief Величина сдвига (знаковое целое, допустимо любое значение)
 *
 * Логическая область значений: вычеты по модулю 26.
 */
using ShiftAmount = std::int32_t;

namespace cipher_limits {
    constexpr ShiftAmount kAlphabetSize = 26;          ///< Размер латинского алфавита
    constexpr ShiftAmount kMaxShift = 25;              ///< Макс. сдвиг для проверяемых функций
    constexpr ShiftAmount kMinShift = -kMaxShift;      ///< Мин. сдвиг для проверяемых функций
    constexpr char32_t kUppercaseBase = U'A';          ///< Начало алфавита заглавных
    constexpr char32_t kLowercaseBase = U'a';          ///< Начало алфавита строчных
    constexpr ShiftAmount kMaxBruteForceShift = 25;    ///< Последний сдвиг перебора
    constexpr ShiftAmount kDefaultShift = 3;           ///< Сдвиг по умолчанию в CLI
    constexpr std::size_t kMaxInputSize = 10 * 1024 * 1024; ///< Лимит входного текста (байт)
}

} // namespace caesar::model
