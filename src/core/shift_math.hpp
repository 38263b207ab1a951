/**
 * @file shift_math.hpp
 * @brief Арифметика сдвигов по модулю алфавита
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Евклидово деление по модулю и безопасное обращение сдвига
 * для любых значений ShiftAmount, включая минимальное.
 */

#pragma once

#include "model/cipher_config.hpp"
#include <cstdint>

namespace caesar::core {

using namespace caesar::model;

/**
 * @brief Евклидов остаток от деления
 *
 * В отличие от встроенного %, результат всегда в [0, modulus)
 * при положительном modulus.
 *
 * @param value Делимое (любое значение int64)
 * @param modulus Делитель, > 0
 */
[[nodiscard]] constexpr std::int64_t euclidMod(std::int64_t value, std::int64_t modulus) noexcept {
    std::int64_t r = value % modulus;
    return r < 0 ? r + modulus : r;
}

/**
 * @brief Нормализация сдвига к диапазону [0, 25]
 */
[[nodiscard]] ShiftAmount normalizeShift(ShiftAmount amount) noexcept;

/**
 * @brief Обратный сдвиг, нормализованный к [0, 25]
 *
 * Эквивалент normalizeShift(-amount), но без переполнения
 * при amount == INT32_MIN: отрицание выполняется над вычетом.
 */
[[nodiscard]] ShiftAmount inverseShift(ShiftAmount amount) noexcept;

/**
 * @brief Попадает ли сдвиг в диапазон [-25, 25]
 *
 * Сравнение без abs(), поэтому INT32_MIN классифицируется корректно.
 */
[[nodiscard]] constexpr bool isShiftInRange(ShiftAmount amount) noexcept {
    return amount >= cipher_limits::kMinShift && amount <= cipher_limits::kMaxShift;
}

} // namespace caesar::core
