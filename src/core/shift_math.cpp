/**
 * @file shift_math.cpp
 * @brief Реализация арифметики сдвигов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "shift_math.hpp"

namespace caesar::core {

ShiftAmount normalizeShift(ShiftAmount amount) noexcept {
    return static_cast<ShiftAmount>(euclidMod(amount, cipher_limits::kAlphabetSize));
}

ShiftAmount inverseShift(ShiftAmount amount) noexcept {
    ShiftAmount n = normalizeShift(amount);
    // 0 переходит в 0, иначе дополнение до размера алфавита
    return n == 0 ? 0 : cipher_limits::kAlphabetSize - n;
}

} // namespace caesar::core
