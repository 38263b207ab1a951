/**
 * @file validator.cpp
 * @brief Реализация проверяемых вариантов шифрования
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "validator.hpp"
#include "shift_math.hpp"
#include "transform.hpp"
#include <string>

namespace caesar::core {

std::optional<CipherError> validateCipherInput(std::string_view text, ShiftAmount shift) {
    if (text.empty()) {
        return CipherError::emptyInput();
    }

    if (!isShiftInRange(shift)) {
        return CipherError::invalidShift(
            "Shift value " + std::to_string(shift) + " is out of range (" +
            std::to_string(cipher_limits::kMinShift) + " to " +
            std::to_string(cipher_limits::kMaxShift) + ")");
    }

    return std::nullopt;
}

CipherResult encryptChecked(std::string_view text, ShiftAmount shift) {
    if (auto error = validateCipherInput(text, shift)) {
        return *error;
    }
    return encrypt(text, shift);
}

CipherResult decryptChecked(std::string_view text, ShiftAmount shift) {
    if (auto error = validateCipherInput(text, shift)) {
        return *error;
    }
    return decrypt(text, shift);
}

} // namespace caesar::core
