/**
 * @file transform.cpp
 * @brief Реализация преобразования шифра Цезаря
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "transform.hpp"
#include "shift_math.hpp"
#include "utf8.hpp"

namespace caesar::core {

char32_t shiftCodepoint(char32_t cp, ShiftAmount normalized_shift) noexcept {
    char32_t base;
    if (cp >= U'A' && cp <= U'Z') {
        base = cipher_limits::kUppercaseBase;
    } else if (cp >= U'a' && cp <= U'z') {
        base = cipher_limits::kLowercaseBase;
    } else {
        return cp;
    }

    auto offset = static_cast<std::int64_t>(cp - base) + normalized_shift;
    return base + static_cast<char32_t>(euclidMod(offset, cipher_limits::kAlphabetSize));
}

std::u32string shiftText(std::u32string_view text, ShiftAmount amount) {
    const ShiftAmount normalized = normalizeShift(amount);

    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        out.push_back(shiftCodepoint(cp, normalized));
    }
    return out;
}

std::string shiftText(std::string_view text, ShiftAmount amount) {
    const ShiftAmount normalized = normalizeShift(amount);

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        auto rune = decodeUtf8(text, i);
        if (rune.length == 1) {
            // Латинские буквы всегда однобайтовые
            out.push_back(static_cast<char>(shiftCodepoint(static_cast<unsigned char>(text[i]), normalized)));
        } else {
            out.append(text.substr(i, rune.length));
        }
        i += rune.length;
    }
    return out;
}

std::string encrypt(std::string_view text, ShiftAmount shift) {
    return shiftText(text, shift);
}

std::string decrypt(std::string_view text, ShiftAmount shift) {
    return shiftText(text, inverseShift(shift));
}

std::u32string encrypt(std::u32string_view text, ShiftAmount shift) {
    return shiftText(text, shift);
}

std::u32string decrypt(std::u32string_view text, ShiftAmount shift) {
    return shiftText(text, inverseShift(shift));
}

} // namespace caesar::core
