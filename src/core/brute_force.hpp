/**
 * @file brute_force.hpp
 * @brief Перебор всех сдвигов для неизвестного ключа
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/cipher_config.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace caesar::core {

using namespace caesar::model;

/**
 * @brief Вариант расшифровки для одного сдвига
 */
struct BruteForceCandidate {
    ShiftAmount shift = 0;
    std::string text;
};

/**
 * @brief Расшифровать текст всеми сдвигами 0..kMaxBruteForceShift
 *
 * Сдвиг 0 возвращает исходный текст для сравнения.
 */
[[nodiscard]] std::vector<BruteForceCandidate> bruteForce(std::string_view text);

} // namespace caesar::core
