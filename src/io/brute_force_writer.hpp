/**
 * @file brute_force_writer.hpp
 * @brief Представление результатов перебора сдвигов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/brute_force.hpp"
#include <ostream>
#include <string_view>
#include <vector>

namespace caesar::io {

/**
 * @brief Текстовый вывод: заголовок и строка «Shift NN: ...» на каждый сдвиг
 */
void writeBruteForceText(
    std::ostream& out,
    std::string_view original,
    const std::vector<caesar::core::BruteForceCandidate>& candidates
);

/**
 * @brief JSON-документ {"original": ..., "candidates": [{"shift", "text"}]}
 *
 * Некорректные UTF-8 байты заменяются на U+FFFD.
 */
void writeBruteForceJson(
    std::ostream& out,
    std::string_view original,
    const std::vector<caesar::core::BruteForceCandidate>& candidates
);

} // namespace caesar::io
