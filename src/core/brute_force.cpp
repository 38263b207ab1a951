/**
 * @file brute_force.cpp
 * @brief Реализация перебора сдвигов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "brute_force.hpp"
#include "transform.hpp"

namespace caesar::core {

std::vector<BruteForceCandidate> bruteForce(std::string_view text) {
    std::vector<BruteForceCandidate> candidates;
    candidates.reserve(static_cast<std::size_t>(cipher_limits::kMaxBruteForceShift) + 1);

    for (ShiftAmount shift = 0; shift <= cipher_limits::kMaxBruteForceShift; ++shift) {
        candidates.push_back({shift, decrypt(text, shift)});
    }
    return candidates;
}

} // namespace caesar::core
