/**
 * @file brute_force_writer.cpp
 * @brief Представление результатов перебора сдвигов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "brute_force_writer.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <string>

namespace caesar::io {

void writeBruteForceText(
    std::ostream& out,
    std::string_view original,
    const std::vector<caesar::core::BruteForceCandidate>& candidates
) {
    out << "\n=== Brute Force Decryption ===\n";
    out << "Original: " << original << "\n";
    out << "Trying all possible shifts:\n";
    for (const auto& candidate : candidates) {
        out << "Shift " << std::setw(2) << candidate.shift << ": " << candidate.text << "\n";
    }
}

void writeBruteForceJson(
    std::ostream& out,
    std::string_view original,
    const std::vector<caesar::core::BruteForceCandidate>& candidates
) {
    nlohmann::json j;
    j["original"] = std::string(original);
    j["candidates"] = nlohmann::json::array();
    for (const auto& candidate : candidates) {
        j["candidates"].push_back({
            {"shift", candidate.shift},
            {"text", candidate.text}
        });
    }
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

} // namespace caesar::io
