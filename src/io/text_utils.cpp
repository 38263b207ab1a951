/**
 * @file text_utils.cpp
 * @brief Утилиты для обработки строк пользовательского ввода
 */

#include "text_utils.hpp"

namespace caesar::io {

namespace {

constexpr bool isAsciiSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string_view trimWhitespace(std::string_view input) noexcept {
    size_t begin = 0;
    size_t end = input.size();
    while (begin < end && isAsciiSpace(input[begin])) {
        ++begin;
    }
    while (end > begin && isAsciiSpace(input[end - 1])) {
        --end;
    }
    return input.substr(begin, end - begin);
}

std::string asciiToLower(std::string_view input) {
    std::string out(input);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c + 32);
        }
    }
    return out;
}

} // namespace caesar::io
