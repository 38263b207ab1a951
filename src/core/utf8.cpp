/**
 * @file utf8.cpp
 * @brief Реализация кодека UTF-8
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "utf8.hpp"

namespace caesar::core {

void appendUtf8(char32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

DecodedRune decodeUtf8(std::string_view input, std::size_t offset) noexcept {
    DecodedRune rune{};
    if (offset >= input.size()) {
        return rune;
    }

    unsigned char c0 = static_cast<unsigned char>(input[offset]);
    if (c0 < 0x80) {
        rune.codepoint = c0;
        return rune;
    }

    auto isContinuation = [](unsigned char c) { return (c & 0xC0) == 0x80; };

    // 2-байтовая последовательность
    if ((c0 & 0xE0) == 0xC0 && offset + 1 < input.size()) {
        unsigned char c1 = static_cast<unsigned char>(input[offset + 1]);
        if (isContinuation(c1)) {
            rune.codepoint = static_cast<char32_t>(((c0 & 0x1F) << 6) | (c1 & 0x3F));
            rune.length = 2;
            return rune;
        }
    }

    // 3-байтовая последовательность
    if ((c0 & 0xF0) == 0xE0 && offset + 2 < input.size()) {
        unsigned char c1 = static_cast<unsigned char>(input[offset + 1]);
        unsigned char c2 = static_cast<unsigned char>(input[offset + 2]);
        if (isContinuation(c1) && isContinuation(c2)) {
            rune.codepoint = static_cast<char32_t>(((c0 & 0x0F) << 12) |
                                                   ((c1 & 0x3F) << 6) |
                                                   (c2 & 0x3F));
            rune.length = 3;
            return rune;
        }
    }

    // 4-байтовая последовательность
    if ((c0 & 0xF8) == 0xF0 && offset + 3 < input.size()) {
        unsigned char c1 = static_cast<unsigned char>(input[offset + 1]);
        unsigned char c2 = static_cast<unsigned char>(input[offset + 2]);
        unsigned char c3 = static_cast<unsigned char>(input[offset + 3]);
        if (isContinuation(c1) && isContinuation(c2) && isContinuation(c3)) {
            rune.codepoint = static_cast<char32_t>(((c0 & 0x07) << 18) |
                                                   ((c1 & 0x3F) << 12) |
                                                   ((c2 & 0x3F) << 6) |
                                                   (c3 & 0x3F));
            rune.length = 4;
            return rune;
        }
    }

    // Некорректная последовательность: первый байт как отдельный символ
    rune.codepoint = c0;
    return rune;
}

std::size_t utf8Length(std::string_view input) noexcept {
    std::size_t count = 0;
    for (std::size_t i = 0; i < input.size(); ++count) {
        i += decodeUtf8(input, i).length;
    }
    return count;
}

std::u32string utf8ToUtf32(std::string_view input) {
    std::u32string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size();) {
        auto rune = decodeUtf8(input, i);
        bool malformed = rune.length == 1 && rune.codepoint >= 0x80;
        out.push_back(malformed ? kReplacementCharacter : rune.codepoint);
        i += rune.length;
    }
    return out;
}

std::string utf32ToUtf8(std::u32string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char32_t cp : input) {
        appendUtf8(cp, out);
    }
    return out;
}

} // namespace caesar::core
