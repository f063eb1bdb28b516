#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers used by the parser (\uXXXX decoding).

#include <cstdint>
#include <string>

namespace jsondelta::detail::utf8 {

/// @brief Encodes a Unicode code point as UTF-8 and appends to the string.
/// @param cp   Unicode code point (0x0000..0x10FFFF).
/// @param out  Destination string for UTF-8 bytes.
/// @return false if @p cp is outside the Unicode range.
inline bool encode(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        return false;
    }
    return true;
}

/// @brief Surrogate range checks for \uXXXX pairs.
inline bool is_high_surrogate(uint32_t cp) noexcept { return cp >= 0xD800 && cp <= 0xDBFF; }
inline bool is_low_surrogate(uint32_t cp) noexcept { return cp >= 0xDC00 && cp <= 0xDFFF; }

/// @brief Combine a surrogate pair into a supplementary code point.
inline uint32_t combine_surrogates(uint32_t high, uint32_t low) noexcept {
    return 0x10000u + ((high - 0xD800u) << 10) + (low - 0xDC00u);
}

} // namespace jsondelta::detail::utf8
