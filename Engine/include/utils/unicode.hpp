#pragma once

#include <string>
#include <cstdint>

namespace Bliss {

/**
 * @brief Decode the UTF-8 sequence starting at `s[i]`.
 *
 * Returns the sequence length, or 0 when `s[i]` is not a start byte or the
 * sequence is truncated. `cp` is only meaningful for a non-zero result.
 */
inline size_t decode_utf8_at(const std::string& s, size_t i, char32_t& cp) {
    uint8_t c = static_cast<uint8_t>(s[i]);
    size_t len = 0;

    if (c < 0x80) { cp = c; return 1; }
    else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
    else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
    else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
    else return 0;

    if (i + len > s.size()) return 0;
    for (size_t j = 1; j < len; ++j) {
        uint8_t cc = static_cast<uint8_t>(s[i + j]);
        if ((cc >> 6) != 0x2) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

/**
 * @brief Thread-safe UTF-32 to UTF-8 conversion.
 */
inline std::string utf32_to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char32_t cp : s) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

/**
 * @brief Simple lower-case mapping for the scripts that occur in gloss lists.
 *
 * Covers ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic capitals.
 * Other codepoints are returned unchanged.
 */
inline char32_t to_lower_codepoint(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 32;
    if (cp < 0xC0) return cp;

    // Latin-1 Supplement (skip the multiplication sign)
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 32;

    // Latin Extended-A: alternating upper/lower pairs
    if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;

    // Greek capitals (0x3A2 is unassigned)
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 32;

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 80;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 32;

    return cp;
}

/**
 * @brief Lower-case a UTF-8 string for case-insensitive comparison.
 *
 * Bytes outside a valid sequence are copied unchanged, so two different
 * malformed inputs never fold to the same string.
 */
inline std::string to_lower_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        char32_t cp = 0;
        size_t len = decode_utf8_at(s, i, cp);
        if (len == 0) {
            out.push_back(s[i]);
            ++i;
            continue;
        }
        out += utf32_to_utf8(std::u32string(1, to_lower_codepoint(cp)));
        i += len;
    }
    return out;
}

inline bool equals_ignore_case(const std::string& a, const std::string& b) {
    return to_lower_utf8(a) == to_lower_utf8(b);
}

} // namespace Bliss
