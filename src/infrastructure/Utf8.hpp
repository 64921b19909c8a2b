/**
 * @file Utf8.hpp
 * @brief Byte-level UTF-8 checks for text headed into JSON.
 */

#pragma once

#include <cstddef>
#include <string>

namespace sortwell::infrastructure {

namespace utf8_detail {

/** @brief Length of the sequence introduced by lead, or 0 if lead cannot start one. */
inline std::size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

inline bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace utf8_detail

/**
 * @brief True when text is well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
 */
inline bool IsValidUtf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = utf8_detail::SequenceLength(lead);
        if (length == 0 || i + length > text.size()) return false;
        for (std::size_t k = 1; k < length; ++k) {
            if (!utf8_detail::IsContinuation(static_cast<unsigned char>(text[i + k]))) return false;
        }
        if (length >= 3) {
            auto second = static_cast<unsigned char>(text[i + 1]);
            if (lead == 0xE0 && second < 0xA0) return false; // overlong
            if (lead == 0xED && second > 0x9F) return false; // surrogate
            if (lead == 0xF0 && second < 0x90) return false; // overlong
            if (lead == 0xF4 && second > 0x8F) return false; // above U+10FFFF
        }
        i += length;
    }
    return true;
}

/**
 * @brief Cuts text to at most maxBytes without splitting a multi-byte sequence.
 *
 * Only the cut point is adjusted; bytes before it are kept as they are.
 */
inline std::string TruncateUtf8(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    std::size_t cut = maxBytes;
    // Back up over continuation bytes to the lead of the sequence straddling the cut.
    std::size_t lead = cut;
    while (lead > 0 && cut - lead < 3 && utf8_detail::IsContinuation(static_cast<unsigned char>(text[lead]))) {
        --lead;
    }
    if (lead != cut) {
        std::size_t length = utf8_detail::SequenceLength(static_cast<unsigned char>(text[lead]));
        if (length > 0 && lead + length > cut) cut = lead;
    }
    return text.substr(0, cut);
}

} // namespace sortwell::infrastructure
