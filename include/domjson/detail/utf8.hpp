#pragma once

/// @file utf8.hpp
/// @brief UTF-8 encoding of code points.
///
/// Used by the tokenizer when unescaping \uXXXX sequences and by the encode
/// engine when turning a char32_t into a one-character string.

#include <cstdint>
#include <string>

namespace domjson::detail::utf8 {

/// Largest Unicode scalar value.
constexpr uint32_t kMaxCodePoint = 0x10FFFF;

/// @brief True for code points that may appear in well-formed UTF-8.
constexpr bool is_scalar_value(uint32_t cp) noexcept {
    return cp <= kMaxCodePoint && (cp < 0xD800 || cp > 0xDFFF);
}

/// @brief Encode a code point into a fixed buffer of at least four bytes.
/// @return Number of bytes written (1-4), or 0 above kMaxCodePoint.
inline unsigned encode(uint32_t cp, char* buf) noexcept {
    if (cp < 0x80) {
        buf[0] = static_cast<char>(cp);
        return 1;
    }
    unsigned len;
    if (cp < 0x800) {
        len = 2;
        buf[0] = static_cast<char>(0xC0 | (cp >> 6));
    } else if (cp < 0x10000) {
        len = 3;
        buf[0] = static_cast<char>(0xE0 | (cp >> 12));
    } else if (cp <= kMaxCodePoint) {
        len = 4;
        buf[0] = static_cast<char>(0xF0 | (cp >> 18));
    } else {
        return 0;
    }
    // Continuation bytes carry six bits each, most significant first.
    for (unsigned i = 1; i < len; ++i) {
        const unsigned shift = 6 * (len - 1 - i);
        buf[i] = static_cast<char>(0x80 | ((cp >> shift) & 0x3F));
    }
    return len;
}

/// @brief Append the UTF-8 form of @p cp to @p out.
inline void encode(uint32_t cp, std::string& out) {
    char buf[4];
    const unsigned n = encode(cp, buf);
    out.append(buf, n);
}

} // namespace domjson::detail::utf8
