#pragma once

/// @file simd.hpp
/// @brief Vectorised byte scans used by the tokenizer's indexing pass.
///
/// Supported platforms (opt-in through DOMJSON_SIMD_ENABLED):
///   - x86_64: SSE2 16 bytes/iteration, AVX2 32 bytes/iteration
///   - ARM/AArch64: NEON 16 bytes/iteration
/// Every scan ends in a scalar loop, which is also the whole implementation
/// when SIMD is disabled.

#include <cstddef>
#include <cstdint>

#if defined(DOMJSON_SIMD_ENABLED)
    #if defined(__AVX2__)
        #define DOMJSON_AVX2 1
        #define DOMJSON_SSE2 1
        #include <immintrin.h>
    #elif defined(__SSE2__) || defined(_M_X64) || defined(_M_AMD64)
        #define DOMJSON_SSE2 1
        #include <emmintrin.h>
    #elif defined(__ARM_NEON) || defined(__ARM_NEON__)
        #define DOMJSON_NEON 1
        #include <arm_neon.h>
    #endif
#endif

namespace domjson::detail::simd {

inline int ctz32(uint32_t v) noexcept {
#if defined(_MSC_VER)
    unsigned long idx;
    _BitScanForward(&idx, v);
    return static_cast<int>(idx);
#else
    return __builtin_ctz(v);
#endif
}

// ─── 16-byte masks: bit N set when byte N matches ───────────────────────────

#if defined(DOMJSON_SSE2)

inline uint32_t whitespace_mask16(const char* p) noexcept {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
    const __m128i hit = _mm_or_si128(
        _mm_or_si128(_mm_cmpeq_epi8(v, _mm_set1_epi8(' ')),
                     _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'))),
        _mm_or_si128(_mm_cmpeq_epi8(v, _mm_set1_epi8('\n')),
                     _mm_cmpeq_epi8(v, _mm_set1_epi8('\r'))));
    return static_cast<uint32_t>(_mm_movemask_epi8(hit));
}

inline uint32_t delimiter_mask16(const char* p) noexcept {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
    const __m128i hit = _mm_or_si128(_mm_cmpeq_epi8(v, _mm_set1_epi8('"')),
                                     _mm_cmpeq_epi8(v, _mm_set1_epi8('\\')));
    return static_cast<uint32_t>(_mm_movemask_epi8(hit));
}

#elif defined(DOMJSON_NEON)

/// Equivalent of _mm_movemask_epi8 for a comparison result whose bytes are
/// all 0x00 or 0xFF.
inline uint32_t neon_movemask(uint8x16_t v) noexcept {
    static const uint8_t kBits[16] = {
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80
    };
    uint8x16_t masked = vandq_u8(v, vld1q_u8(kBits));
    uint8x8_t folded = vpadd_u8(vget_low_u8(masked), vget_high_u8(masked));
    folded = vpadd_u8(folded, folded);
    folded = vpadd_u8(folded, folded);
    return vget_lane_u16(vreinterpret_u16_u8(folded), 0);
}

inline uint32_t whitespace_mask16(const char* p) noexcept {
    const uint8x16_t v = vld1q_u8(reinterpret_cast<const uint8_t*>(p));
    const uint8x16_t hit = vorrq_u8(
        vorrq_u8(vceqq_u8(v, vdupq_n_u8(' ')),  vceqq_u8(v, vdupq_n_u8('\t'))),
        vorrq_u8(vceqq_u8(v, vdupq_n_u8('\n')), vceqq_u8(v, vdupq_n_u8('\r'))));
    return neon_movemask(hit);
}

inline uint32_t delimiter_mask16(const char* p) noexcept {
    const uint8x16_t v = vld1q_u8(reinterpret_cast<const uint8_t*>(p));
    const uint8x16_t hit = vorrq_u8(vceqq_u8(v, vdupq_n_u8('"')),
                                    vceqq_u8(v, vdupq_n_u8('\\')));
    return neon_movemask(hit);
}

#endif

#if defined(DOMJSON_AVX2)

inline uint32_t whitespace_mask32(const char* p) noexcept {
    const __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(p));
    const __m256i hit = _mm256_or_si256(
        _mm256_or_si256(_mm256_cmpeq_epi8(v, _mm256_set1_epi8(' ')),
                        _mm256_cmpeq_epi8(v, _mm256_set1_epi8('\t'))),
        _mm256_or_si256(_mm256_cmpeq_epi8(v, _mm256_set1_epi8('\n')),
                        _mm256_cmpeq_epi8(v, _mm256_set1_epi8('\r'))));
    return static_cast<uint32_t>(_mm256_movemask_epi8(hit));
}

inline uint32_t delimiter_mask32(const char* p) noexcept {
    const __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(p));
    const __m256i hit = _mm256_or_si256(_mm256_cmpeq_epi8(v, _mm256_set1_epi8('"')),
                                        _mm256_cmpeq_epi8(v, _mm256_set1_epi8('\\')));
    return static_cast<uint32_t>(_mm256_movemask_epi8(hit));
}

#endif

// ═════════════════════════════════════════════════════════════════════════════
//  skip_whitespace: first byte that is not ' ', '\t', '\n' or '\r'
// ═════════════════════════════════════════════════════════════════════════════

inline const char* skip_whitespace(const char* ptr, const char* end) noexcept {
#if defined(DOMJSON_AVX2)
    while (end - ptr >= 32) {
        const uint32_t other = ~whitespace_mask32(ptr);
        if (other != 0) return ptr + ctz32(other);
        ptr += 32;
    }
#endif
#if defined(DOMJSON_SSE2) || defined(DOMJSON_NEON)
    while (end - ptr >= 16) {
        const uint32_t other = ~whitespace_mask16(ptr) & 0xFFFFu;
        if (other != 0) return ptr + ctz32(other);
        ptr += 16;
    }
#endif
    while (ptr < end) {
        const char c = *ptr;
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return ptr;
        ++ptr;
    }
    return ptr;
}

// ═════════════════════════════════════════════════════════════════════════════
//  find_string_delimiter: first '"' or '\\', or end
// ═════════════════════════════════════════════════════════════════════════════

inline const char* find_string_delimiter(const char* ptr, const char* end) noexcept {
#if defined(DOMJSON_AVX2)
    while (end - ptr >= 32) {
        const uint32_t hit = delimiter_mask32(ptr);
        if (hit != 0) return ptr + ctz32(hit);
        ptr += 32;
    }
#endif
#if defined(DOMJSON_SSE2) || defined(DOMJSON_NEON)
    while (end - ptr >= 16) {
        const uint32_t hit = delimiter_mask16(ptr);
        if (hit != 0) return ptr + ctz32(hit);
        ptr += 16;
    }
#endif
    while (ptr < end) {
        if (*ptr == '"' || *ptr == '\\') return ptr;
        ++ptr;
    }
    return ptr;
}

} // namespace domjson::detail::simd
