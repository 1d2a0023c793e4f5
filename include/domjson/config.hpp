#pragma once

/// @file config.hpp
/// @brief Configuration macros for the domjson library.
///
/// Controls:
///   - Branch prediction hints
///   - SIMD support for the tokenizer
///   - Recursion depth limit shared by the decode and encode engines
///   - Linear vs hashed object lookup threshold

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define DOMJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define DOMJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define DOMJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define DOMJSON_LIKELY(x)   (x)
    #define DOMJSON_UNLIKELY(x) (x)
    #define DOMJSON_NOINLINE    __declspec(noinline)
#else
    #define DOMJSON_LIKELY(x)   (x)
    #define DOMJSON_UNLIKELY(x) (x)
    #define DOMJSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Applies to both decode (document nesting) and encode (value nesting).
// Override per call through DecodeOptions / EncodeOptions::max_depth.

#if !defined(DOMJSON_MAX_DEPTH)
    #define DOMJSON_MAX_DEPTH 512
#endif

// =====================================================================
// Small object threshold for linear vs hash lookup
// =====================================================================

#if !defined(DOMJSON_OBJECT_LINEAR_THRESHOLD)
    #define DOMJSON_OBJECT_LINEAR_THRESHOLD 16
#endif
