#pragma once

/// @file number_parser.hpp
/// @brief RFC 8259 number grammar producing a Number.
///
/// Integers are accumulated inline; floats with at most 19 significant
/// digits and a small decimal exponent are rebuilt from mantissa and
/// exponent without a second pass. Everything else falls back to
/// std::from_chars (or strtod where from_chars for double is unavailable).
/// Magnitudes beyond the double range are rejected; tiny ones round to zero.

#include "../config.hpp"
#include "../number.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <system_error>

namespace domjson::detail::number {

inline bool is_digit(char c) noexcept {
    return static_cast<unsigned>(c - '0') <= 9u;
}

/// strtod over [begin, end). Underflow rounds toward zero; a result that
/// overflows to infinity is rejected.
inline bool parse_double_strtod(const char* begin, const char* end, double& out) noexcept {
    char buf[64];
    const size_t len = static_cast<size_t>(end - begin);
    char* stop = nullptr;
    if (len >= sizeof(buf)) {
        std::string copy(begin, end);
        out = std::strtod(copy.c_str(), &stop);
        return stop == copy.c_str() + copy.size() && std::isfinite(out);
    }
    std::memcpy(buf, begin, len);
    buf[len] = '\0';
    out = std::strtod(buf, &stop);
    return stop == buf + len && std::isfinite(out);
}

/// Slow path for floats and out-of-range integers over [begin, end).
DOMJSON_NOINLINE inline bool parse_double(const char* begin, const char* end, double& out) noexcept {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [p, ec] = std::from_chars(begin, end, out);
    if (DOMJSON_LIKELY(ec == std::errc{})) return p == end;
    if (ec != std::errc::result_out_of_range || p != end) return false;
    // from_chars leaves out untouched on range errors.
    return parse_double_strtod(begin, end, out);
#else
    return parse_double_strtod(begin, end, out);
#endif
}

/// @brief Parse one number.
///
/// @param begin    First byte of the token (the '-' when @p negative).
/// @param end      End of the input.
/// @param negative Whether the token starts with '-'.
/// @param out      Receives the value on success.
/// @return Pointer past the last byte of the number, or nullptr when the
///         bytes do not form a number. Leading zeros are not consumed, so
///         "01" stops after the '0' and the caller's terminator check fails.
inline const char* parse(const char* begin, const char* end, bool negative,
                         Number& out) noexcept {
    const char* ptr = begin + (negative ? 1 : 0);
    if (DOMJSON_UNLIKELY(ptr >= end || !is_digit(*ptr))) return nullptr;

    uint64_t int_val = 0;
    bool int_overflow = false;
    int int_digits = 0;

    if (*ptr == '0') {
        ++ptr;
    } else {
        constexpr uint64_t kOverflowThreshold = UINT64_MAX / 10;
        constexpr uint64_t kOverflowLastDigit = UINT64_MAX % 10;
        while (ptr < end && is_digit(*ptr)) {
            const auto digit = static_cast<uint64_t>(*ptr - '0');
            if (DOMJSON_UNLIKELY(int_val > kOverflowThreshold ||
                                 (int_val == kOverflowThreshold && digit > kOverflowLastDigit))) {
                int_overflow = true;
                while (ptr < end && is_digit(*ptr)) ++ptr;
                break;
            }
            int_val = int_val * 10 + digit;
            ++ptr;
            ++int_digits;
        }
    }

    bool is_float = false;
    uint64_t mantissa = int_val;
    int32_t frac_digits = 0;
    int32_t explicit_exp = 0;
    bool mantissa_overflow = int_overflow;
    constexpr int kMaxMantissaDigits = 19;
    int total_digits = int_digits;

    if (ptr < end && *ptr == '.') {
        is_float = true;
        ++ptr;
        if (DOMJSON_UNLIKELY(ptr >= end || !is_digit(*ptr))) return nullptr;
        while (ptr < end && is_digit(*ptr)) {
            if (total_digits < kMaxMantissaDigits) {
                mantissa = mantissa * 10 + static_cast<uint64_t>(*ptr - '0');
                ++frac_digits;
                ++total_digits;
            } else {
                mantissa_overflow = true;
            }
            ++ptr;
        }
    }

    if (ptr < end && (*ptr == 'e' || *ptr == 'E')) {
        is_float = true;
        ++ptr;
        bool neg_exp = false;
        if (ptr < end && (*ptr == '+' || *ptr == '-')) {
            neg_exp = (*ptr == '-');
            ++ptr;
        }
        if (DOMJSON_UNLIKELY(ptr >= end || !is_digit(*ptr))) return nullptr;
        while (ptr < end && is_digit(*ptr)) {
            explicit_exp = explicit_exp * 10 + (*ptr - '0');
            if (explicit_exp > 400) explicit_exp = 400;
            ++ptr;
        }
        if (neg_exp) explicit_exp = -explicit_exp;
    }

    if (DOMJSON_LIKELY(!is_float && !int_overflow)) {
        constexpr auto kMaxPos = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (negative) {
            if (int_val <= kMaxPos) {
                out = Number(-static_cast<int64_t>(int_val));
                return ptr;
            }
            if (int_val == kMaxPos + 1) {
                out = Number(std::numeric_limits<int64_t>::min());
                return ptr;
            }
        } else if (int_val <= kMaxPos) {
            out = Number(static_cast<int64_t>(int_val));
            return ptr;
        }
        // Integer outside the i64 range: becomes F64 below.
    }

    // Exact when the mantissa fits the 53-bit significand and 10^|exp| is
    // itself exactly representable.
    if (DOMJSON_LIKELY(!mantissa_overflow && mantissa <= (uint64_t{1} << 53))) {
        const int32_t exp10 = explicit_exp - frac_digits;
        if (exp10 >= -22 && exp10 <= 22) {
            static constexpr double kPow10[] = {
                1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,
                1e10, 1e11, 1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19,
                1e20, 1e21, 1e22
            };
            double d = static_cast<double>(mantissa);
            d = exp10 >= 0 ? d * kPow10[exp10] : d / kPow10[-exp10];
            out = Number(negative ? -d : d);
            return ptr;
        }
    }

    double d = 0.0;
    if (DOMJSON_UNLIKELY(!parse_double(begin, ptr, d))) return nullptr;
    out = Number(d);
    return ptr;
}

} // namespace domjson::detail::number
