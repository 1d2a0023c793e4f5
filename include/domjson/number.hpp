#pragma once

/// @file number.hpp
/// @brief Number: the tagged numeric produced by the tokenizer's number grammar.
///
/// The value types never parse digits themselves; they only wrap a Number
/// into their I64 or F64 variant.

#include <cstdint>

namespace domjson {

class Number {
public:
    enum class Kind : uint8_t { I64, F64 };

    constexpr Number(int64_t v) noexcept : kind_(Kind::I64), i_(v) {}
    constexpr Number(double v) noexcept : kind_(Kind::F64), d_(v) {}

    [[nodiscard]] constexpr Kind kind() const noexcept { return kind_; }
    [[nodiscard]] constexpr bool is_i64() const noexcept { return kind_ == Kind::I64; }
    [[nodiscard]] constexpr bool is_f64() const noexcept { return kind_ == Kind::F64; }

    /// Undefined unless is_i64().
    [[nodiscard]] constexpr int64_t i64() const noexcept { return i_; }
    /// Undefined unless is_f64().
    [[nodiscard]] constexpr double f64() const noexcept { return d_; }

    [[nodiscard]] constexpr bool operator==(const Number& o) const noexcept {
        if (kind_ != o.kind_) return false;
        return kind_ == Kind::I64 ? i_ == o.i_ : d_ == o.d_;
    }
    [[nodiscard]] constexpr bool operator!=(const Number& o) const noexcept {
        return !(*this == o);
    }

private:
    Kind kind_;
    union {
        int64_t i_;
        double d_;
    };
};

} // namespace domjson
