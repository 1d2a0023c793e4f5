#pragma once

/// @file error.hpp
/// @brief Error types for domjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, AccessError, EncodeError (default)
///   - Via error_code: domjson::errc enum + domjson_category() (exception-free)
///
/// Use try_decode() / try_to_value() for exception-free operation.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace domjson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief domjson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Decode errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,

    // Value access errors (50-79)
    not_an_object           = 50,
    not_an_array            = 51,

    // Encode errors (80-99)
    key_must_be_a_string    = 80,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class domjson_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "domjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after JSON";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::not_an_object:           return "value is not an object";
            case errc::not_an_array:            return "value is not an array";
            case errc::key_must_be_a_string:    return "map key must be a string";
            default:                            return "unknown domjson error";
        }
    }
};

} // namespace detail

/// @brief Get the domjson error category singleton.
inline const std::error_category& domjson_category() noexcept {
    static const detail::domjson_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from domjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), domjson_category()};
}

/// @brief Create an error_condition from domjson::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), domjson_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Decode error with source position information.
///
/// Raised by the tokenizer (lexical, number and structure errors) and by the
/// decode engine (unexpected value byte, depth limit).
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief Byte offset of the failing token.
    [[nodiscard]] size_t offset() const noexcept { return location_.offset; }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON decode error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) +
               " (offset " + std::to_string(loc.offset) + "): " + msg;
    }

    SourceLocation location_;
};

/// @brief A variant-specific mutator was called on the wrong variant.
///
/// This is a caller logic error, not a decode/encode failure. The code is
/// either errc::not_an_object or errc::not_an_array.
class AccessError : public std::system_error {
public:
    explicit AccessError(errc code)
        : std::system_error(make_error_code(code)) {}
};

/// @brief Failure while encoding a value through the visitor protocol.
class EncodeError : public std::system_error {
public:
    explicit EncodeError(errc code)
        : std::system_error(make_error_code(code)) {}

    EncodeError(errc code, const std::string& what)
        : std::system_error(make_error_code(code), what) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = domjson::try_decode<domjson::OwnedValue>(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace domjson

// Register domjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<domjson::errc> : true_type {};
} // namespace std
