#pragma once

/// @file decoder.hpp
/// @brief Decode engine: builds a value tree from the tokenizer's cursor.
///
/// One recursive algorithm serves every representation that implements the
/// value interface plus bulk construction from CowString, Number, V::Array
/// and V::Object. Features:
///   - Exact pre-sizing of arrays and objects from the look-ahead count
///   - Duplicate-unchecked key insertion, deduplicated once per object
///     (last value wins)
///   - Recursion depth limiting to protect against stack overflow
///   - Exception-free decoding via try_decode() with error_code

#include "borrowed_value.hpp"
#include "config.hpp"
#include "cow_string.hpp"
#include "detail/tokenizer.hpp"
#include "error.hpp"
#include "options.hpp"
#include "owned_value.hpp"
#include "value_trait.hpp"

#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace domjson {
namespace detail {

/// Object key from a decoded string. std::string keys take the buffer of an
/// owned CowString; CowString keys keep borrowing.
template <typename Key>
Key make_key(CowString&& s) { return Key(std::move(s)); }

template <>
inline std::string make_key<std::string>(CowString&& s) { return std::move(s).into_string(); }

template <typename V>
class ValueDeserializer {
    static_assert(is_value_v<V>, "ValueDeserializer requires a value type");

public:
    ValueDeserializer(Tokenizer& cursor, const DecodeOptions& opts) noexcept
        : cursor_(cursor), max_depth_(opts.effective_max_depth()) {}

    /// Entry point: a bare number here may end at the end of input.
    V parse() {
        const char c = cursor_.next();
        if (c == '-') return V(cursor_.parse_number_root(true));
        if (is_digit(c)) return V(cursor_.parse_number_root(false));
        return dispatch(c);
    }

private:
    Tokenizer& cursor_;
    size_t depth_ = 0;
    size_t max_depth_;

    static bool is_digit(char c) noexcept { return static_cast<unsigned>(c - '0') <= 9u; }

    void push_depth() {
        if (DOMJSON_UNLIKELY(++depth_ > max_depth_)) cursor_.error(errc::max_depth_exceeded);
    }
    void pop_depth() noexcept { --depth_; }

    V parse_value() {
        const char c = cursor_.next();
        if (c == '-') return V(cursor_.parse_number(true));
        if (is_digit(c)) return V(cursor_.parse_number(false));
        return dispatch(c);
    }

    /// Every kind except numbers, which differ between root and nested.
    V dispatch(char c) {
        switch (c) {
            case '"': return V(cursor_.parse_str());
            case 'n': return V::null();
            case 't': return V(true);
            case 'f': return V(false);
            case '[': return parse_array();
            case '{': return parse_map();
            default:
                cursor_.error(errc::unexpected_character);
        }
    }

    V parse_array() {
        push_depth();
        const size_t count = cursor_.count_elements();
        if (count == 0) {
            cursor_.skip();
            pop_depth();
            return V::array();
        }
        typename V::Array res;
        res.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            res.emplace_back(parse_value());
            cursor_.skip();
        }
        pop_depth();
        return V(std::move(res));
    }

    V parse_map() {
        push_depth();
        const size_t count = cursor_.count_elements();
        if (count == 0) {
            cursor_.skip();
            pop_depth();
            return V::object();
        }
        typename V::Object res;
        res.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            // The key token is consumed first, then materialized.
            cursor_.skip();
            auto key = make_key<typename V::Key>(cursor_.parse_str());
            cursor_.skip();
            res.append_unchecked(std::move(key), parse_value());
            cursor_.skip();
        }
        res.finalize();
        pop_depth();
        return V(std::move(res));
    }
};

} // namespace detail

// ─── Entry points ────────────────────────────────────────────────────────────

/// @brief Decode @p input into a value of representation V.
///
/// The input is never written to. For BorrowedValue it must outlive the
/// result.
/// @throws ParseError carrying the error code and byte offset.
template <typename V>
[[nodiscard]] V decode(std::string_view input, const DecodeOptions& opts = {}) {
    detail::Tokenizer cursor(input);
    return detail::ValueDeserializer<V>(cursor, opts).parse();
}

/// @brief Decode without exceptions.
template <typename V>
[[nodiscard]] result<V> try_decode(std::string_view input,
                                   const DecodeOptions& opts = {}) noexcept {
    try {
        return {decode<V>(input, opts), {}};
    } catch (const ParseError& e) {
        return {V(), e.code()};
    } catch (const std::bad_alloc&) {
        return {V(), std::make_error_code(std::errc::not_enough_memory)};
    }
}

[[nodiscard]] inline OwnedValue to_owned_value(std::string_view input,
                                               const DecodeOptions& opts = {}) {
    return decode<OwnedValue>(input, opts);
}

[[nodiscard]] inline BorrowedValue to_borrowed_value(std::string_view input,
                                                     const DecodeOptions& opts = {}) {
    return decode<BorrowedValue>(input, opts);
}

// BorrowedDocument members (here, after decode(), to avoid a cycle between
// borrowed_value.hpp and this header)

inline void BorrowedDocument::parse(std::string input, const DecodeOptions& opts) {
    auto buffer = std::make_shared<const std::string>(std::move(input));
    BorrowedValue root = decode<BorrowedValue>(*buffer, opts);
    root_ = std::move(root);
    buffer_ = std::move(buffer);
}

inline std::error_code BorrowedDocument::try_parse(std::string input,
                                                   const DecodeOptions& opts) noexcept {
    try {
        parse(std::move(input), opts);
        return {};
    } catch (const ParseError& e) {
        return e.code();
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

} // namespace domjson
