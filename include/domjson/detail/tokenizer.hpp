#pragma once

/// @file tokenizer.hpp
/// @brief Tokenizer: pre-scans the input and serves it to the decode engine
/// as a cursor over structural tokens.
///
/// Construction runs two passes:
///   1. Index: the byte offset of every token (structural byte, string
///      start, or scalar start). Strings are skipped with the SIMD delimiter
///      search.
///   2. Grammar: an iterative pushdown check over the index that also
///      records, for every '[' and '{', how many elements it holds.
///
/// After construction the token sequence is known to be well formed, so the
/// decode engine can trust count_elements(). String contents, numbers and
/// scalars that are not true/false/null are checked lazily when the decode
/// engine asks for them.

#include "../config.hpp"
#include "../cow_string.hpp"
#include "../error.hpp"
#include "../number.hpp"
#include "number_parser.hpp"
#include "simd.hpp"
#include "utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace domjson::detail {

class Tokenizer {
public:
    /// @throws ParseError when the input is not a single well-formed JSON
    /// value at the token level.
    explicit Tokenizer(std::string_view input)
        : begin_(input.data()), end_(input.data() + input.size()) {
        index();
        check_grammar();
    }

    // ─── Cursor ─────────────────────────────────────────────────────────

    /// First byte of the next token; advances the token index.
    char next() noexcept {
        if (DOMJSON_UNLIKELY(idx_ >= tokens_.size())) {
            ++idx_;
            return '\0';
        }
        return begin_[tokens_[idx_++]];
    }

    /// Advance past the current token.
    void skip() noexcept { ++idx_; }

    /// Elements in the container opened by the last token returned by next().
    [[nodiscard]] size_t count_elements() const noexcept { return counts_[idx_ - 1]; }

    /// Contents of the string token last passed over. Zero-copy unless the
    /// string contains escapes.
    CowString parse_str() {
        const size_t quote = tokens_[idx_ - 1];
        const char* start = begin_ + quote + 1;
        const char* delim = simd::find_string_delimiter(start, end_);
        if (DOMJSON_LIKELY(*delim == '"')) {
            return CowString::borrowed(std::string_view(start, static_cast<size_t>(delim - start)));
        }
        return CowString::owned(unescape(start, delim));
    }

    /// Number at the root: the end of input is a valid terminator.
    Number parse_number_root(bool negative) { return parse_number_impl(negative, true); }

    /// Number inside a container: must be followed by whitespace or a
    /// structural byte.
    Number parse_number(bool negative) { return parse_number_impl(negative, false); }

    /// @brief Fail at the token last returned by next().
    [[noreturn]] DOMJSON_NOINLINE void error(errc code) const {
        const size_t offset = idx_ > 0 && idx_ - 1 < tokens_.size()
                                  ? tokens_[idx_ - 1]
                                  : static_cast<size_t>(end_ - begin_);
        fail(code, offset);
    }

    [[nodiscard]] size_t token_count() const noexcept { return tokens_.size(); }

private:
    const char* begin_;
    const char* end_;
    std::vector<size_t> tokens_;   ///< token start offsets
    std::vector<size_t> counts_;   ///< element count per '['/'{' token
    size_t idx_ = 0;

    // ─── Error reporting ────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location_at(size_t offset) const noexcept {
        SourceLocation loc;
        loc.offset = offset;
        for (const char* p = begin_; p < begin_ + offset; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] DOMJSON_NOINLINE void fail(errc code, size_t offset) const {
        std::string msg = make_error_code(code).message();
        if (code == errc::unexpected_character && begin_ + offset < end_) {
            msg += " '";
            msg += begin_[offset];
            msg += '\'';
        }
        throw ParseError(msg, location_at(offset), code);
    }

    static bool is_whitespace(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }
    static bool is_structural(char c) noexcept {
        return c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',';
    }

    /// End of the scalar token starting at @p p.
    const char* scalar_end(const char* p) const noexcept {
        while (p < end_ && !is_whitespace(*p) && !is_structural(*p) && *p != '"') ++p;
        return p;
    }

    // ─── Pass 1: structural index ───────────────────────────────────────

    void index() {
        tokens_.reserve(static_cast<size_t>(end_ - begin_) / 4 + 1);
        const char* p = begin_;
        for (;;) {
            p = simd::skip_whitespace(p, end_);
            if (p >= end_) break;
            const size_t offset = static_cast<size_t>(p - begin_);
            tokens_.push_back(offset);
            if (is_structural(*p)) {
                ++p;
            } else if (*p == '"') {
                p = skip_string(p + 1, offset);
            } else {
                p = scalar_end(p + 1);
            }
        }
        if (DOMJSON_UNLIKELY(tokens_.empty())) {
            fail(errc::unexpected_end_of_input, static_cast<size_t>(end_ - begin_));
        }
    }

    /// Past the closing quote of the string whose contents start at @p p.
    const char* skip_string(const char* p, size_t open_offset) const {
        for (;;) {
            p = simd::find_string_delimiter(p, end_);
            if (DOMJSON_UNLIKELY(p >= end_)) fail(errc::unterminated_string, open_offset);
            if (*p == '"') return p + 1;
            // Backslash: the escaped byte can never close the string.
            p += 2;
            if (DOMJSON_UNLIKELY(p > end_)) fail(errc::unterminated_string, open_offset);
        }
    }

    // ─── Pass 2: grammar and element counts ─────────────────────────────

    enum class Expect : uint8_t { Value, ValueOrClose, Key, KeyOrClose, Colon, CommaOrClose };

    void check_literal(size_t offset) const {
        const char* p = begin_ + offset;
        const std::string_view tok(p, static_cast<size_t>(scalar_end(p) - p));
        if (DOMJSON_UNLIKELY(tok != "true" && tok != "false" && tok != "null")) {
            fail(errc::invalid_literal, offset);
        }
    }

    void check_grammar() {
        const size_t n = tokens_.size();
        counts_.assign(n, 0);
        std::vector<size_t> open;   // token indices of unclosed '[' / '{'
        Expect expect = Expect::Value;

        for (size_t i = 0; i < n; ++i) {
            const size_t offset = tokens_[i];
            const char c = begin_[offset];
            bool closed_value = false;

            switch (expect) {
                case Expect::ValueOrClose:
                    if (c == ']') {
                        open.pop_back();
                        closed_value = true;
                        break;
                    }
                    [[fallthrough]];
                case Expect::Value:
                    // Object members are counted at their key.
                    if (!open.empty() && begin_[tokens_[open.back()]] == '[') {
                        ++counts_[open.back()];
                    }
                    if (c == '[') {
                        open.push_back(i);
                        expect = Expect::ValueOrClose;
                    } else if (c == '{') {
                        open.push_back(i);
                        expect = Expect::KeyOrClose;
                    } else if (DOMJSON_UNLIKELY(is_structural(c))) {
                        fail(errc::unexpected_character, offset);
                    } else {
                        if (c == 't' || c == 'f' || c == 'n') check_literal(offset);
                        closed_value = true;
                    }
                    break;
                case Expect::KeyOrClose:
                    if (c == '}') {
                        open.pop_back();
                        closed_value = true;
                        break;
                    }
                    [[fallthrough]];
                case Expect::Key:
                    if (DOMJSON_UNLIKELY(c != '"')) fail(errc::unexpected_character, offset);
                    ++counts_[open.back()];
                    expect = Expect::Colon;
                    break;
                case Expect::Colon:
                    if (DOMJSON_UNLIKELY(c != ':')) fail(errc::unexpected_character, offset);
                    expect = Expect::Value;
                    break;
                case Expect::CommaOrClose: {
                    const bool in_object = begin_[tokens_[open.back()]] == '{';
                    if (c == ',') {
                        expect = in_object ? Expect::Key : Expect::Value;
                    } else if (c == (in_object ? '}' : ']')) {
                        open.pop_back();
                        closed_value = true;
                    } else {
                        fail(errc::unexpected_character, offset);
                    }
                    break;
                }
            }

            if (closed_value) {
                if (open.empty()) {
                    if (DOMJSON_UNLIKELY(i + 1 != n)) fail(errc::trailing_content, tokens_[i + 1]);
                    return;
                }
                expect = Expect::CommaOrClose;
            }
        }

        // Tokens ran out inside a container.
        const bool in_object = begin_[tokens_[open.back()]] == '{';
        fail(in_object ? errc::unterminated_object : errc::unterminated_array,
             static_cast<size_t>(end_ - begin_));
    }

    // ─── Strings ────────────────────────────────────────────────────────

    // 256-byte hex lookup table: 0xFF = invalid, otherwise nibble value.
    static constexpr uint8_t kHexTable[256] = {
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0x00,0x01,0x02,0x03,0x04,0x05,0x06,0x07, 0x08,0x09,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0x0A,0x0B,0x0C,0x0D,0x0E,0x0F,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0x0A,0x0B,0x0C,0x0D,0x0E,0x0F,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
    };

    uint32_t parse_hex4(const char*& p) const {
        if (DOMJSON_UNLIKELY(end_ - p < 4)) fail(errc::invalid_unicode_escape, offset_of(p));
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const uint8_t nib = kHexTable[static_cast<unsigned char>(p[i])];
            if (DOMJSON_UNLIKELY(nib > 15)) fail(errc::invalid_unicode_escape, offset_of(p));
            val = (val << 4) | nib;
        }
        p += 4;
        return val;
    }

    size_t offset_of(const char* p) const noexcept { return static_cast<size_t>(p - begin_); }

    /// Unescape the string contents starting at @p start, whose first
    /// backslash is at @p delim.
    std::string unescape(const char* start, const char* delim) const {
        std::string out(start, delim);
        const char* p = delim;
        for (;;) {
            // *p is '\\' here; pass 1 guaranteed a closing quote further on.
            const char* esc = p;
            ++p;
            switch (*p++) {
                case '"':  out.push_back('"');  break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/');  break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    uint32_t cp = parse_hex4(p);
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (DOMJSON_UNLIKELY(end_ - p < 2 || p[0] != '\\' || p[1] != 'u'))
                            fail(errc::invalid_unicode_escape, offset_of(esc));
                        p += 2;
                        const uint32_t low = parse_hex4(p);
                        if (DOMJSON_UNLIKELY(low < 0xDC00 || low > 0xDFFF))
                            fail(errc::invalid_unicode_escape, offset_of(esc));
                        cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
                    } else if (DOMJSON_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
                        fail(errc::invalid_unicode_escape, offset_of(esc));
                    }
                    utf8::encode(cp, out);
                    break;
                }
                default:
                    fail(errc::invalid_escape, offset_of(esc));
            }
            const char* next = simd::find_string_delimiter(p, end_);
            out.append(p, next);
            p = next;
            if (*p == '"') return out;
        }
    }

    // ─── Numbers ────────────────────────────────────────────────────────

    Number parse_number_impl(bool negative, bool root) {
        const size_t offset = tokens_[idx_ - 1];
        Number result(int64_t{0});
        const char* stop = number::parse(begin_ + offset, end_, negative, result);
        if (DOMJSON_UNLIKELY(stop == nullptr)) fail(errc::invalid_number, offset);
        if (stop < end_) {
            const char c = *stop;
            if (DOMJSON_UNLIKELY(!is_whitespace(c) && (root || !is_structural(c))))
                fail(errc::invalid_number, offset);
        } else if (DOMJSON_UNLIKELY(!root)) {
            fail(errc::invalid_number, offset);
        }
        return result;
    }
};

} // namespace domjson::detail
