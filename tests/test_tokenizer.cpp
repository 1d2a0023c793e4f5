/// @file test_tokenizer.cpp
/// @brief Unit tests for the structural tokenizer and its cursor interface.

#include <domjson/domjson.hpp>
#include <domjson/detail/tokenizer.hpp>

#include <gtest/gtest.h>

#include <string>

using domjson::CowString;
using domjson::Number;
using domjson::ParseError;
using domjson::errc;
using domjson::detail::Tokenizer;

// ═══════════════════════════════════════════════════════════════════════════════
// Cursor walk
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, WalksObjectTokens) {
    const std::string input = R"({"a":[1,2],"b":"x"})";
    Tokenizer t(input);
    EXPECT_EQ(t.token_count(), 13u);

    EXPECT_EQ(t.next(), '{');
    EXPECT_EQ(t.count_elements(), 2u);

    t.skip();  // key
    CowString a = t.parse_str();
    EXPECT_EQ(a, "a");
    EXPECT_TRUE(a.is_borrowed());
    EXPECT_EQ(a.data(), input.data() + 2);
    t.skip();  // ':'

    EXPECT_EQ(t.next(), '[');
    EXPECT_EQ(t.count_elements(), 2u);
    EXPECT_EQ(t.next(), '1');
    EXPECT_TRUE(t.parse_number(false) == Number(int64_t{1}));
    t.skip();  // ','
    EXPECT_EQ(t.next(), '2');
    EXPECT_TRUE(t.parse_number(false) == Number(int64_t{2}));
    t.skip();  // ']'
    t.skip();  // ','

    t.skip();  // key
    EXPECT_EQ(t.parse_str(), "b");
    t.skip();  // ':'
    EXPECT_EQ(t.next(), '"');
    EXPECT_EQ(t.parse_str(), "x");
    t.skip();  // '}'

    EXPECT_EQ(t.next(), '\0');
}

TEST(Tokenizer, ElementCountsPerContainer) {
    Tokenizer t(R"([[1,2],[],{"a":1,"b":2,"c":3}])");
    EXPECT_EQ(t.next(), '[');
    EXPECT_EQ(t.count_elements(), 3u);
    EXPECT_EQ(t.next(), '[');
    EXPECT_EQ(t.count_elements(), 2u);
    t.next();  // 1
    t.skip();  // ','
    t.next();  // 2
    t.skip();  // ']'
    t.skip();  // ','
    EXPECT_EQ(t.next(), '[');
    EXPECT_EQ(t.count_elements(), 0u);
    t.skip();  // ']'
    t.skip();  // ','
    EXPECT_EQ(t.next(), '{');
    EXPECT_EQ(t.count_elements(), 3u);
}

TEST(Tokenizer, ObjectCountsMembersNotTokens) {
    Tokenizer single(R"({"k":"v"})");
    EXPECT_EQ(single.next(), '{');
    EXPECT_EQ(single.count_elements(), 1u);

    // Members whose values are containers, and arrays of objects.
    Tokenizer nested(R"({"a":{"b":1,"c":[1,2,3]},"d":[{"e":1},{}]})");
    EXPECT_EQ(nested.next(), '{');
    EXPECT_EQ(nested.count_elements(), 2u);
    nested.skip();  // "a"
    nested.skip();  // ':'
    EXPECT_EQ(nested.next(), '{');
    EXPECT_EQ(nested.count_elements(), 2u);
}

TEST(Tokenizer, EmptyContainersCountZero) {
    Tokenizer arr("[ ]");
    EXPECT_EQ(arr.next(), '[');
    EXPECT_EQ(arr.count_elements(), 0u);

    Tokenizer obj("{}");
    EXPECT_EQ(obj.next(), '{');
    EXPECT_EQ(obj.count_elements(), 0u);
}

TEST(Tokenizer, RootNumber) {
    Tokenizer t("-12");
    EXPECT_EQ(t.token_count(), 1u);
    EXPECT_EQ(t.next(), '-');
    const Number n = t.parse_number_root(true);
    ASSERT_TRUE(n.is_i64());
    EXPECT_EQ(n.i64(), -12);
}

TEST(Tokenizer, FloatNumber) {
    Tokenizer t("[2.5e1]");
    t.next();
    EXPECT_EQ(t.next(), '2');
    const Number n = t.parse_number(false);
    ASSERT_TRUE(n.is_f64());
    EXPECT_EQ(n.f64(), 25.0);
}

TEST(Tokenizer, EscapedStringIsOwned) {
    Tokenizer t(R"("line\nbreak")");
    EXPECT_EQ(t.next(), '"');
    CowString s = t.parse_str();
    EXPECT_TRUE(s.is_owned());
    EXPECT_EQ(s, "line\nbreak");
}

TEST(Tokenizer, StringsMayContainStructuralBytes) {
    Tokenizer t(R"(["[{:,}]"])");
    EXPECT_EQ(t.token_count(), 3u);
    t.next();
    EXPECT_EQ(t.next(), '"');
    EXPECT_EQ(t.parse_str(), "[{:,}]");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Tokenizer, GrammarErrorsThrowFromConstructor) {
    EXPECT_THROW(Tokenizer("[1,2"), ParseError);
    EXPECT_THROW(Tokenizer("{\"a\" 1}"), ParseError);
    EXPECT_THROW(Tokenizer("\"open"), ParseError);
    EXPECT_THROW(Tokenizer("1 2"), ParseError);
    EXPECT_THROW(Tokenizer("nope"), ParseError);
}

TEST(Tokenizer, ErrorReportsCurrentToken) {
    Tokenizer t("[1,  true]");
    t.next();
    t.next();
    t.skip();
    EXPECT_EQ(t.next(), 't');
    try {
        t.error(errc::unexpected_character);
        FAIL() << "error() must throw";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::unexpected_character);
        EXPECT_EQ(e.offset(), 5u);
        EXPECT_EQ(e.location().column, 6u);
    }
}

TEST(Tokenizer, NumberTerminators) {
    Tokenizer nested("[1x]");
    nested.next();
    EXPECT_EQ(nested.next(), '1');
    EXPECT_THROW(nested.parse_number(false), ParseError);

    // A structural byte ends a nested number but not a root one.
    Tokenizer root("[1]");
    root.next();
    root.next();
    EXPECT_THROW(root.parse_number_root(false), ParseError);
    EXPECT_NO_THROW(root.parse_number(false));
}

TEST(Tokenizer, UnterminatedStringPointsAtOpeningQuote) {
    try {
        Tokenizer t(R"([1, "abc])");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::unterminated_string);
        EXPECT_EQ(e.offset(), 4u);
    }
}

TEST(Tokenizer, BackslashBeforeEndOfInput) {
    try {
        Tokenizer t(R"("abc\)");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::unterminated_string);
        EXPECT_EQ(e.offset(), 0u);
    }
}
