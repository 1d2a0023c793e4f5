/// @file test_decoder.cpp
/// @brief Unit tests for the decode engine: both representations, zero-copy
/// strings, duplicate keys, depth limits and error reporting.

#include <domjson/domjson.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace domjson;

namespace {

/// Decode expecting failure; returns the ParseError.
template <typename V = OwnedValue>
ParseError decode_error(std::string_view input, const DecodeOptions& opts = {}) {
    try {
        (void)decode<V>(input, opts);
    } catch (const ParseError& e) {
        return e;
    }
    ADD_FAILURE() << "expected a ParseError for: " << input;
    return ParseError("none", SourceLocation{}, errc::unexpected_character);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Shapes, for both representations
// ═══════════════════════════════════════════════════════════════════════════════

template <typename V>
class DecodeTest : public ::testing::Test {};

using ValueTypes = ::testing::Types<OwnedValue, BorrowedValue>;
TYPED_TEST_SUITE(DecodeTest, ValueTypes);

TYPED_TEST(DecodeTest, Scalars) {
    EXPECT_TRUE(decode<TypeParam>("null").is_null());
    EXPECT_TRUE(decode<TypeParam>("true") == true);
    EXPECT_TRUE(decode<TypeParam>("false") == false);
    EXPECT_TRUE(decode<TypeParam>("42") == 42);
    EXPECT_TRUE(decode<TypeParam>("-7") == -7);
    EXPECT_TRUE(decode<TypeParam>("2.5") == 2.5);
    EXPECT_TRUE(decode<TypeParam>("\"str\"") == "str");
}

TYPED_TEST(DecodeTest, SurroundingWhitespace) {
    EXPECT_TRUE(decode<TypeParam>(" \t\r\n 1 \n") == 1);
    EXPECT_TRUE(decode<TypeParam>("\n[ 1 , 2 ]\n").size() == 2);
}

TYPED_TEST(DecodeTest, NestedStructure) {
    auto v = decode<TypeParam>(R"({"a":[1,{"b":null}],"c":"d","e":{}})");
    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v.size(), 3u);
    const auto* a = v.get("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->is_array());
    EXPECT_TRUE(*a->get_idx(0) == 1);
    EXPECT_TRUE(a->get_idx(1)->get("b")->is_null());
    EXPECT_TRUE(*v.get("c") == "d");
    EXPECT_TRUE(v.get("e")->is_object());
    EXPECT_EQ(v.get("e")->size(), 0u);
}

TYPED_TEST(DecodeTest, ObjectsInsideArrays) {
    auto v = decode<TypeParam>(R"([{"k":"v"},{"a":{"b":[{"c":1}]}},{}])");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v.get_idx(0)->size(), 1u);
    EXPECT_TRUE(*v.get_idx(0)->get("k") == "v");
    const auto* b = v.get_idx(1)->get("a")->get("b");
    ASSERT_NE(b, nullptr);
    ASSERT_EQ(b->size(), 1u);
    EXPECT_TRUE(*b->get_idx(0)->get("c") == 1);
    EXPECT_EQ(v.get_idx(2)->size(), 0u);
}

TYPED_TEST(DecodeTest, EmptyContainers) {
    EXPECT_TRUE(decode<TypeParam>("[]") == TypeParam::array());
    EXPECT_TRUE(decode<TypeParam>("{}") == TypeParam::object());
    EXPECT_TRUE(decode<TypeParam>("[[],{}]").get_idx(0)->is_array());
    EXPECT_TRUE(decode<TypeParam>("[ ]").size() == 0);
}

TYPED_TEST(DecodeTest, ArrayCapacityMatchesCount) {
    auto v = decode<TypeParam>("[1,2,3,4,5,6,7]");
    const auto* arr = v.as_array();
    ASSERT_NE(arr, nullptr);
    EXPECT_EQ(arr->size(), 7u);
    EXPECT_EQ(arr->capacity(), 7u);
}

TYPED_TEST(DecodeTest, DuplicateKeysLastWins) {
    auto v = decode<TypeParam>(R"({"a":1,"b":2,"a":3})");
    EXPECT_EQ(v.size(), 2u);
    EXPECT_TRUE(*v.get("a") == 3);
    EXPECT_TRUE(*v.get("b") == 2);
}

TYPED_TEST(DecodeTest, DuplicateKeysLastWinsInLargeObject) {
    std::string input = "{";
    for (int i = 0; i < 40; ++i) input += "\"k" + std::to_string(i) + "\":" + std::to_string(i) + ",";
    input += R"("k5":"dup","k39":"dup2"})";
    auto v = decode<TypeParam>(input);
    EXPECT_EQ(v.size(), 40u);
    EXPECT_TRUE(*v.get("k5") == "dup");
    EXPECT_TRUE(*v.get("k39") == "dup2");
    EXPECT_TRUE(*v.get("k0") == 0);
}

TYPED_TEST(DecodeTest, EscapedStrings) {
    auto v = decode<TypeParam>(R"(["a\nb","\u00e9","\ud83d\ude00","\"\\\/"])");
    EXPECT_TRUE(*v.get_idx(0) == "a\nb");
    EXPECT_TRUE(*v.get_idx(1) == "\xC3\xA9");
    EXPECT_TRUE(*v.get_idx(2) == "\xF0\x9F\x98\x80");
    EXPECT_TRUE(*v.get_idx(3) == "\"\\/");
}

TYPED_TEST(DecodeTest, EscapedKeys) {
    auto v = decode<TypeParam>(R"({"a\tb":1})");
    EXPECT_TRUE(*v.get("a\tb") == 1);
}

TYPED_TEST(DecodeTest, DepthLimit) {
    DecodeOptions opts;
    opts.max_depth = 2;
    EXPECT_NO_THROW((void)decode<TypeParam>("[[1]]", opts));
    EXPECT_NO_THROW((void)decode<TypeParam>("[{}]", opts));
    auto e = decode_error<TypeParam>("[[[1]]]", opts);
    EXPECT_EQ(e.code(), errc::max_depth_exceeded);
    EXPECT_EQ(e.offset(), 2u);
}

TYPED_TEST(DecodeTest, EmptyContainersCountTowardDepth) {
    DecodeOptions opts;
    opts.max_depth = 1;
    EXPECT_NO_THROW((void)decode<TypeParam>("[]", opts));
    EXPECT_EQ(decode_error<TypeParam>("[[]]", opts).code(), errc::max_depth_exceeded);
    EXPECT_EQ(decode_error<TypeParam>(R"({"a":{}})", opts).code(), errc::max_depth_exceeded);
}

TYPED_TEST(DecodeTest, DefaultDepthLimit) {
    const std::string ok = std::string(DOMJSON_MAX_DEPTH, '[') + std::string(DOMJSON_MAX_DEPTH, ']');
    EXPECT_NO_THROW((void)decode<TypeParam>(ok));
    const std::string deep = std::string(DOMJSON_MAX_DEPTH + 1, '[') +
                             std::string(DOMJSON_MAX_DEPTH + 1, ']');
    EXPECT_EQ(decode_error<TypeParam>(deep).code(), errc::max_depth_exceeded);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Numbers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeNumbers, IntegerBoundaries) {
    EXPECT_EQ(to_owned_value("9223372036854775807").as_i64(), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(to_owned_value("-9223372036854775808").as_i64(), std::numeric_limits<int64_t>::min());
}

TEST(DecodeNumbers, OutOfRangeIntegersBecomeFloat) {
    auto v = to_owned_value("9223372036854775808");
    ASSERT_TRUE(v.is_f64());
    EXPECT_DOUBLE_EQ(*v.as_f64(), 9223372036854775808.0);

    auto u = to_owned_value("18446744073709551615");
    ASSERT_TRUE(u.is_f64());
    EXPECT_DOUBLE_EQ(*u.as_f64(), 18446744073709551615.0);

    auto n = to_owned_value("-9223372036854775809");
    ASSERT_TRUE(n.is_f64());
    EXPECT_LT(*n.as_f64(), 0.0);
}

TEST(DecodeNumbers, Floats) {
    EXPECT_EQ(to_owned_value("0.1").as_f64(), 0.1);
    EXPECT_EQ(to_owned_value("1e2").as_f64(), 100.0);
    EXPECT_EQ(to_owned_value("1E+2").as_f64(), 100.0);
    EXPECT_EQ(to_owned_value("-1.5e-3").as_f64(), -1.5e-3);
    EXPECT_EQ(to_owned_value("123456789.123456789e10").as_f64(), 123456789.123456789e10);
    EXPECT_EQ(to_owned_value("1.7976931348623157e308").as_f64(), 1.7976931348623157e308);
}

TEST(DecodeNumbers, NegativeZero) {
    auto i = to_owned_value("-0");
    EXPECT_EQ(i.as_i64(), 0);
    auto f = to_owned_value("-0.0");
    ASSERT_TRUE(f.is_f64());
    EXPECT_TRUE(std::signbit(*f.as_f64()));
}

TEST(DecodeNumbers, UnderflowRoundsToZero) {
    auto v = to_owned_value("1e-400");
    ASSERT_TRUE(v.is_f64());
    EXPECT_EQ(*v.as_f64(), 0.0);
}

TEST(DecodeNumbers, OverflowIsInvalid) {
    EXPECT_EQ(decode_error("1e400").code(), errc::invalid_number);
    EXPECT_EQ(decode_error("[-1e400]").code(), errc::invalid_number);
}

TEST(DecodeNumbers, GrammarErrors) {
    for (const char* bad : {"01", "-", "1.", ".5", "1e", "1e+", "+1", "-a", "1.2.3", "0x10"}) {
        const errc code = static_cast<errc>(decode_error(bad).code().value());
        EXPECT_TRUE(code == errc::invalid_number || code == errc::unexpected_character)
            << bad << ": " << decode_error(bad).what();
    }
    EXPECT_EQ(decode_error("[01]").code(), errc::invalid_number);
    EXPECT_EQ(decode_error("[1.]").offset(), 1u);
    EXPECT_EQ(decode_error("-").code(), errc::invalid_number);
}

TEST(DecodeNumbers, NestedNumberTerminators) {
    auto v = to_owned_value("[1,-2,3.5 ,4\n]");
    EXPECT_EQ(v.size(), 4u);
    EXPECT_TRUE(*v.get_idx(3) == 4);
    auto o = to_owned_value(R"({"n":-1})");
    EXPECT_TRUE(*o.get("n") == -1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Zero-copy
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeBorrowed, StringsViewTheInput) {
    const std::string input = R"({"key":"value","esc":"a\"b"})";
    auto v = to_borrowed_value(input);

    const auto* value = v.get("key");
    ASSERT_NE(value, nullptr);
    EXPECT_TRUE(value->is_borrowed_str());
    const char* data = value->as_str()->data();
    EXPECT_GE(data, input.data());
    EXPECT_LT(data, input.data() + input.size());

    const auto* escaped = v.get("esc");
    ASSERT_NE(escaped, nullptr);
    EXPECT_FALSE(escaped->is_borrowed_str());
    EXPECT_TRUE(*escaped == "a\"b");
}

TEST(DecodeBorrowed, KeysViewTheInput) {
    const std::string input = R"({"plain":1,"esc\n":2})";
    auto v = to_borrowed_value(input);
    const auto& entries = v.as_object()->storage();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].first.is_borrowed());
    EXPECT_FALSE(entries[1].first.is_borrowed());
    EXPECT_EQ(entries[1].first.view(), "esc\n");
}

TEST(DecodeBorrowed, InputIsNotModified) {
    const std::string input = R"(["a\u0041",{"k\n":"v"}])";
    const std::string copy = input;
    (void)to_borrowed_value(input);
    (void)to_owned_value(input);
    EXPECT_EQ(input, copy);
}

TEST(DecodeBorrowed, OwnedAndBorrowedDecodeEqual) {
    const std::string input = R"({"a":[1,2.5,"x\ty",null,true],"b":{"c":"d"}})";
    EXPECT_TRUE(to_owned_value(input) == to_borrowed_value(input));
}

TEST(BorrowedDocument, KeepsBufferAlive) {
    BorrowedDocument doc;
    {
        std::string input = R"({"name":"document","n":3})";
        doc.parse(std::move(input));
    }
    EXPECT_TRUE(*doc.root().get("name") == "document");
    EXPECT_TRUE(doc.root().get("name")->is_borrowed_str());
    EXPECT_EQ(doc.buffer(), R"({"name":"document","n":3})");

    BorrowedDocument copy = doc;
    doc.reset();
    EXPECT_TRUE(doc.root().is_null());
    EXPECT_TRUE(doc.buffer().empty());
    EXPECT_TRUE(*copy.root().get("name") == "document");
}

TEST(BorrowedDocument, FailedParseLeavesDocumentUnchanged) {
    BorrowedDocument doc;
    doc.parse("[1,2,3]");
    EXPECT_THROW(doc.parse("[1,2"), ParseError);
    EXPECT_EQ(doc.root().size(), 3u);

    const std::error_code ec = doc.try_parse("{");
    EXPECT_EQ(ec, errc::unterminated_object);
    EXPECT_EQ(doc.root().size(), 3u);

    EXPECT_FALSE(doc.try_parse(R"({"x":1})"));
    EXPECT_TRUE(doc.root().is_object());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeErrors, CodesAndOffsets) {
    struct Case {
        const char* input;
        errc code;
        size_t offset;
    };
    const Case cases[] = {
        {"",            errc::unexpected_end_of_input, 0},
        {"   ",         errc::unexpected_end_of_input, 3},
        {"[1,2",        errc::unterminated_array,      4},
        {R"({"a":1)",   errc::unterminated_object,     6},
        {R"("abc)",     errc::unterminated_string,     0},
        {R"(["ok","x)", errc::unterminated_string,     6},
        {"[1,]",        errc::unexpected_character,    3},
        {"[1 2]",       errc::unexpected_character,    3},
        {R"({"a" 1})",  errc::unexpected_character,    5},
        {R"({1:2})",    errc::unexpected_character,    1},
        {"]",           errc::unexpected_character,    0},
        {"@",           errc::unexpected_character,    0},
        {"[1,@]",       errc::unexpected_character,    3},
        {"[1] x",       errc::trailing_content,        4},
        {"1 2",         errc::trailing_content,        2},
        {"tru",         errc::invalid_literal,         0},
        {"[nulll]",     errc::invalid_literal,         1},
        {R"("\x")",     errc::invalid_escape,          1},
        {R"("\ud800")", errc::invalid_unicode_escape,  1},
        {R"("\udc00")", errc::invalid_unicode_escape,  1},
    };
    for (const auto& c : cases) {
        auto e = decode_error(c.input);
        EXPECT_EQ(e.code(), c.code) << "input: " << c.input << " -> " << e.what();
        EXPECT_EQ(e.offset(), c.offset) << "input: " << c.input;
    }
}

TEST(DecodeErrors, BadHexDigit) {
    EXPECT_EQ(decode_error(R"("\u12G4")").code(), errc::invalid_unicode_escape);
    EXPECT_EQ(decode_error(R"("\u12")").code(), errc::invalid_unicode_escape);
}

TEST(DecodeErrors, LineAndColumn) {
    auto e = decode_error("[1,\n  x]");
    EXPECT_EQ(e.code(), errc::unexpected_character);
    EXPECT_EQ(e.location().line, 2u);
    EXPECT_EQ(e.location().column, 3u);
    EXPECT_EQ(e.offset(), 6u);
    EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
}

TEST(DecodeErrors, SameErrorForBothRepresentations) {
    for (const char* bad : {"[1,", "{\"a\":}", "\"\\q\"", "[[[]"}) {
        auto owned = decode_error<OwnedValue>(bad);
        auto borrowed = decode_error<BorrowedValue>(bad);
        EXPECT_EQ(owned.code(), borrowed.code()) << bad;
        EXPECT_EQ(owned.offset(), borrowed.offset()) << bad;
    }
}

TEST(DecodeErrors, TryDecode) {
    auto ok = try_decode<OwnedValue>("[1]");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value.size(), 1u);

    auto bad = try_decode<BorrowedValue>("[1");
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.ec, errc::unterminated_array);
    EXPECT_TRUE(bad.value.is_null());
}
