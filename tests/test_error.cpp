/// @file test_error.cpp
/// @brief Unit tests for the error category, exception types, result<T>
/// and CowString.

#include <domjson/domjson.hpp>

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <system_error>

using namespace domjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Error category
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ErrorCategory, NameAndMessages) {
    EXPECT_STREQ(domjson_category().name(), "domjson");
    EXPECT_EQ(make_error_code(errc::invalid_number).message(), "invalid number");
    EXPECT_EQ(make_error_code(errc::key_must_be_a_string).message(), "map key must be a string");
    EXPECT_EQ(make_error_code(errc::not_an_array).message(), "value is not an array");
}

TEST(ErrorCategory, CodesConvertImplicitly) {
    std::error_code ec = errc::unterminated_array;
    EXPECT_EQ(ec.category(), domjson_category());
    EXPECT_EQ(ec, errc::unterminated_array);
    EXPECT_NE(ec, errc::unterminated_object);
}

TEST(ErrorCategory, CodeRanges) {
    EXPECT_LT(static_cast<int>(errc::invalid_literal), 50);
    EXPECT_EQ(static_cast<int>(errc::not_an_object), 50);
    EXPECT_EQ(static_cast<int>(errc::not_an_array), 51);
    EXPECT_EQ(static_cast<int>(errc::key_must_be_a_string), 80);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Exceptions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Exceptions, ParseErrorCarriesLocation) {
    try {
        (void)to_owned_value("{\n  \"a\": tru\n}");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errc::invalid_literal);
        EXPECT_EQ(e.location().line, 2u);
        EXPECT_EQ(e.location().column, 8u);
        EXPECT_EQ(e.offset(), 9u);
        const std::string what = e.what();
        EXPECT_NE(what.find("line 2, column 8"), std::string::npos) << what;
        EXPECT_NE(what.find("invalid literal"), std::string::npos) << what;
    }
}

TEST(Exceptions, UnexpectedCharacterNamesTheByte) {
    try {
        (void)to_owned_value("[1 2]");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("'2'"), std::string::npos) << what;
    }
}

TEST(Exceptions, AllAreSystemErrors) {
    EXPECT_THROW((void)to_owned_value("["), std::system_error);
    EXPECT_THROW(OwnedValue(1).push(2), std::system_error);
    EXPECT_THROW((void)to_value(std::map<int, int>{{1, 1}}), std::system_error);
}

TEST(Exceptions, EncodeErrorWithMessage) {
    EncodeError e(errc::max_depth_exceeded, "too deep");
    EXPECT_EQ(e.code(), errc::max_depth_exceeded);
    EXPECT_NE(std::string(e.what()).find("too deep"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// result<T>
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Result, BoolConversion) {
    result<int> ok{1, {}};
    EXPECT_TRUE(ok);
    EXPECT_TRUE(ok.has_value());

    result<int> bad{0, make_error_code(errc::invalid_number)};
    EXPECT_FALSE(bad);
    EXPECT_FALSE(bad.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// CowString
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CowStringTest, BorrowedReferencesSource) {
    const std::string src = "source";
    CowString s = CowString::borrowed(src);
    EXPECT_TRUE(s.is_borrowed());
    EXPECT_EQ(s.data(), src.data());
    EXPECT_EQ(s.size(), 6u);
    EXPECT_EQ(s, "source");
}

TEST(CowStringTest, MakeOwnedDetaches) {
    std::string src = "detach";
    CowString s = CowString::borrowed(src);
    s.make_owned();
    EXPECT_TRUE(s.is_owned());
    src[0] = 'X';
    EXPECT_EQ(s, "detach");
}

TEST(CowStringTest, IntoString) {
    EXPECT_EQ(CowString::owned("own").into_string(), "own");
    const std::string src = "view";
    EXPECT_EQ(CowString::borrowed(src).into_string(), "view");
}

TEST(CowStringTest, ConstructorsCopy) {
    std::string src = "copied";
    CowString s(src);
    CowString v{std::string_view(src)};
    CowString c("literal");
    EXPECT_TRUE(s.is_owned());
    EXPECT_TRUE(v.is_owned());
    EXPECT_TRUE(c.is_owned());
    EXPECT_NE(v.data(), src.data());
}

TEST(CowStringTest, ComparisonIgnoresOwnership) {
    const std::string src = "same";
    EXPECT_EQ(CowString::borrowed(src), CowString::owned("same"));
    EXPECT_TRUE(CowString::borrowed("a") < CowString::owned("b"));
    EXPECT_TRUE(CowString().empty());
}
