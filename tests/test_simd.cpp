/// @file test_simd.cpp
/// @brief Tests for the scanning helpers (SSE2/AVX2/NEON or scalar) and for
/// the tokenizer paths that depend on them at 16- and 32-byte block edges.
///
/// Configure with -DDOMJSON_ENABLE_SIMD=ON (and -march=native for AVX2) to
/// exercise the vector paths; otherwise the scalar path is tested.

#include <gtest/gtest.h>
#include <domjson/domjson.hpp>
#include <domjson/detail/simd.hpp>
#include <domjson/detail/tokenizer.hpp>

#include <iostream>
#include <string>

namespace simd = domjson::detail::simd;
using domjson::ParseError;
using domjson::errc;
using domjson::detail::Tokenizer;

namespace {

// Offsets around every block boundary the vector paths can cross.
constexpr size_t kEdges[] = {0, 1, 14, 15, 16, 17, 30, 31, 32, 33, 47, 48, 63, 64, 65};

const char* scan(const std::string& s, size_t from = 0) {
    return simd::find_string_delimiter(s.data() + from, s.data() + s.size());
}

} // namespace

TEST(SimdDetection, ReportActivePath) {
#if defined(DOMJSON_AVX2)
    const char* path = "AVX2";
#elif defined(DOMJSON_SSE2)
    const char* path = "SSE2";
#elif defined(DOMJSON_NEON)
    const char* path = "NEON";
#else
    const char* path = "scalar";
#endif
    std::cout << "[   INFO   ] scanning helpers: " << path << std::endl;
    SUCCEED();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers over a range of lengths
// ═══════════════════════════════════════════════════════════════════════════════

class ScanLengthTest : public ::testing::TestWithParam<size_t> {};

TEST_P(ScanLengthTest, WhitespaceStopsAtFirstOtherByte) {
    const size_t n = GetParam();
    const char ws[] = {' ', '\t', '\n', '\r'};
    std::string s;
    for (size_t i = 0; i < n; ++i) s += ws[i % 4];
    EXPECT_EQ(simd::skip_whitespace(s.data(), s.data() + s.size()), s.data() + n);

    // Vertical tab and form feed are not JSON whitespace.
    for (char stop : {'\v', '\f', '"', '{'}) {
        std::string t = s + stop + "   ";
        EXPECT_EQ(simd::skip_whitespace(t.data(), t.data() + t.size()), t.data() + n)
            << "n=" << n << " stop=" << static_cast<int>(stop);
    }
}

TEST_P(ScanLengthTest, DelimiterFoundAtEveryEdgeWithinLength) {
    const size_t n = GetParam();
    for (size_t pos : kEdges) {
        if (pos >= n) break;
        for (char delim : {'"', '\\'}) {
            std::string s(n, '\xE2');  // UTF-8 lead bytes must not match
            s[pos] = delim;
            EXPECT_EQ(scan(s), s.data() + pos) << "n=" << n << " pos=" << pos;
        }
    }
}

TEST_P(ScanLengthTest, NoDelimiterReturnsEnd) {
    const std::string s(GetParam(), 'c');
    EXPECT_EQ(scan(s), s.data() + s.size());
}

TEST_P(ScanLengthTest, ScanResumesMidBlock) {
    const size_t n = GetParam();
    if (n < 3) return;
    std::string s(n, 'r');
    s[0] = '\\';
    s[n - 1] = '"';
    // The tokenizer restarts two bytes after a backslash.
    EXPECT_EQ(scan(s, 2), s.data() + n - 1);
}

INSTANTIATE_TEST_SUITE_P(
    Lengths, ScanLengthTest,
    ::testing::Values(0, 1, 15, 16, 17, 31, 32, 33, 64, 65, 255, 1024));

// ═══════════════════════════════════════════════════════════════════════════════
// Tokenizer string tokens at block edges
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SimdTokenizer, EscapeAtBlockEdge) {
    for (size_t edge : kEdges) {
        const std::string json =
            "\"" + std::string(edge, 'x') + "\\n" + std::string(20, 'y') + "\"";
        auto v = domjson::to_borrowed_value(json);
        EXPECT_FALSE(v.is_borrowed_str()) << "edge=" << edge;
        EXPECT_EQ(v.as_str(), std::string(edge, 'x') + "\n" + std::string(20, 'y'))
            << "edge=" << edge;
    }
}

TEST(SimdTokenizer, EscapedQuoteAtBlockEdgeDoesNotCloseString) {
    for (size_t edge : kEdges) {
        // The backslash sits at edge - 1 so the escaped quote lands on edge.
        if (edge == 0) continue;
        const std::string body = std::string(edge - 1, 'q') + "\\\"" + "tail";
        const std::string json = "[\"" + body + "\",2]";
        Tokenizer t(json);
        EXPECT_EQ(t.token_count(), 5u) << "edge=" << edge;
        t.next();
        EXPECT_EQ(t.next(), '"');
        EXPECT_EQ(t.parse_str(), std::string(edge - 1, 'q') + "\"tail") << "edge=" << edge;
    }
}

TEST(SimdTokenizer, EscapedBackslashBeforeClosingQuote) {
    for (size_t edge : kEdges) {
        const std::string json = "[\"" + std::string(edge, 'b') + "\\\\\",1]";
        auto v = domjson::to_owned_value(json);
        ASSERT_EQ(v.size(), 2u) << "edge=" << edge;
        EXPECT_EQ(v.get_idx(0)->as_str(), std::string(edge, 'b') + "\\");
        EXPECT_TRUE(*v.get_idx(1) == 1);
    }
}

TEST(SimdTokenizer, StructuralBytesInsideLongStrings) {
    for (size_t edge : {15, 16, 31, 32, 63, 64}) {
        std::string body(edge + 8, 's');
        body[edge - 1] = ',';
        body[edge] = ']';
        body[edge + 1] = '{';
        const std::string json = "[\"" + body + "\",{\"k\":\"" + body + "\"}]";
        Tokenizer t(json);
        // [ "..." , { "k" : "..." } ]
        EXPECT_EQ(t.token_count(), 9u) << "edge=" << edge;
        auto v = domjson::to_borrowed_value(json);
        EXPECT_TRUE(*v.get_idx(0) == body);
        EXPECT_TRUE(*v.get_idx(1)->get("k") == body);
        EXPECT_TRUE(v.get_idx(0)->is_borrowed_str());
    }
}

TEST(SimdTokenizer, LongStringsStayBorrowed) {
    for (size_t len : {0, 15, 16, 31, 32, 64, 100, 1024}) {
        const std::string payload(len, 'A');
        const std::string json = "\"" + payload + "\"";
        auto v = domjson::to_borrowed_value(json);
        EXPECT_EQ(v.as_str(), payload) << "len=" << len;
        EXPECT_TRUE(v.is_borrowed_str()) << "len=" << len;
    }
}

TEST(SimdTokenizer, TrailingBackslashAtBlockEdgeIsUnterminated) {
    for (size_t edge : kEdges) {
        const std::string json = "[1,\"" + std::string(edge, 'a') + "\\";
        try {
            Tokenizer t(json);
            ADD_FAILURE() << "accepted edge=" << edge;
        } catch (const ParseError& e) {
            EXPECT_EQ(e.code(), errc::unterminated_string) << "edge=" << edge;
            EXPECT_EQ(e.offset(), 3u) << "edge=" << edge;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Whitespace between tokens
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SimdTokenizer, WhitespaceRunsBetweenTokens) {
    for (size_t len : kEdges) {
        const std::string ws(len, ' ');
        const std::string json = ws + "{" + ws + "\"k\"" + ws + ":" + ws + "[1," + ws +
                                 "2]" + ws + "}" + ws;
        auto v = domjson::to_owned_value(json);
        ASSERT_TRUE(v.is_object()) << "len=" << len;
        EXPECT_EQ(v.size(), 1u);
        EXPECT_EQ(v.get("k")->size(), 2u);
    }
}

TEST(SimdTokenizer, ErrorOffsetAfterLongWhitespace) {
    for (size_t len : {16, 32, 64}) {
        const std::string json = "[1," + std::string(len, '\n') + "]";
        try {
            (void)domjson::to_owned_value(json);
            ADD_FAILURE() << "accepted len=" << len;
        } catch (const ParseError& e) {
            EXPECT_EQ(e.code(), errc::unexpected_character);
            EXPECT_EQ(e.offset(), 3 + len);
            EXPECT_EQ(e.location().line, 1 + len);
            EXPECT_EQ(e.location().column, 1u);
        }
    }
}
