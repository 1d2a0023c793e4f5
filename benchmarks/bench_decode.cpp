/// @file bench_decode.cpp
/// @brief Decode benchmarks: owned versus borrowed trees, object lookup,
/// equality.
///
/// Measured operations:
///   - Decoding (small, medium, large documents) into both representations
///   - Integer arrays and deep nesting
///   - Escape-heavy strings (where borrowing stops paying off)
///   - Object key lookup below and above the linear-scan threshold
///   - Deep equality

#include <domjson/domjson.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace domjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Medium document (~2KB).
static std::string generate_medium_json() {
    std::string s = R"({"users":[)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Large document (~200KB) with long strings.
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"description":"This is a detailed description for item )" +
             std::to_string(i) +
             R"( which contains enough text to be representative of real data.")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","tag)" + std::to_string(i % 5) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

static std::string generate_int_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += std::to_string(i);
    }
    s += "]";
    return s;
}

static std::string generate_deeply_nested(int depth) {
    std::string s;
    for (int i = 0; i < depth; ++i) {
        s += R"({"level":)" + std::to_string(i) + R"(,"child":)";
    }
    s += "null";
    for (int i = 0; i < depth; ++i) s += "}";
    return s;
}

static std::string generate_escaped_strings(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += R"("line\nbreak \"quoted\" été tab\there")";
    }
    s += "]";
    return s;
}

static std::string generate_object(int keys) {
    std::string s = "{";
    for (int i = 0; i < keys; ++i) {
        if (i > 0) s += ",";
        s += "\"key_" + std::to_string(i) + "\":" + std::to_string(i);
    }
    s += "}";
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Decoding benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

template <typename V>
static void BM_DecodeSmall(benchmark::State& state) {
    auto input = generate_small_json();
    for (auto _ : state) {
        auto v = decode<V>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK_TEMPLATE(BM_DecodeSmall, OwnedValue);
BENCHMARK_TEMPLATE(BM_DecodeSmall, BorrowedValue);

template <typename V>
static void BM_DecodeMedium(benchmark::State& state) {
    auto input = generate_medium_json();
    for (auto _ : state) {
        auto v = decode<V>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK_TEMPLATE(BM_DecodeMedium, OwnedValue);
BENCHMARK_TEMPLATE(BM_DecodeMedium, BorrowedValue);

template <typename V>
static void BM_DecodeLarge(benchmark::State& state) {
    auto input = generate_large_json();
    for (auto _ : state) {
        auto v = decode<V>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK_TEMPLATE(BM_DecodeLarge, OwnedValue);
BENCHMARK_TEMPLATE(BM_DecodeLarge, BorrowedValue);

template <typename V>
static void BM_DecodeIntArray(benchmark::State& state) {
    auto input = generate_int_array(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = decode<V>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK_TEMPLATE(BM_DecodeIntArray, OwnedValue)->Arg(100)->Arg(1000)->Arg(10000);
BENCHMARK_TEMPLATE(BM_DecodeIntArray, BorrowedValue)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_DecodeDeeplyNested(benchmark::State& state) {
    auto input = generate_deeply_nested(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = to_owned_value(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeDeeplyNested)->Arg(10)->Arg(50)->Arg(200);

template <typename V>
static void BM_DecodeEscapedStrings(benchmark::State& state) {
    auto input = generate_escaped_strings(500);
    for (auto _ : state) {
        auto v = decode<V>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK_TEMPLATE(BM_DecodeEscapedStrings, OwnedValue);
BENCHMARK_TEMPLATE(BM_DecodeEscapedStrings, BorrowedValue);

static void BM_BorrowedDocumentParse(benchmark::State& state) {
    auto input = generate_large_json();
    BorrowedDocument doc;
    for (auto _ : state) {
        doc.parse(input);
        benchmark::DoNotOptimize(doc.root());
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_BorrowedDocumentParse);

static void BM_TryDecodeError(benchmark::State& state) {
    std::string input = generate_medium_json();
    input.back() = ',';
    for (auto _ : state) {
        auto r = try_decode<OwnedValue>(input);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_TryDecodeError);

// ═══════════════════════════════════════════════════════════════════════════════
// Access benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ObjectLookup(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto v = to_owned_value(generate_object(n));
    std::string key = "key_" + std::to_string(n / 2);
    for (auto _ : state) {
        auto* found = v.get(key);
        benchmark::DoNotOptimize(found);
    }
}
BENCHMARK(BM_ObjectLookup)->Arg(5)->Arg(15)->Arg(17)->Arg(100)->Arg(1000);

static void BM_ObjectLookupMissing(benchmark::State& state) {
    auto v = to_owned_value(generate_object(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto* found = v.get("absent");
        benchmark::DoNotOptimize(found);
    }
}
BENCHMARK(BM_ObjectLookupMissing)->Arg(5)->Arg(100);

static void BM_BuildObject(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto obj = OwnedValue::object();
        for (int i = 0; i < n; ++i) {
            obj.insert("key_" + std::to_string(i), i);
        }
        benchmark::DoNotOptimize(obj);
    }
}
BENCHMARK(BM_BuildObject)->Arg(10)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Equality and copies
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EqualityOwned(benchmark::State& state) {
    auto a = to_owned_value(generate_large_json());
    auto b = a;
    for (auto _ : state) {
        bool eq = a == b;
        benchmark::DoNotOptimize(eq);
    }
}
BENCHMARK(BM_EqualityOwned);

static void BM_EqualityAcrossRepresentations(benchmark::State& state) {
    auto input = generate_large_json();
    auto a = to_owned_value(input);
    auto b = to_borrowed_value(input);
    for (auto _ : state) {
        bool eq = a == b;
        benchmark::DoNotOptimize(eq);
    }
}
BENCHMARK(BM_EqualityAcrossRepresentations);

static void BM_CopyLarge(benchmark::State& state) {
    auto v = to_owned_value(generate_large_json());
    for (auto _ : state) {
        auto copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_CopyLarge);
