/// @file bench_vs_boost.cpp
/// @brief Head-to-head decode comparison: domjson vs Boost.JSON.
///
/// Every scenario uses identical input and has *_Owned, *_Borrowed and
/// *_BoostJson variants:
///   1. Decode small, medium, large
///   2. Decode int array, string array
///   3. Object key lookup (10, 100, 1000 keys)
///   4. Deep copy

#include <benchmark/benchmark.h>

#include <domjson/domjson.hpp>

#include <boost/json.hpp>

#include <string>

namespace testdata {

inline std::string small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

inline std::string medium_json() {
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

inline std::string large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

inline std::string int_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += std::to_string(i * 7 - 1000);
    }
    s += "]";
    return s;
}

inline std::string string_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += "\"string value number " + std::to_string(i) + " with padding\"";
    }
    s += "]";
    return s;
}

inline std::string flat_object(int keys) {
    std::string s = "{";
    for (int i = 0; i < keys; ++i) {
        if (i > 0) s += ",";
        s += "\"key_" + std::to_string(i) + "\":" + std::to_string(i);
    }
    s += "}";
    return s;
}

} // namespace testdata

// ═══════════════════════════════════════════════════════════════════════════════
// 1. DECODE DOCUMENTS
// ═══════════════════════════════════════════════════════════════════════════════

template <typename V>
static void BM_Decode_Domjson(benchmark::State& state, std::string input) {
    for (auto _ : state) {
        auto v = domjson::decode<V>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

static void BM_Decode_BoostJson(benchmark::State& state, std::string input) {
    for (auto _ : state) {
        auto v = boost::json::parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::OwnedValue>, Small_Owned, testdata::small_json());
BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::BorrowedValue>, Small_Borrowed, testdata::small_json());
BENCHMARK_CAPTURE(BM_Decode_BoostJson, Small_BoostJson, testdata::small_json());

BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::OwnedValue>, Medium_Owned, testdata::medium_json());
BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::BorrowedValue>, Medium_Borrowed, testdata::medium_json());
BENCHMARK_CAPTURE(BM_Decode_BoostJson, Medium_BoostJson, testdata::medium_json());

BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::OwnedValue>, Large_Owned, testdata::large_json());
BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::BorrowedValue>, Large_Borrowed, testdata::large_json());
BENCHMARK_CAPTURE(BM_Decode_BoostJson, Large_BoostJson, testdata::large_json());

// ═══════════════════════════════════════════════════════════════════════════════
// 2. DECODE ARRAYS
// ═══════════════════════════════════════════════════════════════════════════════

BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::OwnedValue>, IntArray_Owned, testdata::int_array(10000));
BENCHMARK_CAPTURE(BM_Decode_BoostJson, IntArray_BoostJson, testdata::int_array(10000));

BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::OwnedValue>, StringArray_Owned, testdata::string_array(1000));
BENCHMARK_CAPTURE(BM_Decode_Domjson<domjson::BorrowedValue>, StringArray_Borrowed, testdata::string_array(1000));
BENCHMARK_CAPTURE(BM_Decode_BoostJson, StringArray_BoostJson, testdata::string_array(1000));

// ═══════════════════════════════════════════════════════════════════════════════
// 3. OBJECT KEY LOOKUP
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ObjectLookup_Domjson(benchmark::State& state) {
    auto count = state.range(0);
    auto v = domjson::to_owned_value(testdata::flat_object(static_cast<int>(count)));

    int64_t idx = 0;
    for (auto _ : state) {
        auto* found = v.get("key_" + std::to_string(idx % count));
        benchmark::DoNotOptimize(found);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(count);
}
BENCHMARK(BM_ObjectLookup_Domjson)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ObjectLookup_BoostJson(benchmark::State& state) {
    auto count = state.range(0);
    auto obj = boost::json::parse(testdata::flat_object(static_cast<int>(count))).as_object();

    int64_t idx = 0;
    for (auto _ : state) {
        auto it = obj.find("key_" + std::to_string(idx % count));
        benchmark::DoNotOptimize(it);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(count);
}
BENCHMARK(BM_ObjectLookup_BoostJson)->Arg(10)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// 4. DEEP COPY
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DeepCopy_Domjson(benchmark::State& state) {
    auto v = domjson::to_owned_value(testdata::large_json());
    for (auto _ : state) {
        auto copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_DeepCopy_Domjson);

static void BM_DeepCopy_BoostJson(benchmark::State& state) {
    auto v = boost::json::parse(testdata::large_json());
    for (auto _ : state) {
        boost::json::value copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_DeepCopy_BoostJson);
