/// @file bench_encode.cpp
/// @brief Encode benchmarks: building trees from native types through the
/// visitor protocol.

#include <domjson/domjson.hpp>

#include <benchmark/benchmark.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace domjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Native types
// ═══════════════════════════════════════════════════════════════════════════════

namespace bench {

struct SmallStruct {
    std::string name;
    int age = 0;
    bool active = false;
    double score = 0.0;
};
DOMJSON_SERIALIZE_STRUCT(SmallStruct, name, age, active, score)

struct Item {
    int64_t id = 0;
    std::string title;
    std::vector<std::string> tags;
    std::optional<double> price;
    std::map<std::string, int> counters;
};
DOMJSON_SERIALIZE_STRUCT(Item, id, title, tags, price, counters)

static SmallStruct make_small(int i) {
    return {"user_" + std::to_string(i), 20 + i % 50, i % 2 == 0, 50.0 + i * 0.5};
}

static Item make_item(int i) {
    Item it;
    it.id = i;
    it.title = "Item " + std::to_string(i) + " with a longer title";
    it.tags = {"tag" + std::to_string(i % 10), "common"};
    if (i % 3 != 0) it.price = 9.99 + i * 0.1;
    it.counters = {{"views", i * 7}, {"likes", i % 13}};
    return it;
}

} // namespace bench

// ═══════════════════════════════════════════════════════════════════════════════
// Encoding benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EncodeSmallStruct(benchmark::State& state) {
    auto s = bench::make_small(1);
    for (auto _ : state) {
        auto v = to_value(s);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_EncodeSmallStruct);

static void BM_EncodeVectorOfStructs(benchmark::State& state) {
    std::vector<bench::Item> items;
    for (int i = 0; i < state.range(0); ++i) items.push_back(bench::make_item(i));
    for (auto _ : state) {
        auto v = to_value(items);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeVectorOfStructs)->Arg(10)->Arg(100)->Arg(1000);

static void BM_EncodeIntVector(benchmark::State& state) {
    std::vector<int64_t> ints(static_cast<size_t>(state.range(0)));
    for (size_t i = 0; i < ints.size(); ++i) ints[i] = static_cast<int64_t>(i);
    for (auto _ : state) {
        auto v = to_value(ints);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeIntVector)->Arg(100)->Arg(10000);

static void BM_EncodeStringMap(benchmark::State& state) {
    std::map<std::string, std::string> m;
    for (int i = 0; i < state.range(0); ++i) {
        m["key_" + std::to_string(i)] = "value_" + std::to_string(i);
    }
    for (auto _ : state) {
        auto v = to_value(m);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeStringMap)->Arg(10)->Arg(100)->Arg(1000);

static void BM_TryEncodeBadKey(benchmark::State& state) {
    std::map<int, int> m{{1, 1}, {2, 2}};
    for (auto _ : state) {
        auto r = try_to_value(m);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_TryEncodeBadKey);

// ═══════════════════════════════════════════════════════════════════════════════
// Tree to tree
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_BorrowedToOwned(benchmark::State& state) {
    std::string input = "[";
    for (int i = 0; i < 500; ++i) {
        if (i > 0) input += ",";
        input += R"({"id":)" + std::to_string(i) + R"(,"name":"entry )" +
                 std::to_string(i) + R"(","ok":true})";
    }
    input += "]";
    auto borrowed = to_borrowed_value(input);
    for (auto _ : state) {
        auto owned = to_value(borrowed);
        benchmark::DoNotOptimize(owned);
    }
}
BENCHMARK(BM_BorrowedToOwned);
