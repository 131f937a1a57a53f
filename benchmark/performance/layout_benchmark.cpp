/**
 * @file layout_benchmark.cpp
 * @brief Performance benchmarks for layout enumeration, composition and parsing
 */

#include <benchmark/benchmark.h>
#include <string>
#include <vector>

#include "layout-algebra/layout-algebra.hpp"

using namespace layout_algebra;

/**
 * @brief Benchmark fixture over a square column-major (n,n):(1,n) layout
 */
class LayoutBenchmark : public benchmark::Fixture {
public:
    void SetUp(const benchmark::State& state) override {
        n = state.range(0);
        shape = IntTuple{n, n};
        stride = IntTuple{1, n};
    }

    void TearDown(const benchmark::State&) override {}

protected:
    index_t n = 0;
    Shape shape;
    Stride stride;
};

/**
 * @brief Nested coordinate enumeration
 */
BENCHMARK_DEFINE_F(LayoutBenchmark, Coordinates)(benchmark::State& state) {
    for (auto _ : state) {
        std::vector<Coord> coords = coordinates(shape);
        benchmark::DoNotOptimize(coords);
    }
    state.SetItemsProcessed(state.iterations() * n * n);
}

/**
 * @brief Evaluation of every offset through the layout function
 */
BENCHMARK_DEFINE_F(LayoutBenchmark, Evaluate)(benchmark::State& state) {
    Layout layout(shape, stride);
    for (auto _ : state) {
        index_t sum = 0;
        for (index_t i = 0; i < layout.size(); ++i) {
            sum += layout(i);
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * n * n);
}

/**
 * @brief Composition with a (n/2,2):(2,1) tile
 */
BENCHMARK_DEFINE_F(LayoutBenchmark, Composition)(benchmark::State& state) {
    Layout outer(shape, stride);
    Layout inner(IntTuple{n / 2, 2}, IntTuple{2, 1});
    for (auto _ : state) {
        Layout result = composition(outer, inner);
        benchmark::DoNotOptimize(result);
    }
    state.counters["n"] = static_cast<double>(n);
}

/**
 * @brief Round trip through the text form
 */
BENCHMARK_DEFINE_F(LayoutBenchmark, ParseRoundTrip)(benchmark::State& state) {
    std::string text = layout_to_string(Layout(shape, stride));
    for (auto _ : state) {
        Layout parsed = parse_layout(text);
        benchmark::DoNotOptimize(parsed);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}

// Register benchmarks with different extents
BENCHMARK_REGISTER_F(LayoutBenchmark, Coordinates)
    ->Arg(16)
    ->Arg(64)
    ->Arg(256)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(LayoutBenchmark, Evaluate)
    ->Arg(16)
    ->Arg(64)
    ->Arg(256)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(LayoutBenchmark, Composition)
    ->Arg(16)
    ->Arg(256)
    ->Arg(4096)
    ->Unit(benchmark::kNanosecond);

BENCHMARK_REGISTER_F(LayoutBenchmark, ParseRoundTrip)
    ->Arg(16)
    ->Arg(4096)
    ->Unit(benchmark::kNanosecond);

/**
 * @brief Parsing of deeply nested layouts
 */
static void BM_ParseNested(benchmark::State& state) {
    int depth = static_cast<int>(state.range(0));
    std::string side = std::string(depth, '(') + "2" + std::string(depth, ')');
    std::string text = side + ":" + side;
    for (auto _ : state) {
        ParsedLayout parsed = parse_layout_string(text);
        benchmark::DoNotOptimize(parsed);
    }
}
BENCHMARK(BM_ParseNested)->Arg(4)->Arg(16)->Arg(64);

BENCHMARK_MAIN();
