// bench/bench_daiji.cpp - Benchmarks for numeral normalization and daiji rendering.

#include <benchmark/benchmark.h>

#include <daiji/daijilib.hpp>

#include <cstddef>
#include <string>

namespace {

static std::string make_digits(std::size_t count) {
    std::string digits;
    digits.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        digits.push_back(static_cast<char>('1' + index % 9));
    }
    return digits;
}

static void BM_NormalizePlain(benchmark::State& state) {
    const std::string numeral = make_digits(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto value = daiji::io::normalize(numeral);
        benchmark::DoNotOptimize(value.integer_digits().data());
    }
}
BENCHMARK(BM_NormalizePlain)->Arg(8)->Arg(32)->Arg(68);

static void BM_NormalizeExponent(benchmark::State& state) {
    const std::string numeral = "1.2345E" + std::to_string(state.range(0));
    for (auto _ : state) {
        auto value = daiji::io::normalize(numeral);
        benchmark::DoNotOptimize(value.integer_digits().data());
    }
}
BENCHMARK(BM_NormalizeExponent)->Arg(4)->Arg(60)->Arg(1000);

static void BM_Render(benchmark::State& state) {
    const daiji::core::RenderOptions options = daiji::core::RenderOptions::defaults();
    const auto value = daiji::io::normalize(make_digits(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto text = daiji::core::render(value, options);
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_Render)->Arg(4)->Arg(16)->Arg(68);

static void BM_ConvertNumber(benchmark::State& state) {
    const daiji::Converter converter;
    for (auto _ : state) {
        auto text = converter.convert_number(123456789.25);
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_ConvertNumber);

} // namespace

BENCHMARK_MAIN();
