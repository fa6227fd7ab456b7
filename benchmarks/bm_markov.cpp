#include <benchmark/benchmark.h>
#include <random>
#include <vector>
#include <cmath>
#include "MarkovModel.hpp"
#include "Accumulator.hpp"
#include "Generator.hpp"
#include "Predictor.hpp"

using Symbol = int;

static std::discrete_distribution<Symbol> make_zipf(size_t alphabet, double s) {
    std::vector<double> w(alphabet);
    for (size_t i=0;i<alphabet;++i) w[i] = 1.0/std::pow(double(i+1), s);
    return std::discrete_distribution<Symbol>(w.begin(), w.end());
}

static MarkovModel<Symbol> trained_model(size_t order, size_t alphabet, size_t sequences, size_t seq_len) {
    MarkovModel<Symbol> model(order);
    Accumulator<Symbol> acc(model);
    std::mt19937 rng(123);
    auto zipf = make_zipf(alphabet, 1.2);
    for (size_t i=0;i<sequences;++i) {
        for (size_t j=0;j<seq_len;++j) acc.add(zipf(rng));
        acc.end();
    }
    return model;
}

static void BM_Train_Zipf(benchmark::State& st) {
    size_t order = st.range(0), alphabet = st.range(1);
    MarkovModel<Symbol> model(order);
    Accumulator<Symbol> acc(model);
    std::mt19937 rng(123);
    auto zipf = make_zipf(alphabet, 1.2);

    size_t n=0;
    for (auto _ : st) {
        acc.add(zipf(rng));
        if (++n % 50 == 0) acc.end();
    }
    st.counters["contexts"] = model.num_contexts();
    st.counters["ops"] = n;
}
BENCHMARK(BM_Train_Zipf)->Args({1, 1000})->Args({2, 1000})->Args({3, 1000})->Unit(benchmark::kNanosecond);

static void BM_Predict_Zipf(benchmark::State& st) {
    size_t order = st.range(0), alphabet = st.range(1);
    const auto model = trained_model(order, alphabet, 10000, 50);
    Predictor<Symbol> pre(model);

    size_t ends=0;
    for (auto _ : st) {
        auto s = pre.next();
        if (!s) { ++ends; pre.end(); }
        benchmark::DoNotOptimize(s);
    }
    st.counters["ends"] = ends;
}
BENCHMARK(BM_Predict_Zipf)->Args({1, 1000})->Args({2, 1000})->Args({3, 1000})->Unit(benchmark::kNanosecond);

static void BM_Sample_Zipf(benchmark::State& st) {
    size_t order = st.range(0), alphabet = st.range(1);
    const auto model = trained_model(order, alphabet, 10000, 50);
    Generator<Symbol> gen(model, Generator<Symbol>::uniform_source(123));

    size_t ends=0;
    for (auto _ : st) {
        auto s = gen.next();
        if (!s) { ++ends; gen.end(); }
        benchmark::DoNotOptimize(s);
    }
    st.counters["ends"] = ends;
}
BENCHMARK(BM_Sample_Zipf)->Args({1, 1000})->Args({2, 1000})->Args({3, 1000})->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
