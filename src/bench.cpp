#include <iostream>
#include <random>
#include <chrono>
#include <vector>
#include <string>
#include <algorithm>
#include <cmath> // std::pow

#include "MarkovModel.hpp"
#include "Accumulator.hpp"
#include "Generator.hpp"
#include "Predictor.hpp"

using Symbol = int;
using Clock = std::chrono::high_resolution_clock;

static void report(const char* what, size_t ops, std::chrono::duration<double> dt) {
    std::cout << what
              << " ops=" << ops
              << " time=" << dt.count() << "s"
              << " throughput=" << (ops / std::max(1e-9, dt.count())) << " ops/s\n";
}

// Trains `sequences` sequences of length `seq_len` drawn from next_symbol.
template <typename NextSymbolFn>
static void train(MarkovModel<Symbol>& model, size_t sequences, size_t seq_len, NextSymbolFn&& next_symbol) {
    Accumulator<Symbol> acc(model);
    auto t0 = Clock::now();
    for (size_t i = 0; i < sequences; ++i) {
        for (size_t j = 0; j < seq_len; ++j) acc.add(next_symbol());
        acc.end();
    }
    report("train   ", sequences * (seq_len + 1), Clock::now() - t0);
}

static void query(const MarkovModel<Symbol>& model, size_t ops, uint64_t seed) {
    Generator<Symbol> gen(model, Generator<Symbol>::uniform_source(seed));
    size_t produced = 0;
    auto t0 = Clock::now();
    for (size_t i = 0; i < ops; ++i) {
        if (gen.next()) ++produced; else gen.end();
    }
    report("sample  ", ops, Clock::now() - t0);

    Predictor<Symbol> pre(model);
    t0 = Clock::now();
    for (size_t i = 0; i < ops; ++i) {
        if (!pre.next()) pre.end();
    }
    report("predict ", ops, Clock::now() - t0);
    std::cout << "generated symbols=" << produced << "\n";
}

int main() {
    // --- knobs ---
    const size_t alphabet  = 1'000;
    const size_t sequences = 20'000;
    const size_t seq_len   = 50;
    const size_t ops       = 1'000'000;

    std::mt19937 rng(123);

    std::vector<double> weights(alphabet);
    const double s = 1.2;
    for (size_t i = 0; i < alphabet; ++i) weights[i] = 1.0 / std::pow(double(i + 1), s);
    std::discrete_distribution<Symbol> zipf(weights.begin(), weights.end());
    auto zipf_gen = [&]() { return zipf(rng); };

    std::uniform_int_distribution<Symbol> uni(0, (Symbol)alphabet - 1);
    auto uniform_gen = [&]() { return uni(rng); };

    for (size_t order = 1; order <= 3; ++order) {
        std::cout << "=== Zipf(s=1.2) workload, order " << order << " ===\n";
        MarkovModel<Symbol> model(order);
        train(model, sequences, seq_len, zipf_gen);
        std::cout << "contexts=" << model.num_contexts() << "\n";
        query(model, ops, 123);
    }

    std::cout << "\n=== Uniform workload, order 2 ===\n";
    {
        MarkovModel<Symbol> model(2);
        train(model, sequences, seq_len, uniform_gen);
        std::cout << "contexts=" << model.num_contexts() << "\n";
        query(model, ops, 123);
    }

    return 0;
}
