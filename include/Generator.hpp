#pragma once
#include <functional>
#include <optional>
#include <random>
#include <cstdint>
#include <utility>
#include <stdexcept>
#include <vector>
#include "MarkovModel.hpp"

// Random walk over a trained model. The random source must return values in [0, 1).
template <typename Symbol>
class Generator {
    public:
        using RandomSource = std::function<double()>;

        Generator(const MarkovModel<Symbol>& model, RandomSource rand) : model_(model) {
            set_random_source(std::move(rand));
        }

        static RandomSource uniform_source(uint64_t seed) {
            std::mt19937_64 rng(seed);
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            // generate_canonical can round up to 1.0 on some standard libraries; redraw.
            return [rng, dist]() mutable {
                double v = dist(rng);
                while (v >= 1.0) v = dist(rng);
                return v;
            };
        }

        void set_random_source(RandomSource rand) {
            if (!rand) throw std::invalid_argument("random source must not be empty");
            rand_ = std::move(rand);
        }

        // nullopt at the end of a sequence; call end() before generating another one.
        std::optional<Symbol> next() {
            auto s = model_.sample(context_, rand_());
            if (s) {
                context_ = model_.advance(context_, *s);
            }
            return s;
        }

        void end() {
            context_ = SequenceKey<Symbol>::empty();
        }

        // Emits one sequence of at most max_len symbols, then resets.
        std::vector<Symbol> generate(size_t max_len) {
            std::vector<Symbol> out;
            while (out.size() < max_len) {
                auto s = next();
                if (!s) break;
                out.push_back(*s);
            }
            end();
            return out;
        }

        const SequenceKey<Symbol>& context() const {
            return context_;
        }

    private:
        const MarkovModel<Symbol>& model_;
        SequenceKey<Symbol> context_;
        RandomSource rand_;
};
