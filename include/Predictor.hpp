#pragma once
#include <optional>
#include <vector>
#include "MarkovModel.hpp"

// Deterministic walk that always follows the most frequent successor.
template <typename Symbol>
class Predictor {
    public:
        explicit Predictor(const MarkovModel<Symbol>& model) : model_(model) {}

        // Primes the context with an observed symbol without querying the model.
        void given(const Symbol& symbol) {
            context_ = model_.advance(context_, symbol);
        }

        std::optional<Symbol> next() {
            auto s = model_.predict(context_);
            if (s) {
                context_ = model_.advance(context_, *s);
            }
            return s;
        }

        std::optional<Symbol> predict() const {
            return model_.predict(context_);
        }

        void end() {
            context_ = SequenceKey<Symbol>::empty();
        }

        // Most likely continuation; max_len bounds it since predictions can cycle.
        std::vector<Symbol> continuation(size_t max_len) {
            std::vector<Symbol> out;
            while (out.size() < max_len) {
                auto s = next();
                if (!s) break;
                out.push_back(*s);
            }
            return out;
        }

        const SequenceKey<Symbol>& context() const {
            return context_;
        }

    private:
        const MarkovModel<Symbol>& model_;
        SequenceKey<Symbol> context_;
};
