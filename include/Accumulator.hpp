#pragma once
#include <optional>
#include <iterator>
#include "MarkovModel.hpp"

// Feeds training sequences into a model one symbol at a time.
// Holds the model exclusively for its lifetime.
template <typename Symbol>
class Accumulator {
    public:
        explicit Accumulator(MarkovModel<Symbol>& model) : model_(model) {}

        void add(const Symbol& symbol) {
            model_.add(context_, symbol);
            context_ = model_.advance(context_, symbol);
        }

        // Records an end marker for the current context and starts a new sequence.
        void end() {
            model_.add(context_, std::nullopt);
            context_ = SequenceKey<Symbol>::empty();
        }

        template <typename It>
        void add_sequence(It first, It last) {
            for (; first != last; ++first) {
                add(*first);
            }
            end();
        }

        template <typename Range>
        void add_sequence(const Range& symbols) {
            add_sequence(std::begin(symbols), std::end(symbols));
        }

        std::optional<Symbol> predict() const {
            return model_.predict(context_);
        }

        const SequenceKey<Symbol>& context() const {
            return context_;
        }

    private:
        MarkovModel<Symbol>& model_;
        SequenceKey<Symbol> context_;
};
