#pragma once
#include <unordered_map>
#include <optional>
#include <cstdint>
#include <spdlog/spdlog.h>
#include "SequenceKey.hpp"
#include "FrequencyTable.hpp"

// Variable-order Markov chain: maps each observed context to the counts of
// what followed it. Not synchronized; callers keep a single writer.
template <typename Symbol>
class MarkovModel {
    public:
        using Context = SequenceKey<Symbol>;
        using Table = FrequencyTable<Symbol>;
        using Outcome = typename Table::Outcome;

        struct Options {
            size_t order = 1;   // 0 gives a unigram model
        };

        explicit MarkovModel(size_t order) : MarkovModel(Options{order}) {}

        explicit MarkovModel(const Options& opt) : opts_(opt) {
            spdlog::trace("markov model created, order={}", opts_.order);
        }

        // Contexts normally come from advance(). One longer than order() is
        // recorded under its trailing order() symbols, so stored keys never exceed the order.
        void add(const Context& context, const Outcome& outcome) {
            if (context.size() > opts_.order) {
                add(context.last(opts_.order), outcome);
                return;
            }
            auto it = tables_.find(context);
            if (it == tables_.end()) {
                it = tables_.emplace(context, Table{}).first;
                spdlog::trace("new context of length {} (contexts={})", context.size(), tables_.size());
            }
            it->second.add(outcome);
        }

        Context advance(const Context& context, const Symbol& symbol) const {
            return context.with_next(symbol, opts_.order);
        }

        std::optional<Symbol> predict(const Context& context) const {
            auto it = tables_.find(context);
            if (it == tables_.end()) {
                return std::nullopt;
            }
            return it->second.most_frequent();
        }

        std::optional<Symbol> sample(const Context& context, double x) const {
            auto it = tables_.find(context);
            if (it == tables_.end()) {
                return std::nullopt;
            }
            return it->second.sample(x);
        }

        // nullptr for a context that was never trained.
        const Table* table(const Context& context) const {
            auto it = tables_.find(context);
            return it == tables_.end() ? nullptr : &it->second;
        }

        bool contains(const Context& context) const {
            return tables_.count(context) != 0;
        }

        size_t num_contexts() const {
            return tables_.size();
        }

        uint64_t total_observations() const {
            uint64_t n = 0;
            for (const auto& [ctx, t] : tables_) {
                n += t.total();
            }
            return n;
        }

        size_t order() const {
            return opts_.order;
        }

    private:
        Options opts_;
        std::unordered_map<Context, Table> tables_;
};
