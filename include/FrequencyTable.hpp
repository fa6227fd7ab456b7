#pragma once
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>
#include <utility>

// Successor counts for one context, kept sorted by descending frequency.
// An outcome is either a symbol or std::nullopt (end of sequence).
template <typename Symbol>
class FrequencyTable {
    public:
        using Outcome = std::optional<Symbol>;

        struct Entry {
            Outcome outcome;
            uint64_t frequency;
        };

        void add(const Outcome& outcome) {
            auto it = index_.find(outcome);
            if (it == index_.end()) {
                entries_.push_back(Entry{outcome, 1});
                index_.emplace(outcome, entries_.size() - 1);
            } else {
                const size_t pos = it->second;
                ++entries_[pos].frequency;
                bubble_up(pos);
            }
            ++total_;
        }

        // O(1): the first entry always holds the highest frequency.
        std::optional<Symbol> most_frequent() const {
            if (entries_.empty()) {
                return std::nullopt;
            }
            return entries_.front().outcome;
        }

        // Picks an outcome with probability proportional to its frequency.
        // x must lie in [0, 1); any other x (including NaN and infinities) returns nullopt.
        std::optional<Symbol> sample(double x) const {
            if (total_ == 0 || !(x >= 0.0 && x < 1.0)) {
                return std::nullopt;
            }
            uint64_t remaining = static_cast<uint64_t>(x * static_cast<double>(total_));
            for (const auto& e : entries_) {
                if (remaining < e.frequency) {
                    return e.outcome;
                }
                remaining -= e.frequency;
            }
            return std::nullopt;
        }

        uint64_t frequency(const Outcome& outcome) const {
            auto it = index_.find(outcome);
            if (it == index_.end()) {
                return 0;
            }
            return entries_[it->second].frequency;
        }

        double probability(const Outcome& outcome) const {
            if (total_ == 0) {
                return 0.0;
            }
            return static_cast<double>(frequency(outcome)) / static_cast<double>(total_);
        }

        // Unlike most_frequent(), tells an end marker apart from an empty table.
        std::optional<Outcome> outcome_at(size_t rank) const {
            if (rank >= entries_.size()) {
                return std::nullopt;
            }
            return entries_[rank].outcome;
        }

        const std::vector<Entry>& entries() const {
            return entries_;
        }

        uint64_t total() const {
            return total_;
        }

        size_t size() const {
            return entries_.size();
        }

        bool is_empty() const {
            return entries_.empty();
        }

    private:
        // Frequencies grow by one per add(), so a single leftward pass restores
        // the order. Equal-frequency neighbours are never overtaken.
        void bubble_up(size_t pos) {
            size_t j = pos;
            while (j > 0 && entries_[j - 1].frequency < entries_[j].frequency) {
                std::swap(entries_[j - 1], entries_[j]);
                --j;
            }
            for (size_t i = j; i <= pos; ++i) {
                index_[entries_[i].outcome] = i;
            }
        }

        std::vector<Entry> entries_;
        std::unordered_map<Outcome, size_t> index_;
        uint64_t total_ = 0;
};
