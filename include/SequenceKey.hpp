#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <functional>

// Bounded window of the most recent symbols; used as the lookup key for a context.
// Immutable: with_next() always builds a new key.
template <typename Symbol>
class SequenceKey {
    public:
        using const_iterator = typename std::vector<Symbol>::const_iterator;

        SequenceKey() = default;

        static SequenceKey empty() {
            return SequenceKey();
        }

        // Keeps at most `order` symbols, evicting the oldest one when full.
        SequenceKey with_next(const Symbol& next, size_t order) const {
            if (order == 0) {
                return SequenceKey();
            }
            const size_t keep = symbols_.size() < order ? symbols_.size() : order - 1;
            std::vector<Symbol> next_symbols;
            next_symbols.reserve(keep + 1);
            next_symbols.insert(next_symbols.end(), symbols_.end() - keep, symbols_.end());
            next_symbols.push_back(next);
            return SequenceKey(std::move(next_symbols));
        }

        // Trailing window of at most n symbols.
        SequenceKey last(size_t n) const {
            if (symbols_.size() <= n) {
                return *this;
            }
            return SequenceKey(std::vector<Symbol>(symbols_.end() - n, symbols_.end()));
        }

        size_t size() const {
            return symbols_.size();
        }

        bool is_empty() const {
            return symbols_.empty();
        }

        const std::vector<Symbol>& symbols() const {
            return symbols_;
        }

        const_iterator begin() const { return symbols_.begin(); }
        const_iterator end() const { return symbols_.end(); }

        bool operator==(const SequenceKey& other) const {
            return symbols_ == other.symbols_;
        }

        bool operator!=(const SequenceKey& other) const {
            return !(*this == other);
        }

    private:
        explicit SequenceKey(std::vector<Symbol> symbols) : symbols_(std::move(symbols)) {}

        std::vector<Symbol> symbols_;
};

namespace std {
template <typename Symbol>
struct hash<SequenceKey<Symbol>> {
    size_t operator()(const SequenceKey<Symbol>& key) const {
        uint64_t h = 0xcbf29ce484222325ULL ^ key.size();
        std::hash<Symbol> hasher;
        for (const auto& s : key) {
            h ^= hasher(s) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return static_cast<size_t>(h);
    }
};
}
