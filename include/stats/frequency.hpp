#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "stats/symbols.hpp"

namespace infocode {

struct SymbolCount {
    Symbol symbol;
    uint64_t count{0};
};

// Symbol -> occurrence count. Every stored count is > 0 and the counts add up
// to total(). Symbols remember the order they were first seen in; rankings
// use it to break ties.
class FrequencyCount {
public:
    // Adds n occurrences of s. n == 0 is a no-op.
    void add(const Symbol& s, uint64_t n = 1);

    uint64_t count(const Symbol& s) const;
    bool contains(const Symbol& s) const;

    uint64_t total() const { return total_; }
    size_t distinct() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    // First-seen order.
    const std::vector<SymbolCount>& items() const { return items_; }

    // Count descending, ties in first-seen order.
    std::vector<SymbolCount> ranked() const;

private:
    std::vector<SymbolCount> items_;
    std::unordered_map<Symbol, size_t> index_;
    uint64_t total_{0};
};

// Build counts over a token sequence.
FrequencyCount count_symbols(const SymbolSequence& sequence);

} // namespace infocode
