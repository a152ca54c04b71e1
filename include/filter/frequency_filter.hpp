#pragma once

#include <set>

#include "stats/symbols.hpp"

namespace infocode {

enum class RemovalMode {
    Top,    // most frequent symbols
    Bottom, // least frequent symbols
};

struct FilterResult {
    SymbolSequence filtered;
    std::set<Symbol> removed;
};

struct EntropyShift {
    FilterResult result;
    double baseline_entropy{0.0};
    double filtered_entropy{0.0};
    double delta{0.0}; // filtered - baseline
};

// Drop every occurrence of the max(1, round(fraction * alphabet)) most or
// least frequent symbols. Rounding is half-to-even; the count never exceeds
// the alphabet. Ranking is count descending with first-seen ties, Bottom
// takes its tail. Retained symbols keep order and multiplicity.
// Throws InvalidInput unless 0 <= fraction <= 1.
FilterResult remove_by_frequency(const SymbolSequence& sequence, RemovalMode mode, double fraction);

// remove_by_frequency plus the unigram entropy before and after.
EntropyShift measure_removal(const SymbolSequence& sequence, RemovalMode mode, double fraction);

const char* to_string(RemovalMode mode);

} // namespace infocode
