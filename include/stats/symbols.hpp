#pragma once

#include <string>
#include <vector>

namespace infocode {

// One alphabet unit: a UTF-8 encoded character or a two-character bigram.
using Symbol = std::string;
using SymbolSequence = std::vector<Symbol>;

// Split text into characters (UTF-8 code points).
// A stray or truncated byte becomes a one-byte symbol of its own.
SymbolSequence tokenize_unigrams(const std::string& text);

// Overlapping bigrams: chars[i] + chars[i+1] for every i.
// Fewer than two characters yields an empty sequence.
SymbolSequence tokenize_bigrams(const std::string& text);

// Inverse of tokenize_bigrams: first token in full, then the last
// character of every following token.
std::string join_bigrams(const SymbolSequence& bigrams);

// Plain concatenation (unigram rejoin).
std::string join_symbols(const SymbolSequence& symbols);

} // namespace infocode
