#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stats/symbols.hpp"

namespace infocode {

// Codeword as text over {'0','1'}.
using CodeWord = std::string;

struct CodecEntry {
    Symbol symbol;
    CodeWord code;
};

// Injective Symbol -> CodeWord table with an inverse lookup for decoding.
// Entries keep the order they were assigned in.
class Codec {
public:
    // Throws InvalidInput for an empty or non-binary codeword, a symbol that
    // already has a codeword, or a codeword already in use.
    void assign(const Symbol& symbol, const CodeWord& code);

    // nullptr when absent.
    const CodeWord* find_code(const Symbol& symbol) const;
    const Symbol* find_symbol(const CodeWord& code) const;

    const std::vector<CodecEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Longest codeword length (0 for an empty codec).
    size_t max_code_length() const { return max_len_; }

private:
    std::vector<CodecEntry> entries_;
    std::unordered_map<Symbol, size_t> by_symbol_;
    std::unordered_map<CodeWord, size_t> by_code_;
    size_t max_len_{0};
};

// True when no codeword is a prefix of another.
bool is_prefix_free(const Codec& codec);

// Sum of 2^-len over all codewords (1.0 for a complete prefix code).
double kraft_sum(const Codec& codec);

} // namespace infocode
