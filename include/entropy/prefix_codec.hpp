#pragma once

#include <string>

#include "entropy/codec.hpp"
#include "stats/frequency.hpp"

namespace infocode {

// Concatenate the codeword of every symbol, in input order.
// Throws MissingSymbol listing every symbol the codec does not cover.
std::string encode(const SymbolSequence& sequence, const Codec& codec);

// Greedy left-to-right decode: bits accumulate until the buffer equals a
// codeword, which is emitted and the buffer cleared. Relies on the codec
// being prefix-free. Throws CorruptStream for a non-binary character, a
// buffer that outgrows every codeword, or leftover bits at the end.
SymbolSequence decode(const std::string& bits, const Codec& codec);

// Expected bits per symbol: sum of count/total * len(code) over symbols the
// codec and the counts share. 0 when counts is empty.
double average_code_length(const Codec& codec, const FrequencyCount& counts);

// entropy / average_length, or 0 when average_length is not positive.
double coding_efficiency(double entropy_bits, double average_length);

} // namespace infocode
