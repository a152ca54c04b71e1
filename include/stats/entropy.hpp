#pragma once

#include <cstddef>
#include <cstdint>

#include "stats/frequency.hpp"

namespace infocode {

struct EntropyMetrics {
    double entropy{0.0};      // bits per symbol
    double code_length{0.0};  // ideal uniform code length, bits
    double redundancy{0.0};   // 1 - entropy / code_length
    size_t alphabet_size{0};
    uint64_t total{0};
};

// Shannon entropy in bits per symbol. 0 for an empty or one-symbol alphabet.
double entropy(const FrequencyCount& counts);

// log2(alphabet_size) for alphabets of two or more symbols, otherwise 0.
double ideal_code_length(size_t alphabet_size);

// 1 - entropy / code_length, or 0 when code_length is not positive.
double redundancy(double entropy_bits, double code_length);

EntropyMetrics analyze_entropy(const FrequencyCount& counts);

} // namespace infocode
