#include "stats/entropy.hpp"

#include <cmath>

namespace infocode {

double entropy(const FrequencyCount& counts) {
    const uint64_t n = counts.total();
    if (n == 0 || counts.distinct() <= 1) return 0.0;
    double h = 0.0;
    for (const auto& sc : counts.items()) {
        const double p = static_cast<double>(sc.count) / static_cast<double>(n);
        h -= p * std::log2(p);
    }
    // guard against -0.0 / rounding just below zero
    return h > 0.0 ? h : 0.0;
}

double ideal_code_length(size_t alphabet_size) {
    if (alphabet_size <= 1) return 0.0;
    return std::log2(static_cast<double>(alphabet_size));
}

double redundancy(double entropy_bits, double code_length) {
    if (code_length <= 0.0) return 0.0;
    return 1.0 - entropy_bits / code_length;
}

EntropyMetrics analyze_entropy(const FrequencyCount& counts) {
    EntropyMetrics m;
    m.alphabet_size = counts.distinct();
    m.total = counts.total();
    m.entropy = entropy(counts);
    m.code_length = ideal_code_length(m.alphabet_size);
    m.redundancy = redundancy(m.entropy, m.code_length);
    return m;
}

} // namespace infocode
