#include "filter/frequency_filter.hpp"

#include "common/errors.hpp"
#include "stats/entropy.hpp"
#include "stats/frequency.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace infocode {

FilterResult remove_by_frequency(const SymbolSequence& sequence, RemovalMode mode, double fraction) {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw InvalidInput("filter: fraction must be within [0, 1], got " + std::to_string(fraction));
    }

    FilterResult out;
    const FrequencyCount counts = count_symbols(sequence);
    if (counts.empty()) {
        return out;
    }

    const size_t alphabet = counts.distinct();
    // nearbyint rounds half to even under the default rounding mode
    const double rounded = std::nearbyint(fraction * static_cast<double>(alphabet));
    size_t remove_n = std::max<size_t>(1, static_cast<size_t>(rounded));
    remove_n = std::min(remove_n, alphabet);

    const std::vector<SymbolCount> ranked = counts.ranked();
    if (mode == RemovalMode::Top) {
        for (size_t i = 0; i < remove_n; ++i) out.removed.insert(ranked[i].symbol);
    } else {
        for (size_t i = alphabet - remove_n; i < alphabet; ++i) out.removed.insert(ranked[i].symbol);
    }

    out.filtered.reserve(sequence.size());
    for (const auto& s : sequence) {
        if (out.removed.count(s) == 0) out.filtered.push_back(s);
    }
    return out;
}

EntropyShift measure_removal(const SymbolSequence& sequence, RemovalMode mode, double fraction) {
    EntropyShift shift;
    shift.result = remove_by_frequency(sequence, mode, fraction);
    shift.baseline_entropy = entropy(count_symbols(sequence));
    shift.filtered_entropy = entropy(count_symbols(shift.result.filtered));
    shift.delta = shift.filtered_entropy - shift.baseline_entropy;
    return shift;
}

const char* to_string(RemovalMode mode) {
    switch (mode) {
    case RemovalMode::Top: return "top";
    case RemovalMode::Bottom: return "bottom";
    }
    return "unknown";
}

} // namespace infocode
