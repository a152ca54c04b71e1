#include "entropy/shannon_fano.hpp"

#include "common/errors.hpp"

#include <string>
#include <vector>

namespace infocode {

namespace {

void split_group(const std::vector<SymbolCount>& ranked,
                 size_t begin,
                 size_t end,
                 std::vector<std::string>& codes) {
    if (end - begin <= 1) return;

    uint64_t total = 0;
    for (size_t i = begin; i < end; ++i) total += ranked[i].count;

    // cut = one past the symbol whose running weight reaches total/2
    size_t cut = begin + 1;
    uint64_t acc = 0;
    for (size_t i = begin; i < end; ++i) {
        acc += ranked[i].count;
        if (acc * 2 >= total) {
            cut = i + 1;
            break;
        }
    }
    // ranked descending keeps both sides non-empty; clamp anyway
    if (cut >= end) cut = end - 1;

    for (size_t i = begin; i < cut; ++i) codes[i] += '0';
    for (size_t i = cut; i < end; ++i) codes[i] += '1';

    split_group(ranked, begin, cut, codes);
    split_group(ranked, cut, end, codes);
}

} // namespace

Codec build_shannon_fano(const FrequencyCount& counts) {
    if (counts.distinct() < 2) {
        throw InvalidInput("shannon-fano: need at least two distinct symbols");
    }
    const std::vector<SymbolCount> ranked = counts.ranked();
    std::vector<std::string> codes(ranked.size());
    split_group(ranked, 0, ranked.size(), codes);

    Codec codec;
    for (size_t i = 0; i < ranked.size(); ++i) {
        codec.assign(ranked[i].symbol, codes[i]);
    }
    return codec;
}

} // namespace infocode
