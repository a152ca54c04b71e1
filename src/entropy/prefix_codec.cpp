#include "entropy/prefix_codec.hpp"

#include "common/errors.hpp"

#include <set>
#include <utility>

namespace infocode {

std::string encode(const SymbolSequence& sequence, const Codec& codec) {
    std::set<Symbol> missing;
    for (const auto& s : sequence) {
        if (!codec.find_code(s)) missing.insert(s);
    }
    if (!missing.empty()) {
        throw MissingSymbol(std::move(missing));
    }

    std::string bits;
    for (const auto& s : sequence) {
        bits += *codec.find_code(s);
    }
    return bits;
}

SymbolSequence decode(const std::string& bits, const Codec& codec) {
    SymbolSequence out;
    std::string buffer;
    size_t buffer_start = 0;
    for (size_t i = 0; i < bits.size(); ++i) {
        const char bit = bits[i];
        if (bit != '0' && bit != '1') {
            throw CorruptStream("decode: non-binary character in bit stream", i);
        }
        buffer += bit;
        if (const Symbol* sym = codec.find_symbol(buffer)) {
            out.push_back(*sym);
            buffer.clear();
            buffer_start = i + 1;
        } else if (buffer.size() >= codec.max_code_length()) {
            throw CorruptStream("decode: bits do not match any codeword", buffer_start);
        }
    }
    if (!buffer.empty()) {
        throw CorruptStream("decode: trailing bits '" + buffer + "' do not form a codeword",
                            buffer_start);
    }
    return out;
}

double average_code_length(const Codec& codec, const FrequencyCount& counts) {
    const uint64_t total = counts.total();
    if (total == 0) return 0.0;
    double avg = 0.0;
    for (const auto& e : codec.entries()) {
        const uint64_t c = counts.count(e.symbol);
        if (c == 0) continue;
        avg += static_cast<double>(c) / static_cast<double>(total) * static_cast<double>(e.code.size());
    }
    return avg;
}

double coding_efficiency(double entropy_bits, double average_length) {
    if (average_length <= 0.0) return 0.0;
    return entropy_bits / average_length;
}

} // namespace infocode
