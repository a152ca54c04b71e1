#include "entropy/codec.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <cmath>

namespace infocode {

void Codec::assign(const Symbol& symbol, const CodeWord& code) {
    if (code.empty()) {
        throw InvalidInput("codec: empty codeword for '" + symbol + "'");
    }
    if (code.find_first_not_of("01") != CodeWord::npos) {
        throw InvalidInput("codec: codeword '" + code + "' is not binary");
    }
    if (by_symbol_.count(symbol) != 0) {
        throw InvalidInput("codec: duplicate symbol '" + symbol + "'");
    }
    if (by_code_.count(code) != 0) {
        throw InvalidInput("codec: duplicate codeword '" + code + "'");
    }
    const size_t idx = entries_.size();
    entries_.push_back({symbol, code});
    by_symbol_.emplace(symbol, idx);
    by_code_.emplace(code, idx);
    max_len_ = std::max(max_len_, code.size());
}

const CodeWord* Codec::find_code(const Symbol& symbol) const {
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) return nullptr;
    return &entries_[it->second].code;
}

const Symbol* Codec::find_symbol(const CodeWord& code) const {
    auto it = by_code_.find(code);
    if (it == by_code_.end()) return nullptr;
    return &entries_[it->second].symbol;
}

bool is_prefix_free(const Codec& codec) {
    // After lexicographic sort a prefix always sits right before some word it prefixes.
    std::vector<CodeWord> codes;
    codes.reserve(codec.size());
    for (const auto& e : codec.entries()) codes.push_back(e.code);
    std::sort(codes.begin(), codes.end());
    for (size_t i = 1; i < codes.size(); ++i) {
        const CodeWord& a = codes[i - 1];
        const CodeWord& b = codes[i];
        if (b.compare(0, a.size(), a) == 0) return false;
    }
    return true;
}

double kraft_sum(const Codec& codec) {
    double sum = 0.0;
    for (const auto& e : codec.entries()) {
        sum += std::ldexp(1.0, -static_cast<int>(e.code.size()));
    }
    return sum;
}

} // namespace infocode
