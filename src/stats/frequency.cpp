#include "stats/frequency.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace infocode {

void FrequencyCount::add(const Symbol& s, uint64_t n) {
    if (n == 0) return;
    if (total_ > std::numeric_limits<uint64_t>::max() - n) {
        throw std::runtime_error("frequency: count overflow");
    }
    auto it = index_.find(s);
    if (it == index_.end()) {
        index_.emplace(s, items_.size());
        items_.push_back({s, n});
    } else {
        items_[it->second].count += n;
    }
    total_ += n;
}

uint64_t FrequencyCount::count(const Symbol& s) const {
    auto it = index_.find(s);
    if (it == index_.end()) return 0;
    return items_[it->second].count;
}

bool FrequencyCount::contains(const Symbol& s) const {
    return index_.find(s) != index_.end();
}

std::vector<SymbolCount> FrequencyCount::ranked() const {
    std::vector<SymbolCount> out = items_;
    std::stable_sort(out.begin(), out.end(),
                     [](const SymbolCount& a, const SymbolCount& b) { return a.count > b.count; });
    return out;
}

FrequencyCount count_symbols(const SymbolSequence& sequence) {
    FrequencyCount counts;
    for (const auto& s : sequence) {
        counts.add(s);
    }
    return counts;
}

} // namespace infocode
