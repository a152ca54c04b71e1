#pragma once

#include "entropy/codec.hpp"
#include "stats/frequency.hpp"

namespace infocode {

// Top-down Shannon-Fano code.
//
// Symbols are ranked by count (descending, first-seen order on ties). A group
// is cut at the first position where the running weight reaches half of the
// group total; the symbol that reaches it stays on the left. The left part
// gets '0', the right part '1', and both parts are split again until every
// group holds one symbol.
//
// Requires at least two distinct symbols, otherwise throws InvalidInput.
Codec build_shannon_fano(const FrequencyCount& counts);

} // namespace infocode
