#pragma once

#include <string>

namespace infocode {

// Strip ASCII spaces and ASCII punctuation (!"#$%&'()*+,-./:;<=>?@[\]^_`{|}~).
// Everything else, newlines and non-ASCII characters included, is kept.
std::string clean_text(const std::string& text);

} // namespace infocode
