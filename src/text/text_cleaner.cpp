#include "text/text_cleaner.hpp"

#include <cstring>

namespace infocode {

namespace {
constexpr const char* kPunctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

bool is_stripped(char c) {
    return c == ' ' || (c != '\0' && std::strchr(kPunctuation, c) != nullptr);
}
} // namespace

std::string clean_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        // UTF-8 lead/continuation bytes are >= 0x80 and never match
        if (!is_stripped(c)) out += c;
    }
    return out;
}

} // namespace infocode
