#include "stats/symbols.hpp"

#include <cstdint>

namespace infocode {

namespace {

// Length of the UTF-8 sequence starting at data[pos], or 1 when the bytes
// there do not form a complete well-formed lead + continuation run.
size_t utf8_char_len(const std::string& data, size_t pos) {
    const uint8_t lead = static_cast<uint8_t>(data[pos]);
    size_t len = 1;
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
    } else {
        return 1; // continuation byte or invalid lead
    }
    if (pos + len > data.size()) return 1;
    for (size_t i = 1; i < len; ++i) {
        const uint8_t b = static_cast<uint8_t>(data[pos + i]);
        if ((b & 0xC0) != 0x80) return 1;
    }
    return len;
}

// Last character of a symbol (by the same segmentation rule).
std::string last_char(const Symbol& s) {
    size_t pos = 0;
    size_t last = 0;
    while (pos < s.size()) {
        last = pos;
        pos += utf8_char_len(s, pos);
    }
    return s.substr(last);
}

} // namespace

SymbolSequence tokenize_unigrams(const std::string& text) {
    SymbolSequence out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t len = utf8_char_len(text, pos);
        out.emplace_back(text, pos, len);
        pos += len;
    }
    return out;
}

SymbolSequence tokenize_bigrams(const std::string& text) {
    const SymbolSequence chars = tokenize_unigrams(text);
    SymbolSequence out;
    if (chars.size() < 2) return out;
    out.reserve(chars.size() - 1);
    for (size_t i = 0; i + 1 < chars.size(); ++i) {
        out.push_back(chars[i] + chars[i + 1]);
    }
    return out;
}

std::string join_bigrams(const SymbolSequence& bigrams) {
    if (bigrams.empty()) return {};
    std::string out = bigrams.front();
    for (size_t i = 1; i < bigrams.size(); ++i) {
        out += last_char(bigrams[i]);
    }
    return out;
}

std::string join_symbols(const SymbolSequence& symbols) {
    std::string out;
    for (const auto& s : symbols) out += s;
    return out;
}

} // namespace infocode
