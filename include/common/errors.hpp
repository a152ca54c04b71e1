#pragma once

#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>

namespace infocode {

// Builder or helper was handed input it cannot work with
// (empty frequency set, malformed codec entry, bad fraction, ...).
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

// encode() met symbols that have no codeword.
class MissingSymbol : public std::runtime_error {
public:
    explicit MissingSymbol(std::set<std::string> symbols);

    const std::set<std::string>& symbols() const { return symbols_; }

private:
    std::set<std::string> symbols_;
};

// decode() could not resolve the bit stream into whole codewords.
class CorruptStream : public std::runtime_error {
public:
    CorruptStream(const std::string& what, size_t bit_offset)
        : std::runtime_error(what), bit_offset_(bit_offset) {}

    // Offset of the first bit that could not be resolved.
    size_t bit_offset() const { return bit_offset_; }

private:
    size_t bit_offset_;
};

} // namespace infocode
