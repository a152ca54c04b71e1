#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace infocode {

// Bit string packed MSB-first into bytes; the last byte is zero padded.
struct PackedBits {
    std::vector<uint8_t> bytes;
    size_t bit_count{0};
};

class BitWriter {
public:
    void write_bit(bool bit);
    // Append every '0'/'1' of a codeword; throws InvalidInput otherwise.
    void write_code(const std::string& code);
    // Pad the pending byte with zeros. Call once, after the last write.
    void flush();

    const std::vector<uint8_t>& data() const { return data_; }
    size_t bit_count() const { return bit_count_; }

private:
    std::vector<uint8_t> data_;
    uint8_t cur_{0};
    uint8_t bit_pos_{0}; // bits filled in cur_ (0..8)
    size_t bit_count_{0};
};

class BitReader {
public:
    BitReader(const std::vector<uint8_t>& buf, size_t bit_count);

    // Throws CorruptStream past bit_count.
    bool read_bit();
    bool eof() const { return read_ >= bit_count_; }

private:
    const std::vector<uint8_t>& data_;
    size_t bit_count_;
    size_t read_{0};
};

PackedBits pack_bits(const std::string& bits);
std::string unpack_bits(const PackedBits& packed);

} // namespace infocode
