#include "entropy/bitstream.hpp"

#include "common/errors.hpp"

namespace infocode {

// ---------------- BitWriter ---------------- //
void BitWriter::write_bit(bool bit) {
    cur_ = static_cast<uint8_t>((cur_ << 1) | (bit ? 1u : 0u));
    ++bit_pos_;
    ++bit_count_;
    if (bit_pos_ == 8) {
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

void BitWriter::write_code(const std::string& code) {
    for (char c : code) {
        if (c != '0' && c != '1') {
            throw InvalidInput("BitWriter: non-binary character in codeword");
        }
        write_bit(c == '1');
    }
}

void BitWriter::flush() {
    if (bit_pos_ > 0) {
        cur_ <<= static_cast<uint8_t>(8 - bit_pos_);
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

// ---------------- BitReader ---------------- //
BitReader::BitReader(const std::vector<uint8_t>& buf, size_t bit_count)
    : data_(buf), bit_count_(bit_count) {
    if ((bit_count + 7) / 8 > buf.size()) {
        throw CorruptStream("BitReader: bit count exceeds buffer", buf.size() * 8);
    }
}

bool BitReader::read_bit() {
    if (read_ >= bit_count_) {
        throw CorruptStream("BitReader: out of data", read_);
    }
    const uint8_t byte = data_[read_ / 8];
    const uint8_t bit = static_cast<uint8_t>((byte >> (7 - read_ % 8)) & 1u);
    ++read_;
    return bit != 0;
}

PackedBits pack_bits(const std::string& bits) {
    BitWriter bw;
    bw.write_code(bits);
    bw.flush();
    return {bw.data(), bw.bit_count()};
}

std::string unpack_bits(const PackedBits& packed) {
    BitReader br(packed.bytes, packed.bit_count);
    std::string bits;
    bits.reserve(packed.bit_count);
    while (!br.eof()) {
        bits += br.read_bit() ? '1' : '0';
    }
    return bits;
}

} // namespace infocode
