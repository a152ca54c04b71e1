// =============================================================================
// Prefix Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "entropy/huffman.hpp"
#include "entropy/prefix_codec.hpp"
#include "entropy/shannon_fano.hpp"
#include "stats/entropy.hpp"

#include <random>

using namespace infocode;

class PrefixCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        seq_ = tokenize_unigrams("abracadabra");
        counts_ = count_symbols(seq_);
    }

    SymbolSequence seq_;
    FrequencyCount counts_;
};

TEST_F(PrefixCodecTest, HuffmanRoundTrip) {
    Codec c = build_huffman(counts_).codec;
    const std::string bits = encode(seq_, c);
    EXPECT_EQ(bits, "10010001011101010010001");
    EXPECT_EQ(decode(bits, c), seq_);
}

TEST_F(PrefixCodecTest, ShannonFanoRoundTrip) {
    Codec c = build_shannon_fano(counts_);
    const std::string bits = encode(seq_, c);
    EXPECT_EQ(bits.size(), 24u);
    EXPECT_EQ(decode(bits, c), seq_);
}

TEST_F(PrefixCodecTest, AverageCodeLength) {
    EXPECT_NEAR(average_code_length(build_huffman(counts_).codec, counts_), 23.0 / 11.0, 1e-9);
    EXPECT_NEAR(average_code_length(build_shannon_fano(counts_), counts_), 24.0 / 11.0, 1e-9);
}

TEST_F(PrefixCodecTest, AverageLengthMatchesEncodedSize) {
    for (const Codec& c : {build_huffman(counts_).codec, build_shannon_fano(counts_)}) {
        const double avg = average_code_length(c, counts_);
        EXPECT_NEAR(avg * static_cast<double>(counts_.total()),
                    static_cast<double>(encode(seq_, c).size()), 1e-9);
    }
}

TEST_F(PrefixCodecTest, AverageLengthSkipsUnsharedSymbols) {
    Codec c;
    c.assign("a", "0");
    c.assign("q", "10");
    // b, r, c, d have no codeword and q never occurs
    EXPECT_NEAR(average_code_length(c, counts_), 5.0 / 11.0, 1e-9);
    EXPECT_EQ(average_code_length(c, FrequencyCount{}), 0.0);
}

TEST_F(PrefixCodecTest, Efficiency) {
    const double h = entropy(counts_);
    const double avg = average_code_length(build_huffman(counts_).codec, counts_);
    EXPECT_NEAR(coding_efficiency(h, avg), h / avg, 1e-12);
    EXPECT_LE(coding_efficiency(h, avg), 1.0 + 1e-12);
    EXPECT_EQ(coding_efficiency(h, 0.0), 0.0);
}

TEST_F(PrefixCodecTest, MissingSymbolReportsWholeSet) {
    Codec c = build_huffman(counts_).codec;
    try {
        encode(tokenize_unigrams("abxyx"), c);
        FAIL() << "expected MissingSymbol";
    } catch (const MissingSymbol& e) {
        EXPECT_EQ(e.symbols(), (std::set<std::string>{"x", "y"}));
        EXPECT_NE(std::string(e.what()).find("'x'"), std::string::npos);
    }
}

TEST_F(PrefixCodecTest, TrailingBitIsCorrupt) {
    Codec c;
    c.assign("a", "0");
    c.assign("b", "10");
    c.assign("c", "11");
    EXPECT_THROW(decode("1", c), CorruptStream);
    try {
        decode("0101", c);
        FAIL() << "expected CorruptStream";
    } catch (const CorruptStream& e) {
        EXPECT_EQ(e.bit_offset(), 3u);
    }
}

TEST_F(PrefixCodecTest, UnmatchableBitsAreCorrupt) {
    Codec c;
    c.assign("a", "0");
    c.assign("b", "10");
    // "11" can never become a codeword
    EXPECT_THROW(decode("011", c), CorruptStream);
    EXPECT_THROW(decode("0a", c), CorruptStream);
    EXPECT_THROW(decode("0", Codec{}), CorruptStream);
}

TEST_F(PrefixCodecTest, EmptyInputs) {
    Codec c = build_huffman(counts_).codec;
    EXPECT_EQ(encode({}, c), "");
    EXPECT_TRUE(decode("", c).empty());
}

TEST(PrefixCodecProperty, AverageLengthBetweenEntropyAndEntropyPlusOne) {
    std::mt19937 rng(99);
    std::uniform_int_distribution<int> size_dist(2, 30);
    std::uniform_int_distribution<uint64_t> weight_dist(1, 1000);
    for (int round = 0; round < 40; ++round) {
        FrequencyCount counts;
        const int n = size_dist(rng);
        for (int i = 0; i < n; ++i) counts.add("k" + std::to_string(i), weight_dist(rng));
        const double h = entropy(counts);
        const double huff = average_code_length(build_huffman(counts).codec, counts);
        const double sf = average_code_length(build_shannon_fano(counts), counts);
        EXPECT_GE(huff, h - 1e-9);
        EXPECT_LT(huff, h + 1.0);
        EXPECT_LE(huff, sf + 1e-9);
    }
}

TEST(PrefixCodecProperty, RoundTripOnBigrams) {
    const std::string text = "abracadabra";
    const SymbolSequence bigrams = tokenize_bigrams(text);
    const FrequencyCount counts = count_symbols(bigrams);
    for (const Codec& c : {build_huffman(counts).codec, build_shannon_fano(counts)}) {
        const SymbolSequence decoded = decode(encode(bigrams, c), c);
        EXPECT_EQ(decoded, bigrams);
        EXPECT_EQ(join_bigrams(decoded), text);
    }
}
