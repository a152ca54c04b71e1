// =============================================================================
// Shannon-Fano Builder Tests
// =============================================================================

#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "entropy/shannon_fano.hpp"

using namespace infocode;

namespace {
std::string code_of(const Codec& c, const Symbol& s) {
    const CodeWord* w = c.find_code(s);
    return w ? *w : std::string("<none>");
}
} // namespace

TEST(ShannonFanoTest, SkewedFourSymbols) {
    FrequencyCount counts;
    counts.add("a", 5);
    counts.add("b", 2);
    counts.add("c", 1);
    counts.add("d", 1);
    Codec c = build_shannon_fano(counts);
    // a alone reaches half of 9
    EXPECT_EQ(code_of(c, "a"), "0");
    EXPECT_EQ(code_of(c, "b"), "10");
    EXPECT_EQ(code_of(c, "c"), "110");
    EXPECT_EQ(code_of(c, "d"), "111");
}

TEST(ShannonFanoTest, Abracadabra) {
    Codec c = build_shannon_fano(count_symbols(tokenize_unigrams("abracadabra")));
    // ranked a5 b2 r2 c1 d1; a+b reaches half of 11
    EXPECT_EQ(code_of(c, "a"), "00");
    EXPECT_EQ(code_of(c, "b"), "01");
    EXPECT_EQ(code_of(c, "r"), "10");
    EXPECT_EQ(code_of(c, "c"), "110");
    EXPECT_EQ(code_of(c, "d"), "111");
    ASSERT_EQ(c.size(), 5u);
    EXPECT_EQ(c.entries()[0].symbol, "a");
}

TEST(ShannonFanoTest, EqualWeightsKeepFirstSeenOrder) {
    FrequencyCount counts;
    counts.add("x", 1);
    counts.add("y", 1);
    counts.add("z", 1);
    Codec c = build_shannon_fano(counts);
    // x reaches 1/3 < half, x+y reaches half -> {x,y} | {z}
    EXPECT_EQ(code_of(c, "x"), "00");
    EXPECT_EQ(code_of(c, "y"), "01");
    EXPECT_EQ(code_of(c, "z"), "1");
}

TEST(ShannonFanoTest, TwoSymbols) {
    FrequencyCount counts;
    counts.add("q", 1);
    counts.add("p", 100);
    Codec c = build_shannon_fano(counts);
    EXPECT_EQ(code_of(c, "p"), "0");
    EXPECT_EQ(code_of(c, "q"), "1");
}

TEST(ShannonFanoTest, NeedsTwoSymbols) {
    FrequencyCount empty;
    EXPECT_THROW(build_shannon_fano(empty), InvalidInput);
    FrequencyCount one;
    one.add("a", 3);
    EXPECT_THROW(build_shannon_fano(one), InvalidInput);
}

TEST(ShannonFanoTest, PrefixFreeAndComplete) {
    const char* texts[] = {
        "abracadabra",
        "mississippi river banks",
        "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaabbbbbbbbbbbbcccccddde",
        "the quick brown fox jumps over the lazy dog",
    };
    for (const char* t : texts) {
        Codec c = build_shannon_fano(count_symbols(tokenize_unigrams(t)));
        EXPECT_TRUE(is_prefix_free(c)) << t;
        EXPECT_NEAR(kraft_sum(c), 1.0, 1e-12) << t;
    }
}
