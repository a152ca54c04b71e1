#pragma once

#include <string>
#include <vector>

#include "entropy/codec.hpp"
#include "filter/frequency_filter.hpp"
#include "stats/entropy.hpp"
#include "stats/frequency.hpp"

namespace infocode {

enum class CodeMethod {
    Huffman,
    ShannonFano,
};

enum class TokenKind {
    Unigram,
    Bigram,
};

const char* to_string(CodeMethod method);
const char* to_string(TokenKind kind);

// Parse "huffman", "shannon-fano" or "both". Throws std::runtime_error otherwise.
std::vector<CodeMethod> parse_methods(const std::string& name);

struct CodingResult {
    CodeMethod method{CodeMethod::Huffman};
    Codec codec;
    std::string encoded;       // bit string
    std::string decoded_text;  // decoded tokens joined back into text
    bool round_trip_ok{false};
    double average_length{0.0};
    double efficiency{0.0};
    size_t packed_bytes{0};
};

struct AlphabetAnalysis {
    TokenKind kind{TokenKind::Unigram};
    FrequencyCount counts;
    EntropyMetrics metrics;
    std::vector<CodingResult> codings;
};

struct RemovalReport {
    double fraction{0.0};
    EntropyShift top;
    EntropyShift bottom;
};

struct AnalysisOptions {
    std::vector<CodeMethod> methods{CodeMethod::Huffman, CodeMethod::ShannonFano};
    bool bigrams{false};
    bool removal{true};
    double removal_fraction{0.2};
};

struct AnalysisReport {
    std::string text;
    std::vector<AlphabetAnalysis> alphabets;
    bool has_removal{false};
    RemovalReport removal;
};

// Count, measure and code one alphabet of the text. A method that cannot
// build a code for the alphabet (Shannon-Fano below two symbols, anything on
// an empty alphabet) is skipped rather than reported as an error.
AlphabetAnalysis analyze_alphabet(const std::string& text,
                                  TokenKind kind,
                                  const std::vector<CodeMethod>& methods);

// Top and bottom removal of the same fraction of the unigram alphabet.
RemovalReport run_removal_experiment(const std::string& text, double fraction);

AnalysisReport run_analysis(const std::string& text, const AnalysisOptions& options);

} // namespace infocode
