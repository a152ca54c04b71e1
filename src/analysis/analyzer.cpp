#include "analysis/analyzer.hpp"

#include "entropy/bitstream.hpp"
#include "entropy/huffman.hpp"
#include "entropy/prefix_codec.hpp"
#include "entropy/shannon_fano.hpp"
#include "stats/symbols.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace infocode {

const char* to_string(CodeMethod method) {
    switch (method) {
    case CodeMethod::Huffman: return "huffman";
    case CodeMethod::ShannonFano: return "shannon-fano";
    }
    return "unknown";
}

const char* to_string(TokenKind kind) {
    switch (kind) {
    case TokenKind::Unigram: return "unigram";
    case TokenKind::Bigram: return "bigram";
    }
    return "unknown";
}

std::vector<CodeMethod> parse_methods(const std::string& name) {
    if (name == "huffman") return {CodeMethod::Huffman};
    if (name == "shannon-fano") return {CodeMethod::ShannonFano};
    if (name == "both") return {CodeMethod::Huffman, CodeMethod::ShannonFano};
    throw std::runtime_error("unknown method '" + name + "' (huffman, shannon-fano, both)");
}

namespace {

SymbolSequence tokenize(const std::string& text, TokenKind kind) {
    return kind == TokenKind::Bigram ? tokenize_bigrams(text) : tokenize_unigrams(text);
}

std::string rejoin(const SymbolSequence& tokens, TokenKind kind) {
    return kind == TokenKind::Bigram ? join_bigrams(tokens) : join_symbols(tokens);
}

CodingResult run_coding(const std::string& text,
                        TokenKind kind,
                        const SymbolSequence& tokens,
                        const AlphabetAnalysis& alphabet,
                        CodeMethod method) {
    CodingResult r;
    r.method = method;

    //===Build code===//
    HuffmanTree tree;
    if (method == CodeMethod::Huffman) {
        HuffmanCode hc = build_huffman(alphabet.counts);
        r.codec = std::move(hc.codec);
        tree = std::move(hc.tree);
    } else {
        r.codec = build_shannon_fano(alphabet.counts);
    }

    //===Encode / decode===//
    r.encoded = encode(tokens, r.codec);
    const SymbolSequence decoded = decode(r.encoded, r.codec);
    r.decoded_text = rejoin(decoded, kind);
    r.round_trip_ok = (decoded == tokens) && (r.decoded_text == text);
    if (method == CodeMethod::Huffman) {
        r.round_trip_ok = r.round_trip_ok && (decode_with_tree(r.encoded, tree) == tokens);
    }

    //===Packing===//
    const PackedBits packed = pack_bits(r.encoded);
    r.packed_bytes = packed.bytes.size();
    r.round_trip_ok = r.round_trip_ok && (unpack_bits(packed) == r.encoded);

    r.average_length = average_code_length(r.codec, alphabet.counts);
    r.efficiency = coding_efficiency(alphabet.metrics.entropy, r.average_length);

#ifndef NDEBUG
    std::fprintf(stderr, "[%s/%s] symbols=%zu bits=%zu avg=%.4f round_trip=%d\n",
                 to_string(kind), to_string(method), r.codec.size(), r.encoded.size(),
                 r.average_length, r.round_trip_ok ? 1 : 0);
#endif
    return r;
}

} // namespace

AlphabetAnalysis analyze_alphabet(const std::string& text,
                                  TokenKind kind,
                                  const std::vector<CodeMethod>& methods) {
    AlphabetAnalysis a;
    a.kind = kind;
    const SymbolSequence tokens = tokenize(text, kind);
    a.counts = count_symbols(tokens);
    a.metrics = analyze_entropy(a.counts);

    for (CodeMethod m : methods) {
        if (a.counts.empty()) continue;
        if (m == CodeMethod::ShannonFano && a.counts.distinct() < 2) continue;
        a.codings.push_back(run_coding(text, kind, tokens, a, m));
    }
    return a;
}

RemovalReport run_removal_experiment(const std::string& text, double fraction) {
    RemovalReport r;
    r.fraction = fraction;
    const SymbolSequence tokens = tokenize_unigrams(text);
    r.top = measure_removal(tokens, RemovalMode::Top, fraction);
    r.bottom = measure_removal(tokens, RemovalMode::Bottom, fraction);
    return r;
}

AnalysisReport run_analysis(const std::string& text, const AnalysisOptions& options) {
    AnalysisReport report;
    report.text = text;
    report.alphabets.push_back(analyze_alphabet(text, TokenKind::Unigram, options.methods));
    if (options.bigrams) {
        report.alphabets.push_back(analyze_alphabet(text, TokenKind::Bigram, options.methods));
    }
    if (options.removal) {
        report.removal = run_removal_experiment(text, options.removal_fraction);
        report.has_removal = true;
    }
    return report;
}

} // namespace infocode
