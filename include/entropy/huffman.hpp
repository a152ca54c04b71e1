#pragma once

#include <cstdint>
#include <vector>

#include "entropy/codec.hpp"
#include "stats/frequency.hpp"

namespace infocode {

// Huffman tree stored as an arena: children are indices into `nodes`, -1 when
// absent. Leaves occupy indices [0, leaf count) in first-seen symbol order,
// internal nodes follow in the order they were merged.
struct HuffmanTree {
    struct Node {
        uint64_t weight{0};
        int left{-1};
        int right{-1};
        Symbol symbol; // leaves only

        bool is_leaf() const { return left == -1 && right == -1; }
    };
    std::vector<Node> nodes;
    int root{-1};

    bool empty() const { return root == -1; }
    size_t leaf_count() const;
};

struct HuffmanCode {
    Codec codec;
    HuffmanTree tree;
};

// Edge labels used when reading codewords off the tree.
inline constexpr char kHuffmanLeftBit = '1';
inline constexpr char kHuffmanRightBit = '0';

// Build a Huffman code.
// Two lowest-weight nodes are merged each round; equal weights go to the node
// created first. The first node taken becomes the left child. A one-symbol
// alphabet gets the codeword "0".
// Throws InvalidInput when counts is empty.
HuffmanCode build_huffman(const FrequencyCount& counts);

// Read codewords off an existing tree (left edge '1', right edge '0').
Codec codes_from_tree(const HuffmanTree& tree);

// Decode by walking the tree from the root. Throws CorruptStream when a bit
// leads nowhere or the stream ends mid-codeword.
SymbolSequence decode_with_tree(const std::string& bits, const HuffmanTree& tree);

} // namespace infocode
