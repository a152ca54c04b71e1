#include "entropy/huffman.hpp"

#include "common/errors.hpp"

#include <cstdint>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace infocode {

size_t HuffmanTree::leaf_count() const {
    size_t n = 0;
    for (const auto& nd : nodes) {
        if (nd.is_leaf()) ++n;
    }
    return n;
}

namespace {

// Heap entry: weight plus arena index. The index doubles as creation order.
struct HeapNode {
    uint64_t weight;
    int index;
};

struct HeapComp {
    bool operator()(const HeapNode& a, const HeapNode& b) const {
        if (a.weight != b.weight) return a.weight > b.weight; // min-heap
        return a.index > b.index; // tie-break by earliest created
    }
};

} // namespace

HuffmanCode build_huffman(const FrequencyCount& counts) {
    if (counts.empty()) {
        throw InvalidInput("huffman: empty symbol-frequency set");
    }

    HuffmanCode out;
    HuffmanTree& tree = out.tree;
    tree.nodes.reserve(counts.distinct() * 2 - 1);

    std::priority_queue<HeapNode, std::vector<HeapNode>, HeapComp> pq;
    for (const auto& sc : counts.items()) {
        HuffmanTree::Node leaf;
        leaf.weight = sc.count;
        leaf.symbol = sc.symbol;
        const int idx = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(std::move(leaf));
        pq.push({sc.count, idx});
    }

    while (pq.size() > 1) {
        HeapNode a = pq.top(); pq.pop();
        HeapNode b = pq.top(); pq.pop();
        if (a.weight > std::numeric_limits<uint64_t>::max() - b.weight) {
            throw std::runtime_error("huffman: weight overflow");
        }
        HuffmanTree::Node parent;
        parent.weight = a.weight + b.weight;
        parent.left = a.index;
        parent.right = b.index;
        const int idx = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(std::move(parent));
        pq.push({a.weight + b.weight, idx});
    }
    tree.root = pq.top().index;

    out.codec = codes_from_tree(tree);
    return out;
}

Codec codes_from_tree(const HuffmanTree& tree) {
    Codec codec;
    if (tree.empty()) return codec;

    const auto& root = tree.nodes[tree.root];
    if (root.is_leaf()) {
        codec.assign(root.symbol, "0");
        return codec;
    }

    // DFS with explicit stack; left pushed last so it is visited first
    std::vector<std::pair<int, std::string>> stack;
    stack.push_back({tree.root, std::string()});
    while (!stack.empty()) {
        auto [idx, prefix] = std::move(stack.back());
        stack.pop_back();
        const auto& nd = tree.nodes[idx];
        if (nd.is_leaf()) {
            codec.assign(nd.symbol, prefix);
            continue;
        }
        if (nd.left == -1 || nd.right == -1) {
            throw std::runtime_error("huffman: invalid tree structure");
        }
        stack.push_back({nd.right, prefix + kHuffmanRightBit});
        stack.push_back({nd.left, prefix + kHuffmanLeftBit});
    }
    return codec;
}

SymbolSequence decode_with_tree(const std::string& bits, const HuffmanTree& tree) {
    SymbolSequence out;
    if (tree.empty()) {
        if (!bits.empty()) throw CorruptStream("huffman decode: empty tree", 0);
        return out;
    }

    const auto& root = tree.nodes[tree.root];
    if (root.is_leaf()) {
        // one-symbol alphabet: every '0' is one occurrence
        for (size_t i = 0; i < bits.size(); ++i) {
            if (bits[i] != '0') {
                throw CorruptStream("huffman decode: unexpected bit in single-symbol stream", i);
            }
            out.push_back(root.symbol);
        }
        return out;
    }

    int node = tree.root;
    size_t codeword_start = 0;
    for (size_t i = 0; i < bits.size(); ++i) {
        const char bit = bits[i];
        if (bit == kHuffmanLeftBit) {
            node = tree.nodes[node].left;
        } else if (bit == kHuffmanRightBit) {
            node = tree.nodes[node].right;
        } else {
            throw CorruptStream("huffman decode: non-binary character", i);
        }
        if (node == -1) {
            throw CorruptStream("huffman decode: reached null child", codeword_start);
        }
        if (tree.nodes[node].is_leaf()) {
            out.push_back(tree.nodes[node].symbol);
            node = tree.root;
            codeword_start = i + 1;
        }
    }
    if (node != tree.root) {
        throw CorruptStream("huffman decode: stream ends inside a codeword", codeword_start);
    }
    return out;
}

#ifndef NDEBUG
namespace {
// Minimal self-test: build, read codes, walk the tree back.
struct HuffmanSelfTest {
    HuffmanSelfTest() {
        FrequencyCount counts;
        counts.add("a", 5);
        counts.add("b", 2);
        counts.add("c", 1);
        counts.add("d", 1);
        HuffmanCode hc = build_huffman(counts);
        std::string bits;
        for (const auto& e : hc.codec.entries()) bits += e.code;
        SymbolSequence decoded = decode_with_tree(bits, hc.tree);
        if (decoded.size() != hc.codec.size()) {
            throw std::runtime_error("huffman self-test: round-trip mismatch");
        }
        for (size_t i = 0; i < decoded.size(); ++i) {
            if (decoded[i] != hc.codec.entries()[i].symbol) {
                throw std::runtime_error("huffman self-test: round-trip mismatch");
            }
        }
    }
};
static HuffmanSelfTest _huff_self_test{};
} // namespace
#endif

} // namespace infocode
