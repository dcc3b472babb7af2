#pragma once

#include "compression/huffman/code_book.hpp"
#include "compression/huffman/frequency_table.hpp"
#include "compression/huffman/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace hzip::compression::huffman {

inline constexpr std::uint8_t kLeafTag = 0x00;
inline constexpr std::uint8_t kInternalTag = 0x01;
inline constexpr std::uint8_t kAbsentTag = 0x02;

struct HuffmanNode {
    std::uint64_t weight {0};
    ByteValue value {0};
    bool leaf {false};
    std::unique_ptr<HuffmanNode> left;
    std::unique_ptr<HuffmanNode> right;

    bool isLeaf() const noexcept { return leaf; }
};

/**
 * Immutable prefix-code tree over byte values.
 *
 * The root is always an internal node. When only one byte value occurs the
 * root has that leaf as its left child and no right child, so the leaf gets
 * the one-bit code "0".
 */
class HuffmanTree {
public:
    HuffmanTree() = default;

    HuffmanTree(HuffmanTree&&) noexcept = default;
    HuffmanTree& operator=(HuffmanTree&&) noexcept = default;
    HuffmanTree(const HuffmanTree&) = delete;
    HuffmanTree& operator=(const HuffmanTree&) = delete;

    // Greedy merge of the two lightest nodes; equal weights are taken in
    // insertion order (leaves in ascending byte order, then merged nodes).
    static HuffmanTree build(const FrequencyTable& frequencies);

    // Inverse of serialize(). Resulting nodes carry zero weights.
    static HuffmanTree deserialize(const std::vector<std::uint8_t>& bytes);

    // Tagged pre-order description: leaf = kLeafTag value,
    // internal = kInternalTag left right, missing child = kAbsentTag.
    std::vector<std::uint8_t> serialize() const;

    CodeBook codes() const;

    const HuffmanNode* root() const noexcept { return root_.get(); }
    bool empty() const noexcept { return !root_; }
    std::uint64_t weight() const noexcept;
    std::size_t leafCount() const;

    // Same shape and same leaf values at the same positions; weights ignored.
    bool sameShape(const HuffmanTree& other) const;

private:
    explicit HuffmanTree(std::unique_ptr<HuffmanNode> root);

    std::unique_ptr<HuffmanNode> root_;
};

} // namespace hzip::compression::huffman
