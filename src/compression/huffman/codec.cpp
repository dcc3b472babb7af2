#include "compression/huffman/codec.hpp"

#include "compression/huffman/bit_stream.hpp"
#include "compression/huffman/errors.hpp"

#include <string>

namespace hzip::compression::huffman {

BitSequence encode(const std::vector<std::uint8_t>& data, const CodeBook& codes)
{
    BitSequence bits;
    for (const auto value : data) {
        const auto& code = codes.code(value);
        bits.insert(bits.end(), code.begin(), code.end());
    }
    return bits;
}

PackedBits pack(const BitSequence& bits)
{
    BitWriter writer;
    writer.writeCode(bits);
    return writer.finish();
}

std::vector<std::uint8_t> decode(const std::vector<std::uint8_t>& bytes,
                                 std::uint8_t padding,
                                 std::uint64_t symbolCount,
                                 const HuffmanTree& tree)
{
    const HuffmanNode* root = tree.root();
    if (!root) {
        throw EmptyTreeError();
    }
    if (padding > 7U) {
        throw DecodeTraversalError("padding of " + std::to_string(padding) + " bits is out of range");
    }
    if (bytes.empty() && padding != 0U) {
        throw DecodeTraversalError("padding without payload");
    }

    std::vector<std::uint8_t> output;
    if (symbolCount == 0U) {
        return output;
    }
    if (root->isLeaf()) {
        throw DecodeTraversalError("tree root is a leaf");
    }

    // Every symbol takes at least one bit.
    const auto availableBits = static_cast<std::uint64_t>(bytes.size()) * 8U - padding;
    if (symbolCount > availableBits) {
        throw DecodeTraversalError("bit stream ended before all symbols were decoded");
    }
    output.reserve(static_cast<std::size_t>(symbolCount));

    BitReader reader(bytes.data(), bytes.size(), padding);
    const HuffmanNode* current = root;
    while (output.size() < symbolCount) {
        bool bit = false;
        if (!reader.readBit(bit)) {
            throw DecodeTraversalError("bit stream ended before all symbols were decoded");
        }
        current = bit ? current->right.get() : current->left.get();
        if (!current) {
            throw DecodeTraversalError("bit path leads outside the tree");
        }
        if (current->isLeaf()) {
            output.push_back(current->value);
            current = root;
        }
    }

    return output;
}

} // namespace hzip::compression::huffman
