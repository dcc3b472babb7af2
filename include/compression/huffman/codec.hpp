#pragma once

#include "compression/huffman/code_book.hpp"
#include "compression/huffman/tree.hpp"
#include "compression/huffman/types.hpp"

#include <cstdint>
#include <vector>

namespace hzip::compression::huffman {

// Concatenates the code of every input byte. Throws MissingCodeError for a
// byte the code book does not cover.
BitSequence encode(const std::vector<std::uint8_t>& data, const CodeBook& codes);

// Padding is (8 - bits mod 8) mod 8.
PackedBits pack(const BitSequence& bits);

// Walks the tree once per bit and stops after exactly symbolCount bytes.
std::vector<std::uint8_t> decode(const std::vector<std::uint8_t>& bytes,
                                 std::uint8_t padding,
                                 std::uint64_t symbolCount,
                                 const HuffmanTree& tree);

} // namespace hzip::compression::huffman
