#pragma once

#include "compression/huffman/types.hpp"

#include <cstdint>
#include <iosfwd>
#include <vector>

namespace hzip::compression::huffman {

void writeContainer(std::ostream& output, const CompressedContainer& container);
CompressedContainer readContainer(std::istream& input);

std::vector<std::uint8_t> encodeContainer(const CompressedContainer& container);
CompressedContainer decodeContainer(const std::vector<std::uint8_t>& bytes);

} // namespace hzip::compression::huffman
