#pragma once

#include "compression/huffman/errors.hpp"
#include "compression/huffman/types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace hzip::compression::huffman {

// Throws EmptyInputError for an empty buffer. Performs no I/O.
CompressedContainer compress(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> decompress(const CompressedContainer& container);

// compress() plus the size figures of the serialized container.
CompressionResult compressWithStats(const std::vector<std::uint8_t>& data);
CompressionStats computeStats(std::uint64_t originalSize, std::uint64_t compressedSize);

CompressionStats compressFile(const std::filesystem::path& source, const std::filesystem::path& destination);
DecompressionStats decompressFile(const std::filesystem::path& source, const std::filesystem::path& destination);

} // namespace hzip::compression::huffman
