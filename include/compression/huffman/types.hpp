#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hzip::compression::huffman {

inline constexpr char kContainerMagic[4] = {'H', 'Z', 'I', 'P'};
inline constexpr std::uint8_t kFormatVersion = 1;
inline constexpr std::size_t kAlphabetSize = 256;

using ByteValue = std::uint8_t;
using BitSequence = std::vector<bool>;

struct PackedBits {
    std::vector<std::uint8_t> bytes;
    std::uint8_t padding {0};
};

struct CompressedContainer {
    std::vector<std::uint8_t> tree;
    std::vector<std::uint8_t> payload;
    std::uint8_t padding {0};
    std::uint64_t symbolCount {0};
};

struct CompressionStats {
    std::uint64_t originalSize {0};
    std::uint64_t compressedSize {0};
    std::int64_t spaceSaved {0};
    double ratio {0.0};
};

struct CompressionResult {
    CompressedContainer container;
    CompressionStats stats;
};

struct DecompressionStats {
    std::uint64_t compressedSize {0};
    std::uint64_t originalSize {0};
    std::uint64_t decompressedSize {0};
};

} // namespace hzip::compression::huffman
