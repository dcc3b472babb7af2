#pragma once

#include "compression/huffman/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hzip::compression::huffman {

// Packs bits MSB-first; the final partial byte is zero-filled on the right.
class BitWriter {
public:
    BitWriter() = default;

    void writeBit(bool bit);
    void writeCode(const BitSequence& bits);
    std::uint64_t bitCount() const noexcept { return totalBits_; }
    PackedBits finish();

private:
    std::vector<std::uint8_t> buffer_;
    std::uint64_t totalBits_ {0};
    std::uint8_t current_ {0};
    std::uint8_t bitCount_ {0};
};

class BitReader {
public:
    // The last `padding` bits of the final byte are never returned.
    BitReader(const std::uint8_t* data, std::size_t size, std::uint8_t padding = 0);

    bool readBit(bool& bit);
    std::uint64_t remaining() const noexcept { return available_ - consumed_; }

private:
    const std::uint8_t* data_ {nullptr};
    std::uint64_t available_ {0};
    std::uint64_t consumed_ {0};
};

} // namespace hzip::compression::huffman
