#include "compression/huffman/bit_stream.hpp"

#include <stdexcept>
#include <utility>

namespace hzip::compression::huffman {

void BitWriter::writeBit(bool bit)
{
    current_ = static_cast<std::uint8_t>((current_ << 1U) | static_cast<std::uint8_t>(bit));
    ++bitCount_;
    ++totalBits_;
    if (bitCount_ == 8U) {
        buffer_.push_back(current_);
        current_ = 0;
        bitCount_ = 0;
    }
}

void BitWriter::writeCode(const BitSequence& bits)
{
    for (bool bit : bits) {
        writeBit(bit);
    }
}

PackedBits BitWriter::finish()
{
    PackedBits packed {};
    if (bitCount_ > 0U) {
        packed.padding = static_cast<std::uint8_t>(8U - bitCount_);
        current_ <<= packed.padding;
        buffer_.push_back(current_);
        current_ = 0;
        bitCount_ = 0;
    }
    packed.bytes = std::move(buffer_);
    buffer_.clear();
    totalBits_ = 0;
    return packed;
}

BitReader::BitReader(const std::uint8_t* data, std::size_t size, std::uint8_t padding)
    : data_(data)
    , available_(static_cast<std::uint64_t>(size) * 8U)
{
    if (padding > 7U) {
        throw std::invalid_argument("Padding must be between 0 and 7 bits");
    }
    if (padding > available_) {
        throw std::invalid_argument("Padding exceeds the available bits");
    }
    available_ -= padding;
}

bool BitReader::readBit(bool& bit)
{
    if (consumed_ >= available_) {
        return false;
    }

    const auto current = data_[consumed_ / 8U];
    const auto shift = 7U - static_cast<unsigned>(consumed_ % 8U);
    bit = static_cast<bool>((current >> shift) & 0x1U);
    ++consumed_;
    return true;
}

} // namespace hzip::compression::huffman
