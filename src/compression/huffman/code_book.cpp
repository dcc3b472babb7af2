#include "compression/huffman/code_book.hpp"

#include "compression/huffman/errors.hpp"

#include <stdexcept>
#include <utility>

namespace hzip::compression::huffman {

void CodeBook::assign(ByteValue value, BitSequence bits)
{
    if (bits.empty()) {
        throw std::invalid_argument("Huffman code must not be empty");
    }

    auto& slot = codes_[static_cast<std::size_t>(value)];
    if (slot.empty()) {
        ++size_;
    }
    slot = std::move(bits);
}

bool CodeBook::contains(ByteValue value) const noexcept
{
    return !codes_[static_cast<std::size_t>(value)].empty();
}

const BitSequence& CodeBook::code(ByteValue value) const
{
    const auto& bits = codes_[static_cast<std::size_t>(value)];
    if (bits.empty()) {
        throw MissingCodeError(value);
    }
    return bits;
}

std::string CodeBook::codeString(ByteValue value) const
{
    const auto& bits = code(value);
    std::string text;
    text.reserve(bits.size());
    for (bool bit : bits) {
        text.push_back(bit ? '1' : '0');
    }
    return text;
}

std::size_t CodeBook::size() const noexcept
{
    return size_;
}

} // namespace hzip::compression::huffman
