#pragma once

#include "compression/huffman/types.hpp"

#include <array>
#include <cstddef>
#include <string>

namespace hzip::compression::huffman {

class CodeBook {
public:
    CodeBook() = default;

    void assign(ByteValue value, BitSequence bits);

    bool contains(ByteValue value) const noexcept;

    // Throws MissingCodeError when value has no code.
    const BitSequence& code(ByteValue value) const;

    // Code rendered as a string of '0' and '1' characters.
    std::string codeString(ByteValue value) const;

    std::size_t size() const noexcept;

private:
    std::array<BitSequence, kAlphabetSize> codes_ {};
    std::size_t size_ {0};
};

} // namespace hzip::compression::huffman
