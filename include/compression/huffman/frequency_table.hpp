#pragma once

#include "compression/huffman/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace hzip::compression::huffman {

// Byte occurrence counts. A value that never occurred is absent from the
// table rather than present with a zero count.
class FrequencyTable {
public:
    using Entry = std::pair<ByteValue, std::uint64_t>;

    FrequencyTable() = default;

    static FrequencyTable build(const std::vector<std::uint8_t>& data);

    void add(ByteValue value, std::uint64_t count = 1);

    bool contains(ByteValue value) const noexcept;
    std::uint64_t count(ByteValue value) const noexcept;

    std::size_t distinctCount() const noexcept;
    std::uint64_t total() const noexcept;
    bool empty() const noexcept;

    // Present entries in ascending byte order; this is the leaf insertion
    // order used by tree construction.
    std::vector<Entry> entries() const;

    bool operator==(const FrequencyTable& other) const noexcept;
    bool operator!=(const FrequencyTable& other) const noexcept { return !(*this == other); }

private:
    std::array<std::uint64_t, kAlphabetSize> counts_ {};
    std::uint64_t total_ {0};
    std::size_t distinct_ {0};
};

} // namespace hzip::compression::huffman
