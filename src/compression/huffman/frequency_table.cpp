#include "compression/huffman/frequency_table.hpp"

#include "compression/huffman/errors.hpp"

namespace hzip::compression::huffman {

FrequencyTable FrequencyTable::build(const std::vector<std::uint8_t>& data)
{
    if (data.empty()) {
        throw EmptyInputError();
    }

    FrequencyTable table;
    for (const auto value : data) {
        table.add(value);
    }
    return table;
}

void FrequencyTable::add(ByteValue value, std::uint64_t count)
{
    if (count == 0U) {
        return;
    }

    auto& slot = counts_[static_cast<std::size_t>(value)];
    if (slot == 0U) {
        ++distinct_;
    }
    slot += count;
    total_ += count;
}

bool FrequencyTable::contains(ByteValue value) const noexcept
{
    return counts_[static_cast<std::size_t>(value)] != 0U;
}

std::uint64_t FrequencyTable::count(ByteValue value) const noexcept
{
    return counts_[static_cast<std::size_t>(value)];
}

std::size_t FrequencyTable::distinctCount() const noexcept
{
    return distinct_;
}

std::uint64_t FrequencyTable::total() const noexcept
{
    return total_;
}

bool FrequencyTable::empty() const noexcept
{
    return distinct_ == 0U;
}

std::vector<FrequencyTable::Entry> FrequencyTable::entries() const
{
    std::vector<Entry> result;
    result.reserve(distinct_);
    for (std::size_t symbol = 0; symbol < counts_.size(); ++symbol) {
        if (counts_[symbol] == 0U) {
            continue;
        }
        result.emplace_back(static_cast<ByteValue>(symbol), counts_[symbol]);
    }
    return result;
}

bool FrequencyTable::operator==(const FrequencyTable& other) const noexcept
{
    return counts_ == other.counts_;
}

} // namespace hzip::compression::huffman
