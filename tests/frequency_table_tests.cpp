#include "compression/huffman/errors.hpp"
#include "compression/huffman/frequency_table.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using hzip::compression::huffman::EmptyInputError;
using hzip::compression::huffman::FrequencyTable;

std::vector<std::uint8_t> bytesOf(const std::string& text)
{
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

TEST(FrequencyTableTest, CountsEveryByte)
{
    const auto table = FrequencyTable::build(bytesOf("aaaabbbccd"));

    EXPECT_EQ(table.count('a'), 4U);
    EXPECT_EQ(table.count('b'), 3U);
    EXPECT_EQ(table.count('c'), 2U);
    EXPECT_EQ(table.count('d'), 1U);
    EXPECT_EQ(table.total(), 10U);
    EXPECT_EQ(table.distinctCount(), 4U);
}

TEST(FrequencyTableTest, AbsentValuesAreNotEntries)
{
    const auto table = FrequencyTable::build(bytesOf("abc"));

    EXPECT_TRUE(table.contains('a'));
    EXPECT_FALSE(table.contains('z'));
    EXPECT_FALSE(table.contains(0));

    const auto entries = table.entries();
    ASSERT_EQ(entries.size(), 3U);
    for (const auto& [value, count] : entries) {
        EXPECT_GE(count, 1U);
        EXPECT_TRUE(table.contains(value));
    }
}

TEST(FrequencyTableTest, EntriesAreInAscendingByteOrder)
{
    const auto table = FrequencyTable::build(std::vector<std::uint8_t> {200, 3, 77, 3, 255, 0});

    const auto entries = table.entries();
    ASSERT_EQ(entries.size(), 5U);
    EXPECT_EQ(entries[0].first, 0);
    EXPECT_EQ(entries[1].first, 3);
    EXPECT_EQ(entries[1].second, 2U);
    EXPECT_EQ(entries[2].first, 77);
    EXPECT_EQ(entries[3].first, 200);
    EXPECT_EQ(entries[4].first, 255);
}

TEST(FrequencyTableTest, SumOfCountsEqualsInputLength)
{
    std::vector<std::uint8_t> data;
    for (int round = 0; round < 3; ++round) {
        for (int value = 0; value < 256; ++value) {
            data.push_back(static_cast<std::uint8_t>(value));
        }
    }
    data.push_back(42);

    const auto table = FrequencyTable::build(data);

    std::uint64_t sum = 0;
    for (const auto& entry : table.entries()) {
        sum += entry.second;
    }
    EXPECT_EQ(sum, data.size());
    EXPECT_EQ(table.distinctCount(), 256U);
    EXPECT_EQ(table.count(42), 4U);
}

TEST(FrequencyTableTest, RejectsEmptyInput)
{
    EXPECT_THROW(FrequencyTable::build({}), EmptyInputError);
}

TEST(FrequencyTableTest, AddIgnoresZeroCounts)
{
    FrequencyTable table;
    table.add('q', 0);
    EXPECT_TRUE(table.empty());

    table.add('q', 5);
    table.add('q');
    EXPECT_EQ(table.count('q'), 6U);
    EXPECT_EQ(table.distinctCount(), 1U);
}

} // namespace
