#include "compression/huffman/codec.hpp"
#include "compression/huffman/errors.hpp"
#include "compression/huffman/frequency_table.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using namespace hzip::compression::huffman;

std::vector<std::uint8_t> bytesOf(const std::string& text)
{
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::string bitsToString(const BitSequence& bits)
{
    std::string text;
    for (bool bit : bits) {
        text.push_back(bit ? '1' : '0');
    }
    return text;
}

class BitStreamCodecTest : public ::testing::Test {
protected:
    BitStreamCodecTest()
        : tree_(HuffmanTree::build(FrequencyTable::build(bytesOf("aaaabbbccd"))))
        , codes_(tree_.codes())
    {
    }

    HuffmanTree tree_;
    CodeBook codes_;
};

TEST_F(BitStreamCodecTest, EncodeConcatenatesCodes)
{
    const auto bits = encode(bytesOf("abcd"), codes_);
    EXPECT_EQ(bitsToString(bits), "0" "10" "111" "110");
}

TEST_F(BitStreamCodecTest, EncodeRejectsUncoveredBytes)
{
    EXPECT_THROW(encode(bytesOf("abz"), codes_), MissingCodeError);
}

TEST_F(BitStreamCodecTest, PackComputesPadding)
{
    const auto packed = pack(encode(bytesOf("abcd"), codes_));
    ASSERT_EQ(packed.bytes.size(), 2U);
    EXPECT_EQ(packed.bytes[0], 0x5F);
    EXPECT_EQ(packed.bytes[1], 0x00);
    EXPECT_EQ(packed.padding, 7U);

    EXPECT_EQ(pack(BitSequence(8, true)).padding, 0U);
    EXPECT_EQ(pack(BitSequence(9, true)).padding, 7U);
    EXPECT_EQ(pack(BitSequence {}).padding, 0U);
    EXPECT_TRUE(pack(BitSequence {}).bytes.empty());
}

TEST_F(BitStreamCodecTest, DecodeRestoresInput)
{
    const auto input = bytesOf("aaaabbbccd");
    const auto packed = pack(encode(input, codes_));
    const auto output = decode(packed.bytes, packed.padding, input.size(), tree_);
    EXPECT_EQ(output, input);
}

TEST_F(BitStreamCodecTest, SymbolCountStopsBeforePaddingCompletesCodes)
{
    // "b" packs to 10000000; the six zero padding bits each decode as 'a'.
    const auto packed = pack(encode(bytesOf("b"), codes_));
    ASSERT_EQ(packed.padding, 6U);

    EXPECT_EQ(decode(packed.bytes, 0, 1, tree_), bytesOf("b"));
    EXPECT_EQ(decode(packed.bytes, 0, 7, tree_), bytesOf("baaaaaa"));
}

TEST_F(BitStreamCodecTest, DecodeFailsWhenBitsRunOut)
{
    const auto packed = pack(encode(bytesOf("b"), codes_));
    EXPECT_THROW(decode(packed.bytes, packed.padding, 2, tree_), DecodeTraversalError);
    EXPECT_THROW(decode(packed.bytes, packed.padding, 9, tree_), DecodeTraversalError);
}

TEST_F(BitStreamCodecTest, DecodeRejectsBadPadding)
{
    const std::vector<std::uint8_t> bytes {0x00};
    EXPECT_THROW(decode(bytes, 8, 1, tree_), DecodeTraversalError);
    EXPECT_THROW(decode({}, 3, 0, tree_), DecodeTraversalError);
}

TEST_F(BitStreamCodecTest, ZeroSymbolsDecodeToNothing)
{
    EXPECT_TRUE(decode({}, 0, 0, tree_).empty());
}

TEST(BitStreamCodecSingleSymbolTest, PathOutsideTreeIsRejected)
{
    const auto tree = HuffmanTree::build(FrequencyTable::build(bytesOf("x")));

    const std::vector<std::uint8_t> zeroBit {0x00};
    EXPECT_EQ(decode(zeroBit, 7, 1, tree), bytesOf("x"));

    const std::vector<std::uint8_t> oneBit {0x80};
    EXPECT_THROW(decode(oneBit, 7, 1, tree), DecodeTraversalError);
}

TEST(BitStreamCodecSingleSymbolTest, EmptyTreeIsRejected)
{
    HuffmanTree tree;
    EXPECT_THROW(decode({0x00}, 0, 1, tree), EmptyTreeError);
}

} // namespace
