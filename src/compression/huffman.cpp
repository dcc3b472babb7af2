#include "compression/huffman.hpp"

#include "compression/huffman/archive.hpp"
#include "compression/huffman/codec.hpp"
#include "compression/huffman/frequency_table.hpp"
#include "compression/huffman/tree.hpp"
#include "utils/file_io.hpp"

#include <utility>

namespace hzip::compression::huffman {

CompressedContainer compress(const std::vector<std::uint8_t>& data)
{
    const auto frequencies = FrequencyTable::build(data);
    const auto tree = HuffmanTree::build(frequencies);
    const auto codes = tree.codes();
    auto packed = pack(encode(data, codes));

    CompressedContainer container {};
    container.tree = tree.serialize();
    container.payload = std::move(packed.bytes);
    container.padding = packed.padding;
    container.symbolCount = static_cast<std::uint64_t>(data.size());
    return container;
}

std::vector<std::uint8_t> decompress(const CompressedContainer& container)
{
    const auto tree = HuffmanTree::deserialize(container.tree);
    return decode(container.payload, container.padding, container.symbolCount, tree);
}

CompressionStats computeStats(std::uint64_t originalSize, std::uint64_t compressedSize)
{
    CompressionStats stats {};
    stats.originalSize = originalSize;
    stats.compressedSize = compressedSize;
    stats.spaceSaved = static_cast<std::int64_t>(originalSize) - static_cast<std::int64_t>(compressedSize);
    if (originalSize > 0U) {
        stats.ratio = (1.0 - static_cast<double>(compressedSize) / static_cast<double>(originalSize)) * 100.0;
    }
    return stats;
}

CompressionResult compressWithStats(const std::vector<std::uint8_t>& data)
{
    CompressionResult result {};
    result.container = compress(data);
    const auto encodedSize = encodeContainer(result.container).size();
    result.stats = computeStats(static_cast<std::uint64_t>(data.size()), static_cast<std::uint64_t>(encodedSize));
    return result;
}

CompressionStats compressFile(const std::filesystem::path& source, const std::filesystem::path& destination)
{
    const auto buffer = hzip::utils::readFile(source);
    const auto container = compress(buffer);
    const auto encoded = encodeContainer(container);
    hzip::utils::writeFile(destination, encoded);
    return computeStats(static_cast<std::uint64_t>(buffer.size()), static_cast<std::uint64_t>(encoded.size()));
}

DecompressionStats decompressFile(const std::filesystem::path& source, const std::filesystem::path& destination)
{
    const auto encoded = hzip::utils::readFile(source);
    const auto container = decodeContainer(encoded);
    const auto decompressed = decompress(container);
    hzip::utils::writeFile(destination, decompressed);

    DecompressionStats stats {};
    stats.compressedSize = static_cast<std::uint64_t>(encoded.size());
    stats.originalSize = container.symbolCount;
    stats.decompressedSize = static_cast<std::uint64_t>(decompressed.size());
    return stats;
}

} // namespace hzip::compression::huffman
