#include "compression/huffman/archive.hpp"

#include "compression/huffman/errors.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace hzip::compression::huffman {
namespace {

template <class T>
void writeValue(std::ostream& output, T value)
{
    char bytes[sizeof(T)];
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        bytes[index] = static_cast<char>((value >> (8U * index)) & 0xFFU);
    }
    output.write(bytes, sizeof(T));
    if (!output) {
        throw std::runtime_error("Failed to write binary value");
    }
}

template <class T>
T readValue(std::istream& input, const char* field)
{
    unsigned char bytes[sizeof(T)] = {};
    input.read(reinterpret_cast<char*>(bytes), sizeof(T));
    if (input.gcount() != static_cast<std::streamsize>(sizeof(T))) {
        throw ContainerFormatError(std::string("truncated ") + field);
    }

    T value {};
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        value = static_cast<T>(value | (static_cast<T>(bytes[index]) << (8U * index)));
    }
    return value;
}

void writeBytes(std::ostream& output, const std::vector<std::uint8_t>& bytes, const char* field)
{
    if (bytes.empty()) {
        return;
    }
    output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!output) {
        throw std::runtime_error(std::string("Failed to write ") + field);
    }
}

std::vector<std::uint8_t> readBytes(std::istream& input, std::uint64_t size, const char* field)
{
    std::vector<std::uint8_t> bytes;
    // Grows only by bytes actually present in the stream.
    constexpr std::size_t kChunkSize = 1U << 16U;
    std::vector<char> chunk(kChunkSize);
    std::uint64_t remaining = size;
    while (remaining > 0U) {
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kChunkSize));
        input.read(chunk.data(), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(input.gcount());
        bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));
        if (got != wanted) {
            throw ContainerFormatError(std::string("truncated ") + field);
        }
        remaining -= wanted;
    }
    return bytes;
}

} // namespace

void writeContainer(std::ostream& output, const CompressedContainer& container)
{
    if (container.padding > 7U) {
        throw ContainerFormatError("padding must be between 0 and 7 bits");
    }
    if (container.tree.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
        throw ContainerFormatError("tree description exceeds maximum supported length");
    }

    output.write(kContainerMagic, sizeof(kContainerMagic));
    if (!output) {
        throw std::runtime_error("Failed to write container magic");
    }

    writeValue(output, kFormatVersion);
    const std::uint8_t reserved[3] = {0, 0, 0};
    output.write(reinterpret_cast<const char*>(reserved), sizeof(reserved));
    if (!output) {
        throw std::runtime_error("Failed to write container padding");
    }

    writeValue(output, static_cast<std::uint32_t>(container.tree.size()));
    writeBytes(output, container.tree, "tree description");
    writeValue(output, container.padding);
    writeValue(output, container.symbolCount);
    writeValue(output, static_cast<std::uint64_t>(container.payload.size()));
    writeBytes(output, container.payload, "payload");
}

CompressedContainer readContainer(std::istream& input)
{
    char magic[4] = {0, 0, 0, 0};
    input.read(magic, sizeof(magic));
    if (input.gcount() != static_cast<std::streamsize>(sizeof(magic))) {
        throw ContainerFormatError("truncated magic");
    }
    if (std::memcmp(magic, kContainerMagic, sizeof(magic)) != 0) {
        throw ContainerFormatError("bad magic");
    }

    const auto version = readValue<std::uint8_t>(input, "version");
    if (version != kFormatVersion) {
        throw ContainerFormatError("unsupported version " + std::to_string(version));
    }

    char reserved[3];
    input.read(reserved, sizeof(reserved));
    if (input.gcount() != static_cast<std::streamsize>(sizeof(reserved))) {
        throw ContainerFormatError("truncated header");
    }

    CompressedContainer container {};
    const auto treeLength = readValue<std::uint32_t>(input, "tree length");
    container.tree = readBytes(input, treeLength, "tree description");

    container.padding = readValue<std::uint8_t>(input, "padding");
    if (container.padding > 7U) {
        throw ContainerFormatError("padding must be between 0 and 7 bits");
    }
    container.symbolCount = readValue<std::uint64_t>(input, "symbol count");

    const auto payloadLength = readValue<std::uint64_t>(input, "payload length");
    if (payloadLength == 0U && container.padding != 0U) {
        throw ContainerFormatError("padding without payload");
    }
    container.payload = readBytes(input, payloadLength, "payload");

    return container;
}

std::vector<std::uint8_t> encodeContainer(const CompressedContainer& container)
{
    std::ostringstream output(std::ios::binary);
    writeContainer(output, container);
    const auto text = output.str();
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

CompressedContainer decodeContainer(const std::vector<std::uint8_t>& bytes)
{
    std::istringstream input(std::string(bytes.begin(), bytes.end()), std::ios::binary);
    auto container = readContainer(input);
    if (input.peek() != std::char_traits<char>::eof()) {
        throw ContainerFormatError("trailing bytes after payload");
    }
    return container;
}

} // namespace hzip::compression::huffman
