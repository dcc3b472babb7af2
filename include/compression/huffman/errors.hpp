#pragma once

#include <stdexcept>
#include <string>

namespace hzip::compression::huffman {

class HuffmanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EmptyInputError : public HuffmanError {
public:
    EmptyInputError()
        : HuffmanError("Cannot compress an empty input")
    {
    }
};

class EmptyTreeError : public HuffmanError {
public:
    EmptyTreeError()
        : HuffmanError("Huffman tree is empty")
    {
    }
};

class MalformedTreeError : public HuffmanError {
public:
    explicit MalformedTreeError(const std::string& reason)
        : HuffmanError("Malformed Huffman tree: " + reason)
    {
    }
};

class MissingCodeError : public HuffmanError {
public:
    explicit MissingCodeError(unsigned value)
        : HuffmanError("No Huffman code for byte value " + std::to_string(value))
        , value_(value)
    {
    }

    unsigned value() const noexcept { return value_; }

private:
    unsigned value_ {0};
};

class DecodeTraversalError : public HuffmanError {
public:
    explicit DecodeTraversalError(const std::string& reason)
        : HuffmanError("Huffman decode failed: " + reason)
    {
    }
};

class ContainerFormatError : public HuffmanError {
public:
    explicit ContainerFormatError(const std::string& reason)
        : HuffmanError("Invalid container: " + reason)
    {
    }
};

} // namespace hzip::compression::huffman
