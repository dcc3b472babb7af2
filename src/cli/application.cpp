#include "cli/application.hpp"

#include "compression/huffman.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

enum class Command {
    Compress,
    Decompress,
    Help
};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input;
    std::filesystem::path output;
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  hzip help\n"
              << "  hzip compress --input <path> --output <path>\n"
              << "  hzip decompress --input <path> --output <path>\n\n"
              << "Notes:\n"
              << "  - Input must be a non-empty regular file.\n"
              << "  - The output path is always explicit; missing parent directories are created.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "compress") {
        return Command::Compress;
    }
    if (lowered == "decompress") {
        return Command::Decompress;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

// Consumes the value following the flag at `index`.
std::string requireValue(int argc, char** argv, int& index)
{
    if (index + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[index]);
    }
    return argv[++index];
}

void printCompressionReport(const hzip::compression::huffman::CompressionStats& stats)
{
    std::ostringstream line;
    line << "Original size: " << stats.originalSize << " bytes, compressed size: " << stats.compressedSize
         << " bytes, space saved: " << stats.spaceSaved << " bytes (" << std::fixed << std::setprecision(2)
         << stats.ratio << "%)";
    std::cout << line.str() << "\n";
}

void printDecompressionReport(const hzip::compression::huffman::DecompressionStats& stats)
{
    std::cout << "Compressed size: " << stats.compressedSize << " bytes, restored size: "
              << stats.decompressedSize << " bytes\n";
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];

        if (argument == "--input" || argument == "-i") {
            options.input = std::filesystem::path(requireValue(argc, argv, index));
        } else if (argument == "--output" || argument == "-o") {
            options.output = std::filesystem::path(requireValue(argc, argv, index));
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (options.input.empty()) {
        throw std::invalid_argument("Missing required --input argument");
    }
    if (options.output.empty()) {
        throw std::invalid_argument("Missing required --output argument");
    }
    std::error_code ec;
    if (std::filesystem::equivalent(options.input, options.output, ec)) {
        throw std::invalid_argument("Input and output must be different files");
    }
    return options;
}

} // namespace

namespace hzip::cli {

int run(int argc, char** argv)
{
    try {
        const auto options = parseOptions(argc, argv);

        switch (options.command) {
        case Command::Help:
            printUsage();
            return 0;
        case Command::Compress: {
            const auto stats = hzip::compression::huffman::compressFile(options.input, options.output);
            std::cout << "Compression completed successfully\n";
            printCompressionReport(stats);
            return 0;
        }
        case Command::Decompress: {
            const auto stats = hzip::compression::huffman::decompressFile(options.input, options.output);
            std::cout << "Decompression completed successfully\n";
            printDecompressionReport(stats);
            return 0;
        }
        }

        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace hzip::cli
