#include "utils/file_io.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace hzip::utils {
namespace {

std::runtime_error ioFailure(const std::string& what, const std::filesystem::path& path)
{
    return std::runtime_error(what + ": " + path.string());
}

std::filesystem::path stagingPathFor(const std::filesystem::path& path)
{
    auto staging = path;
    staging += ".partial";
    return staging;
}

} // namespace

std::vector<std::uint8_t> readFile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ioFailure("Input is not a regular file", path);
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw ioFailure("Cannot determine file size (" + ec.message() + ")", path);
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ioFailure("Cannot open for reading", path);
    }

    std::vector<std::uint8_t> contents(static_cast<std::size_t>(size));
    if (!contents.empty()
        && !input.read(reinterpret_cast<char*>(contents.data()), static_cast<std::streamsize>(contents.size()))) {
        throw ioFailure("Short read", path);
    }
    return contents;
}

void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::filesystem::filesystem_error("create_directories", path.parent_path(), ec);
        }
    }

    const auto staging = stagingPathFor(path);
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw ioFailure("Cannot open for writing", staging);
        }
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        output.flush();
        if (!output) {
            std::filesystem::remove(staging, ec);
            throw ioFailure("Write failed", staging);
        }
    }

    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(staging, cleanup);
        throw std::filesystem::filesystem_error("rename", staging, path, ec);
    }
}

} // namespace hzip::utils
