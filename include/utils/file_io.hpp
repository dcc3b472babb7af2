#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace hzip::utils {

// Whole contents of a regular file.
std::vector<std::uint8_t> readFile(const std::filesystem::path& path);

// Replaces the file at `path` with `data`. Missing parent directories are
// created. The bytes are staged in a sibling file and renamed into place, so
// a failed write never leaves a truncated destination behind.
void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

} // namespace hzip::utils
