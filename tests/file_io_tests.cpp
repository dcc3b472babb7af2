#include "utils/file_io.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix)
    {
        const auto unique = prefix + "_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = std::filesystem::temp_directory_path() / unique;
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

TEST(FileIoTest, WritesIntoMissingDirectories)
{
    ScopedTempDir temp("hzip_io_nested");
    const auto target = temp.path() / "a" / "b" / "data.bin";
    const std::vector<std::uint8_t> data {0x00, 0xFF, 0x10, 0x0A};

    hzip::utils::writeFile(target, data);
    EXPECT_EQ(hzip::utils::readFile(target), data);

    auto staging = target;
    staging += ".partial";
    EXPECT_FALSE(std::filesystem::exists(staging));
}

TEST(FileIoTest, OverwriteReplacesLongerContents)
{
    ScopedTempDir temp("hzip_io_overwrite");
    const auto target = temp.path() / "data.bin";

    hzip::utils::writeFile(target, std::vector<std::uint8_t>(64, 'x'));
    hzip::utils::writeFile(target, {'y', 'z'});
    EXPECT_EQ(hzip::utils::readFile(target), (std::vector<std::uint8_t> {'y', 'z'}));

    hzip::utils::writeFile(target, {});
    EXPECT_TRUE(hzip::utils::readFile(target).empty());
}

TEST(FileIoTest, ReadRejectsMissingAndDirectoryPaths)
{
    ScopedTempDir temp("hzip_io_reject");
    EXPECT_THROW(hzip::utils::readFile(temp.path() / "absent.bin"), std::runtime_error);
    EXPECT_THROW(hzip::utils::readFile(temp.path()), std::runtime_error);
}

} // namespace
