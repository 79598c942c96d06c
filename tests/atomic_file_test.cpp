#include <gtest/gtest.h>

#include "securexfer/AtomicFile.h"

#include <fstream>
#include <iterator>

TEST(AtomicFileTest, ComputePathsAddsPartSuffix)
{
    const auto p = SecureXfer::computeAtomicFilePaths(
        std::filesystem::path("/tmp/example.json"));

    EXPECT_EQ(p.finalPath, std::filesystem::path("/tmp/example.json"));
    EXPECT_EQ(p.tempPath, std::filesystem::path("/tmp/example.json.part"));
}

TEST(AtomicFileTest, WriteCreatesParentsAndReplacesContent)
{
    const auto root = std::filesystem::temp_directory_path() / "securexfer_atomic_file_test";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);

    const auto finalPath = root / "nested" / "config.json";

    std::string err;
    ASSERT_TRUE(SecureXfer::writeFileAtomically(finalPath, "first", err)) << err;
    ASSERT_TRUE(SecureXfer::writeFileAtomically(finalPath, "second", err)) << err;

    EXPECT_TRUE(std::filesystem::exists(finalPath));
    EXPECT_FALSE(std::filesystem::exists(root / "nested" / "config.json.part"));

    std::ifstream in(finalPath, std::ios::binary);
    std::string content;
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "second");

    std::filesystem::remove_all(root, ec);
}

TEST(AtomicFileTest, WriteFailsWhenParentIsAFile)
{
    const auto root = std::filesystem::temp_directory_path() / "securexfer_atomic_blocked";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root);
    {
        std::ofstream blocker(root / "blocker");
        blocker << "x";
    }

    std::string err;
    EXPECT_FALSE(SecureXfer::writeFileAtomically(root / "blocker" / "config.json", "data", err));
    EXPECT_FALSE(err.empty());

    std::filesystem::remove_all(root, ec);
}
