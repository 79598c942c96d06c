/**
 * @file file_selection_test.cpp
 * @brief Tests for expanding files and folders into an upload list
 */

#include "securexfer/FileSelection.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

using namespace SecureXfer;

namespace fs = std::filesystem;

//=============================================================================
// Test Fixtures
//=============================================================================

class FileSelectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("securexfer_sel_" + std::to_string(rd()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeFile(const fs::path& path, size_t size) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'd');
    }

    fs::path root;
};

//=============================================================================
// processPaths
//=============================================================================

TEST_F(FileSelectionTest, SingleFileUsesItsName) {
    writeFile(root / "notes.txt", 12);

    const auto result = FileSelection::processPaths({(root / "notes.txt").string()});
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files[0].name, "notes.txt");
    EXPECT_EQ(result.files[0].relativePath, "notes.txt");
    EXPECT_EQ(result.files[0].size, 12u);
    EXPECT_TRUE(result.warnings.empty());
}

/** @test Folder contents keep the folder name as the first path component */
TEST_F(FileSelectionTest, DirectoryIsWalkedRecursivelyAndSorted) {
    writeFile(root / "album" / "b.jpg", 3);
    writeFile(root / "album" / "a.jpg", 2);
    writeFile(root / "album" / "raw" / "c.cr2", 5);

    const auto result = FileSelection::processPaths({(root / "album").string() + "/"});
    ASSERT_EQ(result.files.size(), 3u);
    EXPECT_EQ(result.files[0].relativePath, "album/a.jpg");
    EXPECT_EQ(result.files[1].relativePath, "album/b.jpg");
    EXPECT_EQ(result.files[2].relativePath, "album/raw/c.cr2");
    EXPECT_EQ(result.totalSize(), 10u);
}

TEST_F(FileSelectionTest, MissingPathsProduceWarnings) {
    writeFile(root / "real.txt", 1);

    const auto result = FileSelection::processPaths({
        (root / "ghost.txt").string(),
        (root / "real.txt").string(),
    });
    ASSERT_EQ(result.files.size(), 1u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("not found"), std::string::npos);
}

TEST_F(FileSelectionTest, EmptyDirectoryYieldsNothing) {
    fs::create_directories(root / "empty");
    const auto result = FileSelection::processPaths({(root / "empty").string()});
    EXPECT_TRUE(result.files.empty());
    EXPECT_EQ(result.totalSize(), 0u);
}

//=============================================================================
// buildRequest
//=============================================================================

TEST_F(FileSelectionTest, SingleFileRequestNamesTheFile) {
    SelectedFile file;
    file.name = "a.txt";
    file.relativePath = "a.txt";
    file.size = 100;

    const TransferRequest request = FileSelection::buildRequest("t1", "alice", {file});
    EXPECT_EQ(request.transferId, "t1");
    EXPECT_EQ(request.senderName, "alice");
    EXPECT_EQ(request.fileName, "a.txt");
    EXPECT_EQ(request.fileCount, 1u);
    EXPECT_EQ(request.fileSize, 100u);
    EXPECT_EQ(request.totalSize, 100u);
}

TEST_F(FileSelectionTest, MultiFileRequestCountsItems) {
    SelectedFile a;
    a.relativePath = "dir/a";
    a.size = 10;
    SelectedFile b;
    b.relativePath = "dir/b";
    b.size = 32;

    const TransferRequest request = FileSelection::buildRequest("t2", "bob", {a, b});
    EXPECT_EQ(request.fileName, "2 items");
    EXPECT_EQ(request.fileCount, 2u);
    EXPECT_EQ(request.totalSize, 42u);
}
