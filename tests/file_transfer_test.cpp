/**
 * @file file_transfer_test.cpp
 * @brief Tests for upload path resolution, FileReceiver and FileSender
 */

#include "securexfer/FileTransfer.h"
#include "securexfer/ErrorCodes.h"
#include "support/MemoryStream.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace SecureXfer;
using SecureXfer::Testing::MemoryStream;

namespace fs = std::filesystem;

//=============================================================================
// Test Fixtures
//=============================================================================

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("securexfer_ft_" + std::to_string(rd()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    /// Upload request as it arrives on the wire: head, then body bytes
    static std::string uploadMessage(const std::string& name, uint64_t length,
                                     const std::string& body) {
        return "POST " + HttpUpload::buildTarget(name, "t1", length) + " HTTP/1.1\r\n"
               "Content-Length: " + std::to_string(length) + "\r\n\r\n" + body;
    }

    static std::string responseBytes(int statusCode, const std::string& message) {
        MemoryStream out;
        std::string error;
        EXPECT_TRUE(HttpUpload::writeResponse(out, statusCode, message, error)) << error;
        return out.output();
    }

    bool receive(MemoryStream& stream, FileReceiver& receiver, std::string& error,
                 ProgressCallback progress = nullptr) {
        UploadReader reader(stream);
        UploadRequest request;
        if (!reader.readHead("", request, error)) {
            ADD_FAILURE() << "head rejected: " << error;
            return false;
        }
        return receiver.receiveUpload(reader, request, error, std::move(progress));
    }

    fs::path root;
};

//=============================================================================
// Path Resolution
//=============================================================================

TEST_F(FileTransferTest, ResolvesNestedRelativePath) {
    fs::path out;
    std::string error;
    ASSERT_TRUE(FileReceiver::resolveUploadPath(root.string(), "album/2024/a.jpg", out, error)) << error;
    EXPECT_EQ(out, root / "album" / "2024" / "a.jpg");
}

TEST_F(FileTransferTest, BackslashesAreSeparators) {
    fs::path out;
    std::string error;
    ASSERT_TRUE(FileReceiver::resolveUploadPath(root.string(), "dir\\file.txt", out, error)) << error;
    EXPECT_EQ(out, root / "dir" / "file.txt");
}

TEST_F(FileTransferTest, EscapingNamesAreRejected) {
    const char* names[] = {
        "",
        "../secret",
        "a/../../b",
        "..\\x",
        "/etc/passwd",
        "C:\\Windows\\x",
        "dir/",
        "./.",
    };
    for (const char* name : names) {
        fs::path out;
        std::string error;
        EXPECT_FALSE(FileReceiver::resolveUploadPath(root.string(), name, out, error)) << name;
        EXPECT_FALSE(error.empty()) << name;
    }
}

TEST_F(FileTransferTest, OverlongNameIsRejected) {
    fs::path out;
    std::string error;
    EXPECT_FALSE(FileReceiver::resolveUploadPath(root.string(),
                                                 std::string(MAX_UPLOAD_PATH_LENGTH + 1, 'a'),
                                                 out, error));
}

//=============================================================================
// FileReceiver
//=============================================================================

TEST_F(FileTransferTest, ReceiveWritesBodyAndReportsProgress) {
    const std::string body(1000, 'z');
    MemoryStream stream(uploadMessage("sub/out.bin", body.size(), body + "trailing"));

    uint64_t lastDone = 0;
    uint64_t lastTotal = 0;
    FileReceiver receiver(root.string());
    std::string error;
    ASSERT_TRUE(receive(stream, receiver, error,
        [&](uint64_t done, uint64_t total) { lastDone = done; lastTotal = total; })) << error;

    EXPECT_EQ(receiver.getOutputPath(), (root / "sub" / "out.bin").string());
    EXPECT_EQ(receiver.getBytesReceived(), 1000u);
    EXPECT_EQ(readAll(root / "sub" / "out.bin"), body);
    EXPECT_EQ(lastDone, 1000u);
    EXPECT_EQ(lastTotal, 1000u);
}

TEST_F(FileTransferTest, ExistingFileIsOverwritten) {
    {
        std::ofstream existing(root / "same.txt", std::ios::binary);
        existing << "old content that is longer";
    }

    MemoryStream stream(uploadMessage("same.txt", 3, "new"));
    FileReceiver receiver(root.string());
    std::string error;
    ASSERT_TRUE(receive(stream, receiver, error)) << error;
    EXPECT_EQ(readAll(root / "same.txt"), "new");
}

TEST_F(FileTransferTest, TruncatedBodyFailsAndKeepsPartialFile) {
    const std::string firstChunk(BUFFER_SIZE, 'p');
    MemoryStream stream(uploadMessage("partial.bin", BUFFER_SIZE * 2, firstChunk + "short"));

    FileReceiver receiver(root.string());
    std::string error;
    EXPECT_FALSE(receive(stream, receiver, error));
    EXPECT_NE(error.find(ErrorCodes::TRANSFER_STREAM_FAILED), std::string::npos);

    ASSERT_TRUE(fs::exists(root / "partial.bin"));
    EXPECT_EQ(fs::file_size(root / "partial.bin"), BUFFER_SIZE + 5);
    EXPECT_EQ(receiver.getBytesReceived(), BUFFER_SIZE + 5);
}

TEST_F(FileTransferTest, TraversalFailsWithProtocolError) {
    MemoryStream stream(uploadMessage("../escape.txt", 3, "abc"));
    FileReceiver receiver(root.string());
    std::string error;
    EXPECT_FALSE(receive(stream, receiver, error));
    EXPECT_NE(error.find(ErrorCodes::TRANSFER_PROTOCOL_ERROR), std::string::npos);
    EXPECT_FALSE(fs::exists(root.parent_path() / "escape.txt"));
}

TEST_F(FileTransferTest, EmptyUploadCreatesEmptyFile) {
    MemoryStream stream(uploadMessage("empty.txt", 0, ""));
    FileReceiver receiver(root.string());
    std::string error;
    ASSERT_TRUE(receive(stream, receiver, error)) << error;
    EXPECT_TRUE(fs::exists(root / "empty.txt"));
    EXPECT_EQ(fs::file_size(root / "empty.txt"), 0u);
}

//=============================================================================
// FileSender
//=============================================================================

TEST_F(FileTransferTest, SenderWritesHeadAndBody) {
    const fs::path source = root / "source.txt";
    {
        std::ofstream out(source, std::ios::binary);
        out << "hello world";
    }

    FileSender sender(source.string(), "docs/source.txt");
    std::string error;
    ASSERT_TRUE(sender.initialize(error)) << error;
    EXPECT_EQ(sender.getFileSize(), 11u);

    MemoryStream stream(responseBytes(200, "Success"));
    ASSERT_TRUE(sender.sendUpload(stream, "127.0.0.1:4000", "t1", error)) << error;

    const std::string written = stream.output();
    EXPECT_EQ(written.rfind("POST /upload?filename=docs%2Fsource.txt&id=t1&size=11 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(written.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_EQ(written.substr(written.size() - 11), "hello world");
}

TEST_F(FileTransferTest, SenderReportsReceiverRejection) {
    const fs::path source = root / "source.txt";
    {
        std::ofstream out(source, std::ios::binary);
        out << "x";
    }

    FileSender sender(source.string(), "");
    std::string error;
    ASSERT_TRUE(sender.initialize(error)) << error;
    EXPECT_EQ(sender.getUploadName(), "source.txt");

    MemoryStream stream(responseBytes(403, "Transfer not accepted"));
    EXPECT_FALSE(sender.sendUpload(stream, "h", "t1", error));
    EXPECT_NE(error.find(ErrorCodes::TRANSFER_REJECTED_BY_RECEIVER), std::string::npos);
    EXPECT_NE(error.find("Transfer not accepted"), std::string::npos);
}

TEST_F(FileTransferTest, SenderHonoursCancelFlag) {
    const fs::path source = root / "source.txt";
    {
        std::ofstream out(source, std::ios::binary);
        out << "data";
    }

    FileSender sender(source.string(), "source.txt");
    std::string error;
    ASSERT_TRUE(sender.initialize(error)) << error;

    std::atomic<bool> cancel(true);
    MemoryStream stream;
    EXPECT_FALSE(sender.sendUpload(stream, "h", "t1", error, nullptr, &cancel));
    EXPECT_NE(error.find("cancelled"), std::string::npos);
}

TEST_F(FileTransferTest, SenderRejectsMissingFile) {
    FileSender sender((root / "nope").string(), "nope");
    std::string error;
    EXPECT_FALSE(sender.initialize(error));
    EXPECT_NE(error.find(ErrorCodes::TRANSFER_FILE_FAILED), std::string::npos);
}
