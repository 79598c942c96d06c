/**
 * @file control_message_test.cpp
 * @brief Unit tests for control channel JSON messages and framing
 */

#include "securexfer/ControlMessage.h"
#include "support/MemoryStream.h"
#include <gtest/gtest.h>

using namespace SecureXfer;
using SecureXfer::Testing::MemoryStream;

namespace {

std::string frame(const std::string& payload) {
    uint8_t prefix[4];
    ControlCodec::encodeLength(static_cast<uint32_t>(payload.size()), prefix);
    return std::string(reinterpret_cast<const char*>(prefix), 4) + payload;
}

}  // namespace

//=============================================================================
// JSON Tests
//=============================================================================

TEST(ControlMessageTest, RequestJsonUsesWireFieldNames) {
    TransferRequest request;
    request.transferId = "abc";
    request.senderName = "alice";
    request.fileName = "photo.jpg";
    request.fileSize = 2048;
    request.fileType = "image/jpeg";
    request.fileCount = 1;
    request.totalSize = 2048;

    const nlohmann::json j = ControlCodec::toJson(ControlMessage::makeRequest(request));
    EXPECT_EQ(j["type"], "request-transfer");
    EXPECT_EQ(j["id"], "abc");
    EXPECT_EQ(j["senderName"], "alice");
    EXPECT_EQ(j["fileName"], "photo.jpg");
    EXPECT_EQ(j["fileSize"], 2048u);
    EXPECT_EQ(j["fileType"], "image/jpeg");
}

TEST(ControlMessageTest, DecisionJsonCarriesAllowed) {
    const nlohmann::json j = ControlCodec::toJson(ControlMessage::makeDecision("abc", true));
    EXPECT_EQ(j["type"], "transfer-decision");
    EXPECT_EQ(j["allowed"], true);
}

/** @test fileCount and totalSize are optional on the wire */
TEST(ControlMessageTest, OptionalRequestFieldsGetDefaults) {
    const std::string payload =
        R"({"type":"request-transfer","id":"t1","senderName":"bob","fileName":"a.txt","fileSize":10})";

    ControlMessage message;
    std::string error;
    ASSERT_TRUE(ControlCodec::fromJson(payload, message, error)) << error;
    EXPECT_EQ(message.type, ControlMessageType::RequestTransfer);
    EXPECT_EQ(message.request.fileCount, 1u);
    EXPECT_EQ(message.request.totalSize, 10u);
    EXPECT_TRUE(message.request.fileType.empty());
}

TEST(ControlMessageTest, CancelParses) {
    ControlMessage message;
    std::string error;
    ASSERT_TRUE(ControlCodec::fromJson(R"({"type":"cancel-transfer","id":"t9"})", message, error));
    EXPECT_EQ(message.type, ControlMessageType::CancelTransfer);
    EXPECT_EQ(message.transferId, "t9");
}

TEST(ControlMessageTest, MalformedPayloadsAreRejected) {
    const char* payloads[] = {
        "not json",
        "[1,2,3]",
        R"({"id":"t1"})",
        R"({"type":"request-transfer"})",
        R"({"type":"launch-missiles","id":"t1"})",
        R"({"type":"transfer-decision","id":"t1"})",
        R"({"type":"transfer-decision","id":"t1","allowed":"yes"})",
        R"({"type":"request-transfer","id":"t1","senderName":"b","fileName":"a","fileSize":-5})",
        R"({"type":"request-transfer","id":"t1","senderName":"b","fileName":"a","fileSize":1,"fileCount":0})",
        R"({"type":"cancel-transfer","id":""})",
    };

    for (const char* payload : payloads) {
        ControlMessage message;
        std::string error;
        EXPECT_FALSE(ControlCodec::fromJson(payload, message, error)) << payload;
        EXPECT_FALSE(error.empty()) << payload;
    }
}

TEST(ControlMessageTest, LongSenderNameIsTruncated) {
    const std::string payload = R"({"type":"request-transfer","id":"t1","senderName":")" +
                                std::string(200, 'n') + R"(","fileName":"a","fileSize":1})";
    ControlMessage message;
    std::string error;
    ASSERT_TRUE(ControlCodec::fromJson(payload, message, error)) << error;
    EXPECT_EQ(message.request.senderName.size(), MAX_DISPLAY_NAME);
}

//=============================================================================
// Framing Tests
//=============================================================================

TEST(ControlFrameTest, LengthIsBigEndian) {
    uint8_t prefix[4];
    ControlCodec::encodeLength(0x01020304u, prefix);
    EXPECT_EQ(prefix[0], 0x01);
    EXPECT_EQ(prefix[3], 0x04);
    EXPECT_EQ(ControlCodec::decodeLength(prefix), 0x01020304u);
}

TEST(ControlFrameTest, WrittenFrameCanBeReadBack) {
    MemoryStream out;
    std::string error;
    ASSERT_TRUE(ControlCodec::writeFrame(out, ControlMessage::makeDecision("t1", false), error));

    MemoryStream in(out.output());
    ControlMessage message;
    ASSERT_TRUE(ControlCodec::readFrame(in, message, error)) << error;
    EXPECT_EQ(message.type, ControlMessageType::TransferDecision);
    EXPECT_EQ(message.transferId, "t1");
    EXPECT_FALSE(message.allowed);
    EXPECT_EQ(in.remaining(), 0u);
}

TEST(ControlFrameTest, ZeroAndOversizedLengthsAreRejected) {
    ControlMessage message;
    std::string error;

    MemoryStream zero(std::string(4, '\0'));
    EXPECT_FALSE(ControlCodec::readFrame(zero, message, error));

    uint8_t prefix[4];
    ControlCodec::encodeLength(MAX_CONTROL_FRAME_SIZE + 1, prefix);
    MemoryStream huge(std::string(reinterpret_cast<const char*>(prefix), 4));
    EXPECT_FALSE(ControlCodec::readFrame(huge, message, error));
    EXPECT_NE(error.find("Invalid control frame length"), std::string::npos);
}

TEST(ControlFrameTest, TruncatedBodyFails) {
    std::string data = frame(R"({"type":"cancel-transfer","id":"t1"})");
    data.resize(data.size() - 3);

    MemoryStream in(data);
    ControlMessage message;
    std::string error;
    EXPECT_FALSE(ControlCodec::readFrame(in, message, error));
}
