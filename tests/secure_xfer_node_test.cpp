/**
 * @file secure_xfer_node_test.cpp
 * @brief Two nodes on loopback exchanging a file through the node facade
 */

#include "securexfer/SecureXferNode.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>

using namespace SecureXfer;

namespace fs = std::filesystem;

class SecureXferNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("securexfer_node_" + std::to_string(rd()));
        fs::create_directories(root / "inbox");
        fs::create_directories(root / "outbox");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    NodeOptions makeOptions(const std::string& name, const fs::path& downloads) const {
        NodeOptions options;
        options.displayName = name;
        options.downloadDir = downloads.string();
        options.bindIp = LOCALHOST_IP;
        options.enableDiscovery = false;
        options.decisionTimeoutMs = 5000;
        return options;
    }

    fs::path root;
};

TEST_F(SecureXferNodeTest, NodesExchangeFileOverLoopback) {
    SecureXferNode receiver(makeOptions("receiver", root / "inbox"));
    SecureXferNode sender(makeOptions("sender", root / "outbox"));

    std::atomic<int> requests(0);
    receiver.setIncomingRequestCallback([&](const TransferRequest& request, const std::string&) {
        ++requests;
        receiver.resolveIncoming(request.transferId, true);
    });

    std::atomic<bool> senderDone(false);
    sender.setStatusCallback([&](const TransferStatus& status) {
        if (status.phase == StatusPhase::Completed && status.isCompleted) {
            senderDone.store(true);
        }
    });

    std::string error;
    if (!receiver.start(error)) {
        GTEST_SKIP() << "Receiver node unavailable: " << error;
    }
    ASSERT_TRUE(sender.start(error)) << error;

    EXPECT_NE(receiver.getListenPort(), 0);
    EXPECT_EQ(receiver.identity().displayName, "receiver");
    EXPECT_EQ(receiver.discovery(), nullptr);
    EXPECT_TRUE(receiver.listPeers().empty());

    const fs::path source = root / "outbox" / "hello.txt";
    {
        std::ofstream out(source, std::ios::binary);
        out << "hello over tls";
    }

    const PeerRecord peer(receiver.identity().processId, "receiver", LOCALHOST_IP,
                          receiver.getListenPort(), receiver.identity().fingerprint(),
                          std::chrono::steady_clock::now());

    std::string transferId;
    ASSERT_TRUE(sender.sendFiles(peer, {source.string()}, transferId, error)) << error;
    sender.waitOutgoing(transferId);

    EXPECT_TRUE(senderDone.load());
    EXPECT_EQ(requests.load(), 1);

    const fs::path saved = root / "inbox" / "hello.txt";
    for (int i = 0; i < 50 && !fs::exists(saved); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_TRUE(fs::exists(saved));
    EXPECT_EQ(fs::file_size(saved), 14u);

    sender.stop();
    receiver.stop();
    EXPECT_FALSE(receiver.isRunning());
}

TEST_F(SecureXferNodeTest, SendWithNothingSelectedFails) {
    SecureXferNode sender(makeOptions("sender", root / "outbox"));
    std::string error;
    if (!sender.start(error)) {
        GTEST_SKIP() << "Node unavailable: " << error;
    }

    PeerRecord peer;
    std::string transferId;
    EXPECT_FALSE(sender.sendFiles(peer, {(root / "missing").string()}, transferId, error));
    EXPECT_NE(error.find("Nothing to send"), std::string::npos);
    sender.stop();
}

TEST_F(SecureXferNodeTest, OperationsBeforeStartAreRejected) {
    SecureXferNode node(makeOptions("idle", root / "inbox"));
    PeerRecord peer;
    std::string transferId;
    std::string error;
    EXPECT_FALSE(node.sendFiles(peer, {"x"}, transferId, error));
    EXPECT_FALSE(node.resolveIncoming("nope", true));
    EXPECT_FALSE(node.cancelOutgoing("nope"));
}
