/**
 * @file transfer_server_dos_test.cpp
 * @brief DoS hardening tests for TransferServer (connection thread cap, junk input).
 */

#include "securexfer/CertificateManager.h"
#include "securexfer/SocketUtils.h"
#include "securexfer/TransferServer.h"
#include <gtest/gtest.h>

#include <sys/socket.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace SecureXfer;

namespace {

int connectLoopback(uint16_t port) {
    int fd = INVALID_SOCKET_FD;
    std::string error;
    if (!SocketUtils::connectTcp(LOCALHOST_IP, port, 2000, fd, error)) {
        return INVALID_SOCKET_FD;
    }
    return fd;
}

bool waitForIdle(const TransferServer& server, uint32_t timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (server.getActiveClientCount() == 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return server.getActiveClientCount() == 0;
}

}  // namespace

class TransferServerDoSTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        std::string error;
        ready = CertificateManager::initializeIdentity(identity, error);
    }

    void SetUp() override { ASSERT_TRUE(ready); }

    static LocalIdentity identity;
    static bool ready;
};

LocalIdentity TransferServerDoSTest::identity;
bool TransferServerDoSTest::ready = false;

TEST_F(TransferServerDoSTest, CapsActiveClientThreads) {
    TransferServer server(identity);
    std::string error;
    if (!server.start(error, 0, LOCALHOST_IP)) {
        GTEST_SKIP() << "Loopback listener unavailable: " << error;
    }
    const uint16_t port = server.getPort();
    ASSERT_NE(port, 0);

    std::vector<int> sockets;
    sockets.reserve(64);

    for (int i = 0; i < 64; ++i) {
        int s = connectLoopback(port);
        if (s != INVALID_SOCKET_FD) {
            sockets.push_back(s);
        }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const size_t active = server.getActiveClientCount();
    EXPECT_LE(active, MAX_CONCURRENT_INCOMING_CLIENT_THREADS);

    for (int& s : sockets) {
        SocketUtils::closeSocket(s);
    }

    EXPECT_TRUE(waitForIdle(server, 5000));
    server.stop();
}

TEST_F(TransferServerDoSTest, PlaintextGarbageDoesNotStopListener) {
    TransferServer server(identity);
    std::string error;
    if (!server.start(error, 0, LOCALHOST_IP)) {
        GTEST_SKIP() << "Loopback listener unavailable: " << error;
    }

    for (int i = 0; i < 4; ++i) {
        int s = connectLoopback(server.getPort());
        ASSERT_NE(s, INVALID_SOCKET_FD);
        const std::string junk = "GET / HTTP/1.0\r\n\r\n";
        EXPECT_GT(::send(s, junk.data(), junk.size(), MSG_NOSIGNAL), 0);
        SocketUtils::closeSocket(s);
    }

    EXPECT_TRUE(waitForIdle(server, 5000));
    EXPECT_TRUE(server.isRunning());
    EXPECT_EQ(server.arbitrator().size(), 0u);
    server.stop();
}
