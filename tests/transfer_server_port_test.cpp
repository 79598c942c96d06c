#include <gtest/gtest.h>
#include "securexfer/CertificateManager.h"
#include "securexfer/TransferServer.h"

using namespace SecureXfer;

class TransferServerPortTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        std::string error;
        ready = CertificateManager::initializeIdentity(identity, error);
    }

    void SetUp() override { ASSERT_TRUE(ready); }

    static bool startOrSkip(TransferServer& server) {
        std::string error;
        return server.start(error, 0, LOCALHOST_IP);
    }

    static LocalIdentity identity;
    static bool ready;
};

LocalIdentity TransferServerPortTest::identity;
bool TransferServerPortTest::ready = false;

TEST_F(TransferServerPortTest, ReturnsZeroPortBeforeStart) {
    TransferServer server(identity);
    EXPECT_EQ(server.getPort(), 0u);
    EXPECT_FALSE(server.isRunning());
}

TEST_F(TransferServerPortTest, BindsToNonZeroPortAfterStart) {
    TransferServer server(identity);
    if (!startOrSkip(server)) {
        GTEST_SKIP() << "Loopback listener unavailable";
    }
    EXPECT_NE(server.getPort(), 0u);
    server.stop();
}

TEST_F(TransferServerPortTest, TwoInstancesReceiveDifferentPorts) {
    TransferServer s1(identity);
    TransferServer s2(identity);
    if (!startOrSkip(s1) || !startOrSkip(s2)) {
        GTEST_SKIP() << "Loopback listener unavailable";
    }
    EXPECT_NE(s1.getPort(), s2.getPort());
    s1.stop();
    s2.stop();
}

TEST_F(TransferServerPortTest, PortIsZeroAfterStop) {
    TransferServer server(identity);
    if (!startOrSkip(server)) {
        GTEST_SKIP() << "Loopback listener unavailable";
    }
    EXPECT_NE(server.getPort(), 0u);
    server.stop();
    EXPECT_EQ(server.getPort(), 0u);
    EXPECT_EQ(server.getActiveClientCount(), 0u);
}

TEST_F(TransferServerPortTest, InvalidMaterialIsRejected) {
    LocalIdentity empty;
    TransferServer server(empty);
    std::string error;
    EXPECT_FALSE(server.start(error, 0, LOCALHOST_IP));
    EXPECT_FALSE(error.empty());
}
