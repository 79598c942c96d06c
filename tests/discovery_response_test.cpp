/**
 * @file discovery_response_test.cpp
 * @brief Tests for discovery response handling, query answering and address selection
 *
 * No socket is opened: responses are built in memory and outbound packets are
 * captured through the packet sender hook.
 */

#include "securexfer/DiscoveryService.h"
#include "securexfer/ErrorCodes.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>

using namespace SecureXfer;

//=============================================================================
// Test Fixtures
//=============================================================================

class DiscoveryResponseTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity.processId = "self-id";
        identity.displayName = "self-host";
        identity.material.fingerprint = std::string(64, 'E');
        identity.listenPort = 45000;

        service = std::make_unique<DiscoveryService>(
            identity, PEER_STALE_MS, [this]() { return *clockNow; });
        service->setPacketSender([this](const std::vector<uint8_t>& packet) {
            sentPackets.push_back(packet);
            return true;
        });
    }

    /**
     * @brief Response as another process would announce itself
     */
    static DnsMessage makeResponse(const std::string& id, const std::string& name,
                                   const std::string& ip, uint16_t port,
                                   const std::string& fp) {
        const std::string instance = "host." + std::string(SERVICE_NAME);

        DnsMessage message;
        message.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;

        DnsRecord ptr;
        ptr.name = SERVICE_NAME;
        ptr.type = DnsType::PTR;
        ptr.ptrName = instance;
        message.answers.push_back(ptr);

        DnsRecord srv;
        srv.name = instance;
        srv.type = DnsType::SRV;
        srv.srv.port = port;
        srv.srv.target = "host.local";
        message.additionals.push_back(srv);

        DnsRecord txt;
        txt.name = instance;
        txt.type = DnsType::TXT;
        txt.txt = {"id=" + id, "name=" + name, "fp=" + fp};
        message.additionals.push_back(txt);

        DnsRecord a;
        a.name = "host.local";
        a.type = DnsType::A;
        a.address = ip;
        message.additionals.push_back(a);

        return message;
    }

    static void removeType(DnsMessage& message, uint16_t type) {
        auto& records = message.additionals;
        for (auto it = records.begin(); it != records.end();) {
            it = (it->type == type) ? records.erase(it) : it + 1;
        }
    }

    void advance(uint32_t ms) { *clockNow += std::chrono::milliseconds(ms); }

    std::shared_ptr<std::chrono::steady_clock::time_point> clockNow =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
    LocalIdentity identity;
    std::unique_ptr<DiscoveryService> service;
    std::vector<std::vector<uint8_t>> sentPackets;

    const std::string fpPeer = std::string(64, 'a');
};

//=============================================================================
// Response Handling
//=============================================================================

/** @test A complete response adds the peer with a normalized fingerprint */
TEST_F(DiscoveryResponseTest, CompleteResponseAddsPeer) {
    std::string error;
    ASSERT_TRUE(service->handleResponse(
        makeResponse("peer-1", "laptop", "192.168.1.50", 41000, fpPeer), error)) << error;

    const auto peers = service->getPeers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].peerId, "peer-1");
    EXPECT_EQ(peers[0].displayName, "laptop");
    EXPECT_EQ(peers[0].ipAddress, "192.168.1.50");
    EXPECT_EQ(peers[0].port, 41000);
    EXPECT_EQ(peers[0].certificateFingerprint, std::string(64, 'A'));
}

/** @test A response lacking any of TXT, SRV or A leaves the table unchanged */
TEST_F(DiscoveryResponseTest, IncompleteResponsesAreRejected) {
    for (uint16_t missing : {DnsType::TXT, DnsType::SRV, DnsType::A}) {
        DnsMessage response = makeResponse("peer-1", "laptop", "192.168.1.50", 41000, fpPeer);
        removeType(response, missing);

        std::string error;
        EXPECT_FALSE(service->handleResponse(response, error));
        EXPECT_NE(error.find(ErrorCodes::DISCOVERY_INCOMPLETE_RESPONSE), std::string::npos);
    }
    EXPECT_TRUE(service->getPeers().empty());
}

TEST_F(DiscoveryResponseTest, TxtWithoutFingerprintIsRejected) {
    DnsMessage response = makeResponse("peer-1", "laptop", "192.168.1.50", 41000, fpPeer);
    for (auto& record : response.additionals) {
        if (record.type == DnsType::TXT) {
            record.txt = {"id=peer-1", "name=laptop"};
        }
    }

    std::string error;
    EXPECT_FALSE(service->handleResponse(response, error));
    EXPECT_FALSE(error.empty());
    EXPECT_TRUE(service->getPeers().empty());
}

TEST_F(DiscoveryResponseTest, InvalidFingerprintIsRejected) {
    std::string error;
    EXPECT_FALSE(service->handleResponse(
        makeResponse("peer-1", "laptop", "192.168.1.50", 41000, "not-hex"), error));
    EXPECT_NE(error.find(ErrorCodes::DISCOVERY_MALFORMED_PACKET), std::string::npos);
}

/** @test Our own announcement looping back is ignored silently */
TEST_F(DiscoveryResponseTest, OwnAnnouncementIsIgnored) {
    std::string error;
    EXPECT_FALSE(service->handleResponse(
        makeResponse("self-id", "self-host", "192.168.1.2", 45000, fpPeer), error));
    EXPECT_TRUE(error.empty());
    EXPECT_TRUE(service->getPeers().empty());
}

TEST_F(DiscoveryResponseTest, ForeignServiceIsIgnored) {
    DnsMessage response = makeResponse("peer-1", "laptop", "192.168.1.50", 41000, fpPeer);
    response.answers[0].name = "_http._tcp.local";

    std::string error;
    EXPECT_FALSE(service->handleResponse(response, error));
    EXPECT_TRUE(error.empty());
}

/** @test A new id on a known IP replaces the old record */
TEST_F(DiscoveryResponseTest, RestartedPeerReplacesOldId) {
    std::string error;
    ASSERT_TRUE(service->handleResponse(
        makeResponse("old-id", "laptop", "192.168.1.50", 41000, fpPeer), error));
    ASSERT_TRUE(service->handleResponse(
        makeResponse("new-id", "laptop", "192.168.1.50", 42000, fpPeer), error));

    const auto peers = service->getPeers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].peerId, "new-id");
    EXPECT_EQ(peers[0].port, 42000);
}

TEST_F(DiscoveryResponseTest, StalePeersAreExcluded) {
    std::string error;
    ASSERT_TRUE(service->handleResponse(
        makeResponse("peer-1", "laptop", "192.168.1.50", 41000, fpPeer), error));

    advance(PEER_STALE_MS + 1);
    EXPECT_TRUE(service->getPeers().empty());
    EXPECT_EQ(service->peerTable().size(), 0u);
}

//=============================================================================
// Query Handling
//=============================================================================

TEST_F(DiscoveryResponseTest, QueryForServiceTriggersAnnouncement) {
    EXPECT_TRUE(service->handleQuery(DiscoveryService::buildQuery()));
    ASSERT_EQ(sentPackets.size(), 1u);

    DnsMessage announced;
    std::string error;
    ASSERT_TRUE(DnsCodec::decode(sentPackets[0].data(), sentPackets[0].size(), announced, error)) << error;
    EXPECT_TRUE(announced.isResponse());
    ASSERT_EQ(announced.answers.size(), 1u);
    EXPECT_EQ(announced.answers[0].type, DnsType::PTR);
}

TEST_F(DiscoveryResponseTest, QueryForOtherNameIsIgnored) {
    DnsMessage query;
    DnsQuestion question;
    question.name = "_printer._tcp.local";
    query.questions.push_back(question);

    EXPECT_FALSE(service->handleQuery(query));
    EXPECT_TRUE(sentPackets.empty());
}

TEST_F(DiscoveryResponseTest, AnnouncementCarriesIdentity) {
    const DnsMessage message = service->buildAnnouncement();

    bool sawTxt = false;
    bool sawSrv = false;
    for (const auto& record : message.additionals) {
        if (record.type == DnsType::TXT) {
            sawTxt = true;
            EXPECT_NE(std::find(record.txt.begin(), record.txt.end(), "id=self-id"), record.txt.end());
            EXPECT_NE(std::find(record.txt.begin(), record.txt.end(), "fp=" + std::string(64, 'E')),
                      record.txt.end());
        } else if (record.type == DnsType::SRV) {
            sawSrv = true;
            EXPECT_EQ(record.srv.port, 45000);
        }
    }
    EXPECT_TRUE(sawTxt);
    EXPECT_TRUE(sawSrv);
}

//=============================================================================
// Packet Processing
//=============================================================================

TEST_F(DiscoveryResponseTest, GarbagePacketIsDropped) {
    const uint8_t garbage[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x00};
    service->processPacket(garbage, sizeof(garbage));
    EXPECT_TRUE(service->getPeers().empty());
    EXPECT_TRUE(sentPackets.empty());
}

TEST_F(DiscoveryResponseTest, EncodedResponseIsProcessed) {
    std::vector<uint8_t> packet;
    std::string error;
    ASSERT_TRUE(DnsCodec::encode(
        makeResponse("peer-2", "desk", "10.0.0.7", 43000, fpPeer), packet, error)) << error;

    service->processPacket(packet.data(), packet.size());
    EXPECT_TRUE(service->peerTable().contains("peer-2"));
}

//=============================================================================
// Address Selection
//=============================================================================

TEST(DiscoveryAddressTest, PrefersPhysicalAdapter) {
    const std::vector<NetworkInterfaceAddress> interfaces = {
        {"lo", "127.0.0.1", true},
        {"docker0", "172.17.0.1", false},
        {"wlp2s0", "192.168.1.9", false},
    };
    EXPECT_EQ(DiscoveryService::selectAdvertisedAddress(interfaces), "192.168.1.9");
}

TEST(DiscoveryAddressTest, FallsBackToFirstNonLoopback) {
    const std::vector<NetworkInterfaceAddress> interfaces = {
        {"lo", "127.0.0.1", true},
        {"docker0", "172.17.0.1", false},
    };
    EXPECT_EQ(DiscoveryService::selectAdvertisedAddress(interfaces), "172.17.0.1");
}

TEST(DiscoveryAddressTest, FallsBackToLoopback) {
    EXPECT_EQ(DiscoveryService::selectAdvertisedAddress({}), "127.0.0.1");
    EXPECT_EQ(DiscoveryService::selectAdvertisedAddress({{"lo", "127.0.0.1", true}}), "127.0.0.1");
}

TEST(DiscoveryAddressTest, HostLabelReplacesInvalidCharacters) {
    EXPECT_EQ(DiscoveryService::hostLabel("My Laptop.home"), "My-Laptop-home");
    EXPECT_EQ(DiscoveryService::hostLabel(""), "securexfer-host");
    EXPECT_EQ(DiscoveryService::hostLabel(std::string(100, 'x')).size(), 63u);
}
