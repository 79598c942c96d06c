/**
 * @file DiscoveryService.h
 * @brief Multicast DNS peer discovery service
 */

#pragma once

#include "DnsMessage.h"
#include "Identity.h"
#include "PeerRecord.h"
#include "PeerTable.h"
#include "config.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace SecureXfer {

/**
 * @brief One IPv4 address of a local network interface
 */
struct NetworkInterfaceAddress {
    std::string name;       ///< Interface name (eth0, wlp2s0, lo, ...)
    std::string address;    ///< Dotted IPv4 address
    bool isLoopback;        ///< IFF_LOOPBACK

    NetworkInterfaceAddress(const std::string& n = "", const std::string& a = "", bool loopback = false)
        : name(n), address(a), isLoopback(loopback) {}
};

/**
 * @brief Outbound packet hook (tests capture packets instead of sending them)
 */
using PacketSender = std::function<bool(const std::vector<uint8_t>& packet)>;

/**
 * @class DiscoveryService
 * @brief Multicast DNS discovery service for SecureXfer
 *
 * Announces this process (PTR, SRV, TXT, A records) on 224.0.0.251:5353 and
 * records other SecureXfer processes in a PeerTable. The TXT record carries
 * `id=`, `name=` and `fp=`; the fingerprint is what the transfer initiator
 * later pins.
 *
 * Scheduling belongs to the caller: discover() and getPeers() are meant to
 * be polled (SecureXferNode does it every DISCOVERY_INTERVAL_MS). Only
 * inbound packets are handled on the service's own listener thread.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Peer table access is serialized by PeerTable's mutex
 * - Malformed packets are dropped and never stop the listener
 */
class DiscoveryService {
public:
    /**
     * @brief Constructor
     * @param identity Local identity (id, display name, fingerprint, port)
     * @param staleMs Peer staleness threshold
     * @param clock Monotonic clock override for tests
     */
    explicit DiscoveryService(const LocalIdentity& identity,
                              uint32_t staleMs = PEER_STALE_MS,
                              PeerTable::Clock clock = nullptr);

    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    //=========================================================================
    // Service Control
    //=========================================================================

    /**
     * @brief Open the multicast socket and start the listener thread
     * @param errorMsg Output error message on failure
     * @return true if the socket joined the group
     */
    bool start(std::string& errorMsg);

    /**
     * @brief Stop the listener thread and close the socket
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    //=========================================================================
    // Discovery Operations
    //=========================================================================

    /**
     * @brief Multicast one response advertising this process
     */
    void announce();

    /**
     * @brief Multicast one PTR query for the service name
     *
     * Fire-and-forget: answers arrive asynchronously through handleResponse().
     */
    void discover();

    /**
     * @brief Evict stale peers, then return a snapshot of the rest
     *
     * Never contains this process's own id.
     */
    std::vector<PeerRecord> getPeers();

    /**
     * @brief Answer a query that asks for the service name
     * @return true if an announcement was sent
     */
    bool handleQuery(const DnsMessage& query);

    /**
     * @brief Record the peer described by a response
     * @param response Decoded response
     * @param errorMsg Set (with an SXF-DISC code) when the response is unusable
     * @return true if the peer table was updated
     *
     * Responses that are not for the service name, or that advertise our own
     * id, return false with errorMsg left empty.
     */
    bool handleResponse(const DnsMessage& response, std::string& errorMsg);

    /**
     * @brief Decode a datagram and dispatch it as query or response
     *
     * Parse errors are DiscoveryParseErrors: logged and dropped.
     */
    void processPacket(const uint8_t* data, size_t size);

    //=========================================================================
    // Message Construction
    //=========================================================================

    DnsMessage buildAnnouncement() const;
    static DnsMessage buildQuery();

    //=========================================================================
    // Configuration
    //=========================================================================

    void setListenPort(uint16_t port);
    void setDisplayName(const std::string& name);

    /**
     * @brief Replace the multicast send path (tests)
     */
    void setPacketSender(PacketSender sender);

    const std::string& getProcessId() const { return m_processId; }
    uint16_t getListenPort() const;
    std::string getDisplayName() const;

    //=========================================================================
    // Address Selection
    //=========================================================================

    /**
     * @brief IPv4 address advertised in the A record
     *
     * Physical adapters (PHYSICAL_ADAPTER_FRAGMENTS prefixes) first, then the
     * first non-loopback address, then 127.0.0.1.
     */
    static std::string selectAdvertisedAddress(const std::vector<NetworkInterfaceAddress>& interfaces);

    /**
     * @brief IPv4 addresses of all interfaces that are up (getifaddrs)
     */
    static std::vector<NetworkInterfaceAddress> enumerateInterfaces();

    /**
     * @brief Host label used in the PTR target and SRV target
     *
     * The display name reduced to characters valid in a DNS label.
     */
    static std::string hostLabel(const std::string& displayName);

    //=========================================================================
    // Test Hooks
    //=========================================================================

    PeerTable& peerTable() { return m_peers; }

private:
    void listenerThreadFunc();
    bool initializeSocket(std::string& errorMsg);
    void cleanupSocket();
    void sendMessage(const DnsMessage& message, const char* what);

    // Identity
    const std::string m_processId;
    const std::string m_fingerprint;
    mutable std::mutex m_identityMutex;   ///< Protects m_displayName, m_listenPort
    std::string m_displayName;
    uint16_t m_listenPort;

    // Peer table
    PeerTable m_peers;

    // Socket
    int m_socket;
    std::mutex m_senderMutex;             ///< Protects m_packetSender
    PacketSender m_packetSender;

    // Listener
    std::thread m_listenerThread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
};

}  // namespace SecureXfer
