/**
 * @file SecureXferNode.h
 * @brief One running SecureXfer instance: identity, listener, discovery, sender
 */

#pragma once

#include "DiscoveryService.h"
#include "FileSelection.h"
#include "Identity.h"
#include "PeerRecord.h"
#include "TransferInitiator.h"
#include "TransferServer.h"
#include "TransferStatus.h"
#include "config.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace SecureXfer {

class SettingsManager;

/**
 * @brief Runtime options of a node
 */
struct NodeOptions {
    std::string displayName;                 ///< Empty: hostname
    std::string downloadDir;                 ///< Where uploads are written
    std::string bindIp = "0.0.0.0";
    uint16_t listenPort = 0;                 ///< 0: ephemeral
    bool enableDiscovery = true;
    uint32_t decisionTimeoutMs = DECISION_TIMEOUT_MS;
    uint32_t discoveryIntervalMs = DISCOVERY_INTERVAL_MS;
    uint32_t peerStaleMs = PEER_STALE_MS;
    uint64_t maxIncomingSizeBytes = DEFAULT_MAX_INCOMING_SIZE_BYTES;

    static NodeOptions fromSettings(const SettingsManager& settings);
};

/**
 * @brief Fresh peer snapshot, delivered after every discovery round
 */
using PeerListCallback = std::function<void(const std::vector<PeerRecord>& peers)>;

/**
 * @class SecureXferNode
 * @brief Wires the components together in startup order
 *
 * start(): identity → transfer listener (ephemeral port) → discovery.
 * A driver thread then queries the network every discoveryIntervalMs and
 * publishes the peer list.
 *
 * Status events from both directions (incoming uploads, outgoing transfers)
 * go to the single status callback. Callbacks run on internal threads.
 */
class SecureXferNode {
public:
    explicit SecureXferNode(const NodeOptions& options);
    ~SecureXferNode();

    SecureXferNode(const SecureXferNode&) = delete;
    SecureXferNode& operator=(const SecureXferNode&) = delete;

    /**
     * @brief Create the identity and start listener, discovery and driver
     * @return false on IdentityError or if the listener cannot bind
     */
    bool start(std::string& errorMsg);

    void stop();

    bool isRunning() const { return m_running.load(); }

    //=========================================================================
    // Caller-facing operations
    //=========================================================================

    /**
     * @brief Current (non-stale) peers
     */
    std::vector<PeerRecord> listPeers();

    /**
     * @brief Look up a discovered peer by id
     */
    bool findPeer(const std::string& peerId, PeerRecord& peer);

    /**
     * @brief Expand @p paths and send them to @p peer on a worker thread
     * @param transferId Output id of the new transfer
     */
    bool sendFiles(const PeerRecord& peer, const std::vector<std::string>& paths,
                   std::string& transferId, std::string& errorMsg);

    bool resolveIncoming(const std::string& transferId, bool allowed);

    bool cancelOutgoing(const std::string& transferId);

    /**
     * @brief Block until an outgoing transfer's worker has finished
     */
    void waitOutgoing(const std::string& transferId);

    //=========================================================================
    // Subscriptions (set before start())
    //=========================================================================

    void setPeerListCallback(PeerListCallback callback);
    void setIncomingRequestCallback(IncomingRequestCallback callback);
    void setRequestWithdrawnCallback(RequestWithdrawnCallback callback);
    void setStatusCallback(StatusCallback callback);

    //=========================================================================
    // Accessors
    //=========================================================================

    const LocalIdentity& identity() const { return m_identity; }
    uint16_t getListenPort() const;
    TransferServer* server() { return m_server.get(); }
    TransferInitiator* initiator() { return m_initiator.get(); }
    DiscoveryService* discovery() { return m_discovery.get(); }

private:
    void driverThreadFunc();
    void forwardStatus(const TransferStatus& status);

    NodeOptions m_options;
    LocalIdentity m_identity;

    std::unique_ptr<TransferServer> m_server;
    std::unique_ptr<TransferInitiator> m_initiator;
    std::unique_ptr<DiscoveryService> m_discovery;

    std::mutex m_callbackMutex;
    PeerListCallback m_peerListCallback;
    IncomingRequestCallback m_incomingRequestCallback;
    RequestWithdrawnCallback m_requestWithdrawnCallback;
    StatusCallback m_statusCallback;

    std::thread m_driverThread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::mutex m_driverMutex;
    std::condition_variable m_driverCv;
};

}  // namespace SecureXfer
