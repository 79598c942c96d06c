/**
 * @file TransferServer.h
 * @brief TLS transfer listener: approval handshake and upload ingestion
 */

#pragma once

#include "ControlMessage.h"
#include "DecisionArbitrator.h"
#include "HttpUpload.h"
#include "Identity.h"
#include "TransferStatus.h"
#include "TransportStream.h"
#include "config.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace SecureXfer {

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Incoming transfer request awaiting a decision
 *
 * Called on the connection's handler thread. The application answers later
 * with TransferServer::resolveDecision(); it must not block here.
 *
 * @param request Request as sent by the initiator
 * @param peerIp Address of the connecting initiator
 */
using IncomingRequestCallback = std::function<void(const TransferRequest& request,
                                                   const std::string& peerIp)>;

/**
 * @brief A pending request was withdrawn (cancel, disconnect, stop)
 *
 * @param transferId Withdrawn transfer
 * @param reason TransferState::Cancelled or TransferState::TimedOut
 */
using RequestWithdrawnCallback = std::function<void(const std::string& transferId,
                                                    TransferState reason)>;

//=============================================================================
// TransferServer Class
//=============================================================================

/**
 * @class TransferServer
 * @brief Accepts control and upload connections on one ephemeral TLS port
 *
 * The first four bytes of a connection select its handler: "POST" starts an
 * upload, anything else is the big-endian length of a control frame.
 *
 * Architecture:
 * - One listener thread running a non-blocking accept() loop
 * - One detached handler thread per connection, capped at
 *   MAX_CONCURRENT_INCOMING_CLIENT_THREADS; all TLS I/O of a connection
 *   stays on its handler thread
 * - One cleanup thread failing accepted transfers whose uploads stopped
 *   arriving and pruning terminal arbitrator entries
 *
 * Control handlers wait on two sources in HANDLER_POLL_SLICE_MS slices: the
 * socket (cancel frame or disconnect) and the arbitrator's decision future.
 *
 * Trust: the listener never asks for a client certificate. Pinning is the
 * initiator's job. Uploads are only written for transfers the user accepted.
 *
 * Thread Safety:
 * - resolveDecision() and the setters are thread-safe
 * - start() and stop() are NOT thread-safe (call from same thread)
 */
class TransferServer {
public:
    /**
     * @brief Constructor
     * @param identity Identity whose certificate material the listener presents
     */
    explicit TransferServer(const LocalIdentity& identity);

    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;
    TransferServer(TransferServer&&) = delete;
    TransferServer& operator=(TransferServer&&) = delete;

    //=========================================================================
    // Server Control Methods
    //=========================================================================

    /**
     * @brief Bind, listen and launch the listener and cleanup threads
     * @param errorMsg Output error message on failure
     * @param port Port to bind, 0 for an ephemeral port
     * @param bindIp Address to bind
     */
    bool start(std::string& errorMsg, uint16_t port = 0,
               const std::string& bindIp = "0.0.0.0");

    /**
     * @brief Stop accepting, shut down live connections and join all threads
     *
     * Pending requests are discarded and reported as withdrawn.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Bound port, valid after start()
     */
    uint16_t getPort() const { return m_port.load(); }

    size_t getActiveClientCount() const { return m_activeClientThreadCount.load(); }

    //=========================================================================
    // Decisions
    //=========================================================================

    /**
     * @brief Accept or decline a pending request
     * @return true if the request was pending; false (no-op) otherwise
     *
     * The handler thread owning the connection sends transfer-decision
     * within one poll slice.
     */
    bool resolveDecision(const std::string& transferId, bool allowed);

    DecisionArbitrator& arbitrator() { return m_arbitrator; }

    //=========================================================================
    // Configuration Methods
    //=========================================================================

    void setDownloadDir(const std::string& downloadDir);
    std::string getDownloadDir() const;

    /**
     * @brief Requests whose totalSize exceeds this are declined automatically
     */
    void setMaxIncomingSizeBytes(uint64_t bytes) { m_maxIncomingSizeBytes.store(bytes); }

    /**
     * @brief Upper bound on how long a request may stay pending
     *
     * Guards against initiators that vanish without closing the connection.
     */
    void setPendingDecisionLimitMs(uint32_t ms) { m_pendingDecisionLimitMs.store(ms); }

    /**
     * @brief How long an accepted transfer may wait for its next upload
     *
     * Takes effect immediately; a running cleanup thread reschedules.
     */
    void setUploadIdleTimeoutMs(uint32_t ms);

    void setIncomingRequestCallback(IncomingRequestCallback callback);
    void setRequestWithdrawnCallback(RequestWithdrawnCallback callback);
    void setStatusCallback(StatusCallback callback);

private:
    //=========================================================================
    // Private Methods
    //=========================================================================

    void listenerThreadFunc();
    void cleanupThreadFunc();

    /**
     * @brief TLS handshake and dispatch on the first four bytes
     */
    void handleClient(int clientSocket, const std::string& clientIp);

    /**
     * @brief Run one request-transfer exchange to its decision or withdrawal
     */
    void handleControlConnection(TransportStream& stream, const uint8_t prefix[4],
                                 const std::string& clientIp);

    /**
     * @brief Receive one upload and answer with an HTTP status
     */
    void handleUploadConnection(TransportStream& stream, const uint8_t prefix[4],
                                const std::string& clientIp);

    void sendUploadResponse(TransportStream& stream, int statusCode, const std::string& message);
    void notifyWithdrawn(const std::string& transferId, TransferState reason);
    void expireIdleTransfers();
    void emitStatus(const TransferStatus& status);

    //=========================================================================
    // Member Variables
    //=========================================================================

    // Identity
    const CertificateMaterial m_material;

    // Configuration
    mutable std::mutex m_configMutex;          ///< Protects m_downloadDir and callbacks
    std::string m_downloadDir;
    std::atomic<uint64_t> m_maxIncomingSizeBytes;
    std::atomic<uint32_t> m_pendingDecisionLimitMs;
    std::atomic<uint32_t> m_uploadIdleTimeoutMs;
    IncomingRequestCallback m_incomingRequestCallback;
    RequestWithdrawnCallback m_requestWithdrawnCallback;
    StatusCallback m_statusCallback;

    // Decisions
    DecisionArbitrator m_arbitrator;

    // Socket
    int m_listenSocket;
    std::atomic<uint16_t> m_port;

    // Threads
    std::thread m_listenerThread;
    std::thread m_cleanupThread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::condition_variable m_cleanupCv;
    std::mutex m_cleanupCvMutex;
    bool m_cleanupRescheduled = false;  ///< Guarded by m_cleanupCvMutex

    // Connection handlers
    std::atomic<size_t> m_activeClientThreadCount;
    std::mutex m_activeClientsMutex;
    std::unordered_set<int> m_activeClientSockets;
    std::condition_variable m_activeClientsCv;
    std::mutex m_activeClientsCvMutex;
};

}  // namespace SecureXfer
