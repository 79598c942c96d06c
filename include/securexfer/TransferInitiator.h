/**
 * @file TransferInitiator.h
 * @brief Outgoing transfers: pinned TLS, approval wait, sequential uploads
 */

#pragma once

#include "ControlMessage.h"
#include "FileSelection.h"
#include "PeerRecord.h"
#include "TransferStatus.h"
#include "ErrorCodes.h"
#include "config.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace SecureXfer {

/**
 * @class TransferInitiator
 * @brief Runs outgoing transfers against peers' listeners
 *
 * Per transfer:
 * 1. Connect, complete the TLS handshake and compare the presented
 *    certificate with the peer's advertised fingerprint. A mismatch ends
 *    the transfer with a TrustError before request-transfer is sent.
 * 2. Send request-transfer and wait for transfer-decision, at most the
 *    decision timeout. On timeout send cancel-transfer and report TIMED_OUT.
 * 3. On accept, upload the files one by one, each over its own pinned TLS
 *    connection. The first failure stops the remaining uploads.
 *
 * sendFiles() runs each transfer on its own worker thread;
 * sendTransferRequest() runs one on the calling thread. Ended transfers
 * stay queryable for TERMINAL_STATE_RETENTION_MS, then are dropped.
 *
 * Thread Safety: all public methods are thread-safe.
 */
class TransferInitiator {
public:
    /**
     * @param senderName Display name placed in outgoing requests
     */
    explicit TransferInitiator(const std::string& senderName);

    /**
     * @brief Cancels outstanding transfers and joins their workers
     */
    ~TransferInitiator();

    TransferInitiator(const TransferInitiator&) = delete;
    TransferInitiator& operator=(const TransferInitiator&) = delete;

    /**
     * @brief Run one transfer to its end on the calling thread
     * @param peer Target (ip, port and pinned fingerprint are used)
     * @param request Request to send; transferId must be unique
     * @param files Files to upload once accepted, in order
     * @param errorMsg Output error message when the transfer did not complete
     * @return true only if every file was uploaded
     */
    bool sendTransferRequest(const PeerRecord& peer, const TransferRequest& request,
                             const std::vector<SelectedFile>& files, std::string& errorMsg);

    /**
     * @brief Start a transfer of @p files on a worker thread
     * @param transferId Output id of the new transfer
     * @return false if there is nothing to send or no id could be generated
     */
    bool sendFiles(const PeerRecord& peer, const std::vector<SelectedFile>& files,
                   std::string& transferId, std::string& errorMsg);

    /**
     * @brief Cancel an outgoing transfer
     *
     * While OPEN this sends cancel-transfer and ends in CANCELLED. During
     * uploads the current upload stops between chunks.
     *
     * @return true if the transfer exists and was not finished yet
     */
    bool cancelOutgoing(const std::string& transferId);

    /**
     * @brief Local state of an outgoing transfer
     */
    bool getState(const std::string& transferId, TransferState& state) const;

    /**
     * @brief Wait until the worker of @p transferId has finished
     */
    void wait(const std::string& transferId);

    /**
     * @brief Cancel everything and join all workers
     */
    void shutdown();

    /**
     * @brief Forget transfers that ended more than the retention time ago
     *
     * Also runs whenever a new transfer starts. getState() returns false
     * for a removed transfer.
     *
     * @return Number of transfers removed
     */
    size_t prune();

    void setStatusCallback(StatusCallback callback);
    void setDecisionTimeoutMs(uint32_t ms) { m_decisionTimeoutMs.store(ms); }
    uint32_t getDecisionTimeoutMs() const { return m_decisionTimeoutMs.load(); }
    void setRetentionMs(uint32_t ms) { m_retentionMs.store(ms); }
    const std::string& getSenderName() const { return m_senderName; }

private:
    struct Outgoing {
        std::atomic<TransferState> state{TransferState::Open};
        std::atomic<bool> cancelRequested{false};
        std::atomic<bool> finished{false};
        std::chrono::steady_clock::time_point finishedAt;  ///< Valid once finished is set
        std::thread worker;
    };

    bool run(const PeerRecord& peer, const TransferRequest& request,
             const std::vector<SelectedFile>& files, Outgoing& outgoing, std::string& errorMsg);
    bool awaitDecision(TransportStream& stream, const TransferRequest& request,
                       Outgoing& outgoing, bool& allowed, std::string& errorMsg);
    bool uploadAll(const PeerRecord& peer, const TransferRequest& request,
                   const std::vector<SelectedFile>& files, Outgoing& outgoing,
                   std::string& errorMsg);

    std::shared_ptr<Outgoing> registerOutgoing(const std::string& transferId);
    std::shared_ptr<Outgoing> findOutgoing(const std::string& transferId) const;
    size_t reapFinishedLocked();
    static void markFinished(Outgoing& outgoing);

    void emitStatus(const TransferStatus& status);
    void emitError(const std::string& transferId, TransferState state, ErrorKind kind,
                   const char* code, const std::string& message);

    const std::string m_senderName;
    std::atomic<uint32_t> m_decisionTimeoutMs;
    std::atomic<uint32_t> m_retentionMs;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Outgoing>> m_outgoing;

    std::mutex m_callbackMutex;
    StatusCallback m_statusCallback;
};

}  // namespace SecureXfer
