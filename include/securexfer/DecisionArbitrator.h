/**
 * @file DecisionArbitrator.h
 * @brief Correlates transfer requests with their approval outcome
 */

#pragma once

#include "ControlMessage.h"
#include "TransferStatus.h"
#include "config.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SecureXfer {

/**
 * @brief Result of polling a decision future
 */
enum class DecisionWait {
    Pending,     ///< No outcome yet
    Accepted,    ///< resolve(id, true)
    Declined,    ///< resolve(id, false)
    Discarded    ///< Cancelled, timed out or disconnected; no resolution
};

//=============================================================================
// DecisionArbitrator Class
//=============================================================================

/**
 * @class DecisionArbitrator
 * @brief Per-transferId state machine with one-shot pending decisions
 *
 * Each OPEN entry owns a std::promise<bool>. Exactly one of accept, decline,
 * cancel, disconnect or timeout leaves OPEN: accept/decline fulfil the
 * promise, the others drop it so the waiting future reports Discarded.
 * Every later signal for the same id returns false and changes nothing.
 *
 * Accepted entries whose uploads stop arriving are failed by expireIdle();
 * an entry with an upload in progress never expires.
 *
 * Terminal entries are kept for TERMINAL_STATE_RETENTION_MS so late
 * duplicates stay no-ops, then removed by prune().
 *
 * Thread Safety: all methods are thread-safe.
 */
class DecisionArbitrator {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit DecisionArbitrator(Clock clock = nullptr);

    DecisionArbitrator(const DecisionArbitrator&) = delete;
    DecisionArbitrator& operator=(const DecisionArbitrator&) = delete;

    //=========================================================================
    // Pending Decisions
    //=========================================================================

    /**
     * @brief Register an OPEN entry
     * @param request Request being decided
     * @param decision Output future, fulfilled by resolve()
     * @return false if the transferId is already known
     */
    bool open(const TransferRequest& request, std::future<bool>& decision);

    /**
     * @brief Accept or decline an OPEN entry
     * @return true if this call resolved it; false (no-op) otherwise
     */
    bool resolve(const std::string& transferId, bool allowed);

    /**
     * @brief Discard an OPEN entry without resolution
     * @param transferId Transfer to discard
     * @param reason TransferState::Cancelled or TransferState::TimedOut
     * @return true if this call discarded it; false (no-op) otherwise
     *
     * Connection drops are recorded as Cancelled.
     */
    bool discard(const std::string& transferId, TransferState reason);

    /**
     * @brief Poll a future from open() without blocking longer than timeoutMs
     */
    static DecisionWait poll(std::future<bool>& decision, uint32_t timeoutMs);

    //=========================================================================
    // Transfer Progression
    //=========================================================================

    /**
     * @brief An upload starts: ACCEPTED → TRANSFERRING (already TRANSFERRING is fine)
     * @return false if uploads are not allowed for this transfer
     *
     * Every successful call must be paired with endUpload().
     */
    bool beginUpload(const std::string& transferId);

    /**
     * @brief An upload begun with beginUpload() finished, either way
     */
    void endUpload(const std::string& transferId);

    /**
     * @brief ACCEPTED | TRANSFERRING → COMPLETED
     */
    bool markCompleted(const std::string& transferId);

    /**
     * @brief ACCEPTED | TRANSFERRING → FAILED
     */
    bool markFailed(const std::string& transferId);

    /**
     * @brief Count one finished upload
     * @return Uploads finished so far, 0 if the id is unknown
     */
    uint32_t recordUploadCompleted(const std::string& transferId);

    //=========================================================================
    // Queries
    //=========================================================================

    bool getState(const std::string& transferId, TransferState& state) const;
    bool getRequest(const std::string& transferId, TransferRequest& request) const;

    /**
     * @brief Whether uploads may be written for this transfer
     *
     * Only ACCEPTED and TRANSFERRING transfers receive data.
     */
    bool isUploadAllowed(const std::string& transferId) const;

    /**
     * @brief Whether an OPEN (pending) entry exists
     */
    bool hasPending(const std::string& transferId) const;

    size_t pendingCount() const;
    size_t size() const;

    /**
     * @brief Fail ACCEPTED | TRANSFERRING entries idle for at least idleMs
     * @return Ids moved to FAILED
     *
     * Idle means no upload in progress and none started or finished since
     * the deadline; acceptance counts as activity.
     */
    std::vector<std::string> expireIdle(uint32_t idleMs);

    /**
     * @brief Remove terminal entries older than retentionMs
     * @return Number of entries removed
     */
    size_t prune(uint32_t retentionMs = TERMINAL_STATE_RETENTION_MS);

    std::vector<std::string> getPendingIds() const;

private:
    struct Entry {
        TransferRequest request;
        TransferState state = TransferState::Open;
        std::unique_ptr<std::promise<bool>> promise;
        uint32_t uploadsCompleted = 0;
        uint32_t activeUploads = 0;
        std::chrono::steady_clock::time_point lastActivity;
        std::chrono::steady_clock::time_point terminalAt;
    };

    std::chrono::steady_clock::time_point now() const;
    bool transition(const std::string& transferId,
                    std::initializer_list<TransferState> from,
                    TransferState to);

    Clock m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

}  // namespace SecureXfer
