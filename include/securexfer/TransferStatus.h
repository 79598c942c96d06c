/**
 * @file TransferStatus.h
 * @brief Transfer states and the status events delivered to callers
 */

#pragma once

#include "ErrorCodes.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace SecureXfer {

/**
 * @brief Lifecycle of one transferId
 *
 * OPEN → ACCEPTED → TRANSFERRING → COMPLETED | FAILED, or
 * OPEN → DECLINED | CANCELLED | TIMED_OUT. Terminal states are final.
 */
enum class TransferState {
    Open,
    Accepted,
    Transferring,
    Completed,
    Failed,
    Declined,
    Cancelled,
    TimedOut
};

inline bool isTerminalState(TransferState state) {
    switch (state) {
        case TransferState::Completed:
        case TransferState::Failed:
        case TransferState::Declined:
        case TransferState::Cancelled:
        case TransferState::TimedOut:
            return true;
        default:
            return false;
    }
}

inline const char* transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::Open:         return "OPEN";
        case TransferState::Accepted:     return "ACCEPTED";
        case TransferState::Transferring: return "TRANSFERRING";
        case TransferState::Completed:    return "COMPLETED";
        case TransferState::Failed:       return "FAILED";
        case TransferState::Declined:     return "DECLINED";
        case TransferState::Cancelled:    return "CANCELLED";
        case TransferState::TimedOut:     return "TIMED_OUT";
    }
    return "UNKNOWN";
}

/**
 * @brief Text shown to the user for a state
 */
inline const char* statusTextForState(TransferState state) {
    switch (state) {
        case TransferState::Open:         return "Waiting for approval";
        case TransferState::Accepted:     return "Accepted";
        case TransferState::Transferring: return "Transferring";
        case TransferState::Completed:    return "Completed";
        case TransferState::Failed:       return "Failed";
        case TransferState::Declined:     return "Denied by recipient";
        case TransferState::Cancelled:    return "Cancelled";
        case TransferState::TimedOut:     return "Timed out";
    }
    return "Unknown";
}

/**
 * @brief Kind of status event
 */
enum class StatusPhase {
    Waiting,     ///< Request sent, awaiting the recipient's decision
    Progress,    ///< Bytes moved; percentage updated
    Completed,   ///< One file saved (listener) or whole set sent (initiator)
    Denied,      ///< Recipient declined
    Cancelled,   ///< Cancelled locally or withdrawn by the sender
    Error        ///< Trust, I/O or timeout failure; see errorKind
};

inline const char* statusPhaseToString(StatusPhase phase) {
    switch (phase) {
        case StatusPhase::Waiting:   return "waiting";
        case StatusPhase::Progress:  return "progress";
        case StatusPhase::Completed: return "completed";
        case StatusPhase::Denied:    return "denied";
        case StatusPhase::Cancelled: return "cancelled";
        case StatusPhase::Error:     return "error";
    }
    return "unknown";
}

/**
 * @brief Ephemeral status event, consumed immediately by the caller
 */
struct TransferStatus {
    std::string transferId;
    StatusPhase phase = StatusPhase::Progress;
    TransferState state = TransferState::Open;

    int percentage = -1;             ///< 0-100, or -1 when indeterminate
    uint64_t bytesTransferred = 0;
    uint64_t totalBytes = 0;

    std::string savedPath;           ///< Completed uploads (listener side)
    std::string fileName;            ///< File the event refers to, if any

    ErrorKind errorKind = ErrorKind::None;
    std::string errorCode;           ///< SXF-* code for errors
    std::string message;             ///< Human-readable text

    bool isCompleted = false;        ///< Whole transfer finished successfully
};

using StatusCallback = std::function<void(const TransferStatus& status)>;

/**
 * @brief round(done / total × 100), or -1 when total is 0
 */
inline int computePercentage(uint64_t done, uint64_t total) {
    if (total == 0) {
        return -1;
    }
    if (done >= total) {
        return 100;
    }
    return static_cast<int>((done * 200 + total) / (total * 2));
}

/**
 * @brief Limits progress events to one per percentage point
 *
 * With an indeterminate total, events are limited to one per
 * PROGRESS_THROTTLE_MS instead.
 */
class ThrottledProgress {
public:
    static constexpr int64_t PROGRESS_THROTTLE_MS = 200;

    ThrottledProgress()
        : m_lastPercentage(-2)
        , m_lastUpdate(std::chrono::steady_clock::time_point::min()) {}

    bool shouldEmit(int percentage) {
        if (percentage >= 0) {
            if (percentage == m_lastPercentage) {
                return false;
            }
            m_lastPercentage = percentage;
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (m_lastUpdate != std::chrono::steady_clock::time_point::min() &&
            std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastUpdate).count() <
                PROGRESS_THROTTLE_MS) {
            return false;
        }
        m_lastUpdate = now;
        return true;
    }

private:
    int m_lastPercentage;
    std::chrono::steady_clock::time_point m_lastUpdate;
};

}  // namespace SecureXfer
