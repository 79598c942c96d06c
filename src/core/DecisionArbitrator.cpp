/**
 * @file DecisionArbitrator.cpp
 * @brief Correlates transfer requests with their approval outcome
 */

#include "securexfer/DecisionArbitrator.h"

#include <algorithm>

namespace SecureXfer {

DecisionArbitrator::DecisionArbitrator(Clock clock)
    : m_clock(std::move(clock)) {
}

std::chrono::steady_clock::time_point DecisionArbitrator::now() const {
    return m_clock ? m_clock() : std::chrono::steady_clock::now();
}

//=============================================================================
// Pending Decisions
//=============================================================================

bool DecisionArbitrator::open(const TransferRequest& request, std::future<bool>& decision) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (request.transferId.empty() || m_entries.count(request.transferId) != 0) {
        return false;
    }

    Entry entry;
    entry.request = request;
    entry.promise = std::make_unique<std::promise<bool>>();
    decision = entry.promise->get_future();

    m_entries.emplace(request.transferId, std::move(entry));
    return true;
}

bool DecisionArbitrator::resolve(const std::string& transferId, bool allowed) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end() || it->second.state != TransferState::Open) {
        return false;
    }

    Entry& entry = it->second;
    entry.state = allowed ? TransferState::Accepted : TransferState::Declined;
    if (allowed) {
        entry.lastActivity = now();
    } else {
        entry.terminalAt = now();
    }
    if (entry.promise) {
        entry.promise->set_value(allowed);
        entry.promise.reset();
    }
    return true;
}

bool DecisionArbitrator::discard(const std::string& transferId, TransferState reason) {
    if (reason != TransferState::Cancelled && reason != TransferState::TimedOut) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end() || it->second.state != TransferState::Open) {
        return false;
    }

    Entry& entry = it->second;
    entry.state = reason;
    entry.terminalAt = now();
    // Destroying the unfulfilled promise breaks it: the waiter sees Discarded
    entry.promise.reset();
    return true;
}

DecisionWait DecisionArbitrator::poll(std::future<bool>& decision, uint32_t timeoutMs) {
    if (!decision.valid()) {
        return DecisionWait::Discarded;
    }

    if (decision.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        return DecisionWait::Pending;
    }

    try {
        return decision.get() ? DecisionWait::Accepted : DecisionWait::Declined;
    } catch (const std::future_error&) {
        // broken_promise: discarded without resolution
        return DecisionWait::Discarded;
    }
}

//=============================================================================
// Transfer Progression
//=============================================================================

bool DecisionArbitrator::transition(const std::string& transferId,
                                    std::initializer_list<TransferState> from,
                                    TransferState to) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end()) {
        return false;
    }

    Entry& entry = it->second;
    if (std::find(from.begin(), from.end(), entry.state) == from.end()) {
        return false;
    }

    entry.state = to;
    if (isTerminalState(to)) {
        entry.terminalAt = now();
    }
    return true;
}

bool DecisionArbitrator::beginUpload(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end()) {
        return false;
    }

    Entry& entry = it->second;
    if (entry.state != TransferState::Accepted && entry.state != TransferState::Transferring) {
        return false;
    }

    entry.state = TransferState::Transferring;
    ++entry.activeUploads;
    entry.lastActivity = now();
    return true;
}

void DecisionArbitrator::endUpload(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end()) {
        return;
    }

    Entry& entry = it->second;
    if (entry.activeUploads > 0) {
        --entry.activeUploads;
    }
    entry.lastActivity = now();
}

bool DecisionArbitrator::markCompleted(const std::string& transferId) {
    return transition(transferId, {TransferState::Accepted, TransferState::Transferring},
                      TransferState::Completed);
}

bool DecisionArbitrator::markFailed(const std::string& transferId) {
    return transition(transferId, {TransferState::Accepted, TransferState::Transferring},
                      TransferState::Failed);
}

uint32_t DecisionArbitrator::recordUploadCompleted(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end()) {
        return 0;
    }
    return ++it->second.uploadsCompleted;
}

//=============================================================================
// Queries
//=============================================================================

bool DecisionArbitrator::getState(const std::string& transferId, TransferState& state) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end()) {
        return false;
    }
    state = it->second.state;
    return true;
}

bool DecisionArbitrator::getRequest(const std::string& transferId, TransferRequest& request) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(transferId);
    if (it == m_entries.end()) {
        return false;
    }
    request = it->second.request;
    return true;
}

bool DecisionArbitrator::isUploadAllowed(const std::string& transferId) const {
    TransferState state;
    if (!getState(transferId, state)) {
        return false;
    }
    return state == TransferState::Accepted || state == TransferState::Transferring;
}

bool DecisionArbitrator::hasPending(const std::string& transferId) const {
    TransferState state;
    return getState(transferId, state) && state == TransferState::Open;
}

size_t DecisionArbitrator::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [](const std::pair<const std::string, Entry>& kv) {
            return kv.second.state == TransferState::Open;
        }));
}

size_t DecisionArbitrator::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<std::string> DecisionArbitrator::getPendingIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& kv : m_entries) {
        if (kv.second.state == TransferState::Open) {
            ids.push_back(kv.first);
        }
    }
    return ids;
}

std::vector<std::string> DecisionArbitrator::expireIdle(uint32_t idleMs) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto current = now();
    const auto cutoff = current - std::chrono::milliseconds(idleMs);
    std::vector<std::string> expired;
    for (auto& kv : m_entries) {
        Entry& entry = kv.second;
        const bool receiving = entry.state == TransferState::Accepted ||
                               entry.state == TransferState::Transferring;
        if (!receiving || entry.activeUploads > 0 || entry.lastActivity > cutoff) {
            continue;
        }
        entry.state = TransferState::Failed;
        entry.terminalAt = current;
        expired.push_back(kv.first);
    }
    return expired;
}

size_t DecisionArbitrator::prune(uint32_t retentionMs) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto cutoff = now() - std::chrono::milliseconds(retentionMs);
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (isTerminalState(it->second.state) && it->second.terminalAt <= cutoff) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}  // namespace SecureXfer
