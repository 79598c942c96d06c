/**
 * @file PeerTable.cpp
 * @brief Time-bounded peer table
 */

#include "securexfer/PeerTable.h"

namespace SecureXfer {

PeerTable::PeerTable(uint32_t staleMs, Clock clock)
    : m_staleMs(staleMs)
    , m_clock(std::move(clock))
{
}

std::chrono::steady_clock::time_point PeerTable::now() const {
    return m_clock ? m_clock() : std::chrono::steady_clock::now();
}

UpsertResult PeerTable::upsert(const std::string& peerId,
                               const std::string& displayName,
                               const std::string& ipAddress,
                               uint16_t port,
                               const std::string& certificateFingerprint) {
    const auto seen = now();
    UpsertResult result = UpsertResult::Added;

    std::lock_guard<std::mutex> lock(m_mutex);

    // A different id on the same address means the host restarted with a new
    // process id; the old record is dead.
    for (auto it = m_peers.begin(); it != m_peers.end();) {
        if (it->second.ipAddress == ipAddress && it->first != peerId) {
            it = m_peers.erase(it);
            result = UpsertResult::Replaced;
        } else {
            ++it;
        }
    }

    auto it = m_peers.find(peerId);
    if (it != m_peers.end()) {
        it->second.displayName = displayName;
        it->second.ipAddress = ipAddress;
        it->second.port = port;
        it->second.certificateFingerprint = certificateFingerprint;
        it->second.lastSeen = seen;
        return result == UpsertResult::Replaced ? result : UpsertResult::Updated;
    }

    m_peers[peerId] = PeerRecord(peerId, displayName, ipAddress, port,
                                 certificateFingerprint, seen);
    return result;
}

std::vector<PeerRecord> PeerTable::sweepAndSnapshot() {
    const auto current = now();

    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<PeerRecord> snapshot;
    snapshot.reserve(m_peers.size());

    auto it = m_peers.begin();
    while (it != m_peers.end()) {
        if (it->second.isStale(current, m_staleMs)) {
            it = m_peers.erase(it);
        } else {
            snapshot.push_back(it->second);
            ++it;
        }
    }

    return snapshot;
}

bool PeerTable::find(const std::string& peerId, PeerRecord& out) const {
    const auto current = now();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peerId);
    if (it == m_peers.end() || it->second.isStale(current, m_staleMs)) {
        return false;
    }
    out = it->second;
    return true;
}

bool PeerTable::contains(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.count(peerId) > 0;
}

bool PeerTable::containsIp(const std::string& ipAddress) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, peer] : m_peers) {
        if (peer.ipAddress == ipAddress) return true;
    }
    return false;
}

size_t PeerTable::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.size();
}

void PeerTable::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_peers.clear();
}

}  // namespace SecureXfer
