/**
 * @file PeerTable.h
 * @brief Time-bounded table of live peers keyed by peer id
 */

#pragma once

#include "PeerRecord.h"
#include "config.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SecureXfer {

/**
 * @brief Outcome of a PeerTable::upsert()
 */
enum class UpsertResult {
    Added,      ///< New peer id
    Updated,    ///< Known peer id refreshed
    Replaced    ///< Another id on the same IP was evicted first (peer restart)
};

/**
 * @class PeerTable
 * @brief Mapping peerId -> PeerRecord with lazy staleness eviction
 *
 * The table has no background sweeper: sweepAndSnapshot() evicts stale
 * records and returns what is left, so polling it is the eviction mechanism.
 * The clock is injectable so staleness can be tested without sleeping.
 *
 * Thread Safety: every method locks m_mutex.
 */
class PeerTable {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit PeerTable(uint32_t staleMs = PEER_STALE_MS, Clock clock = nullptr);

    /**
     * @brief Insert or refresh a peer
     *
     * lastSeen is stamped from the table's clock. Any record that shares the
     * IP address under a different peer id is evicted before the upsert.
     */
    UpsertResult upsert(const std::string& peerId,
                        const std::string& displayName,
                        const std::string& ipAddress,
                        uint16_t port,
                        const std::string& certificateFingerprint);

    /**
     * @brief Evict stale records, then return a snapshot of the rest
     */
    std::vector<PeerRecord> sweepAndSnapshot();

    /**
     * @brief Look up one peer without sweeping
     * @return true and fills @p out if present and not stale
     */
    bool find(const std::string& peerId, PeerRecord& out) const;

    bool contains(const std::string& peerId) const;
    bool containsIp(const std::string& ipAddress) const;
    size_t size() const;
    void clear();

    uint32_t staleMs() const { return m_staleMs; }

private:
    std::chrono::steady_clock::time_point now() const;

    uint32_t m_staleMs;
    Clock m_clock;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, PeerRecord> m_peers;
};

}  // namespace SecureXfer
