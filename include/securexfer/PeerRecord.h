/**
 * @file PeerRecord.h
 * @brief Peer information structure for discovered hosts
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace SecureXfer {

    /**
     * @brief Information about a discovered peer on the network
     *
     * Holds everything learned from one peer's discovery response. Records are
     * keyed by peerId in the PeerTable and refreshed on every response.
     */
    struct PeerRecord {
        std::string peerId;                                         ///< Peer process id (UUID)
        std::string displayName;                                    ///< Human-readable host name
        std::string ipAddress;                                      ///< IPv4 address from the A record
        uint16_t port;                                              ///< Transfer listener port from SRV
        std::string certificateFingerprint;                         ///< Pinned SHA-256 fingerprint (64 hex)
        std::chrono::steady_clock::time_point lastSeen;             ///< Last discovery response

        PeerRecord() : port(0), lastSeen(std::chrono::steady_clock::now()) {}

        PeerRecord(const std::string& id, const std::string& name,
                   const std::string& ip, uint16_t port_,
                   const std::string& fingerprint,
                   std::chrono::steady_clock::time_point seen)
            : peerId(id), displayName(name), ipAddress(ip), port(port_),
              certificateFingerprint(fingerprint), lastSeen(seen) {}

        /**
         * @brief Check if this peer has gone stale
         * @param now Current monotonic time
         * @param staleMs Staleness threshold in milliseconds
         * @return true if the record is strictly older than the threshold
         */
        bool isStale(std::chrono::steady_clock::time_point now, uint32_t staleMs) const {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSeen);
            return elapsed.count() > static_cast<int64_t>(staleMs);
        }

        /**
         * @brief Milliseconds since the last response
         */
        int64_t ageMs(std::chrono::steady_clock::time_point now) const {
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSeen).count();
        }
    };
}  // namespace SecureXfer
