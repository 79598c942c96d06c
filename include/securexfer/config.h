/**
 * @file config.h
 * @brief Configuration constants for SecureXfer
 *
 * This file contains all compile-time configuration constants used throughout
 * SecureXfer, including the multicast DNS parameters, timing values, buffer
 * sizes, wire-protocol limits, and TLS/SSL configuration.
 *
 * Runtime-adjustable values (download directory, decision timeout, discovery
 * interval) live in Settings; the constants here are their defaults.
 *
 * @note Changes to these constants may affect protocol compatibility.
 *       Ensure all peers use compatible configurations.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace SecureXfer
 * @brief SecureXfer namespace containing all public APIs
 */
namespace SecureXfer {

//=========================================================================
// Discovery (multicast DNS)
//=========================================================================

/** @defgroup Discovery Discovery Configuration
 * @brief Multicast DNS group, port and service name
 *
 * Presence is advertised with standard DNS resource records (PTR, SRV, TXT, A)
 * sent to the link-local mDNS group. Every SecureXfer host queries and answers
 * for the same fixed service name.
 * @{
 */

/**
 * @brief Link-local multicast DNS group (RFC 6762)
 */
constexpr const char* MDNS_MULTICAST_GROUP = "224.0.0.251";

/**
 * @brief Multicast DNS UDP port
 */
constexpr uint16_t MDNS_PORT = 5353;

/**
 * @brief Service name used as the query/response key
 *
 * PTR answers resolve this name to `<hostname>.securexfer.local`.
 */
constexpr const char* SERVICE_NAME = "securexfer.local";

/**
 * @brief Suffix appended to the hostname for the SRV target
 */
constexpr const char* HOST_DOMAIN_SUFFIX = ".local";

/**
 * @brief TTL advertised on every resource record (seconds)
 */
constexpr uint32_t MDNS_RECORD_TTL_S = 120;

/**
 * @brief Multicast TTL for outbound packets (stay on the local link)
 */
constexpr int MDNS_MULTICAST_TTL = 255;

/**
 * @brief Maximum accepted mDNS datagram size
 *
 * Larger datagrams are truncated by recvfrom() and fail to parse.
 */
constexpr size_t MAX_MDNS_PACKET_SIZE = 9000;

/**
 * @brief Maximum DNS name compression pointer hops
 *
 * Bounds the decoder against pointer loops in hostile packets.
 */
constexpr int MAX_DNS_POINTER_HOPS = 16;

/**
 * @brief Adapter name fragments treated as physical interfaces
 *
 * Interfaces whose name starts with one of these fragments (case-insensitive)
 * are preferred when choosing the IPv4 address advertised in the A record.
 * Prefix matching keeps virtual links such as "veth*" out.
 */
constexpr const char* PHYSICAL_ADAPTER_FRAGMENTS[] = {
    "eth", "en", "wl", "wlan", "wifi", "wi-fi"
};

/** @} */ // end of Discovery

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timing intervals and timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Interval between discover()/announce() rounds driven by the node
 *
 * Discovery is caller-driven; this is the default period used by
 * SecureXferNode and the CLI.
 */
constexpr uint32_t DISCOVERY_INTERVAL_MS = 3000;

/**
 * @brief Peer staleness threshold
 *
 * A peer not refreshed for longer than this is evicted by getPeers().
 */
constexpr uint32_t PEER_STALE_MS = 30000;

/**
 * @brief Time an initiator waits for the recipient's decision
 */
constexpr uint32_t DECISION_TIMEOUT_MS = 30000;

/**
 * @brief Connection / receive timeout for TLS connections
 */
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;

/**
 * @brief Poll slice used by connection handlers waiting on two event sources
 *
 * Handlers wake at this interval to check for a local decision or a local
 * cancel while also watching the socket.
 */
constexpr uint32_t HANDLER_POLL_SLICE_MS = 100;

/**
 * @brief Delay before closing the control connection after a cancel notice
 */
constexpr uint32_t CANCEL_LINGER_MS = 100;

/**
 * @brief Time an accepted transfer may go without upload activity
 *
 * After this the listener fails the transfer and stops accepting uploads
 * for it. Covers senders that die or lose a file after acceptance.
 */
constexpr uint32_t UPLOAD_IDLE_TIMEOUT_MS = 2 * CONNECTION_TIMEOUT_MS;

/**
 * @brief Cleanup interval for the listener's maintenance thread
 */
constexpr uint32_t SESSION_CLEANUP_INTERVAL_MS = 5000;

/**
 * @brief Retention of terminal transfer states before pruning
 *
 * Keeps late duplicate signals idempotent for a while after completion.
 */
constexpr uint32_t TERMINAL_STATE_RETENTION_MS = 10 * 60 * 1000;

/** @} */ // end of Timing

//=========================================================================
// Buffer Sizes
//=========================================================================

/** @defgroup BufferSizes Buffer Size Configuration
 * @{
 */

/**
 * @brief File streaming chunk size (256 KB)
 */
constexpr size_t BUFFER_SIZE = 262144;

/**
 * @brief Maximum control frame payload size
 *
 * Control messages are small JSON objects; anything larger is a protocol
 * violation and the connection is dropped.
 */
constexpr uint32_t MAX_CONTROL_FRAME_SIZE = 64 * 1024;

/**
 * @brief Maximum HTTP request/response head size (request line + headers)
 */
constexpr size_t MAX_HTTP_HEAD_SIZE = 16 * 1024;

/**
 * @brief Maximum display name length
 */
constexpr size_t MAX_DISPLAY_NAME = 64;

/**
 * @brief Maximum transfer / peer id length
 */
constexpr size_t MAX_ID_LENGTH = 64;

/**
 * @brief Maximum relative upload path length
 */
constexpr size_t MAX_UPLOAD_PATH_LENGTH = 1024;

/**
 * @brief Default maximum allowed incoming transfer size (10 GB)
 */
constexpr uint64_t DEFAULT_MAX_INCOMING_SIZE_BYTES = 10ULL * 1024ULL * 1024ULL * 1024ULL;

/** @} */ // end of BufferSizes

//=========================================================================
// Control Protocol
//=========================================================================

/** @defgroup Protocol Control and Upload Protocol
 * @{
 */

constexpr const char* MSG_REQUEST_TRANSFER = "request-transfer";
constexpr const char* MSG_TRANSFER_DECISION = "transfer-decision";
constexpr const char* MSG_CANCEL_TRANSFER = "cancel-transfer";

/**
 * @brief Upload endpoint path
 */
constexpr const char* UPLOAD_PATH = "/upload";

/**
 * @brief First four bytes of an upload connection
 *
 * Control connections start with a big-endian frame length which is always
 * below MAX_CONTROL_FRAME_SIZE, so its first byte is zero and can never be 'P'.
 */
constexpr const char* UPLOAD_METHOD_PREFIX = "POST";

/** @} */ // end of Protocol

//=========================================================================
// Socket Configuration
//=========================================================================

/**
 * @brief Loopback address, used as the last-resort advertised address
 */
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/**
 * @brief Listen backlog for the transfer listener
 */
constexpr int LISTEN_BACKLOG = 16;

/**
 * @brief Maximum concurrent incoming connection handler threads
 */
constexpr size_t MAX_CONCURRENT_INCOMING_CLIENT_THREADS = 32;

//=========================================================================
// TLS/SSL Configuration
//=========================================================================

/** @defgroup TLS TLS/SSL Configuration
 * @{
 */

/**
 * @brief TLS 1.3 cipher suites
 */
constexpr const char* TLS13_CIPHER_SUITES =
    "TLS_AES_256_GCM_SHA384:"
    "TLS_CHACHA20_POLY1305_SHA256:"
    "TLS_AES_128_GCM_SHA256";

/**
 * @brief Supported key exchange groups, X25519 preferred
 */
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256:P-384";

/**
 * @brief Maximum TLS record payload
 */
constexpr size_t TLS_MAX_PACKET_SIZE = 16384;

/**
 * @brief RSA modulus size for the host key
 */
constexpr int RSA_KEY_BITS = 2048;

/**
 * @brief Self-signed certificate validity (1 year)
 */
constexpr int CERT_VALIDITY_DAYS = 365;

/**
 * @brief Certificate subject common name and organization
 */
constexpr const char* CERT_COMMON_NAME = "securexfer.local";
constexpr const char* CERT_ORGANIZATION = "SecureXfer";

/** @} */ // end of TLS

//=========================================================================
// Files
//=========================================================================

constexpr const char* APP_DIR_NAME = "securexfer";
constexpr const char* CONFIG_FILE_NAME = "config.json";
constexpr const char* LOG_FILE_NAME = "debug.log";

//=========================================================================
// Settings ranges
//=========================================================================

constexpr uint32_t MIN_DECISION_TIMEOUT_MS = 1000;
constexpr uint32_t MAX_DECISION_TIMEOUT_MS = 10 * 60 * 1000;
constexpr uint32_t MIN_DISCOVERY_INTERVAL_MS = 500;
constexpr uint32_t MAX_DISCOVERY_INTERVAL_MS = 60000;
constexpr uint32_t MIN_PEER_STALE_MS = 5000;
constexpr uint32_t MAX_PEER_STALE_MS = 10 * 60 * 1000;

}  // namespace SecureXfer
