/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 *
 * Each family maps to one error class of the transfer core:
 * identity (fatal at startup), trust (fingerprint pinning), discovery parse
 * (dropped silently), transfer I/O (surfaced, partial output kept) and
 * timeout (distinct terminal status).
 */

#pragma once

#include <string>

namespace SecureXfer {

/**
 * @brief Error class carried by status events
 */
enum class ErrorKind {
    None,
    Identity,
    Trust,
    DiscoveryParse,
    TransferIO,
    Timeout
};

namespace ErrorCodes {

// Identity (fatal to startup)
inline constexpr const char* IDENTITY_KEYGEN_FAILED = "SXF-ID-1000";
inline constexpr const char* IDENTITY_CERT_FAILED = "SXF-ID-1001";
inline constexpr const char* IDENTITY_ENCODE_FAILED = "SXF-ID-1002";

// Trust (fingerprint pinning)
inline constexpr const char* TRUST_FINGERPRINT_MISMATCH = "SXF-TRUST-2000";
inline constexpr const char* TRUST_NO_PEER_CERTIFICATE = "SXF-TRUST-2001";
inline constexpr const char* TRUST_INVALID_PINNED_FINGERPRINT = "SXF-TRUST-2002";

// Discovery packet parsing
inline constexpr const char* DISCOVERY_MALFORMED_PACKET = "SXF-DISC-3000";
inline constexpr const char* DISCOVERY_INCOMPLETE_RESPONSE = "SXF-DISC-3001";

// Transfer I/O
inline constexpr const char* TRANSFER_CONNECT_FAILED = "SXF-IO-4000";
inline constexpr const char* TRANSFER_TLS_FAILED = "SXF-IO-4001";
inline constexpr const char* TRANSFER_STREAM_FAILED = "SXF-IO-4002";
inline constexpr const char* TRANSFER_FILE_FAILED = "SXF-IO-4003";
inline constexpr const char* TRANSFER_REJECTED_BY_RECEIVER = "SXF-IO-4004";
inline constexpr const char* TRANSFER_PROTOCOL_ERROR = "SXF-IO-4005";

// Timeout
inline constexpr const char* DECISION_TIMED_OUT = "SXF-TIME-5000";
inline constexpr const char* UPLOAD_IDLE_TIMED_OUT = "SXF-TIME-5001";

/**
 * @brief Prefix a message with its code: "[SXF-IO-4000] message"
 */
inline std::string format(const char* code, const std::string& message) {
    return std::string("[") + code + "] " + message;
}

}  // namespace ErrorCodes

/**
 * @brief Human-readable name of an error class
 */
inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::Identity:       return "IdentityError";
        case ErrorKind::Trust:          return "TrustError";
        case ErrorKind::DiscoveryParse: return "DiscoveryParseError";
        case ErrorKind::TransferIO:     return "TransferIOError";
        case ErrorKind::Timeout:        return "TimeoutError";
    }
    return "Unknown";
}

}  // namespace SecureXfer
