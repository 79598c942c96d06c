/**
 * @file ControlMessage.h
 * @brief Transfer control channel messages and framing
 *
 * Wire format (over TLS):
 * @code
 * +----------------------+---------------------------+
 * | length (4 bytes, BE) | UTF-8 JSON object         |
 * +----------------------+---------------------------+
 * @endcode
 * Every object carries a "type" field: request-transfer, transfer-decision
 * or cancel-transfer. Closing the connection is the implicit disconnect.
 */

#pragma once

#include "TransportStream.h"
#include "config.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace SecureXfer {

/**
 * @brief Transfer request sent by the initiator
 *
 * Immutable once sent; transferId correlates every later decision, cancel,
 * upload and status event.
 */
struct TransferRequest {
    std::string transferId;     ///< Unique per attempt ("id")
    std::string senderName;     ///< Initiator display name
    std::string fileName;       ///< Single file name, or "<N> items"
    uint64_t fileSize = 0;      ///< Same as totalSize for multi-file sends
    std::string fileType;       ///< MIME type hint, may be empty
    uint32_t fileCount = 1;     ///< Number of uploads that will follow
    uint64_t totalSize = 0;     ///< Sum of all file sizes
};

enum class ControlMessageType {
    RequestTransfer,
    TransferDecision,
    CancelTransfer
};

/**
 * @brief One control channel message
 *
 * For RequestTransfer, @ref request is filled and transferId mirrors
 * request.transferId. For the other types only transferId (and allowed)
 * are meaningful.
 */
struct ControlMessage {
    ControlMessageType type = ControlMessageType::RequestTransfer;
    std::string transferId;
    bool allowed = false;
    TransferRequest request;

    static ControlMessage makeRequest(const TransferRequest& request);
    static ControlMessage makeDecision(const std::string& transferId, bool allowed);
    static ControlMessage makeCancel(const std::string& transferId);
};

const char* controlMessageTypeToString(ControlMessageType type);

//=============================================================================
// Control Codec
//=============================================================================

namespace ControlCodec {

/**
 * @brief JSON object for a message
 */
nlohmann::json toJson(const ControlMessage& message);

/**
 * @brief Parse a JSON payload
 * @return false with errorMsg set on malformed JSON, unknown type or
 *         missing / mistyped fields
 *
 * Optional request fields: fileCount defaults to 1, totalSize to fileSize.
 */
bool fromJson(const std::string& payload, ControlMessage& message, std::string& errorMsg);

/**
 * @brief Write one length-prefixed frame
 */
bool writeFrame(TransportStream& stream, const ControlMessage& message, std::string& errorMsg);

/**
 * @brief Read one length-prefixed frame
 */
bool readFrame(TransportStream& stream, ControlMessage& message, std::string& errorMsg);

/**
 * @brief Read the body of a frame whose 4-byte prefix was already consumed
 *
 * The listener reads the first four bytes itself to tell control
 * connections from uploads.
 */
bool readFrameBody(TransportStream& stream, const uint8_t prefix[4],
                   ControlMessage& message, std::string& errorMsg);

uint32_t decodeLength(const uint8_t prefix[4]);
void encodeLength(uint32_t length, uint8_t out[4]);

}  // namespace ControlCodec

}  // namespace SecureXfer
