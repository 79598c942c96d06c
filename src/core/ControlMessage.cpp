/**
 * @file ControlMessage.cpp
 * @brief Transfer control channel messages and framing
 */

#include "securexfer/ControlMessage.h"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace SecureXfer {

using json = nlohmann::json;

//=============================================================================
// ControlMessage
//=============================================================================

ControlMessage ControlMessage::makeRequest(const TransferRequest& request) {
    ControlMessage message;
    message.type = ControlMessageType::RequestTransfer;
    message.transferId = request.transferId;
    message.request = request;
    return message;
}

ControlMessage ControlMessage::makeDecision(const std::string& transferId, bool allowed) {
    ControlMessage message;
    message.type = ControlMessageType::TransferDecision;
    message.transferId = transferId;
    message.allowed = allowed;
    return message;
}

ControlMessage ControlMessage::makeCancel(const std::string& transferId) {
    ControlMessage message;
    message.type = ControlMessageType::CancelTransfer;
    message.transferId = transferId;
    return message;
}

const char* controlMessageTypeToString(ControlMessageType type) {
    switch (type) {
        case ControlMessageType::RequestTransfer:  return MSG_REQUEST_TRANSFER;
        case ControlMessageType::TransferDecision: return MSG_TRANSFER_DECISION;
        case ControlMessageType::CancelTransfer:   return MSG_CANCEL_TRANSFER;
    }
    return "unknown";
}

namespace ControlCodec {

namespace {

bool readString(const json& obj, const char* key, bool required, std::string& out,
                std::string& errorMsg) {
    if (!obj.contains(key)) {
        if (required) {
            errorMsg = std::string("Missing field: ") + key;
            return false;
        }
        return true;
    }
    if (!obj[key].is_string()) {
        errorMsg = std::string("Field is not a string: ") + key;
        return false;
    }
    out = obj[key].get<std::string>();
    return true;
}

bool readUnsigned(const json& obj, const char* key, bool required, uint64_t& out,
                  std::string& errorMsg) {
    if (!obj.contains(key)) {
        if (required) {
            errorMsg = std::string("Missing field: ") + key;
            return false;
        }
        return true;
    }
    if (!obj[key].is_number_unsigned()) {
        // nlohmann reports non-negative integers parsed from text as unsigned
        errorMsg = std::string("Field is not a non-negative integer: ") + key;
        return false;
    }
    out = obj[key].get<uint64_t>();
    return true;
}

bool validId(const std::string& id) {
    return !id.empty() && id.size() <= MAX_ID_LENGTH;
}

}  // namespace

json toJson(const ControlMessage& message) {
    json j;
    j["type"] = controlMessageTypeToString(message.type);
    j["id"] = message.transferId;

    switch (message.type) {
        case ControlMessageType::RequestTransfer:
            j["senderName"] = message.request.senderName;
            j["fileName"] = message.request.fileName;
            j["fileSize"] = message.request.fileSize;
            j["fileType"] = message.request.fileType;
            j["fileCount"] = message.request.fileCount;
            j["totalSize"] = message.request.totalSize;
            break;
        case ControlMessageType::TransferDecision:
            j["allowed"] = message.allowed;
            break;
        case ControlMessageType::CancelTransfer:
            break;
    }
    return j;
}

bool fromJson(const std::string& payload, ControlMessage& message, std::string& errorMsg) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        errorMsg = std::string("Malformed control message: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        errorMsg = "Control message is not a JSON object";
        return false;
    }

    std::string type;
    std::string id;
    if (!readString(j, "type", true, type, errorMsg) ||
        !readString(j, "id", true, id, errorMsg)) {
        return false;
    }
    if (!validId(id)) {
        errorMsg = "Invalid transfer id";
        return false;
    }

    ControlMessage parsed;
    parsed.transferId = id;

    if (type == MSG_REQUEST_TRANSFER) {
        parsed.type = ControlMessageType::RequestTransfer;
        TransferRequest& request = parsed.request;
        request.transferId = id;

        uint64_t fileCount = 1;
        const bool hasTotal = j.contains("totalSize");
        if (!readString(j, "senderName", true, request.senderName, errorMsg) ||
            !readString(j, "fileName", true, request.fileName, errorMsg) ||
            !readUnsigned(j, "fileSize", true, request.fileSize, errorMsg) ||
            !readString(j, "fileType", false, request.fileType, errorMsg) ||
            !readUnsigned(j, "fileCount", false, fileCount, errorMsg) ||
            !readUnsigned(j, "totalSize", false, request.totalSize, errorMsg)) {
            return false;
        }

        if (fileCount == 0 || fileCount > UINT32_MAX) {
            errorMsg = "Invalid fileCount";
            return false;
        }
        request.fileCount = static_cast<uint32_t>(fileCount);
        if (!hasTotal) {
            request.totalSize = request.fileSize;
        }
        if (request.senderName.size() > MAX_DISPLAY_NAME) {
            request.senderName.resize(MAX_DISPLAY_NAME);
        }
    } else if (type == MSG_TRANSFER_DECISION) {
        parsed.type = ControlMessageType::TransferDecision;
        if (!j.contains("allowed") || !j["allowed"].is_boolean()) {
            errorMsg = "Missing or invalid field: allowed";
            return false;
        }
        parsed.allowed = j["allowed"].get<bool>();
    } else if (type == MSG_CANCEL_TRANSFER) {
        parsed.type = ControlMessageType::CancelTransfer;
    } else {
        errorMsg = "Unknown control message type: " + type;
        return false;
    }

    message = std::move(parsed);
    return true;
}

uint32_t decodeLength(const uint8_t prefix[4]) {
    return (static_cast<uint32_t>(prefix[0]) << 24) |
           (static_cast<uint32_t>(prefix[1]) << 16) |
           (static_cast<uint32_t>(prefix[2]) << 8) |
           static_cast<uint32_t>(prefix[3]);
}

void encodeLength(uint32_t length, uint8_t out[4]) {
    out[0] = static_cast<uint8_t>(length >> 24);
    out[1] = static_cast<uint8_t>((length >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((length >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(length & 0xFF);
}

bool writeFrame(TransportStream& stream, const ControlMessage& message, std::string& errorMsg) {
    const std::string payload = toJson(message).dump();
    if (payload.size() > MAX_CONTROL_FRAME_SIZE) {
        errorMsg = "Control message too large";
        return false;
    }

    // Prefix and payload in one write so they share a TLS record
    std::vector<uint8_t> frame(4 + payload.size());
    encodeLength(static_cast<uint32_t>(payload.size()), frame.data());
    std::copy(payload.begin(), payload.end(), frame.begin() + 4);

    return stream.sendExact(frame.data(), frame.size(), errorMsg);
}

bool readFrame(TransportStream& stream, ControlMessage& message, std::string& errorMsg) {
    uint8_t prefix[4];
    if (!stream.recvExact(prefix, sizeof(prefix), errorMsg)) {
        return false;
    }
    return readFrameBody(stream, prefix, message, errorMsg);
}

bool readFrameBody(TransportStream& stream, const uint8_t prefix[4],
                   ControlMessage& message, std::string& errorMsg) {
    const uint32_t length = decodeLength(prefix);
    if (length == 0 || length > MAX_CONTROL_FRAME_SIZE) {
        errorMsg = "Invalid control frame length: " + std::to_string(length);
        return false;
    }

    std::string payload(length, '\0');
    if (!stream.recvExact(reinterpret_cast<uint8_t*>(&payload[0]), length, errorMsg)) {
        return false;
    }

    return fromJson(payload, message, errorMsg);
}

}  // namespace ControlCodec

}  // namespace SecureXfer
