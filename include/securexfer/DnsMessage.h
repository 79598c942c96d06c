/**
 * @file DnsMessage.h
 * @brief DNS message model and wire codec for multicast DNS discovery
 *
 * Covers the subset of RFC 1035 / RFC 6762 used for presence announcements:
 * questions plus PTR, SRV, TXT and A resource records. Other record types are
 * decoded with their raw RDATA so a foreign packet never fails as a whole just
 * because it carries records we do not use.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace SecureXfer {

/**
 * @brief Resource record types used by discovery
 */
namespace DnsType {
constexpr uint16_t A = 1;
constexpr uint16_t PTR = 12;
constexpr uint16_t TXT = 16;
constexpr uint16_t SRV = 33;
constexpr uint16_t ANY = 255;
}  // namespace DnsType

constexpr uint16_t DNS_CLASS_IN = 1;
constexpr uint16_t DNS_FLAG_RESPONSE = 0x8000;
constexpr uint16_t DNS_FLAG_AUTHORITATIVE = 0x0400;

struct DnsQuestion {
    std::string name;
    uint16_t type = DnsType::PTR;
    uint16_t qclass = DNS_CLASS_IN;
};

struct DnsSrvData {
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;
    std::string target;
};

/**
 * @brief One resource record
 *
 * Only the field matching @ref type is meaningful:
 * PTR → ptrName, SRV → srv, TXT → txt, A → address (dotted quad).
 */
struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = DNS_CLASS_IN;
    uint32_t ttl = 0;

    std::string ptrName;
    DnsSrvData srv;
    std::vector<std::string> txt;
    std::string address;
    std::vector<uint8_t> rawData;   ///< RDATA of unsupported types
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    bool isResponse() const { return (flags & DNS_FLAG_RESPONSE) != 0; }
};

//=============================================================================
// DnsCodec Class
//=============================================================================

/**
 * @class DnsCodec
 * @brief Encodes and decodes DNS messages
 *
 * Encoding never compresses names. Decoding follows compression pointers,
 * bounded by MAX_DNS_POINTER_HOPS, and rejects any read past the packet.
 */
class DnsCodec {
public:
    /**
     * @brief Serialize a message
     * @param message Message to encode
     * @param out Output packet bytes
     * @param errorMsg Output error message (label or name too long, bad address)
     * @return true on success
     */
    static bool encode(const DnsMessage& message, std::vector<uint8_t>& out,
                       std::string& errorMsg);

    /**
     * @brief Parse a packet
     * @param data Packet bytes
     * @param size Packet length
     * @param message Output message
     * @param errorMsg Output error message for malformed packets
     * @return true if the whole packet parsed
     */
    static bool decode(const uint8_t* data, size_t size, DnsMessage& message,
                       std::string& errorMsg);

    /**
     * @brief Case-insensitive DNS name comparison, ignoring a trailing dot
     */
    static bool namesEqual(const std::string& a, const std::string& b);
};

}  // namespace SecureXfer
