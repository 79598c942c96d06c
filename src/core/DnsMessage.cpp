/**
 * @file DnsMessage.cpp
 * @brief DNS message model and wire codec for multicast DNS discovery
 */

#include "securexfer/DnsMessage.h"
#include "securexfer/config.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <cstring>

namespace SecureXfer {

namespace {

constexpr size_t DNS_HEADER_SIZE = 12;
constexpr size_t MAX_LABEL_LENGTH = 63;
constexpr size_t MAX_NAME_LENGTH = 255;

//=============================================================================
// Encoding helpers
//=============================================================================

void putU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void putU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

bool putName(std::vector<uint8_t>& out, const std::string& name, std::string& errorMsg) {
    std::string trimmed = name;
    if (!trimmed.empty() && trimmed.back() == '.') {
        trimmed.pop_back();
    }
    if (trimmed.size() > MAX_NAME_LENGTH - 2) {
        errorMsg = "DNS name too long: " + name;
        return false;
    }

    size_t start = 0;
    while (start < trimmed.size()) {
        size_t dot = trimmed.find('.', start);
        if (dot == std::string::npos) {
            dot = trimmed.size();
        }
        const size_t len = dot - start;
        if (len == 0 || len > MAX_LABEL_LENGTH) {
            errorMsg = "Invalid DNS label in: " + name;
            return false;
        }
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), trimmed.begin() + static_cast<std::ptrdiff_t>(start),
                   trimmed.begin() + static_cast<std::ptrdiff_t>(dot));
        start = dot + 1;
    }
    out.push_back(0);
    return true;
}

bool putRecordData(std::vector<uint8_t>& out, const DnsRecord& record, std::string& errorMsg) {
    switch (record.type) {
        case DnsType::PTR:
            return putName(out, record.ptrName, errorMsg);

        case DnsType::SRV:
            putU16(out, record.srv.priority);
            putU16(out, record.srv.weight);
            putU16(out, record.srv.port);
            return putName(out, record.srv.target, errorMsg);

        case DnsType::TXT:
            if (record.txt.empty()) {
                // RFC 6763: an empty TXT record holds a single zero byte
                out.push_back(0);
                return true;
            }
            for (const auto& entry : record.txt) {
                if (entry.size() > 255) {
                    errorMsg = "TXT string longer than 255 bytes";
                    return false;
                }
                out.push_back(static_cast<uint8_t>(entry.size()));
                out.insert(out.end(), entry.begin(), entry.end());
            }
            return true;

        case DnsType::A: {
            in_addr addr{};
            if (inet_pton(AF_INET, record.address.c_str(), &addr) != 1) {
                errorMsg = "Invalid IPv4 address in A record: " + record.address;
                return false;
            }
            const auto* bytes = reinterpret_cast<const uint8_t*>(&addr.s_addr);
            out.insert(out.end(), bytes, bytes + 4);
            return true;
        }

        default:
            out.insert(out.end(), record.rawData.begin(), record.rawData.end());
            return true;
    }
}

bool putRecord(std::vector<uint8_t>& out, const DnsRecord& record, std::string& errorMsg) {
    if (!putName(out, record.name, errorMsg)) {
        return false;
    }
    putU16(out, record.type);
    putU16(out, record.rclass);
    putU32(out, record.ttl);

    // RDLENGTH is patched once the data is written
    const size_t lengthOffset = out.size();
    putU16(out, 0);

    if (!putRecordData(out, record, errorMsg)) {
        return false;
    }

    const size_t rdLength = out.size() - lengthOffset - 2;
    if (rdLength > 0xFFFF) {
        errorMsg = "Record data too long";
        return false;
    }
    out[lengthOffset] = static_cast<uint8_t>(rdLength >> 8);
    out[lengthOffset + 1] = static_cast<uint8_t>(rdLength & 0xFF);
    return true;
}

//=============================================================================
// Decoding helpers
//=============================================================================

class PacketReader {
public:
    PacketReader(const uint8_t* data, size_t size) : m_data(data), m_size(size), m_pos(0) {}

    size_t position() const { return m_pos; }
    size_t remaining() const { return m_size - m_pos; }

    bool readU16(uint16_t& value) {
        if (remaining() < 2) return false;
        value = static_cast<uint16_t>((m_data[m_pos] << 8) | m_data[m_pos + 1]);
        m_pos += 2;
        return true;
    }

    bool readU32(uint32_t& value) {
        if (remaining() < 4) return false;
        value = (static_cast<uint32_t>(m_data[m_pos]) << 24) |
                (static_cast<uint32_t>(m_data[m_pos + 1]) << 16) |
                (static_cast<uint32_t>(m_data[m_pos + 2]) << 8) |
                static_cast<uint32_t>(m_data[m_pos + 3]);
        m_pos += 4;
        return true;
    }

    bool skip(size_t count) {
        if (remaining() < count) return false;
        m_pos += count;
        return true;
    }

    /**
     * Reads a possibly compressed name starting at the cursor. The cursor ends
     * after the first pointer (or the terminating zero if uncompressed).
     */
    bool readName(std::string& name) {
        name.clear();
        size_t pos = m_pos;
        size_t resumeAt = 0;
        bool jumped = false;
        int hops = 0;

        while (true) {
            if (pos >= m_size) return false;
            const uint8_t len = m_data[pos];

            if (len == 0) {
                ++pos;
                break;
            }

            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= m_size) return false;
                if (++hops > MAX_DNS_POINTER_HOPS) return false;
                const size_t target = (static_cast<size_t>(len & 0x3F) << 8) | m_data[pos + 1];
                if (target >= m_size) return false;
                if (!jumped) {
                    resumeAt = pos + 2;
                    jumped = true;
                }
                pos = target;
                continue;
            }

            if ((len & 0xC0) != 0) return false;  // reserved label types
            if (pos + 1 + len > m_size) return false;

            if (!name.empty()) name.push_back('.');
            name.append(reinterpret_cast<const char*>(m_data + pos + 1), len);
            if (name.size() > MAX_NAME_LENGTH) return false;
            pos += 1 + len;
        }

        m_pos = jumped ? resumeAt : pos;
        return true;
    }

    const uint8_t* cursor() const { return m_data + m_pos; }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

bool readRecord(PacketReader& reader, DnsRecord& record, const uint8_t* packet,
                std::string& errorMsg) {
    uint16_t rdLength = 0;
    if (!reader.readName(record.name) ||
        !reader.readU16(record.type) ||
        !reader.readU16(record.rclass) ||
        !reader.readU32(record.ttl) ||
        !reader.readU16(rdLength)) {
        errorMsg = "Truncated resource record";
        return false;
    }

    // mDNS uses the top class bit as the cache-flush flag
    record.rclass &= 0x7FFF;

    if (reader.remaining() < rdLength) {
        errorMsg = "Resource data exceeds packet";
        return false;
    }

    // RDATA names may point anywhere in the packet, so rd keeps the full buffer
    const size_t rdEnd = reader.position() + rdLength;
    PacketReader rd = reader;

    switch (record.type) {
        case DnsType::PTR:
            if (!rd.readName(record.ptrName) || rd.position() > rdEnd) {
                errorMsg = "Malformed PTR record";
                return false;
            }
            break;

        case DnsType::SRV:
            if (!rd.readU16(record.srv.priority) ||
                !rd.readU16(record.srv.weight) ||
                !rd.readU16(record.srv.port) ||
                !rd.readName(record.srv.target) ||
                rd.position() > rdEnd) {
                errorMsg = "Malformed SRV record";
                return false;
            }
            break;

        case DnsType::TXT: {
            size_t pos = reader.position();
            while (pos < rdEnd) {
                const uint8_t len = packet[pos];
                if (pos + 1 + len > rdEnd) {
                    errorMsg = "Malformed TXT record";
                    return false;
                }
                if (len > 0) {
                    record.txt.emplace_back(reinterpret_cast<const char*>(packet + pos + 1), len);
                }
                pos += 1 + len;
            }
            break;
        }

        case DnsType::A: {
            if (rdLength != 4) {
                errorMsg = "Malformed A record";
                return false;
            }
            char buf[INET_ADDRSTRLEN] = {};
            in_addr addr{};
            std::memcpy(&addr.s_addr, reader.cursor(), 4);
            if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
                errorMsg = "Malformed A record";
                return false;
            }
            record.address = buf;
            break;
        }

        default:
            record.rawData.assign(reader.cursor(), reader.cursor() + rdLength);
            break;
    }

    reader.skip(rdLength);
    return true;
}

bool readRecords(PacketReader& reader, uint16_t count, std::vector<DnsRecord>& out,
                 const uint8_t* packet, std::string& errorMsg) {
    out.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        DnsRecord record;
        if (!readRecord(reader, record, packet, errorMsg)) {
            return false;
        }
        out.push_back(std::move(record));
    }
    return true;
}

}  // namespace

//=============================================================================
// DnsCodec
//=============================================================================

bool DnsCodec::encode(const DnsMessage& message, std::vector<uint8_t>& out,
                      std::string& errorMsg) {
    if (message.questions.size() > 0xFFFF || message.answers.size() > 0xFFFF ||
        message.authorities.size() > 0xFFFF || message.additionals.size() > 0xFFFF) {
        errorMsg = "Too many DNS entries";
        return false;
    }

    out.clear();
    out.reserve(512);

    putU16(out, message.id);
    putU16(out, message.flags);
    putU16(out, static_cast<uint16_t>(message.questions.size()));
    putU16(out, static_cast<uint16_t>(message.answers.size()));
    putU16(out, static_cast<uint16_t>(message.authorities.size()));
    putU16(out, static_cast<uint16_t>(message.additionals.size()));

    for (const auto& question : message.questions) {
        if (!putName(out, question.name, errorMsg)) {
            return false;
        }
        putU16(out, question.type);
        putU16(out, question.qclass);
    }

    for (const auto* section : {&message.answers, &message.authorities, &message.additionals}) {
        for (const auto& record : *section) {
            if (!putRecord(out, record, errorMsg)) {
                return false;
            }
        }
    }

    return true;
}

bool DnsCodec::decode(const uint8_t* data, size_t size, DnsMessage& message,
                      std::string& errorMsg) {
    if (!data || size < DNS_HEADER_SIZE) {
        errorMsg = "Packet shorter than DNS header";
        return false;
    }

    PacketReader reader(data, size);
    uint16_t qdCount = 0;
    uint16_t anCount = 0;
    uint16_t nsCount = 0;
    uint16_t arCount = 0;

    message = DnsMessage();
    reader.readU16(message.id);
    reader.readU16(message.flags);
    reader.readU16(qdCount);
    reader.readU16(anCount);
    reader.readU16(nsCount);
    reader.readU16(arCount);

    message.questions.reserve(qdCount);
    for (uint16_t i = 0; i < qdCount; ++i) {
        DnsQuestion question;
        if (!reader.readName(question.name) ||
            !reader.readU16(question.type) ||
            !reader.readU16(question.qclass)) {
            errorMsg = "Truncated question";
            return false;
        }
        // Top bit is the mDNS unicast-response flag
        question.qclass &= 0x7FFF;
        message.questions.push_back(std::move(question));
    }

    return readRecords(reader, anCount, message.answers, data, errorMsg) &&
           readRecords(reader, nsCount, message.authorities, data, errorMsg) &&
           readRecords(reader, arCount, message.additionals, data, errorMsg);
}

bool DnsCodec::namesEqual(const std::string& a, const std::string& b) {
    auto trimmedLength = [](const std::string& s) {
        return (!s.empty() && s.back() == '.') ? s.size() - 1 : s.size();
    };

    const size_t lenA = trimmedLength(a);
    const size_t lenB = trimmedLength(b);
    if (lenA != lenB) {
        return false;
    }

    for (size_t i = 0; i < lenA; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace SecureXfer
