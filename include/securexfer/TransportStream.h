/**
 * @file TransportStream.h
 * @brief Minimal transport abstraction over a TLS connection
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace SecureXfer {

class TlsSocket;

/**
 * @brief Outcome of TransportStream::waitReadable()
 */
enum class WaitResult {
    Readable,   ///< Data (or EOF) is ready; the next read will not block
    Timeout,    ///< Nothing arrived within the slice
    Error       ///< The connection is unusable
};

/**
 * @brief Minimal stream interface used by the control and upload protocols.
 *
 * Control frames need exact-length reads and writes, the HTTP parser reads
 * whatever is available, and handlers that wait on two event sources also
 * need a bounded readability check. The
 * interface keeps the protocol code independent of TLS so it can be driven
 * by an in-memory stream in tests.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Read whatever is available, up to size bytes
     * @return Bytes read; 0 on clean close, or 0 with errorMsg set on failure
     */
    virtual size_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    virtual WaitResult waitReadable(uint32_t timeoutMs) = 0;
    virtual void shutdown() {}
};

class TlsTransportStream final : public TransportStream {
public:
    explicit TlsTransportStream(TlsSocket& tls) : m_tls(tls) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    size_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    WaitResult waitReadable(uint32_t timeoutMs) override;
    void shutdown() override;

private:
    TlsSocket& m_tls;
};

}  // namespace SecureXfer
