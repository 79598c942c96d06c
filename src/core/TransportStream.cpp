/**
 * @file TransportStream.cpp
 * @brief TLS-backed TransportStream
 */

#include "securexfer/TransportStream.h"
#include "securexfer/TlsSocket.h"

namespace SecureXfer {

bool TlsTransportStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return m_tls.sendExact(data, size, errorMsg);
}

bool TlsTransportStream::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return m_tls.recvExact(buffer, size, errorMsg);
}

size_t TlsTransportStream::recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return m_tls.recv(buffer, size, errorMsg);
}

WaitResult TlsTransportStream::waitReadable(uint32_t timeoutMs) {
    const int rc = m_tls.waitReadable(timeoutMs);
    if (rc > 0) {
        return WaitResult::Readable;
    }
    return rc == 0 ? WaitResult::Timeout : WaitResult::Error;
}

void TlsTransportStream::shutdown() {
    m_tls.shutdown();
}

}  // namespace SecureXfer
