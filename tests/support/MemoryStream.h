/**
 * @file MemoryStream.h
 * @brief In-memory TransportStream for socket-free tests
 */

#pragma once

#include "securexfer/TransportStream.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace SecureXfer {
namespace Testing {

/**
 * @brief Reads from a prepared buffer and records everything written
 *
 * Once the input is exhausted recvExact() fails like a closed connection,
 * recvSome() reports a clean close and waitReadable() reports Error (or Timeout while holdOpen is set).
 */
class MemoryStream final : public TransportStream {
public:
    MemoryStream() = default;
    explicit MemoryStream(const std::string& input) { feed(input); }

    void feed(const std::string& data) {
        m_input.insert(m_input.end(), data.begin(), data.end());
    }

    void feed(const std::vector<uint8_t>& data) {
        m_input.insert(m_input.end(), data.begin(), data.end());
    }

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override {
        if (m_failWrites) {
            errorMsg = "MemoryStream: write failed";
            return false;
        }
        m_output.insert(m_output.end(), data, data + size);
        return true;
    }

    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        if (m_input.size() - m_readPos < size) {
            m_readPos = m_input.size();
            errorMsg = "Connection closed by peer";
            return false;
        }
        std::memcpy(buffer, m_input.data() + m_readPos, size);
        m_readPos += size;
        return true;
    }

    size_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        (void)errorMsg;
        const size_t n = std::min(size, m_input.size() - m_readPos);
        if (n > 0) {
            std::memcpy(buffer, m_input.data() + m_readPos, n);
            m_readPos += n;
        }
        return n;
    }

    WaitResult waitReadable(uint32_t timeoutMs) override {
        (void)timeoutMs;
        if (m_readPos < m_input.size()) {
            return WaitResult::Readable;
        }
        return m_holdOpen ? WaitResult::Timeout : WaitResult::Error;
    }

    std::string output() const { return std::string(m_output.begin(), m_output.end()); }
    const std::vector<uint8_t>& outputBytes() const { return m_output; }
    size_t remaining() const { return m_input.size() - m_readPos; }

    void setHoldOpen(bool holdOpen) { m_holdOpen = holdOpen; }
    void setFailWrites(bool failWrites) { m_failWrites = failWrites; }

private:
    std::vector<uint8_t> m_input;
    size_t m_readPos = 0;
    std::vector<uint8_t> m_output;
    bool m_holdOpen = false;
    bool m_failWrites = false;
};

}  // namespace Testing
}  // namespace SecureXfer
