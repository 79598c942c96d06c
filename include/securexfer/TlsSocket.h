/**
 * @file TlsSocket.h
 * @brief TLS 1.3 wrapper around a connected TCP socket
 */

#pragma once

#include "config.h"
#include "Identity.h"
#include <cstddef>
#include <cstdint>
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct ssl_st;
typedef struct ssl_st SSL;

namespace SecureXfer {

/**
 * @brief Side of the TLS handshake
 */
enum class TlsRole {
    SERVER,   ///< Transfer listener: presents the host certificate
    CLIENT    ///< Transfer initiator: pins the server certificate
};

/**
 * @brief One-time OpenSSL and networking initialization
 */
void initOpenSsl();

//=============================================================================
// TlsSocket Class
//=============================================================================

/**
 * @class TlsSocket
 * @brief Owns the SSL context and SSL object for one connection
 *
 * Trust model:
 * - The server presents the self-signed host certificate and does not ask
 *   the client for one.
 * - The client accepts any certificate at the TLS layer (SSL_VERIFY_NONE).
 *   The caller MUST compare getPeerFingerprint() with the pinned value
 *   before sending anything.
 *
 * The socket descriptor is borrowed; closing it is the caller's job.
 * All I/O for one TlsSocket must happen on a single thread.
 */
class TlsSocket {
public:
    /**
     * @brief Constructor
     * @param socket Connected TCP socket (blocking)
     * @param role SERVER or CLIENT
     * @param material Host certificate material, required for SERVER
     */
    TlsSocket(int socket, TlsRole role, const CertificateMaterial* material = nullptr);

    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    TlsSocket(TlsSocket&& other) noexcept;
    TlsSocket& operator=(TlsSocket&& other) noexcept;

    //=========================================================================
    // Handshake
    //=========================================================================

    /**
     * @brief Create the context, load material (server) and run the handshake
     * @param errorMsg Output error message on failure
     * @return true once the TLS 1.3 session is established
     */
    bool handshake(std::string& errorMsg);

    //=========================================================================
    // Send / Receive
    //=========================================================================

    /**
     * @brief Read whatever is available, up to size bytes
     * @return Bytes read; 0 on clean close or error (errorMsg set on error)
     */
    size_t recv(uint8_t* buffer, size_t size, std::string& errorMsg);

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg);

    /**
     * @brief Wait until application data may be read
     * @return 1 readable (or buffered), 0 timeout, -1 error
     *
     * Checks SSL_pending() first so records already decrypted by OpenSSL
     * are never missed by poll().
     */
    int waitReadable(uint32_t timeoutMs);

    /**
     * @brief Send close_notify (idempotent)
     */
    void shutdown();

    //=========================================================================
    // Certificate Information
    //=========================================================================

    /**
     * @brief SHA-256 fingerprint of the peer certificate (64 uppercase hex)
     * @return Fingerprint, or empty with errorMsg set if none was presented
     */
    std::string getPeerFingerprint(std::string& errorMsg);

    /**
     * @brief SHA-256 fingerprint of the certificate we presented
     */
    std::string getLocalFingerprint(std::string& errorMsg);

    bool isConnected() const { return m_connected; }
    int getSocket() const { return m_socket; }
    TlsRole getRole() const { return m_role; }

    //=========================================================================
    // Error Handling
    //=========================================================================

    /**
     * @brief Pop and describe the first queued OpenSSL error
     */
    static std::string getLastError();

    /**
     * @brief Name of an SSL_get_error() code
     */
    static std::string getErrorDescription(int sslErrorCode);

private:
    bool createContext(std::string& errorMsg);
    bool createSsl(std::string& errorMsg);
    std::string describeFailure(int result);
    void release();

    int m_socket;
    const CertificateMaterial* m_material;
    SSL_CTX* m_ctx;
    SSL* m_ssl;
    TlsRole m_role;
    bool m_connected;
};

}  // namespace SecureXfer
