/**
 * @file TlsSocket.cpp
 * @brief TLS 1.3 wrapper around a connected TCP socket
 */

#include "securexfer/TlsSocket.h"
#include "securexfer/CertificateManager.h"
#include "securexfer/SocketUtils.h"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <algorithm>
#include <cerrno>
#include <mutex>
#include <string>

namespace SecureXfer {

//=============================================================================
// OpenSSL Initialization (Static)
//=============================================================================

namespace {
    std::once_flag g_openSslOnce;
}

void initOpenSsl() {
    std::call_once(g_openSslOnce, []() {
        // Explicit initialization is optional since OpenSSL 1.1.0
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                         nullptr);
    });
    SocketUtils::initializeNetworking();
}

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int socket, TlsRole role, const CertificateMaterial* material)
    : m_socket(socket)
    , m_material(material)
    , m_ctx(nullptr)
    , m_ssl(nullptr)
    , m_role(role)
    , m_connected(false)
{
    initOpenSsl();
}

TlsSocket::~TlsSocket() {
    release();
}

void TlsSocket::release() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }

    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

TlsSocket::TlsSocket(TlsSocket&& other) noexcept
    : m_socket(other.m_socket)
    , m_material(other.m_material)
    , m_ctx(other.m_ctx)
    , m_ssl(other.m_ssl)
    , m_role(other.m_role)
    , m_connected(other.m_connected)
{
    other.m_ctx = nullptr;
    other.m_ssl = nullptr;
    other.m_connected = false;
}

TlsSocket& TlsSocket::operator=(TlsSocket&& other) noexcept {
    if (this != &other) {
        release();

        m_socket = other.m_socket;
        m_material = other.m_material;
        m_ctx = other.m_ctx;
        m_ssl = other.m_ssl;
        m_role = other.m_role;
        m_connected = other.m_connected;

        other.m_ctx = nullptr;
        other.m_ssl = nullptr;
        other.m_connected = false;
    }
    return *this;
}

//=============================================================================
// TlsSocket: SSL Context Creation
//=============================================================================

bool TlsSocket::createContext(std::string& errorMsg) {
    const SSL_METHOD* method = (m_role == TlsRole::SERVER) ? TLS_server_method()
                                                           : TLS_client_method();

    m_ctx = SSL_CTX_new(method);
    if (!m_ctx) {
        errorMsg = "Failed to create SSL context: " + getLastError();
        return false;
    }

    // TLS 1.3 only
    if (SSL_CTX_set_min_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set minimum TLS version: " + getLastError();
        return false;
    }
    if (SSL_CTX_set_max_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set maximum TLS version: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_ciphersuites(m_ctx, TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + getLastError();
        return false;
    }

    if (SSL_CTX_set1_groups_list(m_ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + getLastError();
        return false;
    }

    SSL_CTX_set_options(m_ctx, SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);

    // Self-signed peers: accept any certificate here, the initiator pins
    // the fingerprint after the handshake.
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);

    if (m_role == TlsRole::SERVER) {
        // No session tickets: they arrive as post-handshake records and
        // would wake a poll() with no application data behind them.
        SSL_CTX_set_num_tickets(m_ctx, 0);

        if (!m_material) {
            errorMsg = "Server role requires certificate material";
            return false;
        }
        std::string loadError;
        if (!CertificateManager::loadIntoContext(m_ctx, *m_material, loadError)) {
            errorMsg = "Failed to load host certificate: " + loadError;
            return false;
        }
    }

    return true;
}

bool TlsSocket::createSsl(std::string& errorMsg) {
    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }

    if (SSL_set_fd(m_ssl, m_socket) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }

    return true;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(std::string& errorMsg) {
    if (m_socket == INVALID_SOCKET_FD) {
        errorMsg = "Invalid socket";
        return false;
    }

    ERR_clear_error();

    if (!createContext(errorMsg)) {
        release();
        return false;
    }

    if (!createSsl(errorMsg)) {
        release();
        return false;
    }

    const int result = (m_role == TlsRole::SERVER) ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
    if (result != 1) {
        errorMsg = "TLS handshake failed " + describeFailure(result);
        release();
        return false;
    }

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Send / Receive
//=============================================================================

size_t TlsSocket::recv(uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return 0;
    }

    if (!buffer || size == 0) {
        return 0;
    }

    const int chunk = static_cast<int>(std::min(size, static_cast<size_t>(BUFFER_SIZE)));
    while (true) {
        const int received = SSL_read(m_ssl, buffer, chunk);
        if (received > 0) {
            return static_cast<size_t>(received);
        }

        const int err = SSL_get_error(m_ssl, received);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;
        }
        if (err == SSL_ERROR_WANT_READ && waitReadable(CONNECTION_TIMEOUT_MS) > 0) {
            continue;
        }

        errorMsg = "TLS read failed " + describeFailure(received);
        return 0;
    }
}

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    if (!data || size == 0) {
        return true;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const size_t chunkSize = std::min(size - totalSent, TLS_MAX_PACKET_SIZE);
        const int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));

        if (sent <= 0) {
            errorMsg = "TLS send failed " + describeFailure(sent);
            return false;
        }

        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

bool TlsSocket::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    if (!buffer || size == 0) {
        return true;
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        const size_t want = std::min(size - totalReceived, static_cast<size_t>(BUFFER_SIZE));
        const int received = SSL_read(m_ssl, buffer + totalReceived, static_cast<int>(want));

        if (received <= 0) {
            const int err = SSL_get_error(m_ssl, received);
            if (err == SSL_ERROR_ZERO_RETURN) {
                errorMsg = "Connection closed by peer";
                return false;
            }

            // SO_RCVTIMEO expiry surfaces as WANT_READ on a blocking socket
            if (err == SSL_ERROR_WANT_READ) {
                if (waitReadable(CONNECTION_TIMEOUT_MS) > 0) {
                    continue;
                }
                errorMsg = "TLS recv timed out";
                return false;
            }

            errorMsg = "TLS recv failed " + describeFailure(received);
            return false;
        }

        totalReceived += static_cast<size_t>(received);
    }

    return true;
}

int TlsSocket::waitReadable(uint32_t timeoutMs) {
    if (!m_ssl) {
        return -1;
    }
    if (SSL_pending(m_ssl) > 0) {
        return 1;
    }
    return SocketUtils::waitReadable(m_socket, timeoutMs);
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        SSL_shutdown(m_ssl);
        m_connected = false;
    }
}

//=============================================================================
// TlsSocket: Certificate Information
//=============================================================================

std::string TlsSocket::getPeerFingerprint(std::string& errorMsg) {
    if (!m_ssl) {
        errorMsg = "TLS not connected";
        return "";
    }

    X509* cert = SSL_get_peer_certificate(m_ssl);
    if (!cert) {
        errorMsg = "No peer certificate";
        return "";
    }

    std::string fingerprint = CertificateManager::fingerprintOf(cert, errorMsg);
    X509_free(cert);
    return fingerprint;
}

std::string TlsSocket::getLocalFingerprint(std::string& errorMsg) {
    if (!m_ssl) {
        errorMsg = "TLS not connected";
        return "";
    }

    // Borrowed reference, not freed
    X509* cert = SSL_get_certificate(m_ssl);
    if (!cert) {
        errorMsg = "No local certificate";
        return "";
    }

    return CertificateManager::fingerprintOf(cert, errorMsg);
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::getLastError() {
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::describeFailure(int result) {
    const int savedErrno = errno;
    const int sslErrorCode = SSL_get_error(m_ssl, result);
    std::string details = "(" + getErrorDescription(sslErrorCode) + "): ";

    // Prefer OpenSSL's error queue when present
    const unsigned long opensslErr = ERR_get_error();
    if (opensslErr != 0) {
        char buf[256];
        ERR_error_string_n(opensslErr, buf, sizeof(buf));
        return details + buf;
    }

    // SSL_ERROR_SYSCALL with an empty queue is a socket error or an EOF
    if (sslErrorCode == SSL_ERROR_SYSCALL) {
        if (savedErrno != 0) {
            return details + SocketUtils::errnoToString(savedErrno);
        }
        return details + "peer closed the connection";
    }

    return details + "no further detail";
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

}  // namespace SecureXfer
