/**
 * @file CertificateManager.h
 * @brief Self-signed certificate generation and TLS context loading
 */

#pragma once

#include "Identity.h"
#include "config.h"
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct x509_st;
typedef struct x509_st X509;

namespace SecureXfer {

//=============================================================================
// CertificateManager Class
//=============================================================================

/**
 * @class CertificateManager
 * @brief Generates the per-process identity and loads it into TLS contexts
 *
 * Security Model:
 * - Self-signed certificates (no CA validation)
 * - Provides encryption (confidentiality) and integrity
 * - Peer authentication is fingerprint pinning: the initiator compares the
 *   listener's certificate digest with the `fp=` token it saw in discovery
 *
 * Usage:
 * @code
 * LocalIdentity identity;
 * std::string error;
 * if (!CertificateManager::initializeIdentity(identity, error)) {
 *     // IdentityError: fatal, nothing else can start
 * }
 * @endcode
 */
class CertificateManager {
public:
    //=========================================================================
    // Identity
    //=========================================================================

    /**
     * @brief Create the process identity
     * @param identity Output identity (processId, displayName, material)
     * @param errorMsg Output error message, prefixed with an SXF-ID code
     * @return true on success; false is an IdentityError
     *
     * Generates a fresh UUID, takes the hostname as display name and
     * creates the certificate material. listenPort is left at 0.
     */
    static bool initializeIdentity(LocalIdentity& identity, std::string& errorMsg);

    //=========================================================================
    // Certificate Generation
    //=========================================================================

    /**
     * @brief Generate a key pair and self-signed certificate in memory
     * @param commonName Common name (CN) for subject and issuer
     * @param material Output PEM key, PEM certificate and fingerprint
     * @param errorMsg Output error message on failure
     * @return true if generated successfully
     *
     * Creates:
     * - RSA 2048-bit key pair (EVP_PKEY)
     * - X.509 v3 certificate, serial from the CSPRNG
     * - Valid for CERT_VALIDITY_DAYS (365 days)
     * - Subject = Issuer: CN=<commonName>, O=SecureXfer
     * - Signature: SHA-256
     */
    static bool generateSelfSigned(const std::string& commonName,
                                   CertificateMaterial& material,
                                   std::string& errorMsg);

    //=========================================================================
    // Certificate Loading
    //=========================================================================

    /**
     * @brief Load certificate and private key into an SSL context
     *
     * Uses the in-memory PEM material and verifies that the private key
     * matches the certificate (SSL_CTX_check_private_key).
     */
    static bool loadIntoContext(SSL_CTX* ctx,
                                const CertificateMaterial& material,
                                std::string& errorMsg);

    //=========================================================================
    // Certificate Information
    //=========================================================================

    /**
     * @brief SHA-256 fingerprint of a certificate's DER encoding
     * @return 64 uppercase hex characters, or empty on error
     */
    static std::string fingerprintOf(X509* cert, std::string& errorMsg);

    /**
     * @brief SHA-256 fingerprint of a PEM certificate
     */
    static std::string fingerprintOfPem(const std::string& certificatePem,
                                        std::string& errorMsg);

    /**
     * @brief Subject common name of a PEM certificate
     */
    static std::string commonNameOfPem(const std::string& certificatePem,
                                       std::string& errorMsg);

    /**
     * @brief Whole days between notBefore and notAfter, or -1 on error
     */
    static int validityDaysOfPem(const std::string& certificatePem,
                                 std::string& errorMsg);

    /**
     * @brief Local hostname, or "securexfer-host" if unavailable
     */
    static std::string getHostname();
};

}  // namespace SecureXfer
