/**
 * @file Identity.h
 * @brief Process identity: id, display name and certificate material
 */

#pragma once

#include <cstdint>
#include <string>

namespace SecureXfer {

/**
 * @brief PEM-encoded key pair and self-signed certificate
 *
 * Generated once per process and never written to disk.
 */
struct CertificateMaterial {
    std::string privateKeyPem;    ///< PKCS#8 PEM private key (unencrypted)
    std::string certificatePem;   ///< X.509 PEM certificate
    std::string fingerprint;      ///< Uppercase hex SHA-256 of the certificate DER

    bool isValid() const {
        return !privateKeyPem.empty() && !certificatePem.empty() && fingerprint.size() == 64;
    }
};

/**
 * @brief Identity of this process on the network
 *
 * Immutable after startup, except listenPort which is filled in once the
 * transfer listener has bound its ephemeral port.
 */
struct LocalIdentity {
    std::string processId;          ///< UUID v4, advertised as `id=` in TXT
    std::string displayName;        ///< Hostname, advertised as `name=` in TXT
    CertificateMaterial material;   ///< TLS key pair and certificate
    uint16_t listenPort = 0;        ///< Transfer listener port (SRV)

    const std::string& fingerprint() const { return material.fingerprint; }
};

}  // namespace SecureXfer
