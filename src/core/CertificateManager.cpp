/**
 * @file CertificateManager.cpp
 * @brief Self-signed certificate generation and TLS context loading
 */

#include "securexfer/CertificateManager.h"
#include "securexfer/ErrorCodes.h"
#include "securexfer/FingerprintUtils.h"
#include "securexfer/ThreadSafeLog.h"
#include "securexfer/UuidGenerator.h"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <unistd.h>

#include <climits>
#include <cstdint>

namespace SecureXfer {

namespace {

std::string opensslError() {
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) {
        return {};
    }
    return std::string(data, static_cast<size_t>(len));
}

X509* readPemCertificate(const std::string& certificatePem, std::string& errorMsg) {
    if (certificatePem.empty() || certificatePem.size() > static_cast<size_t>(INT_MAX)) {
        errorMsg = "Empty certificate";
        return nullptr;
    }

    BIO* bio = BIO_new_mem_buf(certificatePem.data(), static_cast<int>(certificatePem.size()));
    if (!bio) {
        errorMsg = "Failed to create BIO";
        return nullptr;
    }

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) {
        errorMsg = "Failed to read certificate: " + opensslError();
    }
    return cert;
}

} // anonymous namespace

//=============================================================================
// CertificateManager: Identity
//=============================================================================

std::string CertificateManager::getHostname() {
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        std::string name(hostname);
        // Some systems report the FQDN; discovery advertises the bare label.
        const size_t dot = name.find('.');
        if (dot != std::string::npos && dot > 0) {
            name.resize(dot);
        }
        if (name.size() > MAX_DISPLAY_NAME) {
            name.resize(MAX_DISPLAY_NAME);
        }
        return name;
    }
    return "securexfer-host";
}

bool CertificateManager::initializeIdentity(LocalIdentity& identity, std::string& errorMsg) {
    const std::string processId = UuidGenerator::generate();
    if (processId.empty()) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_KEYGEN_FAILED,
                                      "Entropy source unavailable (RAND_bytes failed)");
        return false;
    }

    CertificateMaterial material;
    std::string genError;
    if (!generateSelfSigned(CERT_COMMON_NAME, material, genError)) {
        errorMsg = genError;
        return false;
    }

    identity.processId = processId;
    identity.displayName = getHostname();
    identity.material = std::move(material);
    identity.listenPort = 0;

    ThreadSafeLog::info("Identity initialized: id=" + identity.processId +
                        " name=" + identity.displayName +
                        " fp=" + FingerprintUtils::shortForm(identity.fingerprint()));
    return true;
}

//=============================================================================
// CertificateManager: Certificate Generation
//=============================================================================

bool CertificateManager::generateSelfSigned(const std::string& commonName,
                                            CertificateMaterial& material,
                                            std::string& errorMsg) {
    EVP_PKEY_CTX* pkeyCtx = nullptr;
    EVP_PKEY* pkey = nullptr;
    X509* cert = nullptr;
    X509_NAME* name = nullptr;
    BIO* certBio = nullptr;
    BIO* keyBio = nullptr;
    uint64_t serial = 0;
    std::string certificatePem;
    std::string privateKeyPem;
    std::string fingerprint;
    std::string fpError;
    bool success = false;

    // Generate RSA 2048-bit key pair
    pkeyCtx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!pkeyCtx) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_KEYGEN_FAILED,
                                      "Failed to create key context: " + opensslError());
        goto cleanup;
    }

    if (EVP_PKEY_keygen_init(pkeyCtx) <= 0) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_KEYGEN_FAILED,
                                      "Failed to initialize keygen: " + opensslError());
        goto cleanup;
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pkeyCtx, RSA_KEY_BITS) <= 0) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_KEYGEN_FAILED,
                                      "Failed to set RSA key size: " + opensslError());
        goto cleanup;
    }

    if (EVP_PKEY_keygen(pkeyCtx, &pkey) <= 0) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_KEYGEN_FAILED,
                                      "Failed to generate RSA key: " + opensslError());
        goto cleanup;
    }

    // Create X.509 certificate
    cert = X509_new();
    if (!cert) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to create certificate");
        goto cleanup;
    }

    // X509v3
    if (X509_set_version(cert, 2) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set certificate version");
        goto cleanup;
    }

    // Random positive serial so two processes on one host never collide
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED,
                                      "Entropy source unavailable for serial number");
        goto cleanup;
    }
    serial &= 0x7FFFFFFFFFFFFFFFULL;
    if (serial == 0) {
        serial = 1;
    }
    if (ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert), serial) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set serial number");
        goto cleanup;
    }

    // Validity: now .. now + CERT_VALIDITY_DAYS
    if (!X509_gmtime_adj(X509_getm_notBefore(cert), 0) ||
        !X509_gmtime_adj(X509_getm_notAfter(cert),
                         static_cast<long>(CERT_VALIDITY_DAYS) * 24 * 60 * 60)) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set validity period");
        goto cleanup;
    }

    if (X509_set_pubkey(cert, pkey) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set public key");
        goto cleanup;
    }

    name = X509_get_subject_name(cert);
    if (!name) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to get subject name");
        goto cleanup;
    }

    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(commonName.c_str()),
                                   static_cast<int>(commonName.length()), -1, 0) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set common name");
        goto cleanup;
    }

    if (X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(CERT_ORGANIZATION),
                                   -1, -1, 0) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set organization");
        goto cleanup;
    }

    // Self-signed: issuer = subject
    if (X509_set_issuer_name(cert, name) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED, "Failed to set issuer name");
        goto cleanup;
    }

    if (X509_sign(cert, pkey, EVP_sha256()) <= 0) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_CERT_FAILED,
                                      "Failed to sign certificate: " + opensslError());
        goto cleanup;
    }

    // Serialize to PEM in memory
    certBio = BIO_new(BIO_s_mem());
    keyBio = BIO_new(BIO_s_mem());
    if (!certBio || !keyBio) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_ENCODE_FAILED, "Failed to create BIO");
        goto cleanup;
    }

    if (PEM_write_bio_X509(certBio, cert) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_ENCODE_FAILED, "Failed to encode certificate");
        goto cleanup;
    }

    if (PEM_write_bio_PrivateKey(keyBio, pkey, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_ENCODE_FAILED, "Failed to encode private key");
        goto cleanup;
    }

    certificatePem = bioToString(certBio);
    privateKeyPem = bioToString(keyBio);
    fingerprint = fingerprintOf(cert, fpError);
    if (certificatePem.empty() || privateKeyPem.empty() || fingerprint.empty()) {
        errorMsg = ErrorCodes::format(ErrorCodes::IDENTITY_ENCODE_FAILED,
                                      "Failed to export certificate material" +
                                      (fpError.empty() ? std::string() : ": " + fpError));
        goto cleanup;
    }

    material.certificatePem = std::move(certificatePem);
    material.privateKeyPem = std::move(privateKeyPem);
    material.fingerprint = std::move(fingerprint);
    success = true;

cleanup:
    if (certBio) BIO_free(certBio);
    if (keyBio) BIO_free(keyBio);
    if (cert) X509_free(cert);
    if (pkey) EVP_PKEY_free(pkey);
    if (pkeyCtx) EVP_PKEY_CTX_free(pkeyCtx);

    return success;
}

//=============================================================================
// CertificateManager: Certificate Loading
//=============================================================================

bool CertificateManager::loadIntoContext(SSL_CTX* ctx,
                                         const CertificateMaterial& material,
                                         std::string& errorMsg) {
    if (!ctx) {
        errorMsg = "SSL context is null";
        return false;
    }

    if (!material.isValid()) {
        errorMsg = "Certificate material is incomplete";
        return false;
    }

    X509* cert = readPemCertificate(material.certificatePem, errorMsg);
    if (!cert) {
        return false;
    }

    BIO* keyBio = BIO_new_mem_buf(material.privateKeyPem.data(),
                                  static_cast<int>(material.privateKeyPem.size()));
    EVP_PKEY* pkey = keyBio ? PEM_read_bio_PrivateKey(keyBio, nullptr, nullptr, nullptr) : nullptr;
    if (keyBio) BIO_free(keyBio);

    if (!pkey) {
        X509_free(cert);
        errorMsg = "Failed to read private key: " + opensslError();
        return false;
    }

    bool ok = true;
    if (SSL_CTX_use_certificate(ctx, cert) != 1) {
        errorMsg = "Failed to load certificate: " + opensslError();
        ok = false;
    } else if (SSL_CTX_use_PrivateKey(ctx, pkey) != 1) {
        errorMsg = "Failed to load private key: " + opensslError();
        ok = false;
    } else if (SSL_CTX_check_private_key(ctx) != 1) {
        errorMsg = "Private key does not match certificate";
        ok = false;
    }

    // The context holds its own references.
    X509_free(cert);
    EVP_PKEY_free(pkey);
    return ok;
}

//=============================================================================
// CertificateManager: Certificate Information
//=============================================================================

std::string CertificateManager::fingerprintOf(X509* cert, std::string& errorMsg) {
    if (!cert) {
        errorMsg = "No certificate";
        return "";
    }

    unsigned char* der = nullptr;
    const int derLen = i2d_X509(cert, &der);
    if (derLen < 0 || !der) {
        errorMsg = "Failed to encode certificate";
        return "";
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(der, static_cast<size_t>(derLen), hash);
    OPENSSL_free(der);

    return FingerprintUtils::toUpperHex(hash, SHA256_DIGEST_LENGTH);
}

std::string CertificateManager::fingerprintOfPem(const std::string& certificatePem,
                                                 std::string& errorMsg) {
    X509* cert = readPemCertificate(certificatePem, errorMsg);
    if (!cert) {
        return "";
    }
    std::string fingerprint = fingerprintOf(cert, errorMsg);
    X509_free(cert);
    return fingerprint;
}

std::string CertificateManager::commonNameOfPem(const std::string& certificatePem,
                                                std::string& errorMsg) {
    X509* cert = readPemCertificate(certificatePem, errorMsg);
    if (!cert) {
        return "";
    }

    X509_NAME* name = X509_get_subject_name(cert);
    char cnBuffer[256];
    const int cnLen = name ? X509_NAME_get_text_by_NID(name, NID_commonName,
                                                       cnBuffer, sizeof(cnBuffer))
                           : -1;
    X509_free(cert);

    if (cnLen <= 0) {
        errorMsg = "No common name in certificate";
        return "";
    }

    return std::string(cnBuffer, static_cast<size_t>(cnLen));
}

int CertificateManager::validityDaysOfPem(const std::string& certificatePem,
                                          std::string& errorMsg) {
    X509* cert = readPemCertificate(certificatePem, errorMsg);
    if (!cert) {
        return -1;
    }

    int days = 0;
    int seconds = 0;
    const int ok = ASN1_TIME_diff(&days, &seconds,
                                  X509_get0_notBefore(cert), X509_get0_notAfter(cert));
    X509_free(cert);

    if (ok != 1) {
        errorMsg = "Failed to compare validity times";
        return -1;
    }
    return days;
}

}  // namespace SecureXfer
