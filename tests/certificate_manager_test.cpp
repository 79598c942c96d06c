/**
 * @file certificate_manager_test.cpp
 * @brief Tests for in-memory identity and certificate generation
 */

#include "securexfer/CertificateManager.h"
#include "securexfer/FingerprintUtils.h"
#include <gtest/gtest.h>

#include <openssl/ssl.h>

using namespace SecureXfer;

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Generates one certificate shared by the whole suite (RSA keygen is slow)
 */
class CertificateManagerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        std::string error;
        generated = CertificateManager::generateSelfSigned("unit-host", material, error);
        generationError = error;
    }

    void SetUp() override {
        ASSERT_TRUE(generated) << generationError;
    }

    static CertificateMaterial material;
    static bool generated;
    static std::string generationError;
};

CertificateMaterial CertificateManagerTest::material;
bool CertificateManagerTest::generated = false;
std::string CertificateManagerTest::generationError;

//=============================================================================
// Generation
//=============================================================================

TEST_F(CertificateManagerTest, MaterialIsComplete) {
    EXPECT_TRUE(material.isValid());
    EXPECT_NE(material.privateKeyPem.find("BEGIN PRIVATE KEY"), std::string::npos);
    EXPECT_NE(material.certificatePem.find("BEGIN CERTIFICATE"), std::string::npos);
    EXPECT_EQ(FingerprintUtils::normalizeSha256Hex(material.fingerprint), material.fingerprint);
}

TEST_F(CertificateManagerTest, FingerprintMatchesCertificate) {
    std::string error;
    EXPECT_EQ(CertificateManager::fingerprintOfPem(material.certificatePem, error),
              material.fingerprint) << error;
}

TEST_F(CertificateManagerTest, SubjectAndValidity) {
    std::string error;
    EXPECT_EQ(CertificateManager::commonNameOfPem(material.certificatePem, error), "unit-host");
    EXPECT_EQ(CertificateManager::validityDaysOfPem(material.certificatePem, error),
              CERT_VALIDITY_DAYS);
}

TEST_F(CertificateManagerTest, LoadsIntoServerContext) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    ASSERT_NE(ctx, nullptr);

    std::string error;
    EXPECT_TRUE(CertificateManager::loadIntoContext(ctx, material, error)) << error;
    SSL_CTX_free(ctx);
}

TEST_F(CertificateManagerTest, MismatchedKeyIsRejected) {
    CertificateMaterial other;
    std::string error;
    ASSERT_TRUE(CertificateManager::generateSelfSigned("other-host", other, error)) << error;
    EXPECT_NE(other.fingerprint, material.fingerprint);

    CertificateMaterial mixed = material;
    mixed.privateKeyPem = other.privateKeyPem;

    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    ASSERT_NE(ctx, nullptr);
    EXPECT_FALSE(CertificateManager::loadIntoContext(ctx, mixed, error));
    SSL_CTX_free(ctx);
}

TEST_F(CertificateManagerTest, GarbagePemIsRejected) {
    std::string error;
    EXPECT_TRUE(CertificateManager::fingerprintOfPem("not a certificate", error).empty());
    EXPECT_FALSE(error.empty());
}

//=============================================================================
// Identity
//=============================================================================

TEST(IdentityTest, InitializeIdentityFillsEverythingButPort) {
    LocalIdentity identity;
    std::string error;
    ASSERT_TRUE(CertificateManager::initializeIdentity(identity, error)) << error;

    EXPECT_EQ(identity.processId.size(), 36u);
    EXPECT_EQ(identity.processId[14], '4');
    EXPECT_FALSE(identity.displayName.empty());
    EXPECT_TRUE(identity.material.isValid());
    EXPECT_EQ(identity.listenPort, 0);
}
