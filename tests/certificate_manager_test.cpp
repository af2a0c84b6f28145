/**
 * @file certificate_manager_test.cpp
 * @brief Self-signed certificate provisioning and inspection
 */

#include "filebeam/CertificateManager.h"
#include "test_util.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace FileBeam;
using namespace FileBeam::test;

class CertificateManagerTest : public ::testing::Test {
protected:
    CertificateManagerTest()
        : m_dir("certs")
        , m_certPath((m_dir.path() / "nested" / "server-cert.pem").string())
        , m_keyPath((m_dir.path() / "nested" / "server-key.pem").string())
    {
    }

    ScratchDir m_dir;
    std::string m_certPath;
    std::string m_keyPath;
};

TEST_F(CertificateManagerTest, GeneratesOnceThenReuses) {
    CertificatePaths paths;
    std::string error;

    ASSERT_TRUE(CertificateManager::ensureSelfSignedCertificate(
        m_certPath, m_keyPath, {"localhost", "127.0.0.1"}, paths, error)) << error;
    EXPECT_TRUE(paths.generated);
    EXPECT_TRUE(CertificateManager::certificateExists(m_certPath));
    EXPECT_TRUE(CertificateManager::certificateExists(m_keyPath));

    const std::string first = CertificateManager::getCertificateFingerprint(m_certPath, error);
    ASSERT_EQ(first.size(), 64u) << error;

    ASSERT_TRUE(CertificateManager::ensureSelfSignedCertificate(
        m_certPath, m_keyPath, {"other.example"}, paths, error)) << error;
    EXPECT_FALSE(paths.generated);
    EXPECT_EQ(CertificateManager::getCertificateFingerprint(m_certPath, error), first);
}

TEST_F(CertificateManagerTest, SubjectAltNamesAreWritten) {
    std::string error;
    ASSERT_TRUE(CertificateManager::generateSelfSignedCert(
        m_certPath, m_keyPath, {"files.example", "127.0.0.1", "::1"}, error)) << error;

    const auto names = CertificateManager::getSubjectAltNames(m_certPath, error);
    auto has = [&names](const std::string& entry) {
        return std::find(names.begin(), names.end(), entry) != names.end();
    };
    EXPECT_TRUE(has("DNS:files.example"));
    EXPECT_TRUE(has("IP:127.0.0.1"));
    EXPECT_TRUE(has("IP:::1"));
}

TEST_F(CertificateManagerTest, FreshCertificateIsNotExpired) {
    std::string error;
    ASSERT_TRUE(CertificateManager::generateSelfSignedCert(
        m_certPath, m_keyPath, {"localhost"}, error)) << error;

    EXPECT_FALSE(CertificateManager::isCertificateExpired(m_certPath, error));
    EXPECT_FALSE(CertificateManager::getCertificateExpiry(m_certPath, error).empty());
}

TEST_F(CertificateManagerTest, PrivateKeyIsOwnerOnly) {
    std::string error;
    ASSERT_TRUE(CertificateManager::generateSelfSignedCert(
        m_certPath, m_keyPath, {"localhost"}, error)) << error;

    const auto perms = std::filesystem::status(m_keyPath).permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);
}

TEST_F(CertificateManagerTest, MissingCertificateReportsError) {
    std::string error;
    EXPECT_TRUE(CertificateManager::getCertificateFingerprint(m_certPath, error).empty());
    EXPECT_FALSE(error.empty());
}

TEST(CertificateManagerIpTest, RecognizesIpLiterals) {
    EXPECT_TRUE(CertificateManager::isIpAddress("127.0.0.1"));
    EXPECT_TRUE(CertificateManager::isIpAddress("::1"));
    EXPECT_FALSE(CertificateManager::isIpAddress("localhost"));
    EXPECT_FALSE(CertificateManager::isIpAddress("999.1.1.1"));
}
