/**
 * @file CertificateManager.h
 * @brief Self-signed TLS certificate bootstrap and inspection
 */

#pragma once

#include "config.h"
#include <string>
#include <vector>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct x509_st;
typedef struct x509_st X509;

namespace FileBeam {

/**
 * @brief Paths returned by ensureSelfSignedCertificate()
 */
struct CertificatePaths {
    std::string certPath;
    std::string keyPath;
    bool generated = false;  ///< true if new material was written
};

//=============================================================================
// CertificateManager Class
//=============================================================================

/**
 * @class CertificateManager
 * @brief Provisions and loads the server's TLS identity
 *
 * The server presents a self-signed certificate; clients trust it by loading
 * the same PEM file as their CA. Existing files are always reused, so
 * deleting them is the way to rotate the identity.
 *
 * Usage:
 * @code
 * CertificatePaths paths;
 * std::string error;
 * if (!CertificateManager::ensureSelfSignedCertificate(
 *         "certs/server-cert.pem", "certs/server-key.pem",
 *         {"localhost", "127.0.0.1"}, paths, error)) {
 *     std::cerr << "Failed to provision certificate: " << error << "\n";
 * }
 * @endcode
 */
class CertificateManager {
public:
    //=========================================================================
    // Provisioning
    //=========================================================================

    /**
     * @brief Reuse or generate a self-signed certificate and key
     * @param certPath Certificate PEM path
     * @param keyPath Private key PEM path
     * @param subjectAltNames DNS names and/or IP addresses to certify
     * @param out Resulting paths, with generated set when new files were written
     * @param errorMsg Output error message on failure
     * @return true if both files exist afterwards
     *
     * If both files already exist they are returned untouched (an expired
     * certificate only produces a warning). Otherwise parent directories are
     * created and a new key pair and certificate are written, replacing any
     * lone leftover file.
     */
    static bool ensureSelfSignedCertificate(const std::string& certPath,
                                            const std::string& keyPath,
                                            const std::vector<std::string>& subjectAltNames,
                                            CertificatePaths& out,
                                            std::string& errorMsg);

    /**
     * @brief Generate a self-signed certificate
     *
     * Creates:
     * - RSA CERT_RSA_BITS key pair, unencrypted PEM
     * - X.509 v3 certificate valid for CERT_VALIDITY_DAYS, signed with SHA-256
     * - subjectAltName with DNS: entries for names and IP: entries for
     *   IPv4/IPv6 literals
     * - Subject/Issuer: CN=<first name, or "FileBeam">, O=FileBeam
     */
    static bool generateSelfSignedCert(const std::string& certPath,
                                       const std::string& keyPath,
                                       const std::vector<std::string>& subjectAltNames,
                                       std::string& errorMsg);

    //=========================================================================
    // Loading
    //=========================================================================

    /**
     * @brief Load certificate and private key into an SSL context
     *
     * Verifies that the private key matches the certificate.
     */
    static bool loadCertificate(SSL_CTX* ctx,
                                const std::string& certPath,
                                const std::string& keyPath,
                                std::string& errorMsg);

    static bool certificateExists(const std::string& certPath);

    //=========================================================================
    // Inspection
    //=========================================================================

    /**
     * @brief SHA-256 fingerprint of a PEM certificate (64 uppercase hex)
     * @return Fingerprint, or empty string on error
     */
    static std::string getCertificateFingerprint(const std::string& certPath,
                                                 std::string& errorMsg);

    /**
     * @brief SHA-256 fingerprint of a loaded certificate (64 uppercase hex)
     */
    static std::string fingerprintOf(X509* cert, std::string& errorMsg);

    /**
     * @brief Subject alternative names as "DNS:x" / "IP:y" strings
     */
    static std::vector<std::string> getSubjectAltNames(const std::string& certPath,
                                                       std::string& errorMsg);

    /**
     * @brief Human-readable notAfter date
     */
    static std::string getCertificateExpiry(const std::string& certPath,
                                            std::string& errorMsg);

    /**
     * @brief Check whether the certificate's notAfter is in the past
     * @return true if expired or unreadable
     */
    static bool isCertificateExpired(const std::string& certPath,
                                     std::string& errorMsg);

    /**
     * @brief true for IPv4/IPv6 literals (as opposed to DNS names)
     */
    static bool isIpAddress(const std::string& name);

private:
    static bool ensureCertDir(const std::string& certDir, std::string& errorMsg);

    CertificateManager() = delete;
};

}  // namespace FileBeam
