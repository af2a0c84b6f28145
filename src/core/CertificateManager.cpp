/**
 * @file CertificateManager.cpp
 * @brief Self-signed TLS certificate bootstrap and inspection
 */

#include "filebeam/CertificateManager.h"
#include "filebeam/Debug.h"
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
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace FileBeam {

namespace {

X509* readCertificateFile(const std::string& certPath, std::string& errorMsg) {
    BIO* bio = BIO_new_file(certPath.c_str(), "r");
    if (!bio) {
        errorMsg = "Failed to open certificate file: " + certPath;
        return nullptr;
    }

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) {
        errorMsg = "Failed to read certificate: " + certPath;
    }
    return cert;
}

std::string buildSubjectAltNameValue(const std::vector<std::string>& names) {
    std::string value;
    for (const auto& name : names) {
        if (!value.empty()) {
            value += ",";
        }
        value += CertificateManager::isIpAddress(name) ? "IP:" : "DNS:";
        value += name;
    }
    return value;
}

std::string openSslDetail() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(": ") + buf;
}

EVP_PKEY* generateRsaKey(std::string& errorMsg) {
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!ctx ||
        EVP_PKEY_keygen_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, CERT_RSA_BITS) <= 0 ||
        EVP_PKEY_keygen(ctx, &pkey) <= 0) {
        errorMsg = "RSA-" + std::to_string(CERT_RSA_BITS) + " key generation failed" +
                   openSslDetail();
        EVP_PKEY_free(pkey);
        pkey = nullptr;
    }
    EVP_PKEY_CTX_free(ctx);
    return pkey;
}

// Positive random serial so regenerated certificates are distinguishable
bool assignRandomSerial(X509* cert, std::string& errorMsg) {
    uint32_t serial = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) {
        errorMsg = "No entropy for certificate serial" + openSslDetail();
        return false;
    }
    ASN1_INTEGER_set(X509_get_serialNumber(cert), static_cast<long>((serial & 0x7FFFFFFF) | 1));
    return true;
}

bool addSubjectAltNames(X509* cert, const std::vector<std::string>& names, std::string& errorMsg) {
    std::string value = buildSubjectAltNameValue(names);
    if (value.empty()) {
        return true;
    }

    X509V3_CTX extCtx;
    X509V3_set_ctx(&extCtx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &extCtx, NID_subject_alt_name, value.data());
    if (!ext) {
        errorMsg = "Invalid subjectAltName '" + value + "'" + openSslDetail();
        return false;
    }
    const bool added = X509_add_ext(cert, ext, -1) == 1;
    X509_EXTENSION_free(ext);
    if (!added) {
        errorMsg = "X509_add_ext(subjectAltName)" + openSslDetail();
    }
    return added;
}

// Created (or truncated) with mode 0600 before any key material is written
bool writePrivateKeyFile(const std::string& keyPath, EVP_PKEY* pkey, std::string& errorMsg) {
    const int fd = ::open(keyPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        errorMsg = "Cannot create key file " + keyPath + ": " + std::strerror(errno);
        return false;
    }
    if (::fchmod(fd, 0600) != 0) {
        LOG_WARNING("Could not restrict permissions of " << keyPath << ": " << std::strerror(errno));
    }

    FILE* fp = ::fdopen(fd, "w");
    if (!fp) {
        errorMsg = "fdopen(" + keyPath + "): " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    BIO* bio = BIO_new_fp(fp, BIO_CLOSE);
    if (!bio) {
        std::fclose(fp);
        errorMsg = "BIO_new_fp" + openSslDetail();
        return false;
    }

    const bool written =
        PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr) == 1 &&
        BIO_flush(bio) == 1;
    if (!written) {
        errorMsg = "Cannot write private key to " + keyPath + openSslDetail();
    }
    BIO_free(bio);
    return written;
}

bool writeCertificateFile(const std::string& certPath, X509* cert, std::string& errorMsg) {
    BIO* bio = BIO_new_file(certPath.c_str(), "w");
    if (!bio) {
        errorMsg = "Cannot create certificate file " + certPath + openSslDetail();
        return false;
    }
    const bool written = PEM_write_bio_X509(bio, cert) == 1 && BIO_flush(bio) == 1;
    if (!written) {
        errorMsg = "Cannot write certificate to " + certPath + openSslDetail();
    }
    BIO_free(bio);
    return written;
}

}  // namespace

//=============================================================================
// CertificateManager: Directory Management
//=============================================================================

bool CertificateManager::ensureCertDir(const std::string& certDir,
                                       std::string& errorMsg) {
    if (certDir.empty()) {
        return true;  // Relative file in the working directory
    }

    const std::filesystem::path dir(certDir);
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    if (std::filesystem::exists(dir, ec)) {
        errorMsg = "Certificate location is not a directory: " + certDir;
        return false;
    }

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        errorMsg = "Cannot create certificate directory " + certDir + ": " + ec.message();
        return false;
    }
    return true;
}

//=============================================================================
// CertificateManager: Provisioning
//=============================================================================

bool CertificateManager::certificateExists(const std::string& certPath) {
    std::error_code ec;
    const std::filesystem::path path(certPath);
    return std::filesystem::exists(path, ec) && std::filesystem::is_regular_file(path, ec);
}

bool CertificateManager::ensureSelfSignedCertificate(const std::string& certPath,
                                                     const std::string& keyPath,
                                                     const std::vector<std::string>& subjectAltNames,
                                                     CertificatePaths& out,
                                                     std::string& errorMsg) {
    out.certPath = certPath;
    out.keyPath = keyPath;
    out.generated = false;

    if (certificateExists(certPath) && certificateExists(keyPath)) {
        std::string expiryError;
        if (isCertificateExpired(certPath, expiryError)) {
            LOG_WARNING("Certificate " << certPath << " is expired or unreadable"
                        << (expiryError.empty() ? "" : ": " + expiryError)
                        << "; delete it to generate a new one");
        }
        LOG_DEBUG("Using existing certificate " << certPath);
        return true;
    }

    if (!generateSelfSignedCert(certPath, keyPath, subjectAltNames, errorMsg)) {
        return false;
    }

    out.generated = true;
    LOG_INFO("Generated self-signed certificate at " << certPath);
    return true;
}

bool CertificateManager::generateSelfSignedCert(const std::string& certPath,
                                                const std::string& keyPath,
                                                const std::vector<std::string>& subjectAltNames,
                                                std::string& errorMsg) {
    for (const auto& name : subjectAltNames) {
        if (name.empty() || name.find(',') != std::string::npos) {
            errorMsg = "Invalid subject alternative name: '" + name + "'";
            return false;
        }
    }

    if (!ensureCertDir(std::filesystem::path(certPath).parent_path().string(), errorMsg) ||
        !ensureCertDir(std::filesystem::path(keyPath).parent_path().string(), errorMsg)) {
        return false;
    }

    const std::string commonName = subjectAltNames.empty() ? "FileBeam" : subjectAltNames.front();

    EVP_PKEY* pkey = generateRsaKey(errorMsg);
    if (!pkey) {
        return false;
    }

    X509* cert = nullptr;
    X509_NAME* subject = nullptr;
    bool success = false;

    cert = X509_new();
    if (!cert || X509_set_version(cert, 2) != 1) {
        errorMsg = "X509_new/X509_set_version" + openSslDetail();
        goto cleanup;
    }

    if (!assignRandomSerial(cert, errorMsg)) {
        goto cleanup;
    }

    X509_gmtime_adj(X509_getm_notBefore(cert), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert),
                    static_cast<long>(CERT_VALIDITY_DAYS) * 24 * 60 * 60);

    if (X509_set_pubkey(cert, pkey) != 1) {
        errorMsg = "X509_set_pubkey" + openSslDetail();
        goto cleanup;
    }

    subject = X509_get_subject_name(cert);
    if (!subject ||
        X509_NAME_add_entry_by_txt(subject, "CN", MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(commonName.c_str()),
                                   static_cast<int>(commonName.length()), -1, 0) != 1 ||
        X509_NAME_add_entry_by_txt(subject, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("FileBeam"),
                                   -1, -1, 0) != 1) {
        errorMsg = "Cannot build subject for CN=" + commonName + openSslDetail();
        goto cleanup;
    }

    // Self-signed
    if (X509_set_issuer_name(cert, subject) != 1) {
        errorMsg = "X509_set_issuer_name" + openSslDetail();
        goto cleanup;
    }

    if (!addSubjectAltNames(cert, subjectAltNames, errorMsg)) {
        goto cleanup;
    }

    if (X509_sign(cert, pkey, EVP_sha256()) <= 0) {
        errorMsg = "X509_sign" + openSslDetail();
        goto cleanup;
    }

    // Key first so a certificate never exists without its key
    success = writePrivateKeyFile(keyPath, pkey, errorMsg) &&
              writeCertificateFile(certPath, cert, errorMsg);

cleanup:
    if (cert) X509_free(cert);
    EVP_PKEY_free(pkey);
    return success;
}

//=============================================================================
// CertificateManager: Certificate Loading
//=============================================================================

bool CertificateManager::loadCertificate(SSL_CTX* ctx,
                                         const std::string& certPath,
                                         const std::string& keyPath,
                                         std::string& errorMsg) {
    if (!ctx) {
        errorMsg = "SSL context is null";
        return false;
    }

    if (SSL_CTX_use_certificate_file(ctx, certPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load certificate: " + certPath;
        return false;
    }

    if (SSL_CTX_use_PrivateKey_file(ctx, keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load private key: " + keyPath;
        return false;
    }

    if (SSL_CTX_check_private_key(ctx) != 1) {
        errorMsg = "Private key does not match certificate";
        return false;
    }

    return true;
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
    int derLen = i2d_X509(cert, &der);
    if (derLen < 0) {
        errorMsg = "Failed to encode certificate";
        return "";
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(der, static_cast<size_t>(derLen), hash);
    OPENSSL_free(der);

    // Canonical form: 64 uppercase hex, no separators
    std::string fingerprint;
    fingerprint.reserve(SHA256_DIGEST_LENGTH * 2);
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02X", hash[i]);
        fingerprint += buf;
    }
    return fingerprint;
}

std::string CertificateManager::getCertificateFingerprint(const std::string& certPath,
                                                          std::string& errorMsg) {
    X509* cert = readCertificateFile(certPath, errorMsg);
    if (!cert) {
        return "";
    }

    std::string fingerprint = fingerprintOf(cert, errorMsg);
    X509_free(cert);
    return fingerprint;
}

std::vector<std::string> CertificateManager::getSubjectAltNames(const std::string& certPath,
                                                                std::string& errorMsg) {
    std::vector<std::string> result;

    X509* cert = readCertificateFile(certPath, errorMsg);
    if (!cert) {
        return result;
    }

    auto* names = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    X509_free(cert);

    if (!names) {
        return result;
    }

    const int count = sk_GENERAL_NAME_num(names);
    for (int i = 0; i < count; ++i) {
        const GENERAL_NAME* entry = sk_GENERAL_NAME_value(names, i);
        if (entry->type == GEN_DNS) {
            const ASN1_STRING* dns = entry->d.dNSName;
            result.push_back("DNS:" + std::string(
                reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                static_cast<size_t>(ASN1_STRING_length(dns))));
        } else if (entry->type == GEN_IPADD) {
            const ASN1_OCTET_STRING* ip = entry->d.iPAddress;
            const int len = ASN1_STRING_length(ip);
            char text[INET6_ADDRSTRLEN] = {0};
            const int family = (len == 4) ? AF_INET : (len == 16 ? AF_INET6 : -1);
            if (family != -1 &&
                inet_ntop(family, ASN1_STRING_get0_data(ip), text, sizeof(text))) {
                result.push_back("IP:" + std::string(text));
            }
        }
    }

    GENERAL_NAMES_free(names);
    return result;
}

std::string CertificateManager::getCertificateExpiry(const std::string& certPath,
                                                     std::string& errorMsg) {
    X509* cert = readCertificateFile(certPath, errorMsg);
    if (!cert) {
        return "";
    }

    const ASN1_TIME* notAfter = X509_get0_notAfter(cert);

    BIO* memBio = BIO_new(BIO_s_mem());
    if (!memBio) {
        X509_free(cert);
        errorMsg = "Failed to create BIO";
        return "";
    }

    ASN1_TIME_print(memBio, notAfter);

    char buffer[256];
    int len = BIO_read(memBio, buffer, sizeof(buffer) - 1);
    X509_free(cert);
    BIO_free(memBio);

    if (len <= 0) {
        errorMsg = "Failed to format expiry date";
        return "";
    }

    buffer[len] = '\0';
    return std::string(buffer);
}

bool CertificateManager::isCertificateExpired(const std::string& certPath,
                                              std::string& errorMsg) {
    X509* cert = readCertificateFile(certPath, errorMsg);
    if (!cert) {
        return true;  // Treat unreadable cert as expired
    }

    int result = X509_cmp_time(X509_get0_notAfter(cert), nullptr);
    X509_free(cert);

    // 0 means the comparison itself failed
    return result <= 0;
}

bool CertificateManager::isIpAddress(const std::string& name) {
    in6_addr buf6{};
    in_addr buf4{};
    return inet_pton(AF_INET, name.c_str(), &buf4) == 1 ||
           inet_pton(AF_INET6, name.c_str(), &buf6) == 1;
}

}  // namespace FileBeam
