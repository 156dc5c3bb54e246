/**
 * @file X509Util.hpp
 * @brief Pure X.509 helper operations (no I/O, no logging)
 *
 * DN strings use the OpenSSL oneline format ("/C=KR/O=Gov/CN=CSCA").
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <openssl/x509.h>
#include <openssl/asn1.h>

namespace epassport::shared::util {

class X509Util {
public:
    /// @name Signatures
    /// @{

    /**
     * @brief Verify a certificate's signature with the given public key
     *
     * Clears the OpenSSL error queue on failure so stale errors do not leak
     * into later diagnostics.
     */
    static bool verifyCertificateSignature(X509* cert, EVP_PKEY* publicKey);

    /**
     * @brief Verify a CRL's signature with the given public key
     */
    static bool verifyCrlSignature(X509_CRL* crl, EVP_PKEY* publicKey);

    /// @}

    /// @name Names and identifiers
    /// @{

    static std::string getSubjectDn(const X509* cert);
    static std::string getIssuerDn(const X509* cert);
    static std::string getCrlIssuerDn(const X509_CRL* crl);
    static std::string nameToString(const X509_NAME* name);

    /**
     * @brief Serial number as uppercase hex (BN_bn2hex), empty on error
     */
    static std::string getSerialNumberHex(const X509* cert);

    /**
     * @brief SHA-256 fingerprint, 64-char lowercase hex, empty on error
     */
    static std::string getFingerprint(const X509* cert);

    /**
     * @brief Normalize DN for format-independent comparison
     *
     * Accepts both slash (/C=X/O=Y/CN=Z) and RFC 2253 (CN=Z,O=Y,C=X) forms.
     * Lowercases, sorts RDNs and joins them with '|'.
     */
    static std::string normalizeDn(const std::string& dn);

    /**
     * @brief Extract an RDN value (e.g. "C", "CN") from a DN in either format
     * @return value in original case, or empty string if not present
     */
    static std::string extractDnAttribute(const std::string& dn, const std::string& attr);

    /// @}

    /// @name Time
    /// @{

    /**
     * @brief Convert ASN1_TIME (UTCTime or GeneralizedTime) to a UTC time point
     * @return std::nullopt if the time is absent or malformed
     */
    static std::optional<std::chrono::system_clock::time_point> toTimePoint(const ASN1_TIME* t);

    /**
     * @brief Format as ISO 8601 UTC ("2024-01-01T00:00:00Z")
     */
    static std::string toIso8601(std::chrono::system_clock::time_point tp);

    /**
     * @brief Parse "YYYY-MM-DDTHH:MM:SS[Z]" or "YYYY-MM-DD" as UTC
     */
    static std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& text);

    /// @}
};

} // namespace epassport::shared::util
