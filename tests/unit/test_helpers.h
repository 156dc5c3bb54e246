/**
 * @file test_helpers.h
 * @brief Shared test helpers for epassport PA unit tests
 *
 * Builds CSCA/DSC certificates, CRLs and signed EF.SOD structures with
 * OpenSSL so tests run without a PKD directory or database.
 */

#pragma once

#include "shared/util/OpenSslPtr.hpp"
#include "passiveauthentication/domain/model/DataGroupNumber.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <ctime>
#include <cstdint>
#include <cstring>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>
#include <openssl/cms.h>
#include <openssl/bio.h>
#include <openssl/asn1.h>
#include <openssl/objects.h>

namespace test_helpers {

using UniqueKey = epassport::shared::util::EvpPkeyPtr;
using UniqueCert = epassport::shared::util::X509Ptr;
using UniqueCrl = epassport::shared::util::X509CrlPtr;
using Bytes = std::vector<uint8_t>;

constexpr long DAY = 86400L;

inline time_t now() {
    return time(nullptr);
}

// --- Key Generation ---

inline UniqueKey generateRsaKey(unsigned int bits = 2048) {
    return UniqueKey(EVP_RSA_gen(bits));
}

inline UniqueKey generateEcKey() {
    return UniqueKey(EVP_EC_gen("P-256"));
}

// --- Certificate Creation ---

namespace detail {

inline void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    X509_NAME_add_entry_by_txt(name, field, MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0);
}

inline void addExtension(X509* cert, X509* issuer, int nid, const char* value) {
    if (!value) {
        return;
    }
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, const_cast<char*>(value));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
}

} // namespace detail

struct CertOptions {
    long serial = 1;
    time_t notBefore = now() - DAY;
    time_t notAfter = now() + 3650 * DAY;
    const char* basicConstraints = "critical,CA:TRUE";
    const char* keyUsage = "critical,keyCertSign,cRLSign";
    const EVP_MD* md = EVP_sha256();
};

/**
 * @brief Self-signed CSCA; pass nullptr extensions in options to omit them
 */
inline UniqueCert createCsca(
    EVP_PKEY* key,
    const std::string& cn,
    const std::string& country = "KR",
    const CertOptions& options = CertOptions())
{
    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), options.serial);

    X509_NAME* name = X509_NAME_new();
    detail::addNameEntry(name, "C", country);
    detail::addNameEntry(name, "O", "Test CA");
    detail::addNameEntry(name, "CN", cn);
    X509_set_subject_name(cert, name);
    X509_set_issuer_name(cert, name);
    X509_NAME_free(name);

    ASN1_TIME_set(X509_getm_notBefore(cert), options.notBefore);
    ASN1_TIME_set(X509_getm_notAfter(cert), options.notAfter);
    X509_set_pubkey(cert, key);

    detail::addExtension(cert, cert, NID_basic_constraints, options.basicConstraints);
    detail::addExtension(cert, cert, NID_key_usage, options.keyUsage);

    X509_sign(cert, key, options.md);
    return UniqueCert(cert);
}

inline CertOptions dscOptions(long serial = 100) {
    CertOptions options;
    options.serial = serial;
    options.notAfter = now() + 365 * DAY;
    options.basicConstraints = nullptr;
    options.keyUsage = "critical,digitalSignature";
    return options;
}

/**
 * @brief DSC issued by issuerCert and signed with issuerKey
 */
inline UniqueCert createDsc(
    EVP_PKEY* dscKey,
    EVP_PKEY* issuerKey,
    X509* issuerCert,
    const std::string& cn,
    const CertOptions& options = dscOptions())
{
    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), options.serial);

    X509_NAME* subject = X509_NAME_new();
    detail::addNameEntry(subject, "C", "KR");
    detail::addNameEntry(subject, "CN", cn);
    X509_set_subject_name(cert, subject);
    X509_NAME_free(subject);

    X509_set_issuer_name(cert, X509_get_subject_name(issuerCert));

    ASN1_TIME_set(X509_getm_notBefore(cert), options.notBefore);
    ASN1_TIME_set(X509_getm_notAfter(cert), options.notAfter);
    X509_set_pubkey(cert, dscKey);

    detail::addExtension(cert, issuerCert, NID_basic_constraints, options.basicConstraints);
    detail::addExtension(cert, issuerCert, NID_key_usage, options.keyUsage);

    X509_sign(cert, issuerKey, options.md);
    return UniqueCert(cert);
}

// --- CRL Creation ---

struct RevokedEntry {
    long serial;
    time_t revocationDate;
    std::optional<int> reason;
    // extnValue of the Reason Code extension, written as given
    std::optional<Bytes> rawReasonValue = std::nullopt;
};

/**
 * @brief CRL signed by issuerKey; no nextUpdate when nextUpdate is empty
 */
inline UniqueCrl createCrl(
    EVP_PKEY* issuerKey,
    X509* issuerCert,
    const std::vector<RevokedEntry>& revoked = {},
    time_t thisUpdate = now() - 3600,
    std::optional<time_t> nextUpdate = now() + 30 * DAY)
{
    X509_CRL* crl = X509_CRL_new();
    X509_CRL_set_version(crl, 1);
    X509_CRL_set_issuer_name(crl, X509_get_subject_name(issuerCert));

    ASN1_TIME* t = ASN1_TIME_new();
    ASN1_TIME_set(t, thisUpdate);
    X509_CRL_set1_lastUpdate(crl, t);
    if (nextUpdate.has_value()) {
        ASN1_TIME_set(t, *nextUpdate);
        X509_CRL_set1_nextUpdate(crl, t);
    }
    ASN1_TIME_free(t);

    for (const auto& entry : revoked) {
        X509_REVOKED* rev = X509_REVOKED_new();

        ASN1_INTEGER* serial = ASN1_INTEGER_new();
        ASN1_INTEGER_set(serial, entry.serial);
        X509_REVOKED_set_serialNumber(rev, serial);
        ASN1_INTEGER_free(serial);

        ASN1_TIME* date = ASN1_TIME_new();
        ASN1_TIME_set(date, entry.revocationDate);
        X509_REVOKED_set_revocationDate(rev, date);
        ASN1_TIME_free(date);

        if (entry.reason.has_value()) {
            ASN1_ENUMERATED* reason = ASN1_ENUMERATED_new();
            ASN1_ENUMERATED_set(reason, *entry.reason);
            X509_REVOKED_add1_ext_i2d(rev, NID_crl_reason, reason, 0, 0);
            ASN1_ENUMERATED_free(reason);
        } else if (entry.rawReasonValue.has_value()) {
            ASN1_OCTET_STRING* value = ASN1_OCTET_STRING_new();
            ASN1_OCTET_STRING_set(value, entry.rawReasonValue->data(),
                                  static_cast<int>(entry.rawReasonValue->size()));
            X509_EXTENSION* ext = X509_EXTENSION_create_by_NID(nullptr, NID_crl_reason, 0, value);
            X509_REVOKED_add_ext(rev, ext, -1);
            X509_EXTENSION_free(ext);
            ASN1_OCTET_STRING_free(value);
        }

        X509_CRL_add0_revoked(crl, rev);
    }

    X509_CRL_sort(crl);
    X509_CRL_sign(crl, issuerKey, EVP_sha256());
    return UniqueCrl(crl);
}

// --- DER and SOD Creation ---

inline Bytes derTlv(uint8_t tag, const Bytes& content) {
    Bytes out{tag};
    size_t len = content.size();
    if (len < 0x80) {
        out.push_back(static_cast<uint8_t>(len));
    } else {
        Bytes lenBytes;
        while (len > 0) {
            lenBytes.insert(lenBytes.begin(), static_cast<uint8_t>(len & 0xFF));
            len >>= 8;
        }
        out.push_back(static_cast<uint8_t>(0x80 | lenBytes.size()));
        out.insert(out.end(), lenBytes.begin(), lenBytes.end());
    }
    out.insert(out.end(), content.begin(), content.end());
    return out;
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

inline Bytes encodeOid(const std::string& oid) {
    ASN1_OBJECT* obj = OBJ_txt2obj(oid.c_str(), 1);
    if (!obj) {
        throw std::runtime_error("Bad OID " + oid);
    }
    unsigned char* der = nullptr;
    int len = i2d_ASN1_OBJECT(obj, &der);
    ASN1_OBJECT_free(obj);
    Bytes out(der, der + len);
    OPENSSL_free(der);
    return out;
}

inline Bytes digest(const Bytes& content, const EVP_MD* md = EVP_sha256()) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    EVP_Digest(content.data(), content.size(), out.data(), &len, md, nullptr);
    out.resize(len);
    return out;
}

/**
 * @brief DER LDSSecurityObject (version 0) listing the given hashes
 */
inline Bytes encodeLdsSecurityObject(const std::string& hashOid, const std::map<int, Bytes>& hashes) {
    Bytes hashValues;
    for (const auto& [number, hash] : hashes) {
        Bytes entry = derTlv(0x30, concat({
            derTlv(0x02, Bytes{static_cast<uint8_t>(number)}),
            derTlv(0x04, hash)
        }));
        hashValues.insert(hashValues.end(), entry.begin(), entry.end());
    }

    return derTlv(0x30, concat({
        derTlv(0x02, Bytes{0x00}),
        derTlv(0x30, concat({encodeOid(hashOid), Bytes{0x05, 0x00}})),
        derTlv(0x30, hashValues)
    }));
}

/**
 * @brief CMS SignedData over ldsBytes with eContentType id-icao-ldsSecurityObject
 */
inline Bytes signSod(EVP_PKEY* dscKey, X509* dscCert, const Bytes& ldsBytes,
                     const EVP_MD* md = EVP_sha256(), bool wrapIcao = false) {
    CMS_ContentInfo* cms = CMS_sign(nullptr, nullptr, nullptr, nullptr, CMS_PARTIAL | CMS_BINARY);
    ASN1_OBJECT* contentType = OBJ_txt2obj("2.23.136.1.1.1", 1);
    CMS_set1_eContentType(cms, contentType);
    ASN1_OBJECT_free(contentType);

    if (!CMS_add1_signer(cms, dscCert, dscKey, md, CMS_BINARY)) {
        CMS_ContentInfo_free(cms);
        throw std::runtime_error("CMS_add1_signer failed");
    }

    BIO* content = BIO_new_mem_buf(ldsBytes.data(), static_cast<int>(ldsBytes.size()));
    int finalized = CMS_final(cms, content, nullptr, CMS_BINARY);
    BIO_free(content);
    if (!finalized) {
        CMS_ContentInfo_free(cms);
        throw std::runtime_error("CMS_final failed");
    }

    unsigned char* der = nullptr;
    int len = i2d_CMS_ContentInfo(cms, &der);
    CMS_ContentInfo_free(cms);
    Bytes out(der, der + len);
    OPENSSL_free(der);

    return wrapIcao ? derTlv(0x77, out) : out;
}

/**
 * @brief Signed SOD listing the SHA-2 hash of every given data group
 */
inline Bytes createSod(EVP_PKEY* dscKey, X509* dscCert, const std::map<int, Bytes>& dataGroups,
                       const std::string& hashAlgorithm = "SHA-256", bool wrapIcao = false) {
    std::string oid = "2.16.840.1.101.3.4.2.1";
    const EVP_MD* md = EVP_sha256();
    if (hashAlgorithm == "SHA-384") {
        oid = "2.16.840.1.101.3.4.2.2";
        md = EVP_sha384();
    } else if (hashAlgorithm == "SHA-512") {
        oid = "2.16.840.1.101.3.4.2.3";
        md = EVP_sha512();
    }

    std::map<int, Bytes> hashes;
    for (const auto& [number, content] : dataGroups) {
        hashes[number] = digest(content, md);
    }
    return signSod(dscKey, dscCert, encodeLdsSecurityObject(oid, hashes), EVP_sha256(), wrapIcao);
}

/// Flip the last byte, which falls inside the SignerInfo signature value
inline Bytes tamperSignature(Bytes sod) {
    sod.back() ^= 0x01;
    return sod;
}

inline Bytes sampleDataGroup(int number, size_t size = 64) {
    Bytes content(size);
    for (size_t i = 0; i < size; ++i) {
        content[i] = static_cast<uint8_t>((number * 31 + i) & 0xFF);
    }
    return content;
}

inline std::map<epassport::pa::domain::model::DataGroupNumber, Bytes> toDataGroupMap(
    const std::map<int, Bytes>& dataGroups) {
    std::map<epassport::pa::domain::model::DataGroupNumber, Bytes> out;
    for (const auto& [number, content] : dataGroups) {
        out[epassport::pa::domain::model::dataGroupNumberFromInt(number)] = content;
    }
    return out;
}

} // namespace test_helpers
