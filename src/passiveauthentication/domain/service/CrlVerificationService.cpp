#include "passiveauthentication/domain/service/CrlVerificationService.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/X509Util.hpp"
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

namespace epassport::pa::domain::service {

using model::CrlCheckResult;
using shared::util::X509Util;

namespace {

constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_ENUMERATED = 0x0A;

/**
 * Read one short-form TLV header at pos. Returns the content length and
 * advances pos to the content, or std::nullopt if the header is unusable.
 */
std::optional<size_t> readHeader(const std::vector<uint8_t>& der, size_t& pos, uint8_t expectedTag) {
    if (pos + 2 > der.size() || der[pos] != expectedTag) {
        return std::nullopt;
    }
    size_t len = der[pos + 1];
    if (len & 0x80) {
        // Long-form length: one or two length bytes are enough for this value
        size_t numBytes = len & 0x7F;
        if (numBytes == 0 || numBytes > 2 || pos + 2 + numBytes > der.size()) {
            return std::nullopt;
        }
        len = 0;
        for (size_t i = 0; i < numBytes; ++i) {
            len = (len << 8) | der[pos + 2 + i];
        }
        pos += 2 + numBytes;
    } else {
        pos += 2;
    }
    if (pos + len > der.size()) {
        return std::nullopt;
    }
    return len;
}

} // anonymous namespace

std::optional<int> CrlVerificationService::parseReasonCode(const std::vector<uint8_t>& extensionValue) {
    size_t pos = 0;

    if (!extensionValue.empty() && extensionValue[0] == TAG_OCTET_STRING) {
        if (!readHeader(extensionValue, pos, TAG_OCTET_STRING)) {
            return std::nullopt;
        }
    }

    auto enumLen = readHeader(extensionValue, pos, TAG_ENUMERATED);
    if (!enumLen || *enumLen != 1) {
        return std::nullopt;
    }

    int reason = extensionValue[pos];
    if (reason < CrlCheckResult::MIN_REASON_CODE || reason > CrlCheckResult::MAX_REASON_CODE) {
        return std::nullopt;
    }
    return reason;
}

int CrlVerificationService::extractReasonCode(X509_REVOKED* entry) {
    int idx = X509_REVOKED_get_ext_by_NID(entry, NID_crl_reason, -1);
    if (idx < 0) {
        spdlog::debug("CRL entry does not have a Reason Code extension");
        return CrlCheckResult::REASON_UNSPECIFIED;
    }

    X509_EXTENSION* ext = X509_REVOKED_get_ext(entry, idx);
    ASN1_OCTET_STRING* value = ext ? X509_EXTENSION_get_data(ext) : nullptr;
    if (!value) {
        spdlog::warn("CRL Reason Code extension has no value");
        return CrlCheckResult::REASON_UNSPECIFIED;
    }

    // Re-encode the extnValue so the OCTET STRING wrapper is included
    unsigned char* der = nullptr;
    int derLen = i2d_ASN1_OCTET_STRING(value, &der);
    if (derLen <= 0 || !der) {
        spdlog::warn("Failed to encode CRL Reason Code extension");
        return CrlCheckResult::REASON_UNSPECIFIED;
    }
    std::vector<uint8_t> bytes(der, der + derLen);
    OPENSSL_free(der);

    auto reason = parseReasonCode(bytes);
    if (!reason) {
        spdlog::warn("Invalid CRL Reason Code extension format");
        return CrlCheckResult::REASON_UNSPECIFIED;
    }
    spdlog::debug("Extracted CRL reason code: {}", *reason);
    return *reason;
}

CrlCheckResult CrlVerificationService::verifyCertificate(
    X509* certificate,
    X509_CRL* crl,
    X509* issuerCertificate
) const {
    if (!certificate || !issuerCertificate) {
        throw shared::exception::DomainException(
            "INVALID_ARGUMENT",
            "Certificate and issuer certificate are required for CRL verification"
        );
    }
    if (!crl) {
        return CrlCheckResult::unavailable(
            "No CRL available for issuer " + X509Util::getSubjectDn(issuerCertificate));
    }

    spdlog::debug("Starting CRL verification for certificate serial: {}",
                  X509Util::getSerialNumberHex(certificate));

    // Step 1: CRL signature
    if (X509_NAME_cmp(X509_CRL_get_issuer(crl), X509_get_subject_name(issuerCertificate)) != 0) {
        spdlog::warn("CRL issuer {} does not match CSCA subject {}",
                     X509Util::getCrlIssuerDn(crl), X509Util::getSubjectDn(issuerCertificate));
        return CrlCheckResult::invalid("CRL issuer DN does not match CSCA subject DN");
    }

    EVP_PKEY* issuerKey = X509_get0_pubkey(issuerCertificate);
    if (!issuerKey || !X509Util::verifyCrlSignature(crl, issuerKey)) {
        spdlog::warn("CRL signature verification failed. Issuer: {}", X509Util::getCrlIssuerDn(crl));
        return CrlCheckResult::invalid("CRL signature verification failed using CSCA public key");
    }

    // Step 2: freshness
    CrlCheckResult freshness = checkFreshness(crl);
    if (freshness.getStatus() != model::CrlCheckStatus::VALID) {
        return freshness;
    }

    // Step 3 + 4: revoked list and reason
    return checkRevocationStatus(certificate, crl);
}

CrlCheckResult CrlVerificationService::checkFreshness(X509_CRL* crl) const {
    auto thisUpdate = X509Util::toTimePoint(X509_CRL_get0_lastUpdate(crl));
    if (!thisUpdate) {
        spdlog::warn("CRL thisUpdate cannot be parsed");
        return CrlCheckResult::invalid("CRL thisUpdate is missing or malformed");
    }

    const ASN1_TIME* nextUpdateAsn1 = X509_CRL_get0_nextUpdate(crl);
    std::optional<std::chrono::system_clock::time_point> nextUpdate;
    if (nextUpdateAsn1) {
        nextUpdate = X509Util::toTimePoint(nextUpdateAsn1);
        if (!nextUpdate) {
            spdlog::warn("CRL nextUpdate cannot be parsed");
            return CrlCheckResult::invalid("CRL nextUpdate is malformed");
        }
    }

    auto now = clock_.now();
    spdlog::debug("CRL thisUpdate: {}, nextUpdate: {}, check time: {}",
                  X509Util::toIso8601(*thisUpdate),
                  nextUpdate ? X509Util::toIso8601(*nextUpdate) : std::string("none"),
                  X509Util::toIso8601(now));

    if (now < *thisUpdate) {
        spdlog::warn("CRL is not yet valid. thisUpdate: {}", X509Util::toIso8601(*thisUpdate));
        return CrlCheckResult::expired(
            "CRL is not yet valid (thisUpdate: " + X509Util::toIso8601(*thisUpdate) + ")");
    }

    if (nextUpdate && now >= *nextUpdate) {
        spdlog::warn("CRL has expired. nextUpdate: {}", X509Util::toIso8601(*nextUpdate));
        return CrlCheckResult::expired(
            "CRL has expired (nextUpdate: " + X509Util::toIso8601(*nextUpdate) + ")");
    }

    spdlog::debug("CRL freshness check passed");
    return CrlCheckResult::valid();
}

CrlCheckResult CrlVerificationService::checkRevocationStatus(X509* certificate, X509_CRL* crl) {
    const std::string serial = X509Util::getSerialNumberHex(certificate);

    X509_REVOKED* entry = nullptr;
    int found = X509_CRL_get0_by_serial(crl, &entry, X509_get_serialNumber(certificate));
    if (found != 1 || !entry) {
        spdlog::debug("Certificate serial {} is not revoked", serial);
        return CrlCheckResult::valid();
    }

    auto revocationDate = X509Util::toTimePoint(X509_REVOKED_get0_revocationDate(entry));
    if (!revocationDate) {
        // Entry is still revoked; fall back to the CRL issue time
        spdlog::warn("Revocation date of serial {} cannot be parsed, using CRL thisUpdate", serial);
        revocationDate = X509Util::toTimePoint(X509_CRL_get0_lastUpdate(crl));
    }

    int reason = extractReasonCode(entry);

    spdlog::warn("Certificate serial {} is REVOKED. Date: {}, Reason: {}", serial,
                 revocationDate ? X509Util::toIso8601(*revocationDate) : std::string("unknown"),
                 CrlCheckResult::reasonText(reason));

    return CrlCheckResult::revoked(revocationDate, reason);
}

} // namespace epassport::pa::domain::service
