#pragma once

#include "passiveauthentication/domain/model/CrlCheckResult.hpp"
#include "certificatevalidation/domain/model/ValidationClock.hpp"
#include <openssl/x509.h>
#include <optional>
#include <vector>
#include <cstdint>

namespace epassport::pa::domain::service {

/**
 * CRL Verification Domain Service.
 *
 * Checks a certificate against a CRL issued by the given issuer.
 * Steps, each terminal on failure:
 * 1. CRL signature with the issuer public key      -> CRL_INVALID
 * 2. Freshness: thisUpdate <= now < nextUpdate       -> CRL_EXPIRED
 * 3. Serial number lookup in the revoked list        -> VALID if absent
 * 4. Reason code of the revoked entry (OID 2.5.29.21) -> REVOKED
 *
 * A CRL without nextUpdate is treated as not expired.
 */
class CrlVerificationService {
private:
    certificatevalidation::domain::model::ValidationClock clock_;

    model::CrlCheckResult checkFreshness(X509_CRL* crl) const;
    static model::CrlCheckResult checkRevocationStatus(X509* certificate, X509_CRL* crl);
    static int extractReasonCode(X509_REVOKED* entry);

public:
    explicit CrlVerificationService(
        certificatevalidation::domain::model::ValidationClock clock =
            certificatevalidation::domain::model::ValidationClock::currentTime()
    ) : clock_(clock) {}

    /**
     * Verify a certificate's revocation status.
     *
     * @param certificate certificate to check (DSC)
     * @param crl CRL to check against; nullptr yields CRL_UNAVAILABLE
     * @param issuerCertificate CRL issuer (CSCA)
     * @throws DomainException INVALID_ARGUMENT if certificate or issuer is null
     */
    model::CrlCheckResult verifyCertificate(X509* certificate, X509_CRL* crl, X509* issuerCertificate) const;

    /**
     * Decode a DER CRLReason extension value.
     *
     * Accepts the full extnValue (OCTET STRING wrapping an ENUMERATED) or the
     * bare ENUMERATED. Returns std::nullopt for malformed or out-of-range input.
     */
    static std::optional<int> parseReasonCode(const std::vector<uint8_t>& extensionValue);
};

} // namespace epassport::pa::domain::service
