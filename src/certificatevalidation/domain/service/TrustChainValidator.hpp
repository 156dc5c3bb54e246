/**
 * @file TrustChainValidator.hpp
 * @brief Domain Service for Trust Chain validation
 */

#pragma once

#include "certificatevalidation/domain/model/ValidationResult.hpp"
#include "certificatevalidation/domain/model/ValidationClock.hpp"
#include <openssl/x509.h>
#include <string>
#include <vector>

namespace epassport::certificatevalidation::domain::service {

/**
 * @brief Trust Chain Validator Domain Service
 *
 * Validates the ICAO PKD certificate hierarchy:
 * - CSCA (Root): self-signed, CA flag, keyCertSign + cRLSign, self-signature, validity
 * - DSC (Leaf): issued by CSCA, signed by CSCA key, digitalSignature, validity
 *
 * Every sub-check runs; all failures are accumulated in the result.
 * Revocation is not checked here.
 */
class TrustChainValidator {
private:
    model::ValidationClock clock_;

    std::vector<model::ValidationError> checkValidity(X509* cert, const std::string& role) const;

    static std::vector<model::ValidationError> checkCaConstraints(X509* cert, const std::string& role);
    static std::vector<model::ValidationError> checkKeyUsage(
        X509* cert, const std::string& role, bool requireCertSign, bool requireCrlSign, bool requireDigitalSignature);
    static std::vector<model::ValidationError> checkIssuedBy(
        X509* child, X509* issuer, const std::string& childRole);

    static long elapsedMillis(std::chrono::steady_clock::time_point start);

public:
    explicit TrustChainValidator(model::ValidationClock clock = model::ValidationClock::currentTime())
        : clock_(clock) {}

    const model::ValidationClock& getClock() const { return clock_; }

    /**
     * @brief Validate CSCA certificate (trust anchor)
     */
    model::ValidationResult validateCsca(X509* csca) const;

    /**
     * @brief Validate DSC certificate against its CSCA
     */
    model::ValidationResult validateDsc(X509* dsc, X509* csca) const;

    /**
     * @brief Issuer DN match and signature check only
     */
    model::ValidationResult validateIssuerRelationship(X509* child, X509* parent) const;

    /**
     * @brief Validate an ordered chain, root first
     *
     * chain[0] is checked as CSCA, the last element as DSC issued by the one
     * before it, and elements in between as CA link certificates.
     */
    model::ValidationResult validate(const std::vector<X509*>& orderedChain) const;
};

} // namespace epassport::certificatevalidation::domain::service
