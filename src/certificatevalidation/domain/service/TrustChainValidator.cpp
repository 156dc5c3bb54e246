/**
 * @file TrustChainValidator.cpp
 * @brief Trust chain checks on OpenSSL certificates
 */

#include "certificatevalidation/domain/service/TrustChainValidator.hpp"
#include "shared/util/X509Util.hpp"
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

namespace epassport::certificatevalidation::domain::service {

using model::ValidationError;
using model::ValidationResult;
using shared::util::X509Util;

namespace {

// RFC 5280 KeyUsage bit positions
constexpr int KEY_USAGE_BIT_DIGITAL_SIGNATURE = 0;
constexpr int KEY_USAGE_BIT_KEY_CERT_SIGN = 5;
constexpr int KEY_USAGE_BIT_CRL_SIGN = 6;

} // anonymous namespace

long TrustChainValidator::elapsedMillis(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
}

std::vector<ValidationError> TrustChainValidator::checkValidity(X509* cert, const std::string& role) const {
    std::vector<ValidationError> errors;

    auto notBefore = X509Util::toTimePoint(X509_get0_notBefore(cert));
    auto notAfter = X509Util::toTimePoint(X509_get0_notAfter(cert));
    if (!notBefore || !notAfter) {
        spdlog::warn("{} validity dates cannot be parsed", role);
        errors.push_back(ValidationError::validityUnreadable(role));
        return errors;
    }

    auto checkTime = clock_.now();
    if (checkTime < *notBefore) {
        spdlog::warn("{} not yet valid at {} (notBefore {})", role,
                     X509Util::toIso8601(checkTime), X509Util::toIso8601(*notBefore));
        errors.push_back(ValidationError::certificateNotYetValid(role));
    } else if (checkTime > *notAfter) {
        spdlog::warn("{} expired at {} (notAfter {})", role,
                     X509Util::toIso8601(checkTime), X509Util::toIso8601(*notAfter));
        errors.push_back(ValidationError::certificateExpired(role));
    }
    return errors;
}

std::vector<ValidationError> TrustChainValidator::checkCaConstraints(X509* cert, const std::string& role) {
    std::vector<ValidationError> errors;

    int critical = -1;
    auto* bc = static_cast<BASIC_CONSTRAINTS*>(
        X509_get_ext_d2i(cert, NID_basic_constraints, &critical, nullptr));
    if (!bc) {
        spdlog::error("{} has no Basic Constraints extension", role);
        errors.push_back(ValidationError::basicConstraintsMissing(role));
        return errors;
    }

    bool isCa = bc->ca != 0;
    BASIC_CONSTRAINTS_free(bc);

    if (!isCa) {
        spdlog::error("{} does not have CA flag", role);
        errors.push_back(ValidationError::caFlagNotSet(role));
    }
    return errors;
}

std::vector<ValidationError> TrustChainValidator::checkKeyUsage(
    X509* cert,
    const std::string& role,
    bool requireCertSign,
    bool requireCrlSign,
    bool requireDigitalSignature
) {
    std::vector<ValidationError> errors;

    int critical = -1;
    auto* ku = static_cast<ASN1_BIT_STRING*>(
        X509_get_ext_d2i(cert, NID_key_usage, &critical, nullptr));
    if (!ku) {
        spdlog::error("{} has no Key Usage extension", role);
        errors.push_back(ValidationError::keyUsageMissing(role));
        return errors;
    }

    std::string missing;
    auto require = [&](bool required, int bit, const char* name) {
        if (required && !ASN1_BIT_STRING_get_bit(ku, bit)) {
            if (!missing.empty()) missing += ", ";
            missing += name;
        }
    };
    require(requireCertSign, KEY_USAGE_BIT_KEY_CERT_SIGN, "keyCertSign");
    require(requireCrlSign, KEY_USAGE_BIT_CRL_SIGN, "cRLSign");
    require(requireDigitalSignature, KEY_USAGE_BIT_DIGITAL_SIGNATURE, "digitalSignature");
    ASN1_BIT_STRING_free(ku);

    if (!missing.empty()) {
        spdlog::error("{} Key Usage lacks {}", role, missing);
        errors.push_back(ValidationError::keyUsageInvalid(role, missing));
    }
    return errors;
}

std::vector<ValidationError> TrustChainValidator::checkIssuedBy(
    X509* child,
    X509* issuer,
    const std::string& childRole
) {
    std::vector<ValidationError> errors;

    if (X509_NAME_cmp(X509_get_issuer_name(child), X509_get_subject_name(issuer)) != 0) {
        spdlog::error("{} Issuer DN does not match issuer Subject DN: {} vs {}", childRole,
                      X509Util::getIssuerDn(child), X509Util::getSubjectDn(issuer));
        errors.push_back(ValidationError::issuerMismatch(childRole));
    }

    EVP_PKEY* issuerKey = X509_get0_pubkey(issuer);
    if (!issuerKey) {
        spdlog::error("Cannot extract issuer public key for {}", childRole);
        errors.push_back(ValidationError::publicKeyUnavailable(childRole));
    } else if (!X509Util::verifyCertificateSignature(child, issuerKey)) {
        spdlog::error("{} signature verification failed using issuer public key", childRole);
        errors.push_back(ValidationError::signatureInvalid(childRole));
    }
    return errors;
}

ValidationResult TrustChainValidator::validateCsca(X509* csca) const {
    const std::string role = "CSCA";
    auto startTime = std::chrono::steady_clock::now();

    if (!csca) {
        return ValidationResult::of({ValidationError::certificateMissing(role)}, elapsedMillis(startTime));
    }

    spdlog::debug("=== CSCA Validation Started ===");
    spdlog::debug("CSCA Subject: {}", X509Util::getSubjectDn(csca));

    std::vector<ValidationError> errors;
    auto append = [&errors](std::vector<ValidationError> more) {
        errors.insert(errors.end(), more.begin(), more.end());
    };

    // 1. Self-signed: subject DN == issuer DN
    if (X509_NAME_cmp(X509_get_subject_name(csca), X509_get_issuer_name(csca)) != 0) {
        spdlog::error("CSCA is not self-signed");
        errors.push_back(ValidationError::notSelfSigned(role));
    }

    // 2. Basic Constraints CA flag
    append(checkCaConstraints(csca, role));

    // 3. Key Usage: keyCertSign + cRLSign
    append(checkKeyUsage(csca, role, true, true, false));

    // 4. Self-signature
    EVP_PKEY* key = X509_get0_pubkey(csca);
    if (!key) {
        errors.push_back(ValidationError::publicKeyUnavailable(role));
    } else if (!X509Util::verifyCertificateSignature(csca, key)) {
        spdlog::error("CSCA self-signature verification failed");
        errors.push_back(ValidationError::signatureInvalid(role));
    }

    // 5. Validity window
    append(checkValidity(csca, role));

    ValidationResult result = ValidationResult::of(std::move(errors), elapsedMillis(startTime));
    spdlog::debug("CSCA validation result: {}", result.getSummary());
    return result;
}

ValidationResult TrustChainValidator::validateDsc(X509* dsc, X509* csca) const {
    const std::string role = "DSC";
    auto startTime = std::chrono::steady_clock::now();

    if (!dsc || !csca) {
        return ValidationResult::of(
            {ValidationError::certificateMissing(dsc ? "CSCA" : role)}, elapsedMillis(startTime));
    }

    spdlog::debug("=== DSC Validation Started ===");
    spdlog::debug("DSC Subject: {}", X509Util::getSubjectDn(dsc));
    spdlog::debug("CSCA Subject: {}", X509Util::getSubjectDn(csca));

    std::vector<ValidationError> errors = checkIssuedBy(dsc, csca, role);

    auto keyUsage = checkKeyUsage(dsc, role, false, false, true);
    errors.insert(errors.end(), keyUsage.begin(), keyUsage.end());

    auto validity = checkValidity(dsc, role);
    errors.insert(errors.end(), validity.begin(), validity.end());

    ValidationResult result = ValidationResult::of(std::move(errors), elapsedMillis(startTime));
    spdlog::debug("DSC validation result: {}", result.getSummary());
    return result;
}

ValidationResult TrustChainValidator::validateIssuerRelationship(X509* child, X509* parent) const {
    auto startTime = std::chrono::steady_clock::now();
    if (!child || !parent) {
        return ValidationResult::of(
            {ValidationError::certificateMissing(child ? "issuer" : "child")}, elapsedMillis(startTime));
    }

    spdlog::debug("=== Issuer Relationship Validation ===");
    spdlog::debug("Child: {}", X509Util::getSubjectDn(child));
    spdlog::debug("Parent: {}", X509Util::getSubjectDn(parent));

    return ValidationResult::of(checkIssuedBy(child, parent, "child"), elapsedMillis(startTime));
}

ValidationResult TrustChainValidator::validate(const std::vector<X509*>& orderedChain) const {
    if (orderedChain.empty()) {
        return ValidationResult::of({ValidationError::certificateMissing("CSCA")});
    }

    ValidationResult result = validateCsca(orderedChain.front());

    for (size_t i = 1; i + 1 < orderedChain.size(); ++i) {
        // CA link certificate between the root and the DSC
        auto startTime = std::chrono::steady_clock::now();
        const std::string role = "chain[" + std::to_string(i) + "]";
        X509* link = orderedChain[i];
        X509* issuer = orderedChain[i - 1];
        if (!link || !issuer) {
            result = result.merge(ValidationResult::of({ValidationError::certificateMissing(role)}));
            continue;
        }

        std::vector<ValidationError> errors = checkIssuedBy(link, issuer, role);
        for (auto& more : {checkCaConstraints(link, role),
                           checkKeyUsage(link, role, true, false, false),
                           checkValidity(link, role)}) {
            errors.insert(errors.end(), more.begin(), more.end());
        }
        result = result.merge(ValidationResult::of(std::move(errors), elapsedMillis(startTime)));
    }

    if (orderedChain.size() > 1) {
        result = result.merge(validateDsc(orderedChain.back(), orderedChain[orderedChain.size() - 2]));
    }
    return result;
}

} // namespace epassport::certificatevalidation::domain::service
