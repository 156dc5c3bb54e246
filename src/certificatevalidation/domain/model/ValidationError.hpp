/**
 * @file ValidationError.hpp
 * @brief Value Object for validation error details
 */

#pragma once

#include <string>

namespace epassport::certificatevalidation::domain::model {

/**
 * @brief Category of a trust chain failure
 *
 * A required extension that is absent is CONSTRAINT_VIOLATION; an extension
 * that is present but lacks the required flag or bit is EXTENSION_INVALID.
 */
enum class ValidationErrorKind {
    SIGNATURE,              ///< Signature did not verify or key unavailable
    ISSUER,                 ///< Issuer/subject DN relationship broken
    VALIDITY,               ///< Outside notBefore/notAfter at check time
    CONSTRAINT_VIOLATION,   ///< Required extension missing
    EXTENSION_INVALID,      ///< Extension present but wrong
    STRUCTURE               ///< Certificate could not be read
};

inline std::string toString(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::SIGNATURE:            return "SIGNATURE";
        case ValidationErrorKind::ISSUER:               return "ISSUER";
        case ValidationErrorKind::VALIDITY:             return "VALIDITY";
        case ValidationErrorKind::CONSTRAINT_VIOLATION: return "CONSTRAINT_VIOLATION";
        case ValidationErrorKind::EXTENSION_INVALID:    return "EXTENSION_INVALID";
        case ValidationErrorKind::STRUCTURE:            return "STRUCTURE";
        default:                                        return "UNKNOWN";
    }
}

/**
 * @brief Validation error Value Object
 *
 * One failed sub-check of certificate validation. The subject names the
 * certificate role the check ran on ("CSCA", "DSC", "chain[1]").
 */
class ValidationError {
private:
    std::string errorCode_;
    std::string errorMessage_;
    ValidationErrorKind kind_;
    std::string subject_;

    ValidationError(
        std::string errorCode,
        std::string errorMessage,
        ValidationErrorKind kind,
        std::string subject
    ) : errorCode_(std::move(errorCode)),
        errorMessage_(std::move(errorMessage)),
        kind_(kind),
        subject_(std::move(subject)) {}

public:
    static ValidationError of(
        const std::string& errorCode,
        const std::string& errorMessage,
        ValidationErrorKind kind,
        const std::string& subject
    ) {
        return ValidationError(errorCode, errorMessage, kind, subject);
    }

    // Common error factory methods
    static ValidationError signatureInvalid(const std::string& subject) {
        return of("SIGNATURE_INVALID", subject + " signature verification failed",
                  ValidationErrorKind::SIGNATURE, subject);
    }

    static ValidationError publicKeyUnavailable(const std::string& subject) {
        return of("PUBLIC_KEY_UNAVAILABLE", "Cannot extract public key to verify " + subject,
                  ValidationErrorKind::SIGNATURE, subject);
    }

    static ValidationError notSelfSigned(const std::string& subject) {
        return of("NOT_SELF_SIGNED", subject + " subject DN differs from issuer DN",
                  ValidationErrorKind::ISSUER, subject);
    }

    static ValidationError issuerMismatch(const std::string& subject) {
        return of("ISSUER_MISMATCH", subject + " issuer DN does not match issuer subject DN",
                  ValidationErrorKind::ISSUER, subject);
    }

    static ValidationError certificateExpired(const std::string& subject) {
        return of("CERTIFICATE_EXPIRED", subject + " validity period has ended",
                  ValidationErrorKind::VALIDITY, subject);
    }

    static ValidationError certificateNotYetValid(const std::string& subject) {
        return of("CERTIFICATE_NOT_YET_VALID", subject + " validity period has not started",
                  ValidationErrorKind::VALIDITY, subject);
    }

    static ValidationError validityUnreadable(const std::string& subject) {
        return of("VALIDITY_UNREADABLE", subject + " validity dates cannot be parsed",
                  ValidationErrorKind::VALIDITY, subject);
    }

    static ValidationError basicConstraintsMissing(const std::string& subject) {
        return of("BASIC_CONSTRAINTS_MISSING", subject + " has no Basic Constraints extension",
                  ValidationErrorKind::CONSTRAINT_VIOLATION, subject);
    }

    static ValidationError caFlagNotSet(const std::string& subject) {
        return of("CA_FLAG_NOT_SET", subject + " Basic Constraints CA flag is false",
                  ValidationErrorKind::EXTENSION_INVALID, subject);
    }

    static ValidationError keyUsageMissing(const std::string& subject) {
        return of("KEY_USAGE_MISSING", subject + " has no Key Usage extension",
                  ValidationErrorKind::CONSTRAINT_VIOLATION, subject);
    }

    static ValidationError keyUsageInvalid(const std::string& subject, const std::string& missingBits) {
        return of("KEY_USAGE_INVALID", subject + " Key Usage lacks " + missingBits,
                  ValidationErrorKind::EXTENSION_INVALID, subject);
    }

    static ValidationError certificateMissing(const std::string& subject) {
        return of("CERTIFICATE_MISSING", subject + " certificate is missing",
                  ValidationErrorKind::STRUCTURE, subject);
    }

    [[nodiscard]] const std::string& getErrorCode() const noexcept { return errorCode_; }
    [[nodiscard]] const std::string& getErrorMessage() const noexcept { return errorMessage_; }
    [[nodiscard]] ValidationErrorKind getKind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& getSubject() const noexcept { return subject_; }

    [[nodiscard]] bool isConstraintViolation() const noexcept {
        return kind_ == ValidationErrorKind::CONSTRAINT_VIOLATION;
    }

    bool operator==(const ValidationError& other) const noexcept {
        return errorCode_ == other.errorCode_ &&
               kind_ == other.kind_ &&
               subject_ == other.subject_;
    }

    [[nodiscard]] std::string toString() const {
        return "[" + model::toString(kind_) + "] " + errorCode_ + ": " + errorMessage_;
    }
};

} // namespace epassport::certificatevalidation::domain::model
