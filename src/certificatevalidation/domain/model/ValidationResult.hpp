/**
 * @file ValidationResult.hpp
 * @brief Value Object for certificate validation result
 */

#pragma once

#include "CertificateStatus.hpp"
#include "ValidationError.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace epassport::certificatevalidation::domain::model {

/**
 * @brief Certificate validation result Value Object
 *
 * Holds every failed sub-check of a validation run. Individual check
 * flags are derived from the kinds of the accumulated errors, so a result
 * is VALID exactly when no error was recorded.
 */
class ValidationResult {
private:
    std::vector<ValidationError> errors_;
    long validationDurationMillis_ = 0;

    bool hasKind(ValidationErrorKind kind) const {
        return std::any_of(errors_.begin(), errors_.end(),
            [kind](const ValidationError& e) { return e.getKind() == kind; });
    }

    bool hasCode(const std::string& code) const {
        return std::any_of(errors_.begin(), errors_.end(),
            [&code](const ValidationError& e) { return e.getErrorCode() == code; });
    }

public:
    ValidationResult() = default;

    static ValidationResult of(std::vector<ValidationError> errors, long durationMillis = 0) {
        ValidationResult result;
        result.errors_ = std::move(errors);
        result.validationDurationMillis_ = durationMillis < 0 ? 0 : durationMillis;
        return result;
    }

    static ValidationResult valid(long durationMillis = 0) {
        return of({}, durationMillis);
    }

    /**
     * @brief Combine two results; errors keep their order
     */
    [[nodiscard]] ValidationResult merge(const ValidationResult& other) const {
        std::vector<ValidationError> errors = errors_;
        errors.insert(errors.end(), other.errors_.begin(), other.errors_.end());
        return of(std::move(errors), validationDurationMillis_ + other.validationDurationMillis_);
    }

    [[nodiscard]] const std::vector<ValidationError>& getErrors() const noexcept { return errors_; }
    [[nodiscard]] long getValidationDurationMillis() const noexcept { return validationDurationMillis_; }

    [[nodiscard]] bool isValid() const noexcept { return errors_.empty(); }
    [[nodiscard]] bool isSignatureValid() const { return !hasKind(ValidationErrorKind::SIGNATURE); }
    [[nodiscard]] bool isChainValid() const { return !hasKind(ValidationErrorKind::ISSUER); }
    [[nodiscard]] bool isValidityValid() const { return !hasKind(ValidationErrorKind::VALIDITY); }

    [[nodiscard]] bool isConstraintsValid() const {
        return !hasKind(ValidationErrorKind::CONSTRAINT_VIOLATION) &&
               !hasKind(ValidationErrorKind::EXTENSION_INVALID);
    }

    [[nodiscard]] bool hasConstraintViolation() const {
        return hasKind(ValidationErrorKind::CONSTRAINT_VIOLATION);
    }

    [[nodiscard]] bool hasError(const std::string& code) const { return hasCode(code); }

    [[nodiscard]] CertificateStatus getOverallStatus() const {
        if (errors_.empty()) {
            return CertificateStatus::VALID;
        }
        // Validity outcome is reported only when it is the sole failure kind
        bool onlyValidity = std::all_of(errors_.begin(), errors_.end(),
            [](const ValidationError& e) { return e.getKind() == ValidationErrorKind::VALIDITY; });
        if (onlyValidity && hasCode("CERTIFICATE_EXPIRED")) {
            return CertificateStatus::EXPIRED;
        }
        if (onlyValidity && hasCode("CERTIFICATE_NOT_YET_VALID")) {
            return CertificateStatus::NOT_YET_VALID;
        }
        return CertificateStatus::INVALID;
    }

    /**
     * @brief Error messages joined with "; "
     */
    [[nodiscard]] std::string getSummary() const {
        if (errors_.empty()) {
            return "VALID";
        }
        std::string summary;
        for (const auto& e : errors_) {
            if (!summary.empty()) {
                summary += "; ";
            }
            summary += e.getErrorMessage();
        }
        return summary;
    }
};

} // namespace epassport::certificatevalidation::domain::model
