#pragma once

#include "CrlCheckStatus.hpp"
#include "shared/exception/DomainException.hpp"
#include <string>
#include <optional>
#include <chrono>

namespace epassport::pa::domain::model {

/**
 * Result of CRL (Certificate Revocation List) check.
 *
 * revocationDate and revocationReason are present if and only if the
 * status is REVOKED. Any other combination is rejected at construction.
 */
class CrlCheckResult {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /// RFC 5280 CRLReason range
    static constexpr int MIN_REASON_CODE = 0;
    static constexpr int MAX_REASON_CODE = 10;
    static constexpr int REASON_UNSPECIFIED = 0;

private:
    CrlCheckStatus status_;
    std::optional<TimePoint> revocationDate_;
    std::optional<int> revocationReason_;
    std::optional<std::string> message_;

    CrlCheckResult(
        CrlCheckStatus status,
        std::optional<TimePoint> revocationDate,
        std::optional<int> revocationReason,
        std::optional<std::string> message
    ) : status_(status),
        revocationDate_(std::move(revocationDate)),
        revocationReason_(revocationReason),
        message_(std::move(message)) {
        validate();
    }

    void validate() const {
        if (status_ == CrlCheckStatus::REVOKED) {
            if (!revocationDate_.has_value()) {
                throw shared::exception::DomainException(
                    "REVOCATION_DATE_REQUIRED",
                    "Revocation date is required for REVOKED status"
                );
            }
            if (!revocationReason_.has_value()) {
                throw shared::exception::DomainException(
                    "INVALID_REVOCATION_REASON",
                    "Revocation reason is required for REVOKED status"
                );
            }
            int reason = revocationReason_.value();
            if (reason < MIN_REASON_CODE || reason > MAX_REASON_CODE) {
                throw shared::exception::DomainException(
                    "INVALID_REVOCATION_REASON",
                    "Revocation reason must be between 0 and 10. Got: " + std::to_string(reason)
                );
            }
        } else if (revocationDate_.has_value() || revocationReason_.has_value()) {
            throw shared::exception::DomainException(
                "INVALID_CRL_CHECK_RESULT",
                "Revocation date and reason are only allowed for REVOKED status, got " +
                    toString(status_)
            );
        }
    }

public:
    CrlCheckResult() : status_(CrlCheckStatus::NOT_CHECKED) {}

    /**
     * Certificate not revoked.
     */
    static CrlCheckResult valid() {
        return CrlCheckResult(CrlCheckStatus::VALID, std::nullopt, std::nullopt, std::nullopt);
    }

    /**
     * Certificate revoked.
     *
     * @throws DomainException REVOCATION_DATE_REQUIRED if date is empty,
     *         INVALID_REVOCATION_REASON if reason is outside 0..10
     */
    static CrlCheckResult revoked(const std::optional<TimePoint>& revocationDate, int reason) {
        return CrlCheckResult(CrlCheckStatus::REVOKED, revocationDate, reason, std::nullopt);
    }

    static CrlCheckResult unavailable(const std::string& message) {
        return CrlCheckResult(CrlCheckStatus::CRL_UNAVAILABLE, std::nullopt, std::nullopt, message);
    }

    static CrlCheckResult expired(const std::string& message) {
        return CrlCheckResult(CrlCheckStatus::CRL_EXPIRED, std::nullopt, std::nullopt, message);
    }

    static CrlCheckResult invalid(const std::string& message) {
        return CrlCheckResult(CrlCheckStatus::CRL_INVALID, std::nullopt, std::nullopt, message);
    }

    static CrlCheckResult notChecked() {
        return CrlCheckResult();
    }

    /**
     * Rebuild a persisted result. The same field rules apply.
     */
    static CrlCheckResult restore(
        CrlCheckStatus status,
        const std::optional<TimePoint>& revocationDate,
        const std::optional<int>& revocationReason,
        const std::optional<std::string>& message
    ) {
        return CrlCheckResult(status, revocationDate, revocationReason, message);
    }

    CrlCheckStatus getStatus() const { return status_; }
    const std::optional<TimePoint>& getRevocationDate() const { return revocationDate_; }
    const std::optional<int>& getRevocationReason() const { return revocationReason_; }
    const std::optional<std::string>& getMessage() const { return message_; }

    std::string getStatusDescription() const {
        return model::getStatusDescription(status_);
    }

    std::string getStatusSeverity() const {
        return model::getStatusSeverity(status_);
    }

    /**
     * Get revocation reason as text, empty if not revoked.
     */
    std::string getRevocationReasonText() const {
        if (!revocationReason_.has_value()) {
            return "";
        }
        return reasonText(revocationReason_.value());
    }

    /**
     * RFC 5280 CRLReason display text. Value 7 is unassigned.
     */
    static std::string reasonText(int reason) {
        switch (reason) {
            case 0: return "Unspecified";
            case 1: return "Key Compromise";
            case 2: return "CA Compromise";
            case 3: return "Affiliation Changed";
            case 4: return "Superseded";
            case 5: return "Cessation of Operation";
            case 6: return "Certificate Hold";
            case 8: return "Remove from CRL";
            case 9: return "Privilege Withdrawn";
            case 10: return "AA Compromise";
            default: return "Unknown (" + std::to_string(reason) + ")";
        }
    }

    bool isCertificateRevoked() const {
        return status_ == CrlCheckStatus::REVOKED;
    }

    bool isValid() const {
        return status_ == CrlCheckStatus::VALID;
    }

    bool hasCrlVerificationFailed() const {
        return status_ == CrlCheckStatus::CRL_INVALID ||
               status_ == CrlCheckStatus::CRL_UNAVAILABLE ||
               status_ == CrlCheckStatus::CRL_EXPIRED;
    }
};

} // namespace epassport::pa::domain::model
