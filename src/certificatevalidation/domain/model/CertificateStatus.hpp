#pragma once

#include <string>

namespace epassport::certificatevalidation::domain::model {

/**
 * Overall standing of a validated chain. Time checks are reported
 * separately from structural ones so callers can tell an expired DSC
 * from a forged one; revocation lives in CrlCheckStatus.
 */
enum class CertificateStatus {
    VALID,
    EXPIRED,
    NOT_YET_VALID,
    INVALID         // signature, issuer or extension failure
};

inline std::string toString(CertificateStatus status) {
    switch (status) {
        case CertificateStatus::VALID:         return "VALID";
        case CertificateStatus::EXPIRED:       return "EXPIRED";
        case CertificateStatus::NOT_YET_VALID: return "NOT_YET_VALID";
        case CertificateStatus::INVALID:       return "INVALID";
    }
    return "UNKNOWN";
}

} // namespace epassport::certificatevalidation::domain::model
