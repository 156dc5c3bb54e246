#pragma once

#include "shared/exception/DomainException.hpp"
#include <string>

namespace epassport::pa::domain::model {

/**
 * Outcome of checking the DSC against its issuer's CRL.
 *
 * REVOKED, CRL_EXPIRED and CRL_INVALID fail the verification;
 * CRL_UNAVAILABLE only produces a warning.
 */
enum class CrlCheckStatus {
    VALID,
    REVOKED,
    CRL_UNAVAILABLE,
    CRL_EXPIRED,     // outside thisUpdate/nextUpdate, in either direction
    CRL_INVALID,     // malformed, or not signed by the CSCA
    NOT_CHECKED
};

namespace detail {

struct CrlStatusInfo {
    CrlCheckStatus status;
    const char* name;
    const char* severity;
    const char* description;
};

inline const CrlStatusInfo* crlStatusTable() {
    static const CrlStatusInfo table[] = {
        {CrlCheckStatus::VALID,           "VALID",           "SUCCESS", "Certificate is not on the CRL"},
        {CrlCheckStatus::REVOKED,         "REVOKED",         "FAILURE", "Certificate has been revoked"},
        {CrlCheckStatus::CRL_UNAVAILABLE, "CRL_UNAVAILABLE", "WARNING", "No CRL found for the issuing CSCA"},
        {CrlCheckStatus::CRL_EXPIRED,     "CRL_EXPIRED",     "FAILURE", "CRL is outside its validity period"},
        {CrlCheckStatus::CRL_INVALID,     "CRL_INVALID",     "FAILURE", "CRL could not be verified"},
        {CrlCheckStatus::NOT_CHECKED,     "NOT_CHECKED",     "INFO",    "CRL was not checked"},
    };
    return table;
}

inline const CrlStatusInfo& crlStatusInfo(CrlCheckStatus status) {
    const CrlStatusInfo* table = crlStatusTable();
    for (int i = 0; i < 6; ++i) {
        if (table[i].status == status) return table[i];
    }
    return table[5];
}

} // namespace detail

inline std::string toString(CrlCheckStatus status) {
    return detail::crlStatusInfo(status).name;
}

/// @throws DomainException INVALID_CRL_STATUS
inline CrlCheckStatus crlCheckStatusFromString(const std::string& str) {
    const detail::CrlStatusInfo* table = detail::crlStatusTable();
    for (int i = 0; i < 6; ++i) {
        if (str == table[i].name) return table[i].status;
    }
    throw shared::exception::DomainException("INVALID_CRL_STATUS", "Unknown CRL check status: " + str);
}

inline std::string getStatusDescription(CrlCheckStatus status) {
    return detail::crlStatusInfo(status).description;
}

/// SUCCESS, FAILURE, WARNING or INFO
inline std::string getStatusSeverity(CrlCheckStatus status) {
    return detail::crlStatusInfo(status).severity;
}

} // namespace epassport::pa::domain::model
