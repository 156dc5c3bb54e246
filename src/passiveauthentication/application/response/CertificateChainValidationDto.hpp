#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace epassport::pa::application::response {

/**
 * Chain outcome together with the DSC revocation check. The revocation
 * fields are only meaningful when revoked is set.
 */
struct CertificateChainValidationDto {
    bool valid = false;
    std::string crlStatus;
    std::string crlStatusDescription;
    std::string crlStatusSeverity;
    std::optional<std::string> crlMessage;

    bool revoked = false;
    std::optional<int> revocationReason;
    std::string revocationReasonText;
    std::optional<std::chrono::system_clock::time_point> revocationDate;
};

} // namespace epassport::pa::application::response
