#pragma once

#include "PassiveAuthenticationStatus.hpp"
#include "PassiveAuthenticationError.hpp"
#include "CrlCheckResult.hpp"
#include <algorithm>
#include <iterator>
#include <vector>

namespace epassport::pa::domain::model {

/**
 * Immutable outcome of one Passive Authentication run: the verdict, the
 * step flags it was derived from, and every finding raised on the way.
 */
class PassiveAuthenticationResult {
private:
    PassiveAuthenticationStatus status_ = PassiveAuthenticationStatus::ERROR;
    bool certificateChainValid_ = false;
    bool sodSignatureValid_ = false;
    CrlCheckResult crlCheckResult_;
    int totalDataGroups_ = 0;
    int validDataGroups_ = 0;
    std::vector<PassiveAuthenticationError> errors_;

    PassiveAuthenticationResult() = default;

    PassiveAuthenticationResult(PassiveAuthenticationStatus status, bool chainValid, CrlCheckResult crl,
                                bool sodValid, int total, int valid,
                                std::vector<PassiveAuthenticationError> errors)
        : status_(status), certificateChainValid_(chainValid), sodSignatureValid_(sodValid),
          crlCheckResult_(std::move(crl)), totalDataGroups_(total), validDataGroups_(valid),
          errors_(std::move(errors)) {}

public:
    /**
     * Derive the verdict from the step outcomes. VALID needs a valid chain,
     * a valid signature, at least one data group with none failing, and a
     * CRL check that is VALID or CRL_UNAVAILABLE.
     */
    static PassiveAuthenticationResult withStatistics(
        bool certificateChainValid,
        const CrlCheckResult& crlCheckResult,
        bool sodSignatureValid,
        int totalDataGroups,
        int validDataGroups,
        const std::vector<PassiveAuthenticationError>& errors
    ) {
        const CrlCheckStatus crl = crlCheckResult.getStatus();
        const bool crlOk = crl == CrlCheckStatus::VALID || crl == CrlCheckStatus::CRL_UNAVAILABLE;
        const bool groupsOk = totalDataGroups > 0 && validDataGroups == totalDataGroups;

        const auto status = (certificateChainValid && crlOk && sodSignatureValid && groupsOk)
            ? PassiveAuthenticationStatus::VALID
            : PassiveAuthenticationStatus::INVALID;
        return PassiveAuthenticationResult(status, certificateChainValid, crlCheckResult,
                                           sodSignatureValid, totalDataGroups, validDataGroups, errors);
    }

    /// The run could not complete; no group counts as verified.
    static PassiveAuthenticationResult error(const std::vector<PassiveAuthenticationError>& errors,
                                             int totalDataGroups = 0) {
        PassiveAuthenticationResult result;
        result.totalDataGroups_ = totalDataGroups;
        result.errors_ = errors;
        return result;
    }

    /// Rehydrate a stored result; the status is taken as stored.
    static PassiveAuthenticationResult restore(
        PassiveAuthenticationStatus status,
        bool certificateChainValid,
        const CrlCheckResult& crlCheckResult,
        bool sodSignatureValid,
        int totalDataGroups,
        int validDataGroups,
        const std::vector<PassiveAuthenticationError>& errors
    ) {
        return PassiveAuthenticationResult(status, certificateChainValid, crlCheckResult,
                                           sodSignatureValid, totalDataGroups, validDataGroups, errors);
    }

    PassiveAuthenticationStatus getStatus() const { return status_; }
    bool isValid() const { return status_ == PassiveAuthenticationStatus::VALID; }
    bool isInvalid() const { return status_ == PassiveAuthenticationStatus::INVALID; }
    bool isError() const { return status_ == PassiveAuthenticationStatus::ERROR; }

    bool isCertificateChainValid() const { return certificateChainValid_; }
    bool isSodSignatureValid() const { return sodSignatureValid_; }
    const CrlCheckResult& getCrlCheckResult() const { return crlCheckResult_; }

    int getTotalDataGroups() const { return totalDataGroups_; }
    int getValidDataGroups() const { return validDataGroups_; }
    int getInvalidDataGroups() const { return totalDataGroups_ - validDataGroups_; }

    const std::vector<PassiveAuthenticationError>& getErrors() const { return errors_; }

    std::vector<PassiveAuthenticationError> getCriticalErrors() const {
        std::vector<PassiveAuthenticationError> critical;
        std::copy_if(errors_.begin(), errors_.end(), std::back_inserter(critical),
                     [](const PassiveAuthenticationError& e) { return e.isCritical(); });
        return critical;
    }
};

} // namespace epassport::pa::domain::model
