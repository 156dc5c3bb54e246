#pragma once

#include "CertificateChainValidationDto.hpp"
#include "SodSignatureValidationDto.hpp"
#include "DataGroupValidationDto.hpp"
#include "passiveauthentication/domain/model/PassiveAuthenticationStatus.hpp"
#include "passiveauthentication/domain/model/PassiveAuthenticationError.hpp"
#include "passiveauthentication/domain/model/VerificationRecord.hpp"
#include <json/json.h>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace epassport::pa::application::response {

/**
 * Response for Passive Authentication verification.
 *
 * Built from a stored VerificationRecord, so a fresh verification and a
 * history lookup render the same way.
 */
class PassiveAuthenticationResponse {
private:
    domain::model::PassiveAuthenticationStatus status_ = domain::model::PassiveAuthenticationStatus::ERROR;
    std::string verificationId_;
    std::chrono::system_clock::time_point verificationTimestamp_;
    std::optional<std::chrono::system_clock::time_point> completedAt_;
    std::optional<CertificateChainValidationDto> certificateChainValidation_;
    std::optional<SodSignatureValidationDto> sodSignatureValidation_;
    DataGroupValidationDto dataGroupValidation_;
    std::optional<int64_t> processingDurationMs_;
    std::vector<domain::model::PassiveAuthenticationError> errors_;

    PassiveAuthenticationResponse() = default;

public:
    static PassiveAuthenticationResponse from(const domain::model::VerificationRecord& record);

    domain::model::PassiveAuthenticationStatus getStatus() const { return status_; }
    const std::string& getVerificationId() const { return verificationId_; }
    const std::chrono::system_clock::time_point& getVerificationTimestamp() const { return verificationTimestamp_; }
    const std::optional<std::chrono::system_clock::time_point>& getCompletedAt() const { return completedAt_; }
    const std::optional<CertificateChainValidationDto>& getCertificateChainValidation() const { return certificateChainValidation_; }
    const std::optional<SodSignatureValidationDto>& getSodSignatureValidation() const { return sodSignatureValidation_; }
    const DataGroupValidationDto& getDataGroupValidation() const { return dataGroupValidation_; }
    const std::optional<int64_t>& getProcessingDurationMs() const { return processingDurationMs_; }
    const std::vector<domain::model::PassiveAuthenticationError>& getErrors() const { return errors_; }

    bool isValid() const { return status_ == domain::model::PassiveAuthenticationStatus::VALID; }
    bool isInvalid() const { return status_ == domain::model::PassiveAuthenticationStatus::INVALID; }
    bool isError() const { return status_ == domain::model::PassiveAuthenticationStatus::ERROR; }

    Json::Value toJson() const;

    /**
     * @param indentation "" for a single line
     */
    std::string toJsonString(const std::string& indentation = "  ") const;
};

} // namespace epassport::pa::application::response
