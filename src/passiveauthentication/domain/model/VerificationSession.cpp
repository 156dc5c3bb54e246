#include "passiveauthentication/domain/model/VerificationSession.hpp"
#include "shared/exception/DomainException.hpp"
#include <json/json.h>
#include <algorithm>
#include <set>
#include <memory>

namespace epassport::pa::domain::model {

using shared::exception::DomainException;

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::CREATED:        return "CREATED";
        case SessionState::STARTED:        return "STARTED";
        case SessionState::CHAIN_CHECKED:  return "CHAIN_CHECKED";
        case SessionState::CRL_CHECKED:    return "CRL_CHECKED";
        case SessionState::SOD_CHECKED:    return "SOD_CHECKED";
        case SessionState::HASHES_CHECKED: return "HASHES_CHECKED";
        case SessionState::COMPLETED:      return "COMPLETED";
        default:                           return "UNKNOWN";
    }
}

VerificationSession::VerificationSession(
    VerificationSessionId id,
    SecurityObjectDocument sod,
    std::vector<DataGroup> dataGroups,
    RequestMetadata requestMetadata
) : AggregateRoot(std::move(id)),
    sod_(std::move(sod)),
    dataGroups_(std::move(dataGroups)),
    requestMetadata_(std::move(requestMetadata)) {}

VerificationSession VerificationSession::create(
    SecurityObjectDocument sod,
    std::vector<DataGroup> dataGroups,
    RequestMetadata requestMetadata
) {
    validateCreationParameters(dataGroups);
    return VerificationSession(
        VerificationSessionId::newId(),
        std::move(sod),
        std::move(dataGroups),
        std::move(requestMetadata)
    );
}

void VerificationSession::validateCreationParameters(const std::vector<DataGroup>& dataGroups) {
    if (dataGroups.empty()) {
        throw DomainException(
            "EMPTY_DATA_GROUPS",
            "At least one data group is required"
        );
    }

    std::set<DataGroupNumber> uniqueNumbers;
    for (const auto& dg : dataGroups) {
        if (!uniqueNumbers.insert(dg.getNumber()).second) {
            throw DomainException(
                "DUPLICATE_DATA_GROUP",
                "Duplicate data group number: " + toString(dg.getNumber())
            );
        }
    }
}

// --- State transitions ---

void VerificationSession::ensureNotCompleted(const std::string& action) const {
    if (state_ == SessionState::COMPLETED) {
        throw DomainException(
            "ILLEGAL_STATE_TRANSITION",
            "Cannot " + action + ": session " + id_.getValue() + " is already completed"
        );
    }
}

void VerificationSession::advanceTo(SessionState expectedFrom, SessionState to) {
    ensureNotCompleted("move to " + toString(to));
    if (state_ != expectedFrom) {
        throw DomainException(
            "ILLEGAL_STATE_TRANSITION",
            "Cannot move from " + toString(state_) + " to " + toString(to)
        );
    }
    state_ = to;
}

void VerificationSession::markVerificationStarted() {
    if (startedAt_.has_value()) {
        return;
    }
    ensureNotCompleted("start verification");
    startedAt_ = std::chrono::system_clock::now();
    state_ = SessionState::STARTED;
}

void VerificationSession::markChainChecked() {
    advanceTo(SessionState::STARTED, SessionState::CHAIN_CHECKED);
}

void VerificationSession::markCrlChecked() {
    advanceTo(SessionState::CHAIN_CHECKED, SessionState::CRL_CHECKED);
}

void VerificationSession::markSodChecked() {
    advanceTo(SessionState::CRL_CHECKED, SessionState::SOD_CHECKED);
}

void VerificationSession::markHashesChecked() {
    advanceTo(SessionState::SOD_CHECKED, SessionState::HASHES_CHECKED);
}

void VerificationSession::complete(PassiveAuthenticationStatus status) {
    ensureNotCompleted("complete verification");
    if (!startedAt_.has_value()) {
        startedAt_ = getCreatedAt();
    }

    TimePoint now = std::chrono::system_clock::now();
    completedAt_ = std::max(now, *startedAt_);
    processingDurationMs_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        *completedAt_ - *startedAt_).count();
    verificationStatus_ = status;
    state_ = SessionState::COMPLETED;
    currentStep_.reset();

    registerEvent(std::make_shared<VerificationCompletedEvent>(id_, status));
}

void VerificationSession::recordResult(const PassiveAuthenticationResult& result) {
    ensureNotCompleted("record result");
    result_ = result;
    complete(result.getStatus());
}

void VerificationSession::markVerificationCompleted(PassiveAuthenticationStatus status) {
    complete(status);
}

void VerificationSession::recordError(
    VerificationStep fallbackStep,
    const std::string& code,
    const std::string& message,
    const std::vector<PassiveAuthenticationError>& earlierFindings
) {
    ensureNotCompleted("record error");
    VerificationStep failedStep = currentStep_.value_or(fallbackStep);
    Json::Value details;
    details["code"] = code;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    logStepFailed(failedStep, message, Json::writeString(builder, details));

    std::vector<PassiveAuthenticationError> errors = earlierFindings;
    errors.push_back(PassiveAuthenticationError::critical(code, message));
    recordResult(PassiveAuthenticationResult::error(errors, getDataGroupCount()));
}

// --- Data groups and SOD ---

void VerificationSession::addDataGroup(DataGroup dataGroup) {
    ensureNotCompleted("add data group");
    auto it = std::find_if(dataGroups_.begin(), dataGroups_.end(),
        [&](const DataGroup& dg) { return dg.getNumber() == dataGroup.getNumber(); });
    if (it != dataGroups_.end()) {
        throw DomainException(
            "DUPLICATE_DATA_GROUP",
            "Data group " + toString(dataGroup.getNumber()) + " already exists"
        );
    }
    dataGroups_.push_back(std::move(dataGroup));
}

DataGroup& VerificationSession::findDataGroupForUpdate(DataGroupNumber number) {
    auto it = std::find_if(dataGroups_.begin(), dataGroups_.end(),
        [&](const DataGroup& dg) { return dg.getNumber() == number; });
    if (it == dataGroups_.end()) {
        throw DomainException(
            "DATA_GROUP_NOT_FOUND",
            "Data group " + toString(number) + " is not part of this session"
        );
    }
    return *it;
}

bool VerificationSession::recordDataGroupHash(
    DataGroupNumber number,
    const DataGroupHash& expectedHash,
    const DataGroupHash& actualHash
) {
    ensureNotCompleted("record data group hash");
    DataGroup& dg = findDataGroupForUpdate(number);
    dg.setExpectedHash(expectedHash);
    dg.setActualHash(actualHash);
    return dg.verifyHash();
}

void VerificationSession::recordDataGroupHashMissing(DataGroupNumber number) {
    ensureNotCompleted("record data group hash");
    findDataGroupForUpdate(number).markExpectedHashMissing();
}

void VerificationSession::recordSodAlgorithms(
    const std::string& hashAlgorithm,
    const std::string& signatureAlgorithm
) {
    ensureNotCompleted("record SOD algorithms");
    sod_.setHashAlgorithm(hashAlgorithm);
    sod_.setSignatureAlgorithm(signatureAlgorithm);
}

// --- Audit log ---

void VerificationSession::logStepStarted(VerificationStep step, const std::string& message) {
    auditLog_.push_back(AuditLogEntry::stepStarted(id_, step, message));
    currentStep_ = step;
}

void VerificationSession::logStepInProgress(
    VerificationStep step,
    const std::string& message,
    const std::string& details
) {
    auditLog_.push_back(AuditLogEntry::stepInProgress(id_, step, message, details));
}

void VerificationSession::logStepCompleted(
    VerificationStep step,
    const std::string& message,
    int64_t executionTimeMs
) {
    auditLog_.push_back(AuditLogEntry::stepCompleted(id_, step, message, executionTimeMs));
    if (currentStep_ == step) {
        currentStep_.reset();
    }
}

void VerificationSession::logStepFailed(
    VerificationStep step,
    const std::string& message,
    const std::string& details
) {
    auditLog_.push_back(AuditLogEntry::stepFailed(id_, step, message, details));
    if (currentStep_ == step) {
        currentStep_.reset();
    }
}

void VerificationSession::logEntry(
    VerificationStep step,
    StepStatus status,
    LogLevel level,
    const std::string& message,
    const std::optional<std::string>& details
) {
    auditLog_.push_back(AuditLogEntry::of(id_, step, status, level, message, details));
    if ((status == StepStatus::COMPLETED || status == StepStatus::FAILED) && currentStep_ == step) {
        currentStep_.reset();
    }
}

void VerificationSession::backfillExecutionTime(VerificationStep step, int64_t executionTimeMs) {
    auto it = std::find_if(auditLog_.rbegin(), auditLog_.rend(),
        [step](const AuditLogEntry& e) { return e.getStep() == step; });
    if (it == auditLog_.rend()) {
        throw DomainException(
            "AUDIT_ENTRY_NOT_FOUND",
            "No audit entry for step " + toString(step)
        );
    }
    it->setExecutionTime(executionTimeMs);
}

// --- Accessors ---

std::optional<DataGroup> VerificationSession::getDataGroup(DataGroupNumber number) const {
    for (const auto& dg : dataGroups_) {
        if (dg.getNumber() == number) {
            return dg;
        }
    }
    return std::nullopt;
}

int VerificationSession::getValidDataGroupCount() const {
    return static_cast<int>(std::count_if(dataGroups_.begin(), dataGroups_.end(),
        [](const DataGroup& dg) { return dg.isValid(); }));
}

int VerificationSession::getInvalidDataGroupCount() const {
    return getDataGroupCount() - getValidDataGroupCount();
}

bool VerificationSession::allDataGroupsValid() const {
    if (dataGroups_.empty()) {
        return false;
    }
    return std::all_of(dataGroups_.begin(), dataGroups_.end(),
        [](const DataGroup& dg) { return dg.isValid(); });
}

std::optional<double> VerificationSession::getProcessingDurationInSeconds() const {
    if (!processingDurationMs_.has_value()) {
        return std::nullopt;
    }
    return static_cast<double>(*processingDurationMs_) / 1000.0;
}

std::vector<PassiveAuthenticationError> VerificationSession::getVerificationErrors() const {
    if (!result_.has_value()) {
        return {};
    }
    return result_->getErrors();
}

std::vector<PassiveAuthenticationError> VerificationSession::getCriticalErrors() const {
    if (!result_.has_value()) {
        return {};
    }
    return result_->getCriticalErrors();
}

} // namespace epassport::pa::domain::model
