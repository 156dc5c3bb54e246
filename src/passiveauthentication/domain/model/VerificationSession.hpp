#pragma once

#include "VerificationSessionId.hpp"
#include "SecurityObjectDocument.hpp"
#include "DataGroup.hpp"
#include "DataGroupNumber.hpp"
#include "DataGroupHash.hpp"
#include "RequestMetadata.hpp"
#include "PassiveAuthenticationResult.hpp"
#include "PassiveAuthenticationStatus.hpp"
#include "AuditLogEntry.hpp"
#include "shared/domain/AggregateRoot.hpp"
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <string>

namespace epassport::pa::domain::model {

/**
 * Progress of a verification session. Steps advance strictly in order;
 * COMPLETED is terminal and may be reached from any earlier state.
 */
enum class SessionState {
    CREATED,
    STARTED,
    CHAIN_CHECKED,
    CRL_CHECKED,
    SOD_CHECKED,
    HASHES_CHECKED,
    COMPLETED
};

std::string toString(SessionState state);

/**
 * Raised once when a session reaches its terminal state.
 */
class VerificationCompletedEvent : public shared::domain::DomainEvent {
private:
    VerificationSessionId sessionId_;
    PassiveAuthenticationStatus status_;

public:
    VerificationCompletedEvent(VerificationSessionId sessionId, PassiveAuthenticationStatus status)
        : DomainEvent("VerificationCompleted"),
          sessionId_(std::move(sessionId)),
          status_(status) {}

    const VerificationSessionId& getSessionId() const { return sessionId_; }
    PassiveAuthenticationStatus getStatus() const { return status_; }
};

/**
 * Verification Session Aggregate Root.
 *
 * Owns one Passive Authentication attempt: the SOD, the supplied data
 * groups, the request metadata, the verdict and the append-only audit log.
 *
 * Lifecycle: create() -> markVerificationStarted() -> step marks ->
 * recordResult() / markVerificationCompleted() / recordError().
 * Exactly one terminal transition is allowed; a second one throws
 * ILLEGAL_STATE_TRANSITION.
 */
class VerificationSession : public shared::domain::AggregateRoot<VerificationSessionId> {
public:
    using TimePoint = std::chrono::system_clock::time_point;

private:
    SecurityObjectDocument sod_;
    std::vector<DataGroup> dataGroups_;
    RequestMetadata requestMetadata_;
    SessionState state_ = SessionState::CREATED;
    std::optional<TimePoint> startedAt_;
    std::optional<TimePoint> completedAt_;
    std::optional<int64_t> processingDurationMs_;
    PassiveAuthenticationStatus verificationStatus_ = PassiveAuthenticationStatus::VALID;
    std::optional<PassiveAuthenticationResult> result_;
    std::vector<AuditLogEntry> auditLog_;
    std::optional<VerificationStep> currentStep_;

    VerificationSession(
        VerificationSessionId id,
        SecurityObjectDocument sod,
        std::vector<DataGroup> dataGroups,
        RequestMetadata requestMetadata
    );

    static void validateCreationParameters(const std::vector<DataGroup>& dataGroups);

    void ensureNotCompleted(const std::string& action) const;
    void advanceTo(SessionState expectedFrom, SessionState to);
    void complete(PassiveAuthenticationStatus status);
    DataGroup& findDataGroupForUpdate(DataGroupNumber number);

public:
    /**
     * Create a new session in CREATED state with optimistic VALID status.
     *
     * @throws DomainException EMPTY_DATA_GROUPS, DUPLICATE_DATA_GROUP
     */
    static VerificationSession create(
        SecurityObjectDocument sod,
        std::vector<DataGroup> dataGroups,
        RequestMetadata requestMetadata
    );

    VerificationSession(VerificationSession&&) noexcept = default;
    VerificationSession& operator=(VerificationSession&&) noexcept = default;

    /// @name State transitions
    /// @{

    /**
     * Record start time. No-op if already started.
     */
    void markVerificationStarted();

    void markChainChecked();
    void markCrlChecked();
    void markSodChecked();
    void markHashesChecked();

    /**
     * Record final result: status, completedAt and duration, exactly once.
     */
    void recordResult(const PassiveAuthenticationResult& result);

    /**
     * Terminal transition without a detailed result.
     */
    void markVerificationCompleted(PassiveAuthenticationStatus status);

    /**
     * Terminal ERROR transition: writes a FAILED audit entry for the step in
     * progress (or the given fallback step) and records an ERROR result.
     * Findings raised before the failure come first in the result, followed
     * by the critical error itself.
     */
    void recordError(
        VerificationStep fallbackStep,
        const std::string& code,
        const std::string& message,
        const std::vector<PassiveAuthenticationError>& earlierFindings = {}
    );

    /// @}

    /// @name Data groups and SOD
    /// @{

    /**
     * @throws DomainException DUPLICATE_DATA_GROUP leaving the list unchanged
     */
    void addDataGroup(DataGroup dataGroup);

    /**
     * Apply a hash comparison to one data group. Write-once per group.
     *
     * @return true if the hashes match
     */
    bool recordDataGroupHash(
        DataGroupNumber number,
        const DataGroupHash& expectedHash,
        const DataGroupHash& actualHash
    );

    /**
     * Mark a data group invalid because the SOD carries no hash for it.
     */
    void recordDataGroupHashMissing(DataGroupNumber number);

    void recordSodAlgorithms(const std::string& hashAlgorithm, const std::string& signatureAlgorithm);

    /// @}

    /// @name Audit log (append-only)
    /// @{

    void logStepStarted(VerificationStep step, const std::string& message);
    void logStepInProgress(VerificationStep step, const std::string& message, const std::string& details);
    void logStepCompleted(VerificationStep step, const std::string& message, int64_t executionTimeMs);
    void logStepFailed(VerificationStep step, const std::string& message, const std::string& details);
    void logEntry(VerificationStep step, StepStatus status, LogLevel level,
                  const std::string& message, const std::optional<std::string>& details);

    /**
     * Backfill execution time on the latest entry of a step.
     *
     * @throws DomainException AUDIT_ENTRY_NOT_FOUND, EXECUTION_TIME_ALREADY_SET
     */
    void backfillExecutionTime(VerificationStep step, int64_t executionTimeMs);

    const std::vector<AuditLogEntry>& getAuditLog() const { return auditLog_; }

    /// @}

    /// @name Accessors
    /// @{

    const SecurityObjectDocument& getSod() const { return sod_; }
    const std::vector<DataGroup>& getDataGroups() const { return dataGroups_; }
    std::optional<DataGroup> getDataGroup(DataGroupNumber number) const;
    const RequestMetadata& getRequestMetadata() const { return requestMetadata_; }
    SessionState getState() const { return state_; }
    const std::optional<TimePoint>& getStartedAt() const { return startedAt_; }
    const std::optional<TimePoint>& getCompletedAt() const { return completedAt_; }
    PassiveAuthenticationStatus getVerificationStatus() const { return verificationStatus_; }
    const std::optional<PassiveAuthenticationResult>& getResult() const { return result_; }
    const std::optional<VerificationStep>& getCurrentStep() const { return currentStep_; }

    int getDataGroupCount() const { return static_cast<int>(dataGroups_.size()); }
    int getValidDataGroupCount() const;
    int getInvalidDataGroupCount() const;
    bool allDataGroupsValid() const;

    bool isStarted() const { return startedAt_.has_value(); }
    bool isCompleted() const { return state_ == SessionState::COMPLETED; }
    bool isInProgress() const { return !isCompleted(); }
    bool isValid() const { return verificationStatus_ == PassiveAuthenticationStatus::VALID; }
    bool isInvalid() const { return verificationStatus_ == PassiveAuthenticationStatus::INVALID; }
    bool isError() const { return verificationStatus_ == PassiveAuthenticationStatus::ERROR; }

    const std::optional<int64_t>& getProcessingDurationMs() const { return processingDurationMs_; }
    std::optional<double> getProcessingDurationInSeconds() const;

    std::vector<PassiveAuthenticationError> getVerificationErrors() const;
    std::vector<PassiveAuthenticationError> getCriticalErrors() const;

    /// @}
};

} // namespace epassport::pa::domain::model
