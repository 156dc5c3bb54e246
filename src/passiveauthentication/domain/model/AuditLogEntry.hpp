#pragma once

#include "VerificationSessionId.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/UuidUtil.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>

namespace epassport::pa::domain::model {

/**
 * Steps of the Passive Authentication pipeline recorded in the audit log.
 */
enum class VerificationStep {
    VERIFICATION_STARTED,
    CERTIFICATE_CHAIN,
    SOD_SIGNATURE,
    DATA_GROUP_HASH,
    VERIFICATION_COMPLETED
};

enum class StepStatus {
    STARTED,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

inline std::string toString(VerificationStep step) {
    switch (step) {
        case VerificationStep::VERIFICATION_STARTED:   return "VERIFICATION_STARTED";
        case VerificationStep::CERTIFICATE_CHAIN:      return "CERTIFICATE_CHAIN";
        case VerificationStep::SOD_SIGNATURE:          return "SOD_SIGNATURE";
        case VerificationStep::DATA_GROUP_HASH:        return "DATA_GROUP_HASH";
        case VerificationStep::VERIFICATION_COMPLETED: return "VERIFICATION_COMPLETED";
        default:                                       return "UNKNOWN";
    }
}

inline std::string toString(StepStatus status) {
    switch (status) {
        case StepStatus::STARTED:     return "STARTED";
        case StepStatus::IN_PROGRESS: return "IN_PROGRESS";
        case StepStatus::COMPLETED:   return "COMPLETED";
        case StepStatus::FAILED:      return "FAILED";
        default:                      return "UNKNOWN";
    }
}

inline std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

inline VerificationStep verificationStepFromString(const std::string& str) {
    if (str == "VERIFICATION_STARTED") return VerificationStep::VERIFICATION_STARTED;
    if (str == "CERTIFICATE_CHAIN") return VerificationStep::CERTIFICATE_CHAIN;
    if (str == "SOD_SIGNATURE") return VerificationStep::SOD_SIGNATURE;
    if (str == "DATA_GROUP_HASH") return VerificationStep::DATA_GROUP_HASH;
    if (str == "VERIFICATION_COMPLETED") return VerificationStep::VERIFICATION_COMPLETED;
    throw shared::exception::DomainException("INVALID_AUDIT_STEP", "Unknown audit step: " + str);
}

inline StepStatus stepStatusFromString(const std::string& str) {
    if (str == "STARTED") return StepStatus::STARTED;
    if (str == "IN_PROGRESS") return StepStatus::IN_PROGRESS;
    if (str == "COMPLETED") return StepStatus::COMPLETED;
    if (str == "FAILED") return StepStatus::FAILED;
    throw shared::exception::DomainException("INVALID_STEP_STATUS", "Unknown step status: " + str);
}

inline LogLevel logLevelFromString(const std::string& str) {
    if (str == "DEBUG") return LogLevel::DEBUG;
    if (str == "INFO") return LogLevel::INFO;
    if (str == "WARN") return LogLevel::WARN;
    if (str == "ERROR") return LogLevel::ERROR;
    throw shared::exception::DomainException("INVALID_LOG_LEVEL", "Unknown log level: " + str);
}

/**
 * One audit log entry of a verification session.
 *
 * Created by a named factory per step transition and never edited
 * afterwards, except for a single execution-time backfill.
 */
class AuditLogEntry {
public:
    using TimePoint = std::chrono::system_clock::time_point;

private:
    std::string id_;
    VerificationSessionId sessionId_;
    VerificationStep step_;
    StepStatus stepStatus_;
    TimePoint timestamp_;
    LogLevel logLevel_;
    std::string message_;
    std::optional<std::string> details_;
    std::optional<int64_t> executionTimeMs_;

    AuditLogEntry(
        std::string id,
        VerificationSessionId sessionId,
        VerificationStep step,
        StepStatus stepStatus,
        TimePoint timestamp,
        LogLevel logLevel,
        std::string message,
        std::optional<std::string> details,
        std::optional<int64_t> executionTimeMs
    ) : id_(std::move(id)),
        sessionId_(std::move(sessionId)),
        step_(step),
        stepStatus_(stepStatus),
        timestamp_(timestamp),
        logLevel_(logLevel),
        message_(std::move(message)),
        details_(std::move(details)),
        executionTimeMs_(executionTimeMs) {}

    static AuditLogEntry create(
        const VerificationSessionId& sessionId,
        VerificationStep step,
        StepStatus stepStatus,
        LogLevel logLevel,
        const std::string& message,
        std::optional<std::string> details,
        std::optional<int64_t> executionTimeMs
    ) {
        return AuditLogEntry(
            shared::util::UuidUtil::generate(),
            sessionId,
            step,
            stepStatus,
            std::chrono::system_clock::now(),
            logLevel,
            message,
            std::move(details),
            executionTimeMs
        );
    }

public:
    static AuditLogEntry stepStarted(
        const VerificationSessionId& sessionId,
        VerificationStep step,
        const std::string& message
    ) {
        return create(sessionId, step, StepStatus::STARTED, LogLevel::INFO, message, std::nullopt, std::nullopt);
    }

    static AuditLogEntry stepInProgress(
        const VerificationSessionId& sessionId,
        VerificationStep step,
        const std::string& message,
        const std::string& details
    ) {
        return create(sessionId, step, StepStatus::IN_PROGRESS, LogLevel::DEBUG, message, details, std::nullopt);
    }

    static AuditLogEntry stepCompleted(
        const VerificationSessionId& sessionId,
        VerificationStep step,
        const std::string& message,
        int64_t executionTimeMs
    ) {
        return create(sessionId, step, StepStatus::COMPLETED, LogLevel::INFO, message, std::nullopt, executionTimeMs);
    }

    static AuditLogEntry stepFailed(
        const VerificationSessionId& sessionId,
        VerificationStep step,
        const std::string& message,
        const std::string& details
    ) {
        return create(sessionId, step, StepStatus::FAILED, LogLevel::ERROR, message, details, std::nullopt);
    }

    static AuditLogEntry of(
        const VerificationSessionId& sessionId,
        VerificationStep step,
        StepStatus stepStatus,
        LogLevel logLevel,
        const std::string& message,
        const std::optional<std::string>& details
    ) {
        return create(sessionId, step, stepStatus, logLevel, message, details, std::nullopt);
    }

    /**
     * Rebuild a persisted entry.
     */
    static AuditLogEntry restore(
        const std::string& id,
        const VerificationSessionId& sessionId,
        VerificationStep step,
        StepStatus stepStatus,
        TimePoint timestamp,
        LogLevel logLevel,
        const std::string& message,
        const std::optional<std::string>& details,
        std::optional<int64_t> executionTimeMs
    ) {
        return AuditLogEntry(id, sessionId, step, stepStatus, timestamp, logLevel,
                             message, details, executionTimeMs);
    }

    /**
     * Backfill execution time. Allowed once, and only when none is present.
     *
     * @throws DomainException EXECUTION_TIME_ALREADY_SET
     */
    void setExecutionTime(int64_t executionTimeMs) {
        if (executionTimeMs_.has_value()) {
            throw shared::exception::DomainException(
                "EXECUTION_TIME_ALREADY_SET",
                "Execution time already recorded for " + toString(step_) + " entry"
            );
        }
        executionTimeMs_ = executionTimeMs;
    }

    const std::string& getId() const { return id_; }
    const VerificationSessionId& getSessionId() const { return sessionId_; }
    VerificationStep getStep() const { return step_; }
    StepStatus getStepStatus() const { return stepStatus_; }
    TimePoint getTimestamp() const { return timestamp_; }
    LogLevel getLogLevel() const { return logLevel_; }
    const std::string& getMessage() const { return message_; }
    const std::optional<std::string>& getDetails() const { return details_; }
    const std::optional<int64_t>& getExecutionTimeMs() const { return executionTimeMs_; }

    bool isError() const { return logLevel_ == LogLevel::ERROR; }
    bool isWarning() const { return logLevel_ == LogLevel::WARN; }
    bool isFailed() const { return stepStatus_ == StepStatus::FAILED; }
    bool isCompleted() const { return stepStatus_ == StepStatus::COMPLETED; }
};

} // namespace epassport::pa::domain::model
