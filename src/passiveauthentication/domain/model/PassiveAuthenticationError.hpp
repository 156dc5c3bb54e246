#pragma once

#include "shared/exception/DomainException.hpp"
#include <chrono>
#include <string>

namespace epassport::pa::domain::model {

/**
 * One finding reported by a verification. Any CRITICAL finding makes the
 * verdict INVALID; WARNING and INFO are reported but never decide it.
 */
class PassiveAuthenticationError {
public:
    enum class Severity { INFO, WARNING, CRITICAL };
    using TimePoint = std::chrono::system_clock::time_point;

private:
    std::string code_;
    std::string message_;
    Severity severity_;
    TimePoint timestamp_;

    PassiveAuthenticationError(std::string code, std::string message, Severity severity, TimePoint timestamp)
        : code_(std::move(code)), message_(std::move(message)), severity_(severity), timestamp_(timestamp) {}

    static PassiveAuthenticationError now(const std::string& code, const std::string& message, Severity severity) {
        return PassiveAuthenticationError(code, message, severity, std::chrono::system_clock::now());
    }

public:
    static PassiveAuthenticationError critical(const std::string& code, const std::string& message) {
        return now(code, message, Severity::CRITICAL);
    }
    static PassiveAuthenticationError warning(const std::string& code, const std::string& message) {
        return now(code, message, Severity::WARNING);
    }
    static PassiveAuthenticationError info(const std::string& code, const std::string& message) {
        return now(code, message, Severity::INFO);
    }

    /// Rehydrates a stored finding with its original timestamp.
    static PassiveAuthenticationError restore(const std::string& code, const std::string& message,
                                              Severity severity, TimePoint timestamp) {
        return PassiveAuthenticationError(code, message, severity, timestamp);
    }

    /// @throws DomainException INVALID_SEVERITY
    static Severity severityFromString(const std::string& str) {
        for (auto s : {Severity::INFO, Severity::WARNING, Severity::CRITICAL}) {
            if (str == severityName(s)) return s;
        }
        throw shared::exception::DomainException("INVALID_SEVERITY", "Unknown error severity: " + str);
    }

    static const char* severityName(Severity severity) {
        switch (severity) {
            case Severity::INFO:     return "INFO";
            case Severity::WARNING:  return "WARNING";
            case Severity::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    const std::string& getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    Severity getSeverity() const { return severity_; }
    const TimePoint& getTimestamp() const { return timestamp_; }
    std::string getSeverityString() const { return severityName(severity_); }

    bool isCritical() const { return severity_ == Severity::CRITICAL; }
    bool isWarning() const { return severity_ == Severity::WARNING; }
    bool isInfo() const { return severity_ == Severity::INFO; }
};

} // namespace epassport::pa::domain::model
