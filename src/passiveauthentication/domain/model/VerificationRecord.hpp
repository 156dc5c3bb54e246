#pragma once

#include "VerificationSession.hpp"
#include <optional>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace epassport::pa::domain::model {

/**
 * Stored form of one data group verdict.
 */
struct DataGroupRecord {
    DataGroupNumber number = DataGroupNumber::DG1;
    std::optional<std::string> expectedHash;
    std::optional<std::string> actualHash;
    bool valid = false;
    bool hashMismatchDetected = false;
    size_t contentSize = 0;
};

/**
 * Immutable snapshot of a VerificationSession as written to and read
 * from a repository. Sessions are move-only aggregates; records are
 * plain copyable values.
 */
struct VerificationRecord {
    using TimePoint = std::chrono::system_clock::time_point;

    VerificationSessionId sessionId = VerificationSessionId::newId();
    PassiveAuthenticationStatus status = PassiveAuthenticationStatus::ERROR;
    std::string hashAlgorithm;
    std::string signatureAlgorithm;
    size_t sodSize = 0;
    RequestMetadata requestMetadata = RequestMetadata::empty();
    TimePoint createdAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<int64_t> processingDurationMs;
    std::optional<PassiveAuthenticationResult> result;
    std::vector<DataGroupRecord> dataGroups;
    std::vector<AuditLogEntry> auditLog;

    static VerificationRecord from(const VerificationSession& session) {
        VerificationRecord record;
        record.sessionId = session.getId();
        record.status = session.getVerificationStatus();
        record.hashAlgorithm = session.getSod().getHashAlgorithm();
        record.signatureAlgorithm = session.getSod().getSignatureAlgorithm();
        record.sodSize = session.getSod().calculateSize();
        record.requestMetadata = session.getRequestMetadata();
        record.createdAt = session.getCreatedAt();
        record.startedAt = session.getStartedAt();
        record.completedAt = session.getCompletedAt();
        record.processingDurationMs = session.getProcessingDurationMs();
        record.result = session.getResult();
        record.auditLog = session.getAuditLog();

        for (const auto& dg : session.getDataGroups()) {
            DataGroupRecord dgRecord;
            dgRecord.number = dg.getNumber();
            if (dg.getExpectedHash().has_value()) {
                dgRecord.expectedHash = dg.getExpectedHash()->getValue();
            }
            if (dg.getActualHash().has_value()) {
                dgRecord.actualHash = dg.getActualHash()->getValue();
            }
            dgRecord.valid = dg.isValid();
            dgRecord.hashMismatchDetected = dg.isHashMismatchDetected();
            dgRecord.contentSize = dg.getContent().size();
            record.dataGroups.push_back(dgRecord);
        }
        return record;
    }

    int getValidDataGroupCount() const {
        int count = 0;
        for (const auto& dg : dataGroups) {
            if (dg.valid) {
                ++count;
            }
        }
        return count;
    }
};

} // namespace epassport::pa::domain::model
