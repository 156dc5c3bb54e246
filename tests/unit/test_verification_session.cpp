/**
 * @file test_verification_session.cpp
 * @brief Unit tests for the VerificationSession aggregate and its audit log
 */

#include <gtest/gtest.h>
#include "passiveauthentication/domain/model/VerificationSession.hpp"
#include "passiveauthentication/domain/model/VerificationRecord.hpp"
#include "shared/exception/DomainException.hpp"
#include "test_helpers.h"
#include <functional>

using namespace epassport::pa::domain::model;
using epassport::shared::exception::DomainException;
using namespace test_helpers;

class VerificationSessionTest : public ::testing::Test {
protected:
    static VerificationSession newSession(std::vector<int> numbers = {1, 2}) {
        std::vector<DataGroup> groups;
        for (int n : numbers) {
            groups.push_back(DataGroup::of(dataGroupNumberFromInt(n), sampleDataGroup(n)));
        }
        return VerificationSession::create(
            SecurityObjectDocument::of({0x30, 0x00}),
            std::move(groups),
            RequestMetadata::of("127.0.0.1", "unit-test", ""));
    }

    static std::string codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const DomainException& e) {
            return e.getCode();
        }
        return "";
    }
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(VerificationSessionTest, Create_InitialState) {
    auto session = newSession();
    EXPECT_EQ(session.getState(), SessionState::CREATED);
    EXPECT_FALSE(session.isStarted());
    EXPECT_TRUE(session.isInProgress());
    EXPECT_EQ(session.getDataGroupCount(), 2);
    EXPECT_TRUE(session.getAuditLog().empty());
    EXPECT_FALSE(session.getResult().has_value());
}

TEST_F(VerificationSessionTest, Create_RejectsEmptyDataGroups) {
    EXPECT_EQ(codeOf([] { newSession({}); }), "EMPTY_DATA_GROUPS");
}

TEST_F(VerificationSessionTest, Create_RejectsDuplicateDataGroups) {
    EXPECT_EQ(codeOf([] { newSession({1, 1}); }), "DUPLICATE_DATA_GROUP");
}

// ============================================================================
// State transitions
// ============================================================================

TEST_F(VerificationSessionTest, Transitions_FollowPipelineOrder) {
    auto session = newSession();
    session.markVerificationStarted();
    EXPECT_TRUE(session.isStarted());
    session.markChainChecked();
    session.markCrlChecked();
    session.markSodChecked();
    session.markHashesChecked();
    EXPECT_EQ(session.getState(), SessionState::HASHES_CHECKED);
}

TEST_F(VerificationSessionTest, Transitions_RejectSkippedStep) {
    auto session = newSession();
    session.markVerificationStarted();
    EXPECT_EQ(codeOf([&] { session.markSodChecked(); }), "ILLEGAL_STATE_TRANSITION");
}

TEST_F(VerificationSessionTest, RecordResult_CompletesAndFreezes) {
    auto session = newSession();
    session.markVerificationStarted();
    session.recordResult(PassiveAuthenticationResult::withStatistics(
        true, CrlCheckResult::valid(), true, 2, 2, {}));

    EXPECT_TRUE(session.isCompleted());
    EXPECT_TRUE(session.isValid());
    ASSERT_TRUE(session.getCompletedAt().has_value());
    ASSERT_TRUE(session.getProcessingDurationMs().has_value());
    EXPECT_GE(*session.getProcessingDurationMs(), 0);
    EXPECT_GE(*session.getCompletedAt(), *session.getStartedAt());

    EXPECT_EQ(codeOf([&] { session.markChainChecked(); }), "ILLEGAL_STATE_TRANSITION");
    EXPECT_EQ(codeOf([&] {
        session.recordResult(PassiveAuthenticationResult::error({}, 2));
    }), "ILLEGAL_STATE_TRANSITION");
}

TEST_F(VerificationSessionTest, RecordResult_RegistersCompletionEvent) {
    auto session = newSession();
    session.markVerificationStarted();
    session.recordResult(PassiveAuthenticationResult::withStatistics(
        false, CrlCheckResult::notChecked(), false, 2, 0, {}));

    ASSERT_EQ(session.getDomainEvents().size(), 1u);
    auto event = std::dynamic_pointer_cast<VerificationCompletedEvent>(session.getDomainEvents().front());
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->getStatus(), PassiveAuthenticationStatus::INVALID);
    EXPECT_EQ(event->getSessionId(), session.getId());
}

TEST_F(VerificationSessionTest, RecordError_LogsFailedCurrentStep) {
    auto session = newSession();
    session.markVerificationStarted();
    session.logStepStarted(VerificationStep::SOD_SIGNATURE, "SOD started");
    session.recordError(VerificationStep::VERIFICATION_COMPLETED, "SOD_PARSE_ERROR", "bad CMS");

    EXPECT_TRUE(session.isError());
    ASSERT_TRUE(session.getResult().has_value());
    ASSERT_EQ(session.getCriticalErrors().size(), 1u);
    EXPECT_EQ(session.getCriticalErrors()[0].getCode(), "SOD_PARSE_ERROR");
    EXPECT_EQ(session.getResult()->getInvalidDataGroups(), 2);

    const auto& last = session.getAuditLog().back();
    EXPECT_EQ(last.getStep(), VerificationStep::SOD_SIGNATURE);
    EXPECT_TRUE(last.isFailed());
    EXPECT_TRUE(last.isError());
    EXPECT_NE(last.getDetails()->find("SOD_PARSE_ERROR"), std::string::npos);
}

TEST_F(VerificationSessionTest, RecordError_KeepsEarlierFindingsFirst) {
    auto session = newSession();
    session.markVerificationStarted();
    session.recordError(VerificationStep::VERIFICATION_COMPLETED, "SOD_PARSE_ERROR", "bad CMS",
                        {PassiveAuthenticationError::critical("CERTIFICATE_REVOKED", "DSC revoked"),
                         PassiveAuthenticationError::warning("DG_HASH_MISSING", "DG3 not in SOD")});

    auto errors = session.getVerificationErrors();
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].getCode(), "CERTIFICATE_REVOKED");
    EXPECT_EQ(errors[1].getCode(), "DG_HASH_MISSING");
    EXPECT_EQ(errors[2].getCode(), "SOD_PARSE_ERROR");
    EXPECT_EQ(session.getCriticalErrors().size(), 2u);
    EXPECT_TRUE(session.isError());
}

TEST_F(VerificationSessionTest, RecordError_UsesFallbackStepWhenIdle) {
    auto session = newSession();
    session.recordError(VerificationStep::VERIFICATION_COMPLETED, "X", "y");
    EXPECT_EQ(session.getAuditLog().back().getStep(), VerificationStep::VERIFICATION_COMPLETED);
    EXPECT_TRUE(session.getStartedAt().has_value());
}

// ============================================================================
// Data groups
// ============================================================================

TEST_F(VerificationSessionTest, RecordDataGroupHash_UpdatesCounts) {
    auto session = newSession();
    auto dg1Hash = DataGroupHash::calculate(sampleDataGroup(1), "SHA-256");
    auto dg2Hash = DataGroupHash::calculate(sampleDataGroup(2), "SHA-256");

    EXPECT_TRUE(session.recordDataGroupHash(DataGroupNumber::DG1, dg1Hash, dg1Hash));
    EXPECT_FALSE(session.recordDataGroupHash(DataGroupNumber::DG2, dg1Hash, dg2Hash));
    EXPECT_EQ(session.getValidDataGroupCount(), 1);
    EXPECT_EQ(session.getInvalidDataGroupCount(), 1);
    EXPECT_FALSE(session.allDataGroupsValid());
    EXPECT_TRUE(session.getDataGroup(DataGroupNumber::DG2)->isHashMismatchDetected());
}

TEST_F(VerificationSessionTest, RecordDataGroupHash_UnknownGroupThrows) {
    auto session = newSession({1});
    auto hash = DataGroupHash::calculate(sampleDataGroup(1), "SHA-256");
    EXPECT_EQ(codeOf([&] { session.recordDataGroupHash(DataGroupNumber::DG5, hash, hash); }),
              "DATA_GROUP_NOT_FOUND");
}

TEST_F(VerificationSessionTest, AddDataGroup_RejectsDuplicate) {
    auto session = newSession({1});
    session.addDataGroup(DataGroup::of(DataGroupNumber::DG14, sampleDataGroup(14)));
    EXPECT_EQ(session.getDataGroupCount(), 2);
    EXPECT_EQ(codeOf([&] { session.addDataGroup(DataGroup::of(DataGroupNumber::DG1, sampleDataGroup(1))); }),
              "DUPLICATE_DATA_GROUP");
}

// ============================================================================
// Audit log
// ============================================================================

TEST_F(VerificationSessionTest, AuditLog_AppendsInOrderAndTracksCurrentStep) {
    auto session = newSession();
    session.logStepStarted(VerificationStep::CERTIFICATE_CHAIN, "chain started");
    EXPECT_EQ(session.getCurrentStep(), std::optional<VerificationStep>(VerificationStep::CERTIFICATE_CHAIN));

    session.logStepInProgress(VerificationStep::CERTIFICATE_CHAIN, "DSC extracted", "{}");
    session.logStepCompleted(VerificationStep::CERTIFICATE_CHAIN, "chain valid", 12);
    EXPECT_FALSE(session.getCurrentStep().has_value());

    const auto& log = session.getAuditLog();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0].getStepStatus(), StepStatus::STARTED);
    EXPECT_EQ(log[1].getStepStatus(), StepStatus::IN_PROGRESS);
    EXPECT_EQ(log[1].getLogLevel(), LogLevel::DEBUG);
    EXPECT_EQ(log[2].getStepStatus(), StepStatus::COMPLETED);
    EXPECT_EQ(log[2].getExecutionTimeMs(), std::optional<int64_t>(12));
    for (const auto& entry : log) {
        EXPECT_EQ(entry.getSessionId(), session.getId());
    }
}

TEST_F(VerificationSessionTest, AuditLog_BackfillExecutionTimeOnce) {
    auto session = newSession();
    session.logStepStarted(VerificationStep::SOD_SIGNATURE, "SOD started");
    session.logEntry(VerificationStep::SOD_SIGNATURE, StepStatus::COMPLETED, LogLevel::WARN,
                     "SOD signature invalid", std::string("{\"valid\":false}"));
    session.backfillExecutionTime(VerificationStep::SOD_SIGNATURE, 7);

    const auto& last = session.getAuditLog().back();
    EXPECT_TRUE(last.isWarning());
    EXPECT_EQ(last.getExecutionTimeMs(), std::optional<int64_t>(7));
    EXPECT_EQ(codeOf([&] { session.backfillExecutionTime(VerificationStep::SOD_SIGNATURE, 8); }),
              "EXECUTION_TIME_ALREADY_SET");
    EXPECT_EQ(codeOf([&] { session.backfillExecutionTime(VerificationStep::DATA_GROUP_HASH, 1); }),
              "AUDIT_ENTRY_NOT_FOUND");
}

TEST(AuditLogEntryTest, EnumStrings_RoundTrip) {
    EXPECT_EQ(verificationStepFromString(toString(VerificationStep::DATA_GROUP_HASH)),
              VerificationStep::DATA_GROUP_HASH);
    EXPECT_EQ(stepStatusFromString("FAILED"), StepStatus::FAILED);
    EXPECT_EQ(logLevelFromString("WARN"), LogLevel::WARN);
    EXPECT_THROW(logLevelFromString("TRACE"), DomainException);
}

// ============================================================================
// VerificationRecord snapshot
// ============================================================================

TEST_F(VerificationSessionTest, Record_SnapshotsSession) {
    auto session = newSession();
    session.markVerificationStarted();
    auto hash = DataGroupHash::calculate(sampleDataGroup(1), "SHA-256");
    session.recordDataGroupHash(DataGroupNumber::DG1, hash, hash);
    session.recordDataGroupHashMissing(DataGroupNumber::DG2);
    session.recordSodAlgorithms("SHA-256", "SHA256withECDSA");
    session.logStepStarted(VerificationStep::VERIFICATION_STARTED, "start");
    session.recordResult(PassiveAuthenticationResult::withStatistics(
        true, CrlCheckResult::valid(), true, 2, 1, {}));

    auto record = VerificationRecord::from(session);
    EXPECT_EQ(record.sessionId, session.getId());
    EXPECT_EQ(record.status, PassiveAuthenticationStatus::INVALID);
    EXPECT_EQ(record.hashAlgorithm, "SHA-256");
    EXPECT_EQ(record.signatureAlgorithm, "SHA256withECDSA");
    EXPECT_EQ(record.sodSize, 2u);
    EXPECT_EQ(record.requestMetadata.getIpAddress(), std::optional<std::string>("127.0.0.1"));
    ASSERT_EQ(record.dataGroups.size(), 2u);
    EXPECT_EQ(record.getValidDataGroupCount(), 1);
    EXPECT_EQ(record.dataGroups[0].expectedHash, std::optional<std::string>(hash.getValue()));
    EXPECT_FALSE(record.dataGroups[1].expectedHash.has_value());
    EXPECT_EQ(record.auditLog.size(), 1u);
}
