/**
 * @file test_in_memory_repository.cpp
 * @brief Unit tests for InMemoryVerificationSessionRepository
 */

#include <gtest/gtest.h>
#include "passiveauthentication/infrastructure/repository/InMemoryVerificationSessionRepository.hpp"
#include "test_helpers.h"

using namespace epassport::pa::domain::model;
using epassport::pa::infrastructure::repository::InMemoryVerificationSessionRepository;
using namespace test_helpers;

class InMemoryRepositoryTest : public ::testing::Test {
protected:
    InMemoryVerificationSessionRepository repository;

    static VerificationSession completedSession(PassiveAuthenticationStatus status) {
        std::vector<DataGroup> groups;
        groups.push_back(DataGroup::of(DataGroupNumber::DG1, sampleDataGroup(1)));
        auto session = VerificationSession::create(
            SecurityObjectDocument::of({0x30, 0x00}), std::move(groups), RequestMetadata::empty());

        session.markVerificationStarted();
        session.logStepStarted(VerificationStep::VERIFICATION_STARTED, "started");
        if (status == PassiveAuthenticationStatus::ERROR) {
            session.recordError(VerificationStep::VERIFICATION_COMPLETED, "DIRECTORY_UNAVAILABLE", "down");
        } else {
            bool valid = status == PassiveAuthenticationStatus::VALID;
            session.recordResult(PassiveAuthenticationResult::withStatistics(
                valid, CrlCheckResult::valid(), valid, 1, valid ? 1 : 0, {}));
        }
        return session;
    }
};

TEST_F(InMemoryRepositoryTest, SaveAndFindById) {
    auto session = completedSession(PassiveAuthenticationStatus::VALID);
    repository.save(session);

    auto found = repository.findById(session.getId());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->sessionId, session.getId());
    EXPECT_EQ(found->status, PassiveAuthenticationStatus::VALID);
    EXPECT_EQ(found->dataGroups.size(), 1u);
    EXPECT_FALSE(repository.findById(VerificationSessionId::newId()).has_value());
}

TEST_F(InMemoryRepositoryTest, SaveSameId_Replaces) {
    std::vector<DataGroup> groups;
    groups.push_back(DataGroup::of(DataGroupNumber::DG1, sampleDataGroup(1)));
    auto session = VerificationSession::create(
        SecurityObjectDocument::of({0x30, 0x00}), std::move(groups), RequestMetadata::empty());

    repository.save(session);
    session.markVerificationStarted();
    session.recordResult(PassiveAuthenticationResult::withStatistics(
        false, CrlCheckResult::revoked(std::chrono::system_clock::now(), 1), true, 1, 1, {}));
    repository.save(session);

    EXPECT_EQ(repository.countAll(), 1);
    EXPECT_EQ(repository.findById(session.getId())->status, PassiveAuthenticationStatus::INVALID);
}

TEST_F(InMemoryRepositoryTest, FindAll_NewestFirstWithPaging) {
    std::vector<VerificationSessionId> ids;
    for (int i = 0; i < 5; ++i) {
        auto session = completedSession(PassiveAuthenticationStatus::VALID);
        ids.push_back(session.getId());
        repository.save(session);
    }

    auto firstPage = repository.findAll(0, 2);
    ASSERT_EQ(firstPage.size(), 2u);
    EXPECT_EQ(firstPage[0].sessionId, ids[4]);
    EXPECT_EQ(firstPage[1].sessionId, ids[3]);

    auto lastPage = repository.findAll(4, 2);
    ASSERT_EQ(lastPage.size(), 1u);
    EXPECT_EQ(lastPage[0].sessionId, ids[0]);

    EXPECT_TRUE(repository.findAll(10, 2).empty());
    EXPECT_TRUE(repository.findAll(-1, 2).empty());
    EXPECT_TRUE(repository.findAll(0, 0).empty());
}

TEST_F(InMemoryRepositoryTest, FindByStatusAndCounts) {
    repository.save(completedSession(PassiveAuthenticationStatus::VALID));
    repository.save(completedSession(PassiveAuthenticationStatus::INVALID));
    repository.save(completedSession(PassiveAuthenticationStatus::ERROR));
    repository.save(completedSession(PassiveAuthenticationStatus::INVALID));

    EXPECT_EQ(repository.countAll(), 4);
    EXPECT_EQ(repository.countByStatus(PassiveAuthenticationStatus::INVALID), 2);
    EXPECT_EQ(repository.countByStatus(PassiveAuthenticationStatus::ERROR), 1);

    auto invalid = repository.findByStatus(PassiveAuthenticationStatus::INVALID, 0, 10);
    ASSERT_EQ(invalid.size(), 2u);
    for (const auto& record : invalid) {
        EXPECT_EQ(record.status, PassiveAuthenticationStatus::INVALID);
    }
}

TEST_F(InMemoryRepositoryTest, FindAuditLog_InInsertionOrder) {
    auto session = completedSession(PassiveAuthenticationStatus::ERROR);
    repository.save(session);

    auto log = repository.findAuditLog(session.getId());
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].getStepStatus(), StepStatus::STARTED);
    EXPECT_EQ(log[1].getStepStatus(), StepStatus::FAILED);
    EXPECT_EQ(log[1].getStep(), VerificationStep::VERIFICATION_STARTED);
    EXPECT_TRUE(repository.findAuditLog(VerificationSessionId::newId()).empty());
}
