/**
 * @file test_crl_check_result.cpp
 * @brief Unit tests for CrlCheckResult and CrlCheckStatus
 */

#include <gtest/gtest.h>
#include "passiveauthentication/domain/model/CrlCheckResult.hpp"
#include "shared/exception/DomainException.hpp"
#include <chrono>

using namespace epassport::pa::domain::model;
using epassport::shared::exception::DomainException;

// ============================================================================
// Factories
// ============================================================================

TEST(CrlCheckResultTest, Default_IsNotChecked) {
    CrlCheckResult result;
    EXPECT_EQ(result.getStatus(), CrlCheckStatus::NOT_CHECKED);
    EXPECT_FALSE(result.isValid());
    EXPECT_FALSE(result.hasCrlVerificationFailed());
    EXPECT_EQ(result.getStatusSeverity(), "INFO");
}

TEST(CrlCheckResultTest, Revoked_CarriesDateAndReason) {
    auto date = std::chrono::system_clock::now() - std::chrono::hours(24);
    auto result = CrlCheckResult::revoked(date, 1);

    EXPECT_TRUE(result.isCertificateRevoked());
    EXPECT_EQ(result.getRevocationDate(), std::optional<CrlCheckResult::TimePoint>(date));
    EXPECT_EQ(result.getRevocationReason(), std::optional<int>(1));
    EXPECT_EQ(result.getRevocationReasonText(), "Key Compromise");
    EXPECT_EQ(result.getStatusSeverity(), "FAILURE");
}

TEST(CrlCheckResultTest, Revoked_RejectsOutOfRangeReason) {
    auto date = std::chrono::system_clock::now();
    EXPECT_THROW(CrlCheckResult::revoked(date, 11), DomainException);
    EXPECT_THROW(CrlCheckResult::revoked(date, -1), DomainException);
}

TEST(CrlCheckResultTest, Revoked_RequiresDate) {
    try {
        CrlCheckResult::revoked(std::nullopt, 0);
        FAIL() << "Expected DomainException";
    } catch (const DomainException& e) {
        EXPECT_EQ(e.getCode(), "REVOCATION_DATE_REQUIRED");
    }
}

TEST(CrlCheckResultTest, Restore_RejectsRevocationDataOnNonRevoked) {
    auto date = std::chrono::system_clock::now();
    try {
        CrlCheckResult::restore(CrlCheckStatus::VALID, date, std::nullopt, std::nullopt);
        FAIL() << "Expected DomainException";
    } catch (const DomainException& e) {
        EXPECT_EQ(e.getCode(), "INVALID_CRL_CHECK_RESULT");
    }
}

TEST(CrlCheckResultTest, FailureStatuses_CarryMessage) {
    EXPECT_EQ(CrlCheckResult::unavailable("none").getMessage(), std::optional<std::string>("none"));
    EXPECT_TRUE(CrlCheckResult::unavailable("none").hasCrlVerificationFailed());
    EXPECT_TRUE(CrlCheckResult::expired("old").hasCrlVerificationFailed());
    EXPECT_TRUE(CrlCheckResult::invalid("bad").hasCrlVerificationFailed());
    EXPECT_FALSE(CrlCheckResult::valid().getMessage().has_value());
}

// ============================================================================
// Status mapping
// ============================================================================

TEST(CrlCheckStatusTest, String_RoundTrip) {
    for (auto status : {CrlCheckStatus::VALID, CrlCheckStatus::REVOKED, CrlCheckStatus::CRL_UNAVAILABLE,
                        CrlCheckStatus::CRL_EXPIRED, CrlCheckStatus::CRL_INVALID, CrlCheckStatus::NOT_CHECKED}) {
        EXPECT_EQ(crlCheckStatusFromString(toString(status)), status);
    }
    EXPECT_THROW(crlCheckStatusFromString("MAYBE"), DomainException);
}

TEST(CrlCheckStatusTest, Severity_OnlyUnavailableIsWarning) {
    EXPECT_EQ(getStatusSeverity(CrlCheckStatus::VALID), "SUCCESS");
    EXPECT_EQ(getStatusSeverity(CrlCheckStatus::CRL_UNAVAILABLE), "WARNING");
    EXPECT_EQ(getStatusSeverity(CrlCheckStatus::CRL_EXPIRED), "FAILURE");
    EXPECT_EQ(getStatusSeverity(CrlCheckStatus::CRL_INVALID), "FAILURE");
}

TEST(CrlCheckResultTest, ReasonText_CoversRfc5280Codes) {
    EXPECT_EQ(CrlCheckResult::reasonText(0), "Unspecified");
    EXPECT_EQ(CrlCheckResult::reasonText(4), "Superseded");
    EXPECT_EQ(CrlCheckResult::reasonText(6), "Certificate Hold");
    EXPECT_EQ(CrlCheckResult::reasonText(10), "AA Compromise");
    EXPECT_EQ(CrlCheckResult::reasonText(7), "Unknown (7)");
}
