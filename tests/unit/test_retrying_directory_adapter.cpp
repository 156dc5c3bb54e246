/**
 * @file test_retrying_directory_adapter.cpp
 * @brief Unit tests for the timeout and retry decorator around DirectoryPort
 */

#include <gtest/gtest.h>
#include "passiveauthentication/infrastructure/adapter/RetryingDirectoryAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/exception/DomainException.hpp"
#include "test_helpers.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using epassport::pa::domain::port::DirectoryPort;
using epassport::pa::infrastructure::adapter::RetryingDirectoryAdapter;
using epassport::shared::exception::InfrastructureException;
using epassport::shared::exception::DomainException;
using epassport::shared::util::X509Ptr;
using epassport::shared::util::X509CrlPtr;
using epassport::shared::util::shareCertificate;
using namespace std::chrono_literals;
using namespace test_helpers;

namespace {

/**
 * Directory that fails a fixed number of times before answering.
 * SLOW failures sleep for the delay and then fail transiently.
 */
class ScriptedDirectory : public DirectoryPort {
public:
    enum class Failure { NONE, TRANSIENT, PERMANENT, TIMEOUT, SLOW };

    Failure failure = Failure::NONE;
    int failuresBeforeSuccess = 0;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};
    X509Ptr csca;
    std::mutex threadsMutex;
    std::set<std::thread::id> callingThreads;

    X509Ptr findCscaBySubjectDn(const std::string& subjectDn) override {
        {
            std::lock_guard<std::mutex> lock(threadsMutex);
            callingThreads.insert(std::this_thread::get_id());
        }
        int call = ++calls;
        if (call <= failuresBeforeSuccess) {
            switch (failure) {
                case Failure::TRANSIENT:
                    throw InfrastructureException("LDAP_SERVER_DOWN", "Can't contact LDAP server", true);
                case Failure::PERMANENT:
                    throw InfrastructureException("LDAP_SEARCH_ERROR", "Invalid DN syntax: " + subjectDn);
                case Failure::TIMEOUT:
                    throw InfrastructureException("DIRECTORY_TIMEOUT", "Timed out", true);
                case Failure::SLOW:
                    std::this_thread::sleep_for(delay);
                    throw InfrastructureException("DIRECTORY_UNAVAILABLE", "Server busy", true);
                case Failure::NONE:
                    break;
            }
        }
        return csca ? shareCertificate(csca.get()) : X509Ptr();
    }

    X509CrlPtr findCrlByIssuerDn(const std::string&) override {
        ++calls;
        return X509CrlPtr();
    }
};

RetryingDirectoryAdapter::Options fastOptions(int maxAttempts = 3) {
    RetryingDirectoryAdapter::Options options;
    options.timeout = 500ms;
    options.maxAttempts = maxAttempts;
    options.initialBackoff = 1ms;
    return options;
}

} // anonymous namespace

class RetryingDirectoryAdapterTest : public ::testing::Test {
protected:
    UniqueKey key;
    UniqueCert csca;
    std::shared_ptr<ScriptedDirectory> directory;

    void SetUp() override {
        key = generateEcKey();
        csca = createCsca(key.get(), "CSCA-KOREA");
        directory = std::make_shared<ScriptedDirectory>();
        directory->csca = shareCertificate(csca.get());
    }

    static std::string codeOf(RetryingDirectoryAdapter& adapter) {
        try {
            adapter.findCscaBySubjectDn("/C=KR/CN=CSCA-KOREA");
        } catch (const InfrastructureException& e) {
            return e.getCode();
        }
        return "";
    }
};

// ============================================================================
// Success paths
// ============================================================================

TEST_F(RetryingDirectoryAdapterTest, FirstAttemptSucceeds) {
    RetryingDirectoryAdapter adapter(directory, fastOptions());

    auto found = adapter.findCscaBySubjectDn("/C=KR/CN=CSCA-KOREA");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(directory->calls.load(), 1);
}

TEST_F(RetryingDirectoryAdapterTest, NotFoundIsNotRetried) {
    directory->csca.reset();
    RetryingDirectoryAdapter adapter(directory, fastOptions());

    EXPECT_EQ(adapter.findCscaBySubjectDn("/C=KR/CN=CSCA-KOREA"), nullptr);
    EXPECT_EQ(adapter.findCrlByIssuerDn("/C=KR/CN=CSCA-KOREA"), nullptr);
    EXPECT_EQ(directory->calls.load(), 2);
}

TEST_F(RetryingDirectoryAdapterTest, TransientFailureThenSuccess) {
    directory->failure = ScriptedDirectory::Failure::TRANSIENT;
    directory->failuresBeforeSuccess = 2;
    RetryingDirectoryAdapter adapter(directory, fastOptions(3));

    EXPECT_NE(adapter.findCscaBySubjectDn("/C=KR/CN=CSCA-KOREA"), nullptr);
    EXPECT_EQ(directory->calls.load(), 3);
}

// ============================================================================
// Failure paths
// ============================================================================

TEST_F(RetryingDirectoryAdapterTest, TransientExhaustion_IsUnavailable) {
    directory->failure = ScriptedDirectory::Failure::TRANSIENT;
    directory->failuresBeforeSuccess = 10;
    RetryingDirectoryAdapter adapter(directory, fastOptions(3));

    EXPECT_EQ(codeOf(adapter), "DIRECTORY_UNAVAILABLE");
    EXPECT_EQ(directory->calls.load(), 3);
}

TEST_F(RetryingDirectoryAdapterTest, PermanentFailure_PropagatesImmediately) {
    directory->failure = ScriptedDirectory::Failure::PERMANENT;
    directory->failuresBeforeSuccess = 10;
    RetryingDirectoryAdapter adapter(directory, fastOptions(3));

    EXPECT_EQ(codeOf(adapter), "LDAP_SEARCH_ERROR");
    EXPECT_EQ(directory->calls.load(), 1);
}

TEST_F(RetryingDirectoryAdapterTest, TransportTimeout_IsTimeout) {
    directory->failure = ScriptedDirectory::Failure::TIMEOUT;
    directory->failuresBeforeSuccess = 10;
    RetryingDirectoryAdapter adapter(directory, fastOptions(2));

    EXPECT_EQ(codeOf(adapter), "DIRECTORY_TIMEOUT");
    EXPECT_EQ(directory->calls.load(), 2);
}

TEST_F(RetryingDirectoryAdapterTest, SlowTransientFailure_CountsAsTimeout) {
    directory->failure = ScriptedDirectory::Failure::SLOW;
    directory->failuresBeforeSuccess = 10;
    directory->delay = 40ms;

    RetryingDirectoryAdapter::Options options = fastOptions(2);
    options.timeout = 20ms;
    RetryingDirectoryAdapter adapter(directory, options);

    EXPECT_EQ(codeOf(adapter), "DIRECTORY_TIMEOUT");
}

TEST_F(RetryingDirectoryAdapterTest, SlowFirstAttempt_RetrySucceeds) {
    directory->failure = ScriptedDirectory::Failure::SLOW;
    directory->failuresBeforeSuccess = 1;
    directory->delay = 30ms;

    RetryingDirectoryAdapter::Options options = fastOptions(2);
    options.timeout = 10ms;
    RetryingDirectoryAdapter adapter(directory, options);

    EXPECT_NE(adapter.findCscaBySubjectDn("/C=KR/CN=CSCA-KOREA"), nullptr);
    EXPECT_EQ(directory->calls.load(), 2);
}

TEST_F(RetryingDirectoryAdapterTest, TimedOutAttempts_LeaveNoWorkBehind) {
    directory->failure = ScriptedDirectory::Failure::SLOW;
    directory->failuresBeforeSuccess = 10;
    directory->delay = 50ms;

    RetryingDirectoryAdapter::Options options = fastOptions(2);
    options.timeout = 10ms;
    RetryingDirectoryAdapter adapter(directory, options);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(codeOf(adapter), "DIRECTORY_TIMEOUT");
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(directory->calls.load(), 2);
    std::lock_guard<std::mutex> lock(directory->threadsMutex);
    ASSERT_EQ(directory->callingThreads.size(), 1u);
    EXPECT_EQ(*directory->callingThreads.begin(), std::this_thread::get_id());
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(RetryingDirectoryAdapterTest, InvalidOptions_Throw) {
    EXPECT_THROW(RetryingDirectoryAdapter(nullptr, fastOptions()), DomainException);

    auto zeroAttempts = fastOptions(0);
    EXPECT_THROW(RetryingDirectoryAdapter adapter(directory, zeroAttempts), DomainException);

    auto zeroTimeout = fastOptions();
    zeroTimeout.timeout = 0ms;
    EXPECT_THROW(RetryingDirectoryAdapter adapter(directory, zeroTimeout), DomainException);
}
