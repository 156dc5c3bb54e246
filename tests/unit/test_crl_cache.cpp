/**
 * @file test_crl_cache.cpp
 * @brief Unit tests for CrlCache expiry and pass-through behavior
 */

#include <gtest/gtest.h>
#include "passiveauthentication/infrastructure/adapter/CrlCache.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/X509Util.hpp"
#include "test_helpers.h"
#include <chrono>

using epassport::pa::domain::port::DirectoryPort;
using epassport::pa::infrastructure::adapter::CrlCache;
using epassport::shared::exception::DomainException;
using epassport::shared::util::X509Ptr;
using epassport::shared::util::X509CrlPtr;
using epassport::shared::util::X509Util;
using epassport::shared::util::shareCertificate;
using epassport::shared::util::shareCrl;
using namespace std::chrono_literals;
using namespace test_helpers;

namespace {

class CountingDirectory : public DirectoryPort {
public:
    X509* csca = nullptr;
    X509_CRL* crl = nullptr;
    int cscaCalls = 0;
    int crlCalls = 0;

    X509Ptr findCscaBySubjectDn(const std::string&) override {
        ++cscaCalls;
        return shareCertificate(csca);
    }

    X509CrlPtr findCrlByIssuerDn(const std::string&) override {
        ++crlCalls;
        return shareCrl(crl);
    }
};

} // anonymous namespace

class CrlCacheTest : public ::testing::Test {
protected:
    UniqueKey key;
    UniqueCert csca;
    UniqueCrl crl;
    std::shared_ptr<CountingDirectory> directory;
    std::chrono::system_clock::time_point fakeNow;
    std::string issuerDn;

    void SetUp() override {
        key = generateEcKey();
        csca = createCsca(key.get(), "CSCA-KOREA");
        crl = createCrl(key.get(), csca.get(), {}, now() - 3600, now() + 30 * DAY);
        directory = std::make_shared<CountingDirectory>();
        directory->csca = csca.get();
        directory->crl = crl.get();
        fakeNow = std::chrono::system_clock::now();
        issuerDn = X509Util::getSubjectDn(csca.get());
    }

    CrlCache makeCache(std::chrono::seconds ttl) {
        return CrlCache(directory, ttl, [this] { return fakeNow; });
    }
};

TEST_F(CrlCacheTest, SecondLookup_IsServedFromCache) {
    auto cache = makeCache(3600s);

    EXPECT_NE(cache.findCrlByIssuerDn(issuerDn), nullptr);
    EXPECT_NE(cache.findCrlByIssuerDn(issuerDn), nullptr);
    EXPECT_EQ(directory->crlCalls, 1);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(CrlCacheTest, Key_IsNormalizedDn) {
    auto cache = makeCache(3600s);

    cache.findCrlByIssuerDn("/C=KR/O=Test CA/CN=CSCA-KOREA");
    cache.findCrlByIssuerDn("CN=CSCA-KOREA,O=Test CA,C=KR");
    EXPECT_EQ(directory->crlCalls, 1);
}

TEST_F(CrlCacheTest, Entry_ExpiresAfterTtl) {
    auto cache = makeCache(60s);

    cache.findCrlByIssuerDn(issuerDn);
    fakeNow += 59s;
    cache.findCrlByIssuerDn(issuerDn);
    EXPECT_EQ(directory->crlCalls, 1);

    fakeNow += 2s;
    cache.findCrlByIssuerDn(issuerDn);
    EXPECT_EQ(directory->crlCalls, 2);
}

TEST_F(CrlCacheTest, Entry_ExpiresAtNextUpdateBeforeTtl) {
    crl = createCrl(key.get(), csca.get(), {}, now() - 3600, now() + 600);
    directory->crl = crl.get();
    auto cache = makeCache(std::chrono::hours(24));

    cache.findCrlByIssuerDn(issuerDn);
    fakeNow += 1200s;
    cache.findCrlByIssuerDn(issuerDn);
    EXPECT_EQ(directory->crlCalls, 2);
}

TEST_F(CrlCacheTest, StaleCrl_IsReturnedButNotCached) {
    crl = createCrl(key.get(), csca.get(), {}, now() - 40 * DAY, now() - DAY);
    directory->crl = crl.get();
    auto cache = makeCache(3600s);

    EXPECT_NE(cache.findCrlByIssuerDn(issuerDn), nullptr);
    EXPECT_EQ(cache.size(), 0u);
    cache.findCrlByIssuerDn(issuerDn);
    EXPECT_EQ(directory->crlCalls, 2);
}

TEST_F(CrlCacheTest, MissingCrl_IsNotCached) {
    directory->crl = nullptr;
    auto cache = makeCache(3600s);

    EXPECT_EQ(cache.findCrlByIssuerDn(issuerDn), nullptr);
    EXPECT_EQ(cache.findCrlByIssuerDn(issuerDn), nullptr);
    EXPECT_EQ(directory->crlCalls, 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(CrlCacheTest, InvalidateAndClear) {
    auto cache = makeCache(3600s);

    cache.findCrlByIssuerDn(issuerDn);
    cache.invalidate("CN=CSCA-KOREA,O=Test CA,C=KR");
    EXPECT_EQ(cache.size(), 0u);
    cache.findCrlByIssuerDn(issuerDn);
    EXPECT_EQ(directory->crlCalls, 2);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(CrlCacheTest, CscaLookup_PassesThrough) {
    auto cache = makeCache(3600s);

    cache.findCscaBySubjectDn(issuerDn);
    cache.findCscaBySubjectDn(issuerDn);
    EXPECT_EQ(directory->cscaCalls, 2);
}

TEST_F(CrlCacheTest, InvalidConfiguration_Throws) {
    EXPECT_THROW(CrlCache(directory, 0s), DomainException);
    EXPECT_THROW(CrlCache(nullptr, 60s), DomainException);
}
