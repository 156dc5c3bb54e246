/**
 * @file test_local_trust_store.cpp
 * @brief Unit tests for LocalTrustStoreAdapter
 */

#include <gtest/gtest.h>
#include "passiveauthentication/infrastructure/adapter/LocalTrustStoreAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/X509Util.hpp"
#include "test_helpers.h"
#include <openssl/pem.h>
#include <cstdio>
#include <string>

using epassport::pa::infrastructure::adapter::LocalTrustStoreAdapter;
using epassport::shared::exception::InfrastructureException;
using epassport::shared::util::X509Util;
using epassport::shared::util::shareCertificate;
using epassport::shared::util::shareCrl;
using namespace test_helpers;

class LocalTrustStoreTest : public ::testing::Test {
protected:
    LocalTrustStoreAdapter store;
    UniqueKey krKey;
    UniqueCert krCsca;
    UniqueKey jpKey;
    UniqueCert jpCsca;
    std::vector<std::string> tempFiles;

    void SetUp() override {
        krKey = generateEcKey();
        krCsca = createCsca(krKey.get(), "CSCA-KOREA", "KR");
        jpKey = generateEcKey();
        jpCsca = createCsca(jpKey.get(), "CSCA-JAPAN", "JP");
    }

    void TearDown() override {
        for (const auto& path : tempFiles) {
            std::remove(path.c_str());
        }
    }

    std::string tempPath(const std::string& name) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string path = ::testing::TempDir() + "epassport_" + info->name() + "_" + name;
        tempFiles.push_back(path);
        return path;
    }

    std::string writePem(const std::string& name, std::initializer_list<X509*> certs) {
        std::string path = tempPath(name);
        BIO* bio = BIO_new_file(path.c_str(), "wb");
        for (X509* cert : certs) {
            PEM_write_bio_X509(bio, cert);
        }
        BIO_free(bio);
        return path;
    }

    std::string writeDer(const std::string& name, X509* cert) {
        std::string path = tempPath(name);
        BIO* bio = BIO_new_file(path.c_str(), "wb");
        i2d_X509_bio(bio, cert);
        BIO_free(bio);
        return path;
    }

    std::string writeCrlPem(const std::string& name, X509_CRL* crl) {
        std::string path = tempPath(name);
        BIO* bio = BIO_new_file(path.c_str(), "wb");
        PEM_write_bio_X509_CRL(bio, crl);
        BIO_free(bio);
        return path;
    }
};

// ============================================================================
// Lookup
// ============================================================================

TEST_F(LocalTrustStoreTest, FindCsca_NormalizesDnFormat) {
    store.addCsca(shareCertificate(krCsca.get()));

    auto bySlash = store.findCscaBySubjectDn("/C=KR/O=Test CA/CN=CSCA-KOREA");
    auto byRfc2253 = store.findCscaBySubjectDn("CN=csca-korea, O=Test CA, C=kr");
    ASSERT_NE(bySlash, nullptr);
    ASSERT_NE(byRfc2253, nullptr);
    EXPECT_EQ(X509_cmp(bySlash.get(), krCsca.get()), 0);
    EXPECT_EQ(X509_cmp(byRfc2253.get(), krCsca.get()), 0);
}

TEST_F(LocalTrustStoreTest, FindCsca_SameDnReturnsEveryKeyNewestFirst) {
    CertOptions rollover;
    rollover.serial = 2;
    rollover.notBefore = now() - 3600;
    auto newKey = generateEcKey();
    auto newCsca = createCsca(newKey.get(), "CSCA-KOREA", "KR", rollover);

    store.addCsca(shareCertificate(krCsca.get()));
    store.addCsca(shareCertificate(newCsca.get()));

    auto all = store.findAllCscasBySubjectDn("/C=KR/O=Test CA/CN=CSCA-KOREA");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(X509Util::getSerialNumberHex(all[0].get()), X509Util::getSerialNumberHex(newCsca.get()));
    EXPECT_EQ(X509Util::getSerialNumberHex(all[1].get()), X509Util::getSerialNumberHex(krCsca.get()));

    auto newest = store.findCscaBySubjectDn("/C=KR/O=Test CA/CN=CSCA-KOREA");
    ASSERT_NE(newest, nullptr);
    EXPECT_EQ(X509_cmp(newest.get(), newCsca.get()), 0);
    EXPECT_TRUE(store.findAllCscasBySubjectDn("/C=KR/CN=NOBODY").empty());
}

TEST_F(LocalTrustStoreTest, FindCsca_UnknownReturnsEmpty) {
    store.addCsca(shareCertificate(krCsca.get()));
    EXPECT_EQ(store.findCscaBySubjectDn("/C=FR/CN=CSCA-FRANCE"), nullptr);
}

TEST_F(LocalTrustStoreTest, FindCrl_ByIssuerDn) {
    auto crl = createCrl(krKey.get(), krCsca.get());
    store.addCrl(shareCrl(crl.get()));

    EXPECT_NE(store.findCrlByIssuerDn(X509Util::getSubjectDn(krCsca.get())), nullptr);
    EXPECT_EQ(store.findCrlByIssuerDn(X509Util::getSubjectDn(jpCsca.get())), nullptr);
    EXPECT_EQ(store.crlCount(), 1u);
}

TEST_F(LocalTrustStoreTest, AddCrl_KeepsNewestThisUpdate) {
    auto older = createCrl(krKey.get(), krCsca.get(), {}, now() - 10 * DAY);
    auto newer = createCrl(krKey.get(), krCsca.get(), {{100, now() - DAY, 1}}, now() - DAY);

    store.addCrl(shareCrl(newer.get()));
    store.addCrl(shareCrl(older.get()));

    auto found = store.findCrlByIssuerDn(X509Util::getSubjectDn(krCsca.get()));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found.get(), newer.get());
    EXPECT_EQ(sk_X509_REVOKED_num(X509_CRL_get_REVOKED(found.get())), 1);
}

TEST_F(LocalTrustStoreTest, AddNull_IsIgnored) {
    store.addCsca(nullptr);
    store.addCrl(nullptr);
    EXPECT_EQ(store.cscaCount(), 0u);
    EXPECT_EQ(store.crlCount(), 0u);
}

// ============================================================================
// File loading
// ============================================================================

TEST_F(LocalTrustStoreTest, LoadCscaFile_PemBundle) {
    auto path = writePem("bundle.pem", {krCsca.get(), jpCsca.get()});

    EXPECT_EQ(store.loadCscaFile(path), 2u);
    EXPECT_EQ(store.cscaCount(), 2u);
    EXPECT_NE(store.findCscaBySubjectDn("/C=JP/O=Test CA/CN=CSCA-JAPAN"), nullptr);
}

TEST_F(LocalTrustStoreTest, LoadCscaFile_SingleDer) {
    auto path = writeDer("csca.der", krCsca.get());

    EXPECT_EQ(store.loadCscaFile(path), 1u);
    EXPECT_NE(store.findCscaBySubjectDn("/C=KR/O=Test CA/CN=CSCA-KOREA"), nullptr);
}

TEST_F(LocalTrustStoreTest, LoadCrlFile_Pem) {
    auto crl = createCrl(jpKey.get(), jpCsca.get());
    auto path = writeCrlPem("crl.pem", crl.get());

    store.loadCrlFile(path);
    EXPECT_NE(store.findCrlByIssuerDn("/C=JP/O=Test CA/CN=CSCA-JAPAN"), nullptr);
}

TEST_F(LocalTrustStoreTest, LoadCscaFile_MissingFileThrows) {
    try {
        store.loadCscaFile(::testing::TempDir() + "epassport_does_not_exist.pem");
        FAIL() << "Expected InfrastructureException";
    } catch (const InfrastructureException& e) {
        EXPECT_EQ(e.getCode(), "TRUST_STORE_LOAD_ERROR");
        EXPECT_FALSE(e.isTransient());
    }
}

TEST_F(LocalTrustStoreTest, LoadCrlFile_NotACrlThrows) {
    auto path = writePem("not-a-crl.pem", {krCsca.get()});
    EXPECT_THROW(store.loadCrlFile(path), InfrastructureException);
}
