/**
 * @file test_sod_parser_adapter.cpp
 * @brief Unit tests for OpenSslSodParserAdapter against OpenSSL-signed SODs
 */

#include <gtest/gtest.h>
#include "passiveauthentication/infrastructure/adapter/OpenSslSodParserAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/X509Util.hpp"
#include "test_helpers.h"
#include <functional>

using namespace epassport::pa::domain::model;
using epassport::pa::infrastructure::adapter::OpenSslSodParserAdapter;
using epassport::shared::exception::InfrastructureException;
using epassport::shared::util::X509Util;
using namespace test_helpers;

class SodParserAdapterTest : public ::testing::Test {
protected:
    OpenSslSodParserAdapter parser;
    UniqueKey cscaKey;
    UniqueCert csca;
    UniqueKey dscKey;
    UniqueCert dsc;
    std::map<int, Bytes> dataGroups;
    Bytes sod;

    void SetUp() override {
        cscaKey = generateEcKey();
        csca = createCsca(cscaKey.get(), "CSCA-KOREA");
        dscKey = generateEcKey();
        dsc = createDsc(dscKey.get(), cscaKey.get(), csca.get(), "DSC-KOREA", dscOptions(100));
        dataGroups = {{1, sampleDataGroup(1)}, {2, sampleDataGroup(2, 512)}, {14, sampleDataGroup(14)}};
        sod = createSod(dscKey.get(), dsc.get(), dataGroups);
    }

    static std::string expectCode(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const InfrastructureException& e) {
            return e.getCode();
        }
        return "";
    }
};

// ============================================================================
// LDSSecurityObject
// ============================================================================

TEST_F(SodParserAdapterTest, ParseDataGroupHashes_ReturnsEveryEntry) {
    auto hashes = parser.parseDataGroupHashes(sod);

    ASSERT_EQ(hashes.size(), 3u);
    for (const auto& [number, content] : dataGroups) {
        auto it = hashes.find(dataGroupNumberFromInt(number));
        ASSERT_NE(it, hashes.end()) << "DG" << number;
        EXPECT_EQ(it->second, DataGroupHash::calculate(content, "SHA-256"));
    }
}

TEST_F(SodParserAdapterTest, ExtractHashAlgorithm_Sha256) {
    EXPECT_EQ(parser.extractHashAlgorithm(sod), "SHA-256");
}

TEST_F(SodParserAdapterTest, ExtractHashAlgorithm_Sha384) {
    auto sod384 = createSod(dscKey.get(), dsc.get(), dataGroups, "SHA-384");
    EXPECT_EQ(parser.extractHashAlgorithm(sod384), "SHA-384");
    EXPECT_EQ(parser.parseDataGroupHashes(sod384).at(DataGroupNumber::DG1).getAlgorithm(), "SHA-384");
}

TEST_F(SodParserAdapterTest, ExtractHashAlgorithm_Sha1IsRecognized) {
    auto lds = encodeLdsSecurityObject("1.3.14.3.2.26", {{1, digest(sampleDataGroup(1), EVP_sha1())}});
    auto sha1Sod = signSod(dscKey.get(), dsc.get(), lds);
    EXPECT_EQ(parser.extractHashAlgorithm(sha1Sod), "SHA-1");
}

TEST_F(SodParserAdapterTest, ExtractHashAlgorithm_UnknownOid) {
    auto lds = encodeLdsSecurityObject("1.2.3.4", {{1, digest(sampleDataGroup(1))}});
    EXPECT_EQ(parser.extractHashAlgorithm(signSod(dscKey.get(), dsc.get(), lds)), "UNKNOWN(1.2.3.4)");
}

TEST_F(SodParserAdapterTest, ParseDataGroupHashes_SkipsOutOfRangeNumber) {
    auto lds = encodeLdsSecurityObject("2.16.840.1.101.3.4.2.1",
                                       {{1, digest(sampleDataGroup(1))}, {17, digest(sampleDataGroup(17))}});
    auto hashes = parser.parseDataGroupHashes(signSod(dscKey.get(), dsc.get(), lds));
    EXPECT_EQ(hashes.size(), 1u);
    EXPECT_EQ(hashes.count(DataGroupNumber::DG1), 1u);
}

// ============================================================================
// ICAO 0x77 wrapper
// ============================================================================

TEST_F(SodParserAdapterTest, Unwrap_RemovesApplicationTag) {
    auto wrapped = createSod(dscKey.get(), dsc.get(), dataGroups, "SHA-256", true);
    ASSERT_EQ(wrapped[0], 0x77);

    auto unwrapped = parser.unwrapIcaoSod(wrapped);
    EXPECT_EQ(unwrapped[0], 0x30);
    EXPECT_EQ(parser.parseDataGroupHashes(wrapped).size(), 3u);
    EXPECT_TRUE(parser.verifySignature(wrapped, dsc.get()));
}

TEST_F(SodParserAdapterTest, Unwrap_LeavesRawCmsUnchanged) {
    EXPECT_EQ(parser.unwrapIcaoSod(sod), sod);
}

// ============================================================================
// Signature
// ============================================================================

TEST_F(SodParserAdapterTest, VerifySignature_WithCertificate) {
    EXPECT_TRUE(parser.verifySignature(sod, dsc.get()));
}

TEST_F(SodParserAdapterTest, VerifySignature_WithPublicKey) {
    EXPECT_TRUE(parser.verifySignature(sod, X509_get0_pubkey(dsc.get())));
}

TEST_F(SodParserAdapterTest, VerifySignature_TamperedFails) {
    EXPECT_FALSE(parser.verifySignature(tamperSignature(sod), dsc.get()));
}

TEST_F(SodParserAdapterTest, VerifySignature_OtherKeyFails) {
    auto otherKey = generateEcKey();
    EXPECT_FALSE(parser.verifySignature(sod, otherKey.get()));
}

TEST_F(SodParserAdapterTest, ExtractSignatureAlgorithm_Ecdsa) {
    EXPECT_EQ(parser.extractSignatureAlgorithm(sod), "SHA256withECDSA");
}

TEST_F(SodParserAdapterTest, ExtractSignatureAlgorithm_Rsa) {
    auto rsaKey = generateRsaKey();
    auto rsaDsc = createDsc(rsaKey.get(), cscaKey.get(), csca.get(), "DSC-RSA", dscOptions(200));
    auto rsaSod = createSod(rsaKey.get(), rsaDsc.get(), dataGroups);

    EXPECT_EQ(parser.extractSignatureAlgorithm(rsaSod), "SHA256withRSA");
    EXPECT_TRUE(parser.verifySignature(rsaSod, rsaDsc.get()));
}

// ============================================================================
// DSC extraction
// ============================================================================

TEST_F(SodParserAdapterTest, ExtractDscCertificate_MatchesSigner) {
    auto extracted = parser.extractDscCertificate(sod);
    ASSERT_NE(extracted, nullptr);
    EXPECT_EQ(X509_cmp(extracted.get(), dsc.get()), 0);
}

TEST_F(SodParserAdapterTest, ExtractDscInfo_SubjectAndSerial) {
    auto info = parser.extractDscInfo(sod);
    EXPECT_EQ(X509Util::extractDnAttribute(info.subjectDn, "CN"), "DSC-KOREA");
    EXPECT_EQ(info.serialNumber, "64");
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_F(SodParserAdapterTest, Garbage_ThrowsInfrastructureException) {
    Bytes garbage = {0x30, 0x03, 0x02, 0x01, 0x00};
    EXPECT_EQ(expectCode([&] { parser.parseDataGroupHashes(garbage); }), "SOD_PARSE_ERROR");
    EXPECT_EQ(expectCode([&] { parser.extractDscCertificate(garbage); }), "DSC_EXTRACT_ERROR");
    EXPECT_EQ(expectCode([&] { parser.extractSignatureAlgorithm(garbage); }),
              "SIGNATURE_ALGORITHM_EXTRACT_ERROR");
}

TEST_F(SodParserAdapterTest, WrapperWithoutCms_Throws) {
    Bytes wrapped = {0x77, 0x03, 0x04, 0x01, 0x00};
    EXPECT_EQ(expectCode([&] { parser.unwrapIcaoSod(wrapped); }), "SOD_PARSE_ERROR");
}

TEST_F(SodParserAdapterTest, VerifySignature_NullKeyThrows) {
    EXPECT_THROW(parser.verifySignature(sod, static_cast<EVP_PKEY*>(nullptr)), InfrastructureException);
}
