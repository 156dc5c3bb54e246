#pragma once

#include "passiveauthentication/domain/port/SodParserPort.hpp"
#include "shared/util/OpenSslPtr.hpp"
#include <map>
#include <string>

namespace epassport::pa::infrastructure::adapter {

/**
 * OpenSSL implementation of SodParserPort.
 *
 * SOD is a CMS SignedData structure (optionally wrapped in ICAO tag 0x77)
 * whose encapsulated content is an LDSSecurityObject:
 *
 *   LDSSecurityObject ::= SEQUENCE {
 *     version             INTEGER,
 *     hashAlgorithm       AlgorithmIdentifier,
 *     dataGroupHashValues SEQUENCE OF DataGroupHash }
 *   DataGroupHash ::= SEQUENCE {
 *     dataGroupNumber     INTEGER,
 *     dataGroupHashValue  OCTET STRING }
 *
 * Reference: ICAO Doc 9303 Part 10 / Part 11
 */
class OpenSslSodParserAdapter : public domain::port::SodParserPort {
private:
    struct LdsSecurityObject {
        std::string hashAlgorithmOid;
        std::map<domain::model::DataGroupNumber, domain::model::DataGroupHash> hashes;
    };

    static const std::map<std::string, std::string>& getHashAlgorithmNames();
    static const std::map<std::string, std::string>& getSignatureAlgorithmNames();
    static std::string getOpenSslError();

    shared::util::CmsPtr parseCms(const std::vector<uint8_t>& sodBytes, const std::string& errorCode);
    LdsSecurityObject parseLdsSecurityObject(const std::vector<uint8_t>& sodBytes);
    static LdsSecurityObject decodeLdsSecurityObject(const uint8_t* data, long len);
    static CMS_SignerInfo* firstSignerInfo(CMS_ContentInfo* cms);
    static std::string oidToString(const ASN1_OBJECT* obj);

public:
    OpenSslSodParserAdapter() = default;
    ~OpenSslSodParserAdapter() override = default;

    std::vector<uint8_t> unwrapIcaoSod(const std::vector<uint8_t>& sodBytes) override;

    std::map<domain::model::DataGroupNumber, domain::model::DataGroupHash> parseDataGroupHashes(
        const std::vector<uint8_t>& sodBytes
    ) override;

    bool verifySignature(const std::vector<uint8_t>& sodBytes, EVP_PKEY* dscPublicKey) override;
    bool verifySignature(const std::vector<uint8_t>& sodBytes, X509* dscCert) override;

    std::string extractHashAlgorithm(const std::vector<uint8_t>& sodBytes) override;
    std::string extractSignatureAlgorithm(const std::vector<uint8_t>& sodBytes) override;

    domain::port::DscInfo extractDscInfo(const std::vector<uint8_t>& sodBytes) override;
    shared::util::X509Ptr extractDscCertificate(const std::vector<uint8_t>& sodBytes) override;
};

} // namespace epassport::pa::infrastructure::adapter
