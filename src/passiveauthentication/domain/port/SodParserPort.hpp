#pragma once

#include "passiveauthentication/domain/model/DataGroupNumber.hpp"
#include "passiveauthentication/domain/model/DataGroupHash.hpp"
#include "shared/util/OpenSslPtr.hpp"
#include <openssl/x509.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace epassport::pa::domain::port {

struct DscInfo {
    std::string subjectDn;
    std::string serialNumber;  // hex
};

/**
 * Reads an EF.SOD: a CMS SignedData whose encapsulated content is the
 * LDSSecurityObject, optionally inside the ICAO application tag 0x77.
 *
 * Every method accepts wrapped or bare input. Structural failures throw
 * InfrastructureException with a per-operation code (SOD_PARSE_ERROR,
 * LDS_PARSE_ERROR, SOD_VERIFY_ERROR, ...); a well-formed SOD whose
 * signature does not verify is a false return, not an exception.
 */
class SodParserPort {
public:
    virtual ~SodParserPort() = default;

    /// Hashes listed in the LDSSecurityObject; numbers outside DG1..DG16 are skipped.
    virtual std::map<model::DataGroupNumber, model::DataGroupHash> parseDataGroupHashes(
        const std::vector<uint8_t>& sodBytes) = 0;

    virtual bool verifySignature(const std::vector<uint8_t>& sodBytes, EVP_PKEY* dscPublicKey) = 0;
    virtual bool verifySignature(const std::vector<uint8_t>& sodBytes, X509* dscCert) = 0;

    /**
     * "SHA-1", "SHA-224", "SHA-256", "SHA-384" or "SHA-512"; anything else is
     * "UNKNOWN(<dotted oid>)". Whether SHA-1 is acceptable is the caller's call.
     */
    virtual std::string extractHashAlgorithm(const std::vector<uint8_t>& sodBytes) = 0;

    /// Java-style name of the SignerInfo algorithm, e.g. "SHA256withECDSA".
    virtual std::string extractSignatureAlgorithm(const std::vector<uint8_t>& sodBytes) = 0;

    virtual DscInfo extractDscInfo(const std::vector<uint8_t>& sodBytes) = 0;

    virtual shared::util::X509Ptr extractDscCertificate(const std::vector<uint8_t>& sodBytes) = 0;

    /// Content of the 0x77 wrapper, or the input unchanged when it is bare CMS.
    virtual std::vector<uint8_t> unwrapIcaoSod(const std::vector<uint8_t>& sodBytes) = 0;
};

} // namespace epassport::pa::domain::port
