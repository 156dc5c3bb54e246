#include "passiveauthentication/infrastructure/adapter/OpenSslSodParserAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/X509Util.hpp"
#include <openssl/cms.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/asn1.h>
#include <openssl/objects.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace epassport::pa::infrastructure::adapter {

using domain::model::DataGroupHash;
using domain::model::DataGroupNumber;
using shared::exception::InfrastructureException;
using shared::util::CmsPtr;
using shared::util::X509Ptr;

namespace {

constexpr uint8_t ICAO_SOD_TAG = 0x77;

/**
 * Read the next TLV header; throws on malformed DER.
 */
void readObject(const uint8_t** p, long* length, int* tag, const uint8_t* end, const char* what) {
    int xclass = 0;
    if (*p >= end) {
        throw InfrastructureException("LDS_PARSE_ERROR", std::string("Truncated LDSSecurityObject at ") + what);
    }
    int ret = ASN1_get_object(p, length, tag, &xclass, end - *p);
    if (ret & 0x80) {
        throw InfrastructureException("LDS_PARSE_ERROR", std::string("Malformed DER at ") + what);
    }
}

} // anonymous namespace

const std::map<std::string, std::string>& OpenSslSodParserAdapter::getHashAlgorithmNames() {
    static const std::map<std::string, std::string> names = {
        {"1.3.14.3.2.26", "SHA-1"},           // Deprecated, reported as unsupported
        {"2.16.840.1.101.3.4.2.4", "SHA-224"},
        {"2.16.840.1.101.3.4.2.1", "SHA-256"},
        {"2.16.840.1.101.3.4.2.2", "SHA-384"},
        {"2.16.840.1.101.3.4.2.3", "SHA-512"}
    };
    return names;
}

const std::map<std::string, std::string>& OpenSslSodParserAdapter::getSignatureAlgorithmNames() {
    static const std::map<std::string, std::string> names = {
        {"1.2.840.113549.1.1.11", "SHA256withRSA"},
        {"1.2.840.113549.1.1.12", "SHA384withRSA"},
        {"1.2.840.113549.1.1.13", "SHA512withRSA"},
        {"1.2.840.10045.4.3.2", "SHA256withECDSA"},
        {"1.2.840.10045.4.3.3", "SHA384withECDSA"},
        {"1.2.840.10045.4.3.4", "SHA512withECDSA"}
    };
    return names;
}

std::string OpenSslSodParserAdapter::getOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    return std::string(buf);
}

std::string OpenSslSodParserAdapter::oidToString(const ASN1_OBJECT* obj) {
    char oid[80];
    int len = OBJ_obj2txt(oid, sizeof(oid), obj, 1);
    if (len <= 0) {
        return "";
    }
    return std::string(oid);
}

std::vector<uint8_t> OpenSslSodParserAdapter::unwrapIcaoSod(const std::vector<uint8_t>& sodBytes) {
    if (sodBytes.size() < 4 || sodBytes[0] != ICAO_SOD_TAG) {
        // Already unwrapped or raw CMS
        return sodBytes;
    }

    spdlog::debug("SOD has Tag 0x77 wrapper, unwrapping...");

    const uint8_t* p = sodBytes.data();
    long length = 0;
    int tag = 0;
    int xclass = 0;
    int ret = ASN1_get_object(&p, &length, &tag, &xclass, static_cast<long>(sodBytes.size()));
    if (ret & 0x80) {
        throw InfrastructureException("SOD_PARSE_ERROR", "Malformed ICAO 0x77 wrapper");
    }

    size_t offset = static_cast<size_t>(p - sodBytes.data());
    if (offset >= sodBytes.size() || sodBytes[offset] != 0x30) {
        throw InfrastructureException("SOD_PARSE_ERROR", "ICAO 0x77 wrapper does not contain CMS SignedData");
    }

    std::vector<uint8_t> result(sodBytes.begin() + static_cast<std::ptrdiff_t>(offset), sodBytes.end());
    spdlog::debug("Unwrapped SOD: {} bytes (was {} bytes)", result.size(), sodBytes.size());
    return result;
}

CmsPtr OpenSslSodParserAdapter::parseCms(const std::vector<uint8_t>& sodBytes, const std::string& errorCode) {
    std::vector<uint8_t> cmsBytes = unwrapIcaoSod(sodBytes);

    shared::util::BioPtr bio(BIO_new_mem_buf(cmsBytes.data(), static_cast<int>(cmsBytes.size())));
    if (!bio) {
        throw InfrastructureException(errorCode, "Failed to create BIO");
    }

    CmsPtr cms(d2i_CMS_bio(bio.get(), nullptr));
    if (!cms) {
        throw InfrastructureException(errorCode, "Failed to parse CMS SignedData: " + getOpenSslError());
    }
    return cms;
}

CMS_SignerInfo* OpenSslSodParserAdapter::firstSignerInfo(CMS_ContentInfo* cms) {
    STACK_OF(CMS_SignerInfo)* signerInfos = CMS_get0_SignerInfos(cms);
    if (!signerInfos || sk_CMS_SignerInfo_num(signerInfos) == 0) {
        return nullptr;
    }
    return sk_CMS_SignerInfo_value(signerInfos, 0);
}

OpenSslSodParserAdapter::LdsSecurityObject OpenSslSodParserAdapter::decodeLdsSecurityObject(
    const uint8_t* data, long len
) {
    LdsSecurityObject lds;

    const uint8_t* p = data;
    const uint8_t* end = data + len;
    long length = 0;
    int tag = 0;

    // LDSSecurityObject SEQUENCE
    readObject(&p, &length, &tag, end, "LDSSecurityObject");
    if (tag != V_ASN1_SEQUENCE) {
        throw InfrastructureException("LDS_PARSE_ERROR", "Expected SEQUENCE for LDSSecurityObject");
    }
    const uint8_t* seqEnd = p + length;

    // version INTEGER
    readObject(&p, &length, &tag, seqEnd, "version");
    if (tag != V_ASN1_INTEGER) {
        throw InfrastructureException("LDS_PARSE_ERROR", "Expected INTEGER for LDS version");
    }
    p += length;

    // hashAlgorithm AlgorithmIdentifier
    readObject(&p, &length, &tag, seqEnd, "hashAlgorithm");
    if (tag != V_ASN1_SEQUENCE) {
        throw InfrastructureException("LDS_PARSE_ERROR", "Expected SEQUENCE for hashAlgorithm");
    }
    const uint8_t* algEnd = p + length;
    const uint8_t* oidStart = p;
    ASN1_OBJECT* algorithm = d2i_ASN1_OBJECT(nullptr, &oidStart, algEnd - p);
    if (!algorithm) {
        throw InfrastructureException("LDS_PARSE_ERROR", "Invalid hashAlgorithm OID");
    }
    lds.hashAlgorithmOid = oidToString(algorithm);
    ASN1_OBJECT_free(algorithm);
    p = algEnd;

    // dataGroupHashValues SEQUENCE OF DataGroupHash
    readObject(&p, &length, &tag, seqEnd, "dataGroupHashValues");
    if (tag != V_ASN1_SEQUENCE) {
        throw InfrastructureException("LDS_PARSE_ERROR", "Expected SEQUENCE for dataGroupHashValues");
    }
    const uint8_t* dgSeqEnd = p + length;

    while (p < dgSeqEnd) {
        readObject(&p, &length, &tag, dgSeqEnd, "DataGroupHash");
        if (tag != V_ASN1_SEQUENCE) {
            throw InfrastructureException("LDS_PARSE_ERROR", "Expected SEQUENCE for DataGroupHash");
        }
        const uint8_t* dgEnd = p + length;

        readObject(&p, &length, &tag, dgEnd, "dataGroupNumber");
        if (tag != V_ASN1_INTEGER || length < 1 || length > 2) {
            spdlog::warn("Skipping DataGroupHash with malformed number");
            p = dgEnd;
            continue;
        }
        int dgNumber = 0;
        for (long i = 0; i < length; ++i) {
            dgNumber = (dgNumber << 8) | p[i];
        }
        p += length;

        readObject(&p, &length, &tag, dgEnd, "dataGroupHashValue");
        if (tag != V_ASN1_OCTET_STRING) {
            spdlog::warn("Skipping DG{} hash: expected OCTET STRING", dgNumber);
            p = dgEnd;
            continue;
        }
        std::vector<uint8_t> hashBytes(p, p + length);
        p = dgEnd;

        try {
            DataGroupNumber number = domain::model::dataGroupNumberFromInt(dgNumber);
            if (!lds.hashes.emplace(number, DataGroupHash::of(hashBytes)).second) {
                spdlog::warn("Duplicate hash entry for DG{} in SOD, keeping the first", dgNumber);
                continue;
            }
            spdlog::debug("Extracted hash for DG{}: {} bytes", dgNumber, hashBytes.size());
        } catch (const shared::exception::DomainException& e) {
            spdlog::warn("Skipping DG{} hash: {}", dgNumber, e.getMessage());
        }
    }

    return lds;
}

OpenSslSodParserAdapter::LdsSecurityObject OpenSslSodParserAdapter::parseLdsSecurityObject(
    const std::vector<uint8_t>& sodBytes
) {
    CmsPtr cms = parseCms(sodBytes, "SOD_PARSE_ERROR");

    ASN1_OCTET_STRING** pContent = CMS_get0_content(cms.get());
    if (!pContent || !*pContent) {
        throw InfrastructureException("SOD_PARSE_ERROR", "No encapsulated content in CMS");
    }

    const uint8_t* contentData = ASN1_STRING_get0_data(*pContent);
    int contentLen = ASN1_STRING_length(*pContent);
    return decodeLdsSecurityObject(contentData, contentLen);
}

std::map<DataGroupNumber, DataGroupHash> OpenSslSodParserAdapter::parseDataGroupHashes(
    const std::vector<uint8_t>& sodBytes
) {
    spdlog::debug("Parsing SOD to extract Data Group hashes (SOD size: {} bytes)", sodBytes.size());

    auto lds = parseLdsSecurityObject(sodBytes);

    spdlog::info("Successfully parsed {} Data Group hashes from SOD", lds.hashes.size());
    return lds.hashes;
}

bool OpenSslSodParserAdapter::verifySignature(const std::vector<uint8_t>& sodBytes, EVP_PKEY* dscPublicKey) {
    spdlog::debug("Verifying SOD signature with DSC public key");

    if (!dscPublicKey) {
        throw InfrastructureException("SOD_VERIFY_ERROR", "DSC public key is null");
    }

    // Select the embedded certificate that carries this key
    CmsPtr cms = parseCms(sodBytes, "SOD_VERIFY_ERROR");
    STACK_OF(X509)* certs = CMS_get1_certs(cms.get());
    X509Ptr signer;
    for (int i = 0; certs && i < sk_X509_num(certs); ++i) {
        X509* cert = sk_X509_value(certs, i);
        EVP_PKEY* key = X509_get0_pubkey(cert);
        if (key && EVP_PKEY_eq(key, dscPublicKey) == 1) {
            signer = shared::util::shareCertificate(cert);
            break;
        }
    }
    if (certs) {
        sk_X509_pop_free(certs, X509_free);
    }

    if (!signer) {
        spdlog::error("SOD carries no certificate matching the DSC public key");
        return false;
    }
    return verifySignature(sodBytes, signer.get());
}

bool OpenSslSodParserAdapter::verifySignature(const std::vector<uint8_t>& sodBytes, X509* dscCert) {
    spdlog::debug("Verifying SOD signature with DSC X509 certificate");

    if (!dscCert) {
        throw InfrastructureException("SOD_VERIFY_ERROR", "DSC certificate is null");
    }

    CmsPtr cms = parseCms(sodBytes, "SOD_VERIFY_ERROR");

    STACK_OF(X509)* certs = sk_X509_new_null();
    X509_STORE* store = X509_STORE_new();
    shared::util::BioPtr contentBio(BIO_new(BIO_s_mem()));
    if (!certs || !store || !contentBio || !sk_X509_push(certs, dscCert)) {
        sk_X509_free(certs);
        X509_STORE_free(store);
        throw InfrastructureException("SOD_VERIFY_ERROR", "Failed to allocate verification context");
    }

    // Chain trust is decided by the trust chain validator, not by CMS
    int result = CMS_verify(cms.get(), certs, store, nullptr, contentBio.get(),
                            CMS_NOINTERN | CMS_NO_SIGNER_CERT_VERIFY | CMS_BINARY);

    sk_X509_free(certs);
    X509_STORE_free(store);

    if (result == 1) {
        spdlog::info("SOD signature verification succeeded with DSC certificate");
        return true;
    }
    spdlog::error("SOD signature verification failed: {}", getOpenSslError());
    return false;
}

std::string OpenSslSodParserAdapter::extractHashAlgorithm(const std::vector<uint8_t>& sodBytes) {
    spdlog::debug("Extracting hash algorithm from SOD");

    auto lds = parseLdsSecurityObject(sodBytes);

    const auto& names = getHashAlgorithmNames();
    auto it = names.find(lds.hashAlgorithmOid);
    std::string algorithmName = it != names.end()
        ? it->second
        : "UNKNOWN(" + lds.hashAlgorithmOid + ")";

    spdlog::info("Extracted hash algorithm: {}", algorithmName);
    return algorithmName;
}

std::string OpenSslSodParserAdapter::extractSignatureAlgorithm(const std::vector<uint8_t>& sodBytes) {
    spdlog::debug("Extracting signature algorithm from SOD");

    CmsPtr cms = parseCms(sodBytes, "SIGNATURE_ALGORITHM_EXTRACT_ERROR");
    CMS_SignerInfo* si = firstSignerInfo(cms.get());
    if (!si) {
        throw InfrastructureException("SIGNATURE_ALGORITHM_EXTRACT_ERROR", "SOD has no SignerInfo");
    }

    X509_ALGOR* digestAlg = nullptr;
    X509_ALGOR* sigAlg = nullptr;
    CMS_SignerInfo_get0_algs(si, nullptr, nullptr, &digestAlg, &sigAlg);
    if (!sigAlg) {
        throw InfrastructureException("SIGNATURE_ALGORITHM_EXTRACT_ERROR", "SignerInfo has no signature algorithm");
    }

    const ASN1_OBJECT* sigObj = nullptr;
    X509_ALGOR_get0(&sigObj, nullptr, nullptr, sigAlg);
    std::string sigOid = oidToString(sigObj);

    const auto& names = getSignatureAlgorithmNames();
    auto it = names.find(sigOid);
    std::string algorithmName;
    if (it != names.end()) {
        algorithmName = it->second;
    } else {
        // Key-only OIDs (rsaEncryption, ecPublicKey, RSASSA-PSS) take the digest from SignerInfo
        std::string digest = "UNKNOWN";
        if (digestAlg) {
            const ASN1_OBJECT* digestObj = nullptr;
            X509_ALGOR_get0(&digestObj, nullptr, nullptr, digestAlg);
            auto hashIt = getHashAlgorithmNames().find(oidToString(digestObj));
            if (hashIt != getHashAlgorithmNames().end()) {
                digest = hashIt->second;
                digest.erase(std::remove(digest.begin(), digest.end(), '-'), digest.end());
            }
        }

        if (sigOid == "1.2.840.113549.1.1.1") {
            algorithmName = digest + "withRSA";
        } else if (sigOid == "1.2.840.113549.1.1.10") {
            algorithmName = digest + "withRSA/PSS";
        } else if (sigOid == "1.2.840.10045.2.1") {
            algorithmName = digest + "withECDSA";
        } else {
            algorithmName = "UNKNOWN(" + sigOid + ")";
        }
    }

    spdlog::info("Extracted signature algorithm: {}", algorithmName);
    return algorithmName;
}

domain::port::DscInfo OpenSslSodParserAdapter::extractDscInfo(const std::vector<uint8_t>& sodBytes) {
    spdlog::debug("Extracting DSC information from SOD");

    X509Ptr cert = extractDscCertificate(sodBytes);

    domain::port::DscInfo info{
        shared::util::X509Util::getSubjectDn(cert.get()),
        shared::util::X509Util::getSerialNumberHex(cert.get())
    };

    spdlog::info("Extracted DSC info - Subject: {}, Serial: {}", info.subjectDn, info.serialNumber);
    return info;
}

X509Ptr OpenSslSodParserAdapter::extractDscCertificate(const std::vector<uint8_t>& sodBytes) {
    spdlog::debug("Extracting full DSC certificate from SOD");

    CmsPtr cms = parseCms(sodBytes, "DSC_EXTRACT_ERROR");

    STACK_OF(X509)* certs = CMS_get1_certs(cms.get());
    if (!certs || sk_X509_num(certs) == 0) {
        if (certs) {
            sk_X509_pop_free(certs, X509_free);
        }
        throw InfrastructureException("NO_DSC_IN_SOD", "No certificates found in SOD");
    }

    // Prefer the certificate identified by the SignerInfo; fall back to the first one
    X509Ptr result;
    CMS_SignerInfo* si = firstSignerInfo(cms.get());
    for (int i = 0; si && i < sk_X509_num(certs); ++i) {
        X509* candidate = sk_X509_value(certs, i);
        if (CMS_SignerInfo_cert_cmp(si, candidate) == 0) {
            result = shared::util::shareCertificate(candidate);
            break;
        }
    }
    if (!result) {
        result = shared::util::shareCertificate(sk_X509_value(certs, 0));
    }
    sk_X509_pop_free(certs, X509_free);

    if (!result) {
        throw InfrastructureException("NO_DSC_IN_SOD", "Failed to get DSC certificate");
    }

    spdlog::info("Extracted DSC certificate - Subject: {}",
                 shared::util::X509Util::getSubjectDn(result.get()));
    return result;
}

} // namespace epassport::pa::infrastructure::adapter
