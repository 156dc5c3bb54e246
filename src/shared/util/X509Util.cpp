/**
 * @file X509Util.cpp
 * @brief Pure X.509 helper operations implementation
 */

#include "shared/util/X509Util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace epassport::shared::util {

namespace {

std::string toLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> splitDn(const std::string& dn) {
    std::vector<std::string> parts;
    if (dn.empty()) return parts;

    if (dn[0] == '/') {
        std::istringstream stream(dn);
        std::string segment;
        while (std::getline(stream, segment, '/')) {
            std::string rdn = trim(segment);
            if (!rdn.empty()) parts.push_back(rdn);
        }
        return parts;
    }

    // RFC 2253: CN=X,O=Y,C=Z with quoting and backslash escapes
    std::string current;
    bool inQuotes = false;
    for (size_t i = 0; i < dn.size(); i++) {
        char c = dn[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            current += c;
        } else if (c == ',' && !inQuotes) {
            std::string rdn = trim(current);
            if (!rdn.empty()) parts.push_back(rdn);
            current.clear();
        } else if (c == '\\' && i + 1 < dn.size()) {
            current += c;
            current += dn[++i];
        } else {
            current += c;
        }
    }
    std::string rdn = trim(current);
    if (!rdn.empty()) parts.push_back(rdn);
    return parts;
}

} // namespace

// --- Signatures ---

bool X509Util::verifyCertificateSignature(X509* cert, EVP_PKEY* publicKey) {
    if (!cert || !publicKey) return false;

    int result = X509_verify(cert, publicKey);
    if (result != 1) {
        ERR_clear_error();
    }
    return result == 1;
}

bool X509Util::verifyCrlSignature(X509_CRL* crl, EVP_PKEY* publicKey) {
    if (!crl || !publicKey) return false;

    int result = X509_CRL_verify(crl, publicKey);
    if (result != 1) {
        ERR_clear_error();
    }
    return result == 1;
}

// --- Names ---

std::string X509Util::nameToString(const X509_NAME* name) {
    if (!name) return "";

    char* dn = X509_NAME_oneline(name, nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string X509Util::getSubjectDn(const X509* cert) {
    if (!cert) return "";
    return nameToString(X509_get_subject_name(cert));
}

std::string X509Util::getIssuerDn(const X509* cert) {
    if (!cert) return "";
    return nameToString(X509_get_issuer_name(cert));
}

std::string X509Util::getCrlIssuerDn(const X509_CRL* crl) {
    if (!crl) return "";
    return nameToString(X509_CRL_get_issuer(crl));
}

std::string X509Util::getSerialNumberHex(const X509* cert) {
    if (!cert) return "";

    const ASN1_INTEGER* serial = X509_get0_serialNumber(cert);
    BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
    if (!bn) return "";

    char* hex = BN_bn2hex(bn);
    std::string result = hex ? std::string(hex) : "";
    OPENSSL_free(hex);
    BN_free(bn);
    return result;
}

std::string X509Util::getFingerprint(const X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < mdLen; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return oss.str();
}

std::string X509Util::normalizeDn(const std::string& dn) {
    std::vector<std::string> parts;
    for (const auto& rdn : splitDn(dn)) {
        parts.push_back(toLower(rdn));
    }
    std::sort(parts.begin(), parts.end());

    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += "|";
        result += parts[i];
    }
    return result;
}

std::string X509Util::extractDnAttribute(const std::string& dn, const std::string& attr) {
    const std::string key = toLower(attr);
    for (const auto& rdn : splitDn(dn)) {
        size_t eq = rdn.find('=');
        if (eq == std::string::npos) continue;
        if (toLower(trim(rdn.substr(0, eq))) == key) {
            return trim(rdn.substr(eq + 1));
        }
    }
    return "";
}

// --- Time ---

std::optional<std::chrono::system_clock::time_point> X509Util::toTimePoint(const ASN1_TIME* t) {
    if (!t) return std::nullopt;

    struct tm tmValue = {};
    if (ASN1_TIME_to_tm(t, &tmValue) != 1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tmValue));
}

std::string X509Util::toIso8601(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tmValue = {};
    gmtime_r(&t, &tmValue);

    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmValue);
    return std::string(buf);
}

std::optional<std::chrono::system_clock::time_point> X509Util::parseIso8601(const std::string& text) {
    struct tm tmValue = {};
    std::istringstream in(text);

    if (text.size() == 10) {
        in >> std::get_time(&tmValue, "%Y-%m-%d");
    } else {
        in >> std::get_time(&tmValue, "%Y-%m-%dT%H:%M:%S");
    }
    if (in.fail()) {
        return std::nullopt;
    }

    std::string rest;
    in >> rest;
    if (!rest.empty() && rest != "Z") {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tmValue));
}

} // namespace epassport::shared::util
