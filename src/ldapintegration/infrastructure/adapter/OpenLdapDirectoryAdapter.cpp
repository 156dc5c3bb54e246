#include "ldapintegration/infrastructure/adapter/OpenLdapDirectoryAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/X509Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <sstream>

namespace epassport::ldap::infrastructure::adapter {

using shared::exception::InfrastructureException;
using shared::util::X509Util;
using shared::util::X509Ptr;
using shared::util::X509CrlPtr;

namespace {

constexpr const char* kCertificateAttribute = "userCertificate;binary";
constexpr const char* kCrlAttribute = "certificateRevocationList;binary";
constexpr const char* kPkdFilter = "(objectClass=pkdDownload)";

} // anonymous namespace

OpenLdapDirectoryAdapter::OpenLdapDirectoryAdapter(
    std::shared_ptr<common::LdapConnectionPool> pool,
    std::string baseDn,
    std::chrono::milliseconds searchTimeout
) : pool_(std::move(pool)), baseDn_(std::move(baseDn)), searchTimeout_(searchTimeout) {
    if (!pool_) {
        throw std::invalid_argument("LDAP connection pool cannot be null");
    }
    if (baseDn_.empty()) {
        throw std::invalid_argument("Base DN cannot be empty");
    }
    spdlog::debug("OpenLdapDirectoryAdapter initialized with baseDn: {}", baseDn_);
}

bool OpenLdapDirectoryAdapter::isTransientError(int ldapResultCode) {
    switch (ldapResultCode) {
        case LDAP_SERVER_DOWN:
        case LDAP_TIMEOUT:
        case LDAP_TIMELIMIT_EXCEEDED:
        case LDAP_BUSY:
        case LDAP_UNAVAILABLE:
        case LDAP_CONNECT_ERROR:
            return true;
        default:
            return false;
    }
}

std::string OpenLdapDirectoryAdapter::buildSearchBaseDn(
    const std::string& type,
    const std::string& countryCode) const
{
    std::ostringstream oss;
    oss << "o=" << type << ",c=" << countryCode << ",dc=data," << baseDn_;
    return oss.str();
}

LDAPMessage* OpenLdapDirectoryAdapter::search(
    common::LdapConnection& conn,
    const std::string& baseDn,
    const char* attribute) const
{
    spdlog::debug("LDAP search: base={}, filter={}", baseDn, kPkdFilter);

    char* attrs[] = {const_cast<char*>(attribute), nullptr};
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(searchTimeout_);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(searchTimeout_ - seconds);
    struct timeval timeout = {
        static_cast<time_t>(seconds.count()),
        static_cast<suseconds_t>(micros.count())
    };

    LDAP* ld = conn.get();
    LDAPMessage* res = nullptr;
    int rc = ldap_search_ext_s(
        ld,
        baseDn.c_str(),
        LDAP_SCOPE_SUBTREE,
        kPkdFilter,
        attrs,
        0,
        nullptr,
        nullptr,
        &timeout,
        100,  // Size limit
        &res
    );

    if (rc == LDAP_NO_SUCH_OBJECT) {
        if (res) ldap_msgfree(res);
        spdlog::debug("LDAP subtree not present: {}", baseDn);
        return nullptr;
    }
    if (rc != LDAP_SUCCESS && rc != LDAP_SIZELIMIT_EXCEEDED) {
        if (res) ldap_msgfree(res);
        if (rc == LDAP_SERVER_DOWN || rc == LDAP_CONNECT_ERROR) {
            conn.discard();
        }
        bool timedOut = rc == LDAP_TIMEOUT || rc == LDAP_TIMELIMIT_EXCEEDED;
        throw InfrastructureException(
            timedOut ? "DIRECTORY_TIMEOUT" : "DIRECTORY_UNAVAILABLE",
            "LDAP search failed on " + baseDn + ": " + ldap_err2string(rc),
            isTransientError(rc)
        );
    }

    int count = ldap_count_entries(ld, res);
    spdlog::debug("LDAP search returned {} entries", count);

    if (count <= 0) {
        ldap_msgfree(res);
        return nullptr;
    }
    return res;
}

std::vector<X509Ptr> OpenLdapDirectoryAdapter::readCertificates(LDAP* ld, LDAPMessage* result) const {
    std::vector<X509Ptr> certs;

    for (LDAPMessage* entry = ldap_first_entry(ld, result); entry; entry = ldap_next_entry(ld, entry)) {
        struct berval** values = ldap_get_values_len(ld, entry, kCertificateAttribute);
        if (!values) {
            continue;
        }
        for (int i = 0; values[i]; ++i) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(values[i]->bv_val);
            X509Ptr cert(d2i_X509(nullptr, &data, static_cast<long>(values[i]->bv_len)));
            if (cert) {
                certs.push_back(std::move(cert));
            } else {
                spdlog::warn("Skipping undecodable certificate in LDAP entry");
            }
        }
        ldap_value_free_len(values);
    }
    return certs;
}

std::vector<X509CrlPtr> OpenLdapDirectoryAdapter::readCrls(LDAP* ld, LDAPMessage* result) const {
    std::vector<X509CrlPtr> crls;

    for (LDAPMessage* entry = ldap_first_entry(ld, result); entry; entry = ldap_next_entry(ld, entry)) {
        struct berval** values = ldap_get_values_len(ld, entry, kCrlAttribute);
        if (!values) {
            continue;
        }
        for (int i = 0; values[i]; ++i) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(values[i]->bv_val);
            X509CrlPtr crl(d2i_X509_CRL(nullptr, &data, static_cast<long>(values[i]->bv_len)));
            if (crl) {
                crls.push_back(std::move(crl));
            } else {
                spdlog::warn("Skipping undecodable CRL in LDAP entry");
            }
        }
        ldap_value_free_len(values);
    }
    return crls;
}

X509Ptr OpenLdapDirectoryAdapter::findCscaBySubjectDn(const std::string& subjectDn) {
    std::vector<X509Ptr> found = findAllCscasBySubjectDn(subjectDn);
    if (found.empty()) {
        return X509Ptr();
    }
    return std::move(found.front());
}

std::vector<X509Ptr> OpenLdapDirectoryAdapter::findAllCscasBySubjectDn(const std::string& subjectDn) {
    std::vector<X509Ptr> matches;
    std::string countryCode = X509Util::extractDnAttribute(subjectDn, "C");
    if (countryCode.empty()) {
        spdlog::warn("No country in CSCA subject DN: {}", subjectDn);
        return matches;
    }

    std::string target = X509Util::normalizeDn(subjectDn);
    common::LdapConnection conn = pool_->acquire();

    for (const char* type : {"csca", "lc"}) {
        LDAPMessage* res = search(conn, buildSearchBaseDn(type, countryCode), kCertificateAttribute);
        if (!res) {
            continue;
        }
        std::vector<X509Ptr> certs = readCertificates(conn.get(), res);
        ldap_msgfree(res);

        for (auto& cert : certs) {
            if (X509Util::normalizeDn(X509Util::getSubjectDn(cert.get())) == target) {
                matches.push_back(std::move(cert));
            }
        }
        if (!matches.empty()) {
            break;
        }
        spdlog::debug("No CSCA match in o={}, c={}", type, countryCode);
    }

    if (matches.empty()) {
        spdlog::info("CSCA not found in LDAP: {}", subjectDn);
        return matches;
    }

    auto notBefore = [](const X509Ptr& cert) {
        return X509Util::toTimePoint(X509_get0_notBefore(cert.get()))
            .value_or(std::chrono::system_clock::time_point{});
    };
    std::stable_sort(matches.begin(), matches.end(), [&notBefore](const X509Ptr& a, const X509Ptr& b) {
        return notBefore(a) > notBefore(b);
    });
    spdlog::debug("LDAP: {} CSCA candidate(s) for {}", matches.size(), subjectDn);
    return matches;
}

X509CrlPtr OpenLdapDirectoryAdapter::findCrlByIssuerDn(const std::string& issuerDn) {
    std::string countryCode = X509Util::extractDnAttribute(issuerDn, "C");
    if (countryCode.empty()) {
        spdlog::warn("No country in CRL issuer DN: {}", issuerDn);
        return X509CrlPtr();
    }

    std::string target = X509Util::normalizeDn(issuerDn);
    common::LdapConnection conn = pool_->acquire();

    LDAPMessage* res = search(conn, buildSearchBaseDn("crl", countryCode), kCrlAttribute);
    if (!res) {
        spdlog::debug("No CRL entries for country: {}", countryCode);
        return X509CrlPtr();
    }
    std::vector<X509CrlPtr> crls = readCrls(conn.get(), res);
    ldap_msgfree(res);

    X509CrlPtr best;
    std::chrono::system_clock::time_point bestThisUpdate{};
    for (auto& crl : crls) {
        if (X509Util::normalizeDn(X509Util::getCrlIssuerDn(crl.get())) != target) {
            continue;
        }
        auto thisUpdate = X509Util::toTimePoint(X509_CRL_get0_lastUpdate(crl.get()))
            .value_or(std::chrono::system_clock::time_point{});
        if (!best || thisUpdate > bestThisUpdate) {
            best = std::move(crl);
            bestThisUpdate = thisUpdate;
        }
    }

    if (!best) {
        spdlog::info("No CRL issued by {} in LDAP", issuerDn);
    }
    return best;
}

} // namespace epassport::ldap::infrastructure::adapter
