#pragma once

#include "passiveauthentication/domain/port/DirectoryPort.hpp"
#include "common/ldap/ldap_connection_pool.h"
#include "shared/util/OpenSslPtr.hpp"
#include <ldap.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace epassport::ldap::infrastructure::adapter {

/**
 * ICAO PKD directory lookup over OpenLDAP.
 *
 * DIT layout:
 *   o=csca,c={COUNTRY},dc=data,{baseDn}  CSCA certificates
 *   o=lc,c={COUNTRY},dc=data,{baseDn}    link certificates
 *   o=crl,c={COUNTRY},dc=data,{baseDn}   CRLs
 *
 * The country comes from the C attribute of the requested DN. Candidates
 * are matched on normalized DN and ordered newest notBefore first; link
 * certificates are searched only when o=csca has no match.
 */
class OpenLdapDirectoryAdapter : public pa::domain::port::DirectoryPort {
private:
    std::shared_ptr<common::LdapConnectionPool> pool_;
    std::string baseDn_;
    std::chrono::milliseconds searchTimeout_;

    std::string buildSearchBaseDn(const std::string& type, const std::string& countryCode) const;

    /**
     * @return search result (caller frees), or nullptr if the subtree is
     *         missing or empty
     * @throws InfrastructureException DIRECTORY_TIMEOUT on a time limit,
     *         DIRECTORY_UNAVAILABLE otherwise (transient for connection
     *         loss and a busy server); a lost connection
     *         is discarded rather than returned to the pool
     */
    LDAPMessage* search(common::LdapConnection& conn, const std::string& baseDn, const char* attribute) const;

    std::vector<shared::util::X509Ptr> readCertificates(LDAP* ld, LDAPMessage* result) const;
    std::vector<shared::util::X509CrlPtr> readCrls(LDAP* ld, LDAPMessage* result) const;

public:
    OpenLdapDirectoryAdapter(
        std::shared_ptr<common::LdapConnectionPool> pool,
        std::string baseDn,
        std::chrono::milliseconds searchTimeout
    );

    shared::util::X509Ptr findCscaBySubjectDn(const std::string& subjectDn) override;
    std::vector<shared::util::X509Ptr> findAllCscasBySubjectDn(const std::string& subjectDn) override;
    shared::util::X509CrlPtr findCrlByIssuerDn(const std::string& issuerDn) override;

    static bool isTransientError(int ldapResultCode);
};

} // namespace epassport::ldap::infrastructure::adapter
