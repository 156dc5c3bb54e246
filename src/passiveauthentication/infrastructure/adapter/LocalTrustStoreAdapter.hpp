#pragma once

#include "passiveauthentication/domain/port/DirectoryPort.hpp"
#include "shared/util/OpenSslPtr.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace epassport::pa::infrastructure::adapter {

/**
 * In-process trust anchor store.
 *
 * Holds CSCA certificates and CRLs loaded from PEM/DER files or added
 * directly, keyed by normalized DN. CSCAs sharing a DN are all kept and
 * returned newest notBefore first. For an issuer with several CRLs the
 * one with the latest thisUpdate is kept.
 */
class LocalTrustStoreAdapter : public domain::port::DirectoryPort {
private:
    mutable std::mutex mutex_;
    std::multimap<std::string, shared::util::X509Ptr> cscas_;
    std::map<std::string, shared::util::X509CrlPtr> crls_;

public:
    LocalTrustStoreAdapter() = default;

    void addCsca(shared::util::X509Ptr csca);
    void addCrl(shared::util::X509CrlPtr crl);

    /**
     * Load every certificate in a PEM bundle or a single DER file.
     *
     * @return number of certificates added
     * @throws InfrastructureException TRUST_STORE_LOAD_ERROR
     */
    size_t loadCscaFile(const std::string& path);

    /**
     * Load one CRL from a PEM or DER file.
     *
     * @throws InfrastructureException TRUST_STORE_LOAD_ERROR
     */
    void loadCrlFile(const std::string& path);

    size_t cscaCount() const;
    size_t crlCount() const;

    shared::util::X509Ptr findCscaBySubjectDn(const std::string& subjectDn) override;
    std::vector<shared::util::X509Ptr> findAllCscasBySubjectDn(const std::string& subjectDn) override;
    shared::util::X509CrlPtr findCrlByIssuerDn(const std::string& issuerDn) override;
};

} // namespace epassport::pa::infrastructure::adapter
