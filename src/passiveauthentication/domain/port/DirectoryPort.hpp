#pragma once

#include "shared/util/OpenSslPtr.hpp"
#include <string>
#include <vector>

namespace epassport::pa::domain::port {

/**
 * Port interface for trust anchor lookup (CSCA certificates and CRLs).
 *
 * Read-only, DN-keyed queries against an external directory. A missing
 * entry is returned as an empty pointer. Transport failures raise
 * InfrastructureException; isTransient() marks those worth retrying.
 */
class DirectoryPort {
public:
    virtual ~DirectoryPort() = default;

    /**
     * Find CSCA certificate by subject DN.
     */
    virtual shared::util::X509Ptr findCscaBySubjectDn(const std::string& subjectDn) = 0;

    /**
     * Every CSCA carrying the subject DN, newest first. Key rollover leaves
     * several CSCAs under one DN; the default returns the single match.
     */
    virtual std::vector<shared::util::X509Ptr> findAllCscasBySubjectDn(const std::string& subjectDn) {
        std::vector<shared::util::X509Ptr> found;
        if (auto csca = findCscaBySubjectDn(subjectDn)) {
            found.push_back(std::move(csca));
        }
        return found;
    }

    /**
     * Find the CRL issued by the given DN.
     */
    virtual shared::util::X509CrlPtr findCrlByIssuerDn(const std::string& issuerDn) = 0;
};

} // namespace epassport::pa::domain::port
