#pragma once

#include "passiveauthentication/domain/model/VerificationSession.hpp"
#include "passiveauthentication/domain/model/VerificationRecord.hpp"
#include "passiveauthentication/domain/model/VerificationSessionId.hpp"
#include "passiveauthentication/domain/model/PassiveAuthenticationStatus.hpp"
#include <optional>
#include <vector>

namespace epassport::pa::domain::repository {

/**
 * Repository interface for verification sessions and their audit logs.
 *
 * Sessions are stored as VerificationRecord snapshots. Listing is ordered
 * by creation time, newest first.
 */
class VerificationSessionRepository {
public:
    virtual ~VerificationSessionRepository() = default;

    /**
     * Save a session and its audit log. Saving the same id again replaces
     * the stored record.
     */
    virtual void save(const model::VerificationSession& session) = 0;

    virtual std::optional<model::VerificationRecord> findById(const model::VerificationSessionId& id) = 0;

    /**
     * @param offset Starting offset
     * @param limit Maximum number of results
     */
    virtual std::vector<model::VerificationRecord> findAll(int offset, int limit) = 0;

    virtual std::vector<model::VerificationRecord> findByStatus(
        model::PassiveAuthenticationStatus status,
        int offset,
        int limit
    ) = 0;

    virtual long countAll() = 0;

    virtual long countByStatus(model::PassiveAuthenticationStatus status) = 0;

    /**
     * Audit entries of one session in insertion order.
     */
    virtual std::vector<model::AuditLogEntry> findAuditLog(const model::VerificationSessionId& id) = 0;
};

} // namespace epassport::pa::domain::repository
