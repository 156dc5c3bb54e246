#pragma once

#include "passiveauthentication/domain/repository/VerificationSessionRepository.hpp"
#include "common/database/db_connection_pool.h"
#include <libpq-fe.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epassport::pa::infrastructure::repository {

/**
 * PostgreSQL repository for verification sessions (libpq).
 *
 * Tables:
 *   pa_verification_session   one row per session, result and data group
 *                             verdicts as JSONB
 *   pa_verification_audit_log one row per audit entry, ordered by seq
 *
 * save() writes the session row and replaces its audit rows in one
 * transaction. Every failure is raised as InfrastructureException
 * DATABASE_ERROR.
 */
class PostgresVerificationSessionRepository : public domain::repository::VerificationSessionRepository {
private:
    std::shared_ptr<common::DbConnectionPool> pool_;

    struct PgResultDeleter { void operator()(PGresult* r) const { PQclear(r); } };
    using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;
    using Params = std::vector<std::optional<std::string>>;

    static PgResultPtr execute(PGconn* conn, const std::string& sql, const Params& params);

    std::vector<domain::model::VerificationRecord> query(const std::string& sql, const Params& params);
    std::vector<domain::model::AuditLogEntry> loadAuditLog(PGconn* conn, const std::string& sessionId);
    static domain::model::VerificationRecord recordFromRow(PGresult* res, int row);
    static long countQuery(PGconn* conn, const std::string& sql, const Params& params);

public:
    explicit PostgresVerificationSessionRepository(std::shared_ptr<common::DbConnectionPool> pool);

    /**
     * Create both tables if they do not exist.
     */
    void initializeSchema();

    void save(const domain::model::VerificationSession& session) override;

    std::optional<domain::model::VerificationRecord> findById(
        const domain::model::VerificationSessionId& id) override;

    std::vector<domain::model::VerificationRecord> findAll(int offset, int limit) override;

    std::vector<domain::model::VerificationRecord> findByStatus(
        domain::model::PassiveAuthenticationStatus status,
        int offset,
        int limit
    ) override;

    long countAll() override;
    long countByStatus(domain::model::PassiveAuthenticationStatus status) override;

    std::vector<domain::model::AuditLogEntry> findAuditLog(
        const domain::model::VerificationSessionId& id) override;
};

} // namespace epassport::pa::infrastructure::repository
