#pragma once

#include "passiveauthentication/domain/repository/VerificationSessionRepository.hpp"
#include <mutex>
#include <unordered_map>
#include <vector>
#include <string>

namespace epassport::pa::infrastructure::repository {

/**
 * Process-local session store. Keeps snapshots in save order.
 */
class InMemoryVerificationSessionRepository : public domain::repository::VerificationSessionRepository {
private:
    mutable std::mutex mutex_;
    std::vector<domain::model::VerificationRecord> records_;
    std::unordered_map<std::string, size_t> indexById_;

    static std::vector<domain::model::VerificationRecord> page(
        const std::vector<const domain::model::VerificationRecord*>& newestFirst, int offset, int limit);

public:
    InMemoryVerificationSessionRepository() = default;

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
