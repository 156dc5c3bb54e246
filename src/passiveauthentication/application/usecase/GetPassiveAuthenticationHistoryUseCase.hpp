#pragma once

#include "passiveauthentication/application/response/PassiveAuthenticationResponse.hpp"
#include "passiveauthentication/domain/repository/VerificationSessionRepository.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epassport::pa::application::usecase {

/**
 * Read side over stored verification sessions.
 */
class GetPassiveAuthenticationHistoryUseCase {
public:
    static constexpr int MAX_PAGE_SIZE = 100;

    struct Page {
        std::vector<response::PassiveAuthenticationResponse> items;
        long total = 0;
        int offset = 0;
        int limit = 0;
    };

private:
    std::shared_ptr<domain::repository::VerificationSessionRepository> repository_;

    static void validatePage(int offset, int limit);

public:
    explicit GetPassiveAuthenticationHistoryUseCase(
        std::shared_ptr<domain::repository::VerificationSessionRepository> repository);

    /**
     * @throws DomainException INVALID_SESSION_ID if id is not a UUID
     */
    std::optional<response::PassiveAuthenticationResponse> findById(const std::string& id);

    /**
     * Newest first.
     *
     * @throws ApplicationException INVALID_PAGINATION for a negative offset or
     *         a limit outside 1..MAX_PAGE_SIZE
     */
    Page findAll(int offset, int limit);

    Page findByStatus(domain::model::PassiveAuthenticationStatus status, int offset, int limit);

    long countByStatus(domain::model::PassiveAuthenticationStatus status);

    std::vector<domain::model::AuditLogEntry> getAuditLog(const std::string& id);
};

} // namespace epassport::pa::application::usecase
