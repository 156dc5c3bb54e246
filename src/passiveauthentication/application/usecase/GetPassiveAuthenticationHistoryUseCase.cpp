#include "passiveauthentication/application/usecase/GetPassiveAuthenticationHistoryUseCase.hpp"
#include "shared/exception/ApplicationException.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace epassport::pa::application::usecase {

using namespace domain::model;
using response::PassiveAuthenticationResponse;

GetPassiveAuthenticationHistoryUseCase::GetPassiveAuthenticationHistoryUseCase(
    std::shared_ptr<domain::repository::VerificationSessionRepository> repository
) : repository_(std::move(repository)) {
    if (!repository_) {
        throw std::invalid_argument("GetPassiveAuthenticationHistoryUseCase: repository cannot be null");
    }
}

void GetPassiveAuthenticationHistoryUseCase::validatePage(int offset, int limit) {
    if (offset < 0 || limit <= 0 || limit > MAX_PAGE_SIZE) {
        throw shared::exception::ApplicationException(
            "INVALID_PAGINATION",
            "offset must be >= 0 and limit between 1 and " + std::to_string(MAX_PAGE_SIZE) +
            ", got offset=" + std::to_string(offset) + " limit=" + std::to_string(limit)
        );
    }
}

std::optional<PassiveAuthenticationResponse> GetPassiveAuthenticationHistoryUseCase::findById(const std::string& id) {
    spdlog::debug("Looking up verification {}", id);
    auto record = repository_->findById(VerificationSessionId::of(id));
    if (!record.has_value()) {
        return std::nullopt;
    }
    return PassiveAuthenticationResponse::from(*record);
}

GetPassiveAuthenticationHistoryUseCase::Page GetPassiveAuthenticationHistoryUseCase::findAll(int offset, int limit) {
    validatePage(offset, limit);

    Page page;
    page.offset = offset;
    page.limit = limit;
    page.total = repository_->countAll();
    for (const auto& record : repository_->findAll(offset, limit)) {
        page.items.push_back(PassiveAuthenticationResponse::from(record));
    }
    return page;
}

GetPassiveAuthenticationHistoryUseCase::Page GetPassiveAuthenticationHistoryUseCase::findByStatus(
    PassiveAuthenticationStatus status,
    int offset,
    int limit)
{
    validatePage(offset, limit);

    Page page;
    page.offset = offset;
    page.limit = limit;
    page.total = repository_->countByStatus(status);
    for (const auto& record : repository_->findByStatus(status, offset, limit)) {
        page.items.push_back(PassiveAuthenticationResponse::from(record));
    }
    return page;
}

long GetPassiveAuthenticationHistoryUseCase::countByStatus(PassiveAuthenticationStatus status) {
    return repository_->countByStatus(status);
}

std::vector<AuditLogEntry> GetPassiveAuthenticationHistoryUseCase::getAuditLog(const std::string& id) {
    return repository_->findAuditLog(VerificationSessionId::of(id));
}

} // namespace epassport::pa::application::usecase
