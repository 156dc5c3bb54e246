#include "passiveauthentication/application/usecase/PerformPassiveAuthenticationUseCase.hpp"
#include "passiveauthentication/domain/model/VerificationRecord.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace epassport::pa::application::usecase {

using namespace domain::model;

PerformPassiveAuthenticationUseCase::PerformPassiveAuthenticationUseCase(
    std::shared_ptr<domain::service::PassiveAuthenticationService> service,
    std::shared_ptr<domain::repository::VerificationSessionRepository> repository
) : service_(std::move(service)), repository_(std::move(repository)) {
    if (!service_) {
        throw std::invalid_argument("PerformPassiveAuthenticationUseCase: service cannot be null");
    }
    if (!repository_) {
        throw std::invalid_argument("PerformPassiveAuthenticationUseCase: repository cannot be null");
    }
}

response::PassiveAuthenticationResponse PerformPassiveAuthenticationUseCase::execute(
    const command::PerformPassiveAuthenticationCommand& command,
    const domain::service::CancellationToken& token)
{
    spdlog::info("Passive Authentication requested: SOD {} bytes, {} data groups",
                 command.getSodBytes().size(), command.getDataGroups().size());

    SecurityObjectDocument sod = SecurityObjectDocument::of(command.getSodBytes());

    std::vector<DataGroup> dataGroups;
    dataGroups.reserve(command.getDataGroups().size());
    for (const auto& [number, content] : command.getDataGroups()) {
        dataGroups.push_back(DataGroup::of(number, content));
    }

    VerificationSession session = VerificationSession::create(
        std::move(sod), std::move(dataGroups), command.toRequestMetadata());

    service_->verify(session, token);
    repository_->save(session);

    auto result = response::PassiveAuthenticationResponse::from(VerificationRecord::from(session));

    spdlog::info("Passive Authentication {} -> {} ({} ms)",
                 result.getVerificationId(), toString(result.getStatus()),
                 result.getProcessingDurationMs().value_or(0));
    return result;
}

} // namespace epassport::pa::application::usecase
