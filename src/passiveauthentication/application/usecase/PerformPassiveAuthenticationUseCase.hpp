#pragma once

#include "passiveauthentication/application/command/PerformPassiveAuthenticationCommand.hpp"
#include "passiveauthentication/application/response/PassiveAuthenticationResponse.hpp"
#include "passiveauthentication/domain/service/PassiveAuthenticationService.hpp"
#include "passiveauthentication/domain/service/CancellationToken.hpp"
#include "passiveauthentication/domain/repository/VerificationSessionRepository.hpp"
#include <memory>

namespace epassport::pa::application::usecase {

/**
 * Use Case for performing Passive Authentication (PA) verification on ePassport data.
 *
 * Builds the verification session from the command, runs the domain
 * service over it, stores the completed session with its audit log and
 * renders the response.
 */
class PerformPassiveAuthenticationUseCase {
private:
    std::shared_ptr<domain::service::PassiveAuthenticationService> service_;
    std::shared_ptr<domain::repository::VerificationSessionRepository> repository_;

public:
    PerformPassiveAuthenticationUseCase(
        std::shared_ptr<domain::service::PassiveAuthenticationService> service,
        std::shared_ptr<domain::repository::VerificationSessionRepository> repository
    );

    /**
     * @throws DomainException if the SOD or a data group is malformed, before
     *         any directory lookup
     * @throws InfrastructureException if the session cannot be stored
     */
    response::PassiveAuthenticationResponse execute(
        const command::PerformPassiveAuthenticationCommand& command,
        const domain::service::CancellationToken& token);

    response::PassiveAuthenticationResponse execute(const command::PerformPassiveAuthenticationCommand& command) {
        domain::service::CancellationToken token;
        return execute(command, token);
    }
};

} // namespace epassport::pa::application::usecase
