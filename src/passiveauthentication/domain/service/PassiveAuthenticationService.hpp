#pragma once

#include "passiveauthentication/domain/model/VerificationSession.hpp"
#include "passiveauthentication/domain/model/CrlCheckResult.hpp"
#include "passiveauthentication/domain/port/SodParserPort.hpp"
#include "passiveauthentication/domain/port/DirectoryPort.hpp"
#include "passiveauthentication/domain/service/CrlVerificationService.hpp"
#include "passiveauthentication/domain/service/CancellationToken.hpp"
#include "certificatevalidation/domain/service/TrustChainValidator.hpp"
#include "shared/util/OpenSslPtr.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epassport::pa::domain::service {

/**
 * Passive Authentication Domain Service (ICAO 9303 Part 11).
 *
 * Runs the verification pipeline over one session:
 *   1. Extract DSC from the SOD
 *   2. Resolve CSCA by DSC issuer DN
 *   3. Validate CSCA and DSC
 *   4. Check DSC revocation against the CSCA's CRL
 *   5. Verify the SOD signature with the DSC public key
 *   6. Recompute and compare every data group hash
 *
 * The session always ends completed. Expected validation failures give
 * INVALID; anything thrown inside the pipeline gives ERROR with a FAILED
 * audit entry for the step in progress.
 */
class PassiveAuthenticationService {
private:
    std::shared_ptr<port::SodParserPort> sodParser_;
    std::shared_ptr<port::DirectoryPort> directory_;
    certificatevalidation::domain::service::TrustChainValidator chainValidator_;
    CrlVerificationService crlVerificationService_;
    bool parallelHashing_;

    /// Outcome of steps that feed the final statistics
    struct PipelineState {
        shared::util::X509Ptr dsc;
        shared::util::X509Ptr csca;
        bool chainValid = false;
        model::CrlCheckResult crlCheckResult = model::CrlCheckResult::notChecked();
        bool sodSignatureValid = false;
        std::vector<model::PassiveAuthenticationError> errors;
    };

    /// Per data group comparison computed off the session
    struct HashOutcome {
        model::DataGroupNumber number;
        std::optional<model::DataGroupHash> expected;
        std::optional<model::DataGroupHash> actual;
    };

    void runPipeline(model::VerificationSession& session, PipelineState& state, const CancellationToken& token);

    bool verifyCertificateChain(model::VerificationSession& session, PipelineState& state);
    void checkRevocation(model::VerificationSession& session, PipelineState& state);
    void verifySodSignature(model::VerificationSession& session, PipelineState& state);
    void verifyDataGroupHashes(model::VerificationSession& session, PipelineState& state,
                               const CancellationToken& token);

    std::vector<HashOutcome> computeHashes(
        const model::VerificationSession& session,
        const std::map<model::DataGroupNumber, model::DataGroupHash>& expectedHashes,
        const std::string& algorithm,
        const CancellationToken& token) const;

    static void checkCancelled(const CancellationToken& token, const char* beforeStep);
    static int64_t elapsedMs(std::chrono::steady_clock::time_point start);
    static void failCentrally(model::VerificationSession& session, const PipelineState& state,
                              const std::string& code, const std::string& message);

public:
    PassiveAuthenticationService(
        std::shared_ptr<port::SodParserPort> sodParser,
        std::shared_ptr<port::DirectoryPort> directory,
        certificatevalidation::domain::service::TrustChainValidator chainValidator,
        CrlVerificationService crlVerificationService,
        bool parallelHashing = true
    );

    /**
     * Run the full pipeline and leave the session completed.
     *
     * Never throws for pipeline failures; only a session that is already
     * completed raises ILLEGAL_STATE_TRANSITION.
     */
    void verify(model::VerificationSession& session, const CancellationToken& token);

    void verify(model::VerificationSession& session) {
        CancellationToken token;
        verify(session, token);
    }

    bool isParallelHashing() const { return parallelHashing_; }
};

} // namespace epassport::pa::domain::service
