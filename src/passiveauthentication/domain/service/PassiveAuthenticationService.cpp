#include "passiveauthentication/domain/service/PassiveAuthenticationService.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/exception/ApplicationException.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/X509Util.hpp"
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <future>
#include <stdexcept>

namespace epassport::pa::domain::service {

using model::VerificationSession;
using model::VerificationStep;
using model::StepStatus;
using model::LogLevel;
using model::CrlCheckResult;
using model::CrlCheckStatus;
using model::DataGroupHash;
using model::DataGroupNumber;
using model::PassiveAuthenticationError;
using model::PassiveAuthenticationResult;
using shared::exception::DomainException;
using shared::exception::ApplicationException;
using shared::exception::InfrastructureException;
using shared::util::X509Util;

namespace {

std::string toJsonText(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

/**
 * Close a step: COMPLETED/INFO when it passed, COMPLETED/WARN with the
 * timing backfilled when it produced a validation failure.
 */
void closeStep(VerificationSession& session, VerificationStep step, bool passed,
               const std::string& message, const Json::Value& details, int64_t elapsedMs) {
    if (passed) {
        session.logStepCompleted(step, message, elapsedMs);
        return;
    }
    session.logEntry(step, StepStatus::COMPLETED, LogLevel::WARN, message, toJsonText(details));
    session.backfillExecutionTime(step, elapsedMs);
}

/**
 * Among CSCAs sharing the DSC issuer DN, the first whose key verifies the
 * DSC signature; otherwise the first candidate, left for the trust chain
 * check to reject.
 */
shared::util::X509Ptr selectIssuingCsca(X509* dsc, std::vector<shared::util::X509Ptr> candidates) {
    if (candidates.empty()) {
        return shared::util::X509Ptr();
    }
    for (auto& candidate : candidates) {
        EVP_PKEY* key = X509_get0_pubkey(candidate.get());
        if (key && X509Util::verifyCertificateSignature(dsc, key)) {
            spdlog::debug("Issuing CSCA found: serial {}", X509Util::getSerialNumberHex(candidate.get()));
            return std::move(candidate);
        }
    }
    spdlog::warn("No CSCA among {} candidate(s) verifies the DSC; using DN-only match", candidates.size());
    return std::move(candidates.front());
}

} // anonymous namespace

PassiveAuthenticationService::PassiveAuthenticationService(
    std::shared_ptr<port::SodParserPort> sodParser,
    std::shared_ptr<port::DirectoryPort> directory,
    certificatevalidation::domain::service::TrustChainValidator chainValidator,
    CrlVerificationService crlVerificationService,
    bool parallelHashing
) : sodParser_(std::move(sodParser)),
    directory_(std::move(directory)),
    chainValidator_(chainValidator),
    crlVerificationService_(crlVerificationService),
    parallelHashing_(parallelHashing) {
    if (!sodParser_ || !directory_) {
        throw std::invalid_argument("Service dependencies cannot be null");
    }
    spdlog::debug("PassiveAuthenticationService initialized (parallelHashing={}, referenceTime={})",
                  parallelHashing_, chainValidator_.getClock().isReferenceTime());
}

void PassiveAuthenticationService::verify(VerificationSession& session, const CancellationToken& token) {
    if (session.isCompleted()) {
        throw DomainException(
            "ILLEGAL_STATE_TRANSITION",
            "Session " + session.getId().getValue() + " is already completed"
        );
    }

    spdlog::info("Starting PA verification for session {} ({} data groups)",
                 session.getId().getValue(), session.getDataGroupCount());

    PipelineState state;
    try {
        runPipeline(session, state, token);
    } catch (const DomainException& e) {
        spdlog::error("PA verification failed [{}]: {}", e.getCode(), e.getMessage());
        failCentrally(session, state, e.getCode(), e.getMessage());
    } catch (const ApplicationException& e) {
        spdlog::error("PA verification failed [{}]: {}", e.getCode(), e.getMessage());
        failCentrally(session, state, e.getCode(), e.getMessage());
    } catch (const InfrastructureException& e) {
        spdlog::error("PA verification failed [{}]: {}", e.getCode(), e.getMessage());
        failCentrally(session, state, e.getCode(), e.getMessage());
    } catch (const std::exception& e) {
        spdlog::error("PA verification failed unexpectedly: {}", e.what());
        failCentrally(session, state, "UNEXPECTED_ERROR", e.what());
    }

    spdlog::info("PA verification completed for session {}: {} ({} ms)",
                 session.getId().getValue(),
                 model::toString(session.getVerificationStatus()),
                 session.getProcessingDurationMs().value_or(0));
}

void PassiveAuthenticationService::failCentrally(
    VerificationSession& session,
    const PipelineState& state,
    const std::string& code,
    const std::string& message
) {
    if (session.isCompleted()) {
        return;
    }
    spdlog::debug("Session {} failed after {} earlier finding(s)",
                  session.getId().getValue(), state.errors.size());
    session.recordError(VerificationStep::VERIFICATION_COMPLETED, code, message, state.errors);
}

void PassiveAuthenticationService::runPipeline(
    VerificationSession& session,
    PipelineState& state,
    const CancellationToken& token
) {
    auto pipelineStart = std::chrono::steady_clock::now();

    session.markVerificationStarted();
    session.logStepStarted(VerificationStep::VERIFICATION_STARTED, "Passive Authentication started");
    checkCancelled(token, "certificate chain validation");
    session.logStepCompleted(VerificationStep::VERIFICATION_STARTED,
                             "Session " + session.getId().getValue() + " started", 0);

    // Step 1-4: DSC, CSCA, trust chain, revocation
    session.logStepStarted(VerificationStep::CERTIFICATE_CHAIN, "Certificate chain validation started");
    checkCancelled(token, "CSCA lookup");
    if (!verifyCertificateChain(session, state)) {
        return;
    }
    checkCancelled(token, "CRL check");
    checkRevocation(session, state);

    // Step 5: SOD signature
    session.logStepStarted(VerificationStep::SOD_SIGNATURE, "SOD signature verification started");
    checkCancelled(token, "SOD signature verification");
    verifySodSignature(session, state);

    // Step 6: data group hashes
    session.logStepStarted(VerificationStep::DATA_GROUP_HASH, "Data group hash verification started");
    checkCancelled(token, "data group hash verification");
    verifyDataGroupHashes(session, state, token);

    session.logStepStarted(VerificationStep::VERIFICATION_COMPLETED, "Aggregating verdict");
    checkCancelled(token, "verdict");

    PassiveAuthenticationResult result = PassiveAuthenticationResult::withStatistics(
        state.chainValid,
        state.crlCheckResult,
        state.sodSignatureValid,
        session.getDataGroupCount(),
        session.getValidDataGroupCount(),
        state.errors
    );

    Json::Value details;
    details["status"] = model::toString(result.getStatus());
    details["certificateChainValid"] = result.isCertificateChainValid();
    details["crlStatus"] = model::toString(result.getCrlCheckResult().getStatus());
    details["sodSignatureValid"] = result.isSodSignatureValid();
    details["validDataGroups"] = result.getValidDataGroups();
    details["invalidDataGroups"] = result.getInvalidDataGroups();
    session.logStepInProgress(VerificationStep::VERIFICATION_COMPLETED, "Verdict computed", toJsonText(details));
    session.logStepCompleted(VerificationStep::VERIFICATION_COMPLETED,
                             "Passive Authentication " + model::toString(result.getStatus()),
                             elapsedMs(pipelineStart));

    session.recordResult(result);
}

bool PassiveAuthenticationService::verifyCertificateChain(VerificationSession& session, PipelineState& state) {
    auto start = std::chrono::steady_clock::now();
    const auto& sodBytes = session.getSod().getEncodedData();

    try {
        state.dsc = sodParser_->extractDscCertificate(sodBytes);
    } catch (const InfrastructureException& e) {
        throw ApplicationException("DSC_EXTRACTION_FAILED", "Cannot extract DSC from SOD: " + e.getMessage());
    }
    if (!state.dsc) {
        throw ApplicationException("DSC_EXTRACTION_FAILED", "SOD carries no DSC certificate");
    }

    std::string dscSubject = X509Util::getSubjectDn(state.dsc.get());
    std::string issuerDn = X509Util::getIssuerDn(state.dsc.get());

    Json::Value dscDetails;
    dscDetails["dscSubject"] = dscSubject;
    dscDetails["dscSerialNumber"] = X509Util::getSerialNumberHex(state.dsc.get());
    dscDetails["issuer"] = issuerDn;
    session.logStepInProgress(VerificationStep::CERTIFICATE_CHAIN, "DSC extracted from SOD", toJsonText(dscDetails));
    spdlog::debug("DSC extracted: subject={}, issuer={}", dscSubject, issuerDn);

    state.csca = selectIssuingCsca(state.dsc.get(), directory_->findAllCscasBySubjectDn(issuerDn));
    if (!state.csca) {
        spdlog::warn("CSCA not found for issuer {}", issuerDn);
        state.errors.push_back(PassiveAuthenticationError::critical(
            "CSCA_NOT_FOUND", "No CSCA found for DSC issuer " + issuerDn));

        Json::Value details;
        details["subStep"] = "CSCA_LOOKUP";
        details["issuer"] = issuerDn;
        closeStep(session, VerificationStep::CERTIFICATE_CHAIN, false,
                  "CSCA not found", details, elapsedMs(start));

        session.recordResult(PassiveAuthenticationResult::withStatistics(
            false, state.crlCheckResult, false, session.getDataGroupCount(), 0, state.errors));
        return false;
    }

    auto validation = chainValidator_.validateCsca(state.csca.get())
        .merge(chainValidator_.validateDsc(state.dsc.get(), state.csca.get()));

    state.chainValid = validation.isValid();
    for (const auto& error : validation.getErrors()) {
        state.errors.push_back(PassiveAuthenticationError::critical(error.getErrorCode(), error.getErrorMessage()));
    }

    Json::Value chainDetails;
    chainDetails["subStep"] = "TRUST_CHAIN";
    chainDetails["cscaSubject"] = X509Util::getSubjectDn(state.csca.get());
    chainDetails["valid"] = state.chainValid;
    chainDetails["summary"] = validation.getSummary();
    session.logStepInProgress(VerificationStep::CERTIFICATE_CHAIN, "Trust chain validated", toJsonText(chainDetails));
    session.markChainChecked();

    if (!state.chainValid) {
        spdlog::warn("Trust chain invalid for DSC {}: {}", dscSubject, validation.getSummary());
    }
    return true;
}

void PassiveAuthenticationService::checkRevocation(VerificationSession& session, PipelineState& state) {
    auto start = std::chrono::steady_clock::now();
    std::string cscaSubject = X509Util::getSubjectDn(state.csca.get());

    shared::util::X509CrlPtr crl;
    try {
        crl = directory_->findCrlByIssuerDn(cscaSubject);
    } catch (const InfrastructureException& e) {
        spdlog::warn("CRL lookup failed for {} [{}]: {}", cscaSubject, e.getCode(), e.getMessage());
        state.crlCheckResult = CrlCheckResult::unavailable("CRL lookup failed: " + e.getMessage());
    }

    if (state.crlCheckResult.getStatus() == CrlCheckStatus::NOT_CHECKED) {
        state.crlCheckResult = crlVerificationService_.verifyCertificate(
            state.dsc.get(), crl.get(), state.csca.get());
    }

    const CrlCheckResult& crlResult = state.crlCheckResult;
    std::string message = crlResult.getMessage().value_or(crlResult.getStatusDescription());
    switch (crlResult.getStatus()) {
        case CrlCheckStatus::VALID:
            break;
        case CrlCheckStatus::REVOKED:
            state.errors.push_back(PassiveAuthenticationError::critical(
                "CERTIFICATE_REVOKED",
                "DSC revoked: " + crlResult.getRevocationReasonText()));
            break;
        case CrlCheckStatus::CRL_UNAVAILABLE:
            state.errors.push_back(PassiveAuthenticationError::warning("CRL_UNAVAILABLE", message));
            break;
        case CrlCheckStatus::CRL_EXPIRED:
            state.errors.push_back(PassiveAuthenticationError::critical("CRL_EXPIRED", message));
            break;
        case CrlCheckStatus::CRL_INVALID:
            state.errors.push_back(PassiveAuthenticationError::critical("CRL_INVALID", message));
            break;
        case CrlCheckStatus::NOT_CHECKED:
            break;
    }

    Json::Value details;
    details["subStep"] = "CRL_CHECK";
    details["crlStatus"] = model::toString(crlResult.getStatus());
    details["message"] = message;
    if (crlResult.isCertificateRevoked()) {
        details["revocationReason"] = crlResult.getRevocationReasonText();
        if (crlResult.getRevocationDate().has_value()) {
            details["revocationDate"] = X509Util::toIso8601(*crlResult.getRevocationDate());
        }
    }
    session.markCrlChecked();

    bool passed = state.chainValid && crlResult.getStatus() == CrlCheckStatus::VALID;
    closeStep(session, VerificationStep::CERTIFICATE_CHAIN, passed,
              "Certificate chain " + std::string(state.chainValid ? "valid" : "invalid") +
                  ", CRL " + model::toString(crlResult.getStatus()),
              details, elapsedMs(start));
}

void PassiveAuthenticationService::verifySodSignature(VerificationSession& session, PipelineState& state) {
    auto start = std::chrono::steady_clock::now();
    const auto& sodBytes = session.getSod().getEncodedData();

    std::string hashAlgorithm = sodParser_->extractHashAlgorithm(sodBytes);
    std::string signatureAlgorithm = sodParser_->extractSignatureAlgorithm(sodBytes);
    session.recordSodAlgorithms(hashAlgorithm, signatureAlgorithm);

    EVP_PKEY* dscPublicKey = X509_get0_pubkey(state.dsc.get());
    if (!dscPublicKey) {
        state.sodSignatureValid = false;
        state.errors.push_back(PassiveAuthenticationError::critical(
            "DSC_PUBLIC_KEY_UNAVAILABLE", "Cannot read DSC public key"));
    } else {
        state.sodSignatureValid = sodParser_->verifySignature(sodBytes, dscPublicKey);
        if (!state.sodSignatureValid) {
            spdlog::warn("SOD signature verification failed ({})", signatureAlgorithm);
            state.errors.push_back(PassiveAuthenticationError::critical(
                "SOD_SIGNATURE_INVALID", "SOD signature does not verify with the DSC public key"));
        }
    }
    session.markSodChecked();

    Json::Value details;
    details["hashAlgorithm"] = hashAlgorithm;
    details["signatureAlgorithm"] = signatureAlgorithm;
    details["valid"] = state.sodSignatureValid;
    closeStep(session, VerificationStep::SOD_SIGNATURE, state.sodSignatureValid,
              state.sodSignatureValid ? "SOD signature valid" : "SOD signature invalid",
              details, elapsedMs(start));
}

void PassiveAuthenticationService::verifyDataGroupHashes(
    VerificationSession& session,
    PipelineState& state,
    const CancellationToken& token
) {
    auto start = std::chrono::steady_clock::now();
    const std::string& algorithm = session.getSod().getHashAlgorithm();

    if (!DataGroupHash::isSupportedAlgorithm(algorithm)) {
        spdlog::warn("Unsupported SOD hash algorithm: {}", algorithm);
        state.errors.push_back(PassiveAuthenticationError::critical(
            "UNSUPPORTED_HASH_ALGORITHM", "Unsupported data group hash algorithm: " + algorithm));
        session.markHashesChecked();

        Json::Value details;
        details["hashAlgorithm"] = algorithm;
        closeStep(session, VerificationStep::DATA_GROUP_HASH, false,
                  "Data group hashes not checked", details, elapsedMs(start));
        return;
    }

    auto expectedHashes = sodParser_->parseDataGroupHashes(session.getSod().getEncodedData());
    spdlog::debug("SOD lists {} data group hash(es), {} supplied",
                  expectedHashes.size(), session.getDataGroupCount());

    std::vector<HashOutcome> outcomes = computeHashes(session, expectedHashes, algorithm, token);
    checkCancelled(token, "data group hash merge");

    Json::Value dgDetails = Json::objectValue;
    for (const auto& outcome : outcomes) {
        std::string dgKey = model::toString(outcome.number);
        Json::Value dgResult;

        if (!outcome.expected.has_value()) {
            session.recordDataGroupHashMissing(outcome.number);
            state.errors.push_back(PassiveAuthenticationError::warning(
                "DG_HASH_MISSING", dgKey + " has no hash in the SOD"));
            dgResult["valid"] = false;
            dgResult["expectedHash"] = Json::nullValue;
            dgResult["actualHash"] = outcome.actual->getValue();
        } else {
            bool matches = session.recordDataGroupHash(outcome.number, *outcome.expected, *outcome.actual);
            if (!matches) {
                spdlog::warn("{} hash mismatch", dgKey);
                state.errors.push_back(PassiveAuthenticationError::critical(
                    "DATA_GROUP_HASH_MISMATCH", dgKey + " hash does not match the SOD"));
            }
            dgResult["valid"] = matches;
            dgResult["expectedHash"] = outcome.expected->getValue();
            dgResult["actualHash"] = outcome.actual->getValue();
        }
        dgDetails[dgKey] = dgResult;
    }
    session.markHashesChecked();

    int valid = session.getValidDataGroupCount();
    int total = session.getDataGroupCount();
    closeStep(session, VerificationStep::DATA_GROUP_HASH, valid == total,
              std::to_string(valid) + "/" + std::to_string(total) + " data groups valid",
              dgDetails, elapsedMs(start));
}

std::vector<PassiveAuthenticationService::HashOutcome> PassiveAuthenticationService::computeHashes(
    const VerificationSession& session,
    const std::map<DataGroupNumber, DataGroupHash>& expectedHashes,
    const std::string& algorithm,
    const CancellationToken& token
) const {
    auto hashOne = [&expectedHashes, &algorithm, &token](const model::DataGroup& dg) {
        checkCancelled(token, "data group hashing");
        HashOutcome outcome{dg.getNumber(), std::nullopt, DataGroupHash::calculate(dg.getContent(), algorithm)};
        auto it = expectedHashes.find(dg.getNumber());
        if (it != expectedHashes.end()) {
            outcome.expected = it->second;
        }
        return outcome;
    };

    std::vector<HashOutcome> outcomes;
    outcomes.reserve(session.getDataGroups().size());

    if (!parallelHashing_ || session.getDataGroups().size() < 2) {
        for (const auto& dg : session.getDataGroups()) {
            outcomes.push_back(hashOne(dg));
        }
        return outcomes;
    }

    std::vector<std::future<HashOutcome>> futures;
    futures.reserve(session.getDataGroups().size());
    for (const auto& dg : session.getDataGroups()) {
        futures.push_back(std::async(std::launch::async, hashOne, std::cref(dg)));
    }

    // Every task finishes before any result (or failure) is merged
    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        outcomes.push_back(future.get());
    }
    return outcomes;
}

void PassiveAuthenticationService::checkCancelled(const CancellationToken& token, const char* beforeStep) {
    if (token.isCancelled()) {
        throw ApplicationException(
            "VERIFICATION_CANCELLED",
            std::string("Verification cancelled before ") + beforeStep
        );
    }
}

int64_t PassiveAuthenticationService::elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace epassport::pa::domain::service
