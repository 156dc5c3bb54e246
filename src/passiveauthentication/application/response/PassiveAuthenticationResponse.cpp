#include "passiveauthentication/application/response/PassiveAuthenticationResponse.hpp"
#include "shared/util/X509Util.hpp"

namespace epassport::pa::application::response {

using namespace domain::model;
using shared::util::X509Util;

PassiveAuthenticationResponse PassiveAuthenticationResponse::from(const VerificationRecord& record) {
    PassiveAuthenticationResponse response;
    response.status_ = record.status;
    response.verificationId_ = record.sessionId.getValue();
    response.verificationTimestamp_ = record.createdAt;
    response.completedAt_ = record.completedAt;
    response.processingDurationMs_ = record.processingDurationMs;

    for (const auto& dg : record.dataGroups) {
        response.dataGroupValidation_.details[dg.number] =
            DataGroupDetailDto{dg.valid, dg.hashMismatchDetected, dg.expectedHash, dg.actualHash};
    }
    response.dataGroupValidation_.totalGroups = static_cast<int>(record.dataGroups.size());
    response.dataGroupValidation_.validGroups = record.getValidDataGroupCount();
    response.dataGroupValidation_.invalidGroups =
        response.dataGroupValidation_.totalGroups - response.dataGroupValidation_.validGroups;

    if (!record.result.has_value()) {
        return response;
    }

    const PassiveAuthenticationResult& result = *record.result;
    response.errors_ = result.getErrors();

    // An ERROR result carries no step outcomes
    if (result.isError()) {
        return response;
    }

    const CrlCheckResult& crl = result.getCrlCheckResult();
    CertificateChainValidationDto chain;
    chain.valid = result.isCertificateChainValid();
    chain.crlStatus = toString(crl.getStatus());
    chain.crlStatusDescription = crl.getStatusDescription();
    chain.crlStatusSeverity = crl.getStatusSeverity();
    chain.crlMessage = crl.getMessage();
    chain.revoked = crl.isCertificateRevoked();
    chain.revocationReason = crl.getRevocationReason();
    chain.revocationReasonText = crl.getRevocationReasonText();
    chain.revocationDate = crl.getRevocationDate();
    response.certificateChainValidation_ = chain;

    SodSignatureValidationDto sod;
    sod.valid = result.isSodSignatureValid();
    if (!record.signatureAlgorithm.empty()) sod.signatureAlgorithm = record.signatureAlgorithm;
    if (!record.hashAlgorithm.empty()) sod.hashAlgorithm = record.hashAlgorithm;
    response.sodSignatureValidation_ = sod;
    return response;
}

namespace {

Json::Value optionalString(const std::optional<std::string>& value) {
    return value.has_value() ? Json::Value(*value) : Json::Value(Json::nullValue);
}

} // anonymous namespace

Json::Value PassiveAuthenticationResponse::toJson() const {
    Json::Value root;
    root["status"] = toString(status_);
    root["verificationId"] = verificationId_;
    root["verificationTimestamp"] = X509Util::toIso8601(verificationTimestamp_);
    root["completedAt"] = completedAt_.has_value()
        ? Json::Value(X509Util::toIso8601(*completedAt_)) : Json::Value(Json::nullValue);
    root["processingDurationMs"] = processingDurationMs_.has_value()
        ? Json::Value(static_cast<Json::Int64>(*processingDurationMs_)) : Json::Value(Json::nullValue);

    if (certificateChainValidation_.has_value()) {
        const auto& chain = *certificateChainValidation_;
        Json::Value chainJson;
        chainJson["valid"] = chain.valid;
        chainJson["crlStatus"] = chain.crlStatus;
        chainJson["crlStatusDescription"] = chain.crlStatusDescription;
        chainJson["crlStatusSeverity"] = chain.crlStatusSeverity;
        chainJson["crlMessage"] = optionalString(chain.crlMessage);
        chainJson["revoked"] = chain.revoked;
        if (chain.revoked) {
            chainJson["revocationReason"] = chain.revocationReason.value_or(CrlCheckResult::REASON_UNSPECIFIED);
            chainJson["revocationReasonText"] = chain.revocationReasonText;
            if (chain.revocationDate.has_value()) {
                chainJson["revocationDate"] = X509Util::toIso8601(*chain.revocationDate);
            }
        }
        root["certificateChainValidation"] = chainJson;
    } else {
        root["certificateChainValidation"] = Json::nullValue;
    }

    if (sodSignatureValidation_.has_value()) {
        Json::Value sodJson;
        sodJson["valid"] = sodSignatureValidation_->valid;
        sodJson["signatureAlgorithm"] = optionalString(sodSignatureValidation_->signatureAlgorithm);
        sodJson["hashAlgorithm"] = optionalString(sodSignatureValidation_->hashAlgorithm);
        root["sodSignatureValidation"] = sodJson;
    } else {
        root["sodSignatureValidation"] = Json::nullValue;
    }

    Json::Value dgJson;
    dgJson["totalGroups"] = dataGroupValidation_.totalGroups;
    dgJson["validGroups"] = dataGroupValidation_.validGroups;
    dgJson["invalidGroups"] = dataGroupValidation_.invalidGroups;
    Json::Value details(Json::objectValue);
    for (const auto& [number, detail] : dataGroupValidation_.details) {
        Json::Value d;
        d["valid"] = detail.valid;
        d["hashMismatchDetected"] = detail.hashMismatchDetected;
        d["expectedHash"] = optionalString(detail.expectedHash);
        d["actualHash"] = optionalString(detail.actualHash);
        details[toString(number)] = d;
    }
    dgJson["details"] = details;
    root["dataGroupValidation"] = dgJson;

    Json::Value errors(Json::arrayValue);
    for (const auto& e : errors_) {
        Json::Value err;
        err["code"] = e.getCode();
        err["message"] = e.getMessage();
        err["severity"] = e.getSeverityString();
        errors.append(err);
    }
    root["errors"] = errors;
    return root;
}

std::string PassiveAuthenticationResponse::toJsonString(const std::string& indentation) const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indentation;
    return Json::writeString(builder, toJson());
}

} // namespace epassport::pa::application::response
