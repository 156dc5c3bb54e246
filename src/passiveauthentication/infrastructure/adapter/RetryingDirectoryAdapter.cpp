#include "passiveauthentication/infrastructure/adapter/RetryingDirectoryAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/exception/DomainException.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace epassport::pa::infrastructure::adapter {

using shared::exception::InfrastructureException;
using shared::util::X509Ptr;
using shared::util::X509CrlPtr;

RetryingDirectoryAdapter::RetryingDirectoryAdapter(
    std::shared_ptr<domain::port::DirectoryPort> delegate,
    Options options
) : delegate_(std::move(delegate)), options_(options) {
    if (!delegate_) {
        throw shared::exception::DomainException("INVALID_CONFIGURATION", "Directory delegate is required");
    }
    if (options_.timeout.count() <= 0 || options_.maxAttempts <= 0 || options_.initialBackoff.count() < 0) {
        throw shared::exception::DomainException(
            "INVALID_CONFIGURATION",
            "Directory timeout and attempts must be positive, backoff non-negative"
        );
    }
}

template<typename T>
T RetryingDirectoryAdapter::execute(
    const std::string& operation,
    const std::string& dn,
    const std::function<T(domain::port::DirectoryPort&)>& call
) {
    std::chrono::milliseconds backoff = options_.initialBackoff;
    bool lastWasTimeout = false;
    std::string lastError;

    for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
        auto start = std::chrono::steady_clock::now();
        try {
            T found = call(*delegate_);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (elapsed > options_.timeout) {
                spdlog::warn("[Directory] {} {} answered after {} ms (timeout {} ms)", operation, dn,
                             elapsed.count(), options_.timeout.count());
            }
            return found;
        } catch (const InfrastructureException& e) {
            if (!e.isTransient()) {
                spdlog::error("[Directory] {} {} failed: {} ({})", operation, dn, e.getMessage(), e.getCode());
                throw;
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            lastWasTimeout = e.getCode() == "DIRECTORY_TIMEOUT" || elapsed >= options_.timeout;
            lastError = e.getMessage();
            spdlog::warn("[Directory] {} {} attempt {}/{} {} after {} ms: {}", operation, dn, attempt,
                         options_.maxAttempts, lastWasTimeout ? "timed out" : "transient failure",
                         elapsed.count(), lastError);
        }

        if (attempt < options_.maxAttempts) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    spdlog::error("[Directory] {} {} gave up after {} attempt(s): {}", operation, dn,
                  options_.maxAttempts, lastError);
    throw InfrastructureException(
        lastWasTimeout ? "DIRECTORY_TIMEOUT" : "DIRECTORY_UNAVAILABLE",
        operation + " for " + dn + " failed after " + std::to_string(options_.maxAttempts) +
            " attempt(s): " + lastError
    );
}

X509Ptr RetryingDirectoryAdapter::findCscaBySubjectDn(const std::string& subjectDn) {
    return execute<X509Ptr>("CSCA lookup", subjectDn,
        [subjectDn](domain::port::DirectoryPort& port) { return port.findCscaBySubjectDn(subjectDn); });
}

std::vector<X509Ptr> RetryingDirectoryAdapter::findAllCscasBySubjectDn(const std::string& subjectDn) {
    return execute<std::vector<X509Ptr>>("CSCA lookup", subjectDn,
        [subjectDn](domain::port::DirectoryPort& port) { return port.findAllCscasBySubjectDn(subjectDn); });
}

X509CrlPtr RetryingDirectoryAdapter::findCrlByIssuerDn(const std::string& issuerDn) {
    return execute<X509CrlPtr>("CRL lookup", issuerDn,
        [issuerDn](domain::port::DirectoryPort& port) { return port.findCrlByIssuerDn(issuerDn); });
}

} // namespace epassport::pa::infrastructure::adapter
