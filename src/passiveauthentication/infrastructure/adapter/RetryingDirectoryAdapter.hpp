#pragma once

#include "passiveauthentication/domain/port/DirectoryPort.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace epassport::pa::infrastructure::adapter {

/**
 * Bounded-retry decorator for a DirectoryPort.
 *
 * Lookups run on the calling thread. The per-attempt bound is enforced by
 * the transport (LDAP network and search time limits are configured with
 * the same timeout); an attempt that fails with DIRECTORY_TIMEOUT, or
 * fails transiently after overrunning the timeout, counts as timed out.
 * Transient InfrastructureExceptions are retried up to maxAttempts with
 * exponential backoff (initialBackoff, 2x, 4x, ...). Non-transient errors
 * propagate on the first occurrence. Exhaustion raises DIRECTORY_TIMEOUT
 * (last attempt timed out) or DIRECTORY_UNAVAILABLE.
 */
class RetryingDirectoryAdapter : public domain::port::DirectoryPort {
public:
    struct Options {
        std::chrono::milliseconds timeout{5000};
        int maxAttempts = 3;
        std::chrono::milliseconds initialBackoff{200};
    };

private:
    std::shared_ptr<domain::port::DirectoryPort> delegate_;
    Options options_;

    template<typename T>
    T execute(const std::string& operation, const std::string& dn,
              const std::function<T(domain::port::DirectoryPort&)>& call);

public:
    RetryingDirectoryAdapter(std::shared_ptr<domain::port::DirectoryPort> delegate, Options options);

    const Options& getOptions() const { return options_; }

    shared::util::X509Ptr findCscaBySubjectDn(const std::string& subjectDn) override;
    std::vector<shared::util::X509Ptr> findAllCscasBySubjectDn(const std::string& subjectDn) override;
    shared::util::X509CrlPtr findCrlByIssuerDn(const std::string& issuerDn) override;
};

} // namespace epassport::pa::infrastructure::adapter
