#pragma once

#include "passiveauthentication/domain/port/DirectoryPort.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace epassport::pa::infrastructure::adapter {

/**
 * Read-mostly CRL cache in front of a DirectoryPort.
 *
 * Entries are keyed by normalized issuer DN and expire at
 * min(fetch time + TTL, CRL nextUpdate). A CRL already past its
 * nextUpdate is returned but never cached. CSCA lookups pass through.
 */
class CrlCache : public domain::port::DirectoryPort {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

private:
    struct Entry {
        shared::util::X509CrlPtr crl;
        std::chrono::system_clock::time_point expiresAt;
    };

    std::shared_ptr<domain::port::DirectoryPort> delegate_;
    std::chrono::seconds ttl_;
    Clock clock_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;

public:
    CrlCache(
        std::shared_ptr<domain::port::DirectoryPort> delegate,
        std::chrono::seconds ttl,
        Clock clock = [] { return std::chrono::system_clock::now(); }
    );

    shared::util::X509Ptr findCscaBySubjectDn(const std::string& subjectDn) override;
    std::vector<shared::util::X509Ptr> findAllCscasBySubjectDn(const std::string& subjectDn) override;
    shared::util::X509CrlPtr findCrlByIssuerDn(const std::string& issuerDn) override;

    void invalidate(const std::string& issuerDn);
    void clear();
    size_t size() const;
};

} // namespace epassport::pa::infrastructure::adapter
