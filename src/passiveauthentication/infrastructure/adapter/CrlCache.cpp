#include "passiveauthentication/infrastructure/adapter/CrlCache.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/X509Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace epassport::pa::infrastructure::adapter {

using shared::util::X509Util;
using shared::util::X509Ptr;
using shared::util::X509CrlPtr;

CrlCache::CrlCache(
    std::shared_ptr<domain::port::DirectoryPort> delegate,
    std::chrono::seconds ttl,
    Clock clock
) : delegate_(std::move(delegate)), ttl_(ttl), clock_(std::move(clock)) {
    if (!delegate_) {
        throw shared::exception::DomainException("INVALID_CONFIGURATION", "CRL cache delegate is required");
    }
    if (ttl_.count() <= 0) {
        throw shared::exception::DomainException("INVALID_CONFIGURATION", "CRL cache TTL must be positive");
    }
}

X509Ptr CrlCache::findCscaBySubjectDn(const std::string& subjectDn) {
    return delegate_->findCscaBySubjectDn(subjectDn);
}

std::vector<X509Ptr> CrlCache::findAllCscasBySubjectDn(const std::string& subjectDn) {
    return delegate_->findAllCscasBySubjectDn(subjectDn);
}

X509CrlPtr CrlCache::findCrlByIssuerDn(const std::string& issuerDn) {
    const std::string key = X509Util::normalizeDn(issuerDn);
    const auto now = clock_();

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && now < it->second.expiresAt) {
            spdlog::debug("[CrlCache] hit for {}", issuerDn);
            return shared::util::shareCrl(it->second.crl.get());
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && now >= it->second.expiresAt) {
            spdlog::debug("[CrlCache] entry for {} expired", issuerDn);
            entries_.erase(it);
        }
    }

    X509CrlPtr crl = delegate_->findCrlByIssuerDn(issuerDn);
    if (!crl) {
        return crl;
    }

    auto expiresAt = now + ttl_;
    if (const ASN1_TIME* nextUpdateAsn1 = X509_CRL_get0_nextUpdate(crl.get())) {
        auto nextUpdate = X509Util::toTimePoint(nextUpdateAsn1);
        if (!nextUpdate || *nextUpdate <= now) {
            spdlog::debug("[CrlCache] CRL for {} is past nextUpdate, not caching", issuerDn);
            return crl;
        }
        expiresAt = std::min(expiresAt, *nextUpdate);
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[key] = Entry{shared::util::shareCrl(crl.get()), expiresAt};
    }
    spdlog::debug("[CrlCache] cached CRL for {} until {}", issuerDn, X509Util::toIso8601(expiresAt));
    return crl;
}

void CrlCache::invalidate(const std::string& issuerDn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(X509Util::normalizeDn(issuerDn));
}

void CrlCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

size_t CrlCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace epassport::pa::infrastructure::adapter
