#include "passiveauthentication/infrastructure/adapter/LocalTrustStoreAdapter.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/X509Util.hpp"
#include <openssl/pem.h>
#include <openssl/err.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace epassport::pa::infrastructure::adapter {

using shared::exception::InfrastructureException;
using shared::util::X509Util;
using shared::util::X509Ptr;
using shared::util::X509CrlPtr;
using shared::util::BioPtr;

namespace {

BioPtr openFile(const std::string& path) {
    BioPtr bio(BIO_new_file(path.c_str(), "rb"));
    if (!bio) {
        ERR_clear_error();
        throw InfrastructureException("TRUST_STORE_LOAD_ERROR", "Cannot open file: " + path);
    }
    return bio;
}

} // anonymous namespace

void LocalTrustStoreAdapter::addCsca(X509Ptr csca) {
    if (!csca) {
        return;
    }
    std::string key = X509Util::normalizeDn(X509Util::getSubjectDn(csca.get()));
    spdlog::debug("Trust store: adding CSCA {}", X509Util::getSubjectDn(csca.get()));

    std::lock_guard<std::mutex> lock(mutex_);
    cscas_.emplace(key, std::move(csca));
}

void LocalTrustStoreAdapter::addCrl(X509CrlPtr crl) {
    if (!crl) {
        return;
    }
    std::string key = X509Util::normalizeDn(X509Util::getCrlIssuerDn(crl.get()));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = crls_.find(key);
    if (it != crls_.end()) {
        auto existing = X509Util::toTimePoint(X509_CRL_get0_lastUpdate(it->second.get()));
        auto candidate = X509Util::toTimePoint(X509_CRL_get0_lastUpdate(crl.get()));
        if (existing && candidate && *candidate <= *existing) {
            spdlog::debug("Trust store: keeping newer CRL for {}", key);
            return;
        }
        it->second = std::move(crl);
        return;
    }
    spdlog::debug("Trust store: adding CRL for {}", X509Util::getCrlIssuerDn(crl.get()));
    crls_.emplace(key, std::move(crl));
}

size_t LocalTrustStoreAdapter::loadCscaFile(const std::string& path) {
    BioPtr bio = openFile(path);

    size_t added = 0;
    while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
        addCsca(X509Ptr(cert));
        ++added;
    }
    ERR_clear_error();

    if (added == 0) {
        // Not PEM: try a single DER certificate
        bio = openFile(path);
        X509Ptr der(d2i_X509_bio(bio.get(), nullptr));
        if (!der) {
            ERR_clear_error();
            throw InfrastructureException("TRUST_STORE_LOAD_ERROR", "No certificate found in " + path);
        }
        addCsca(std::move(der));
        added = 1;
    }

    spdlog::info("Loaded {} CSCA certificate(s) from {}", added, path);
    return added;
}

void LocalTrustStoreAdapter::loadCrlFile(const std::string& path) {
    BioPtr bio = openFile(path);

    X509CrlPtr crl(PEM_read_bio_X509_CRL(bio.get(), nullptr, nullptr, nullptr));
    if (!crl) {
        ERR_clear_error();
        bio = openFile(path);
        crl.reset(d2i_X509_CRL_bio(bio.get(), nullptr));
    }
    if (!crl) {
        ERR_clear_error();
        throw InfrastructureException("TRUST_STORE_LOAD_ERROR", "No CRL found in " + path);
    }

    spdlog::info("Loaded CRL from {} (issuer {})", path, X509Util::getCrlIssuerDn(crl.get()));
    addCrl(std::move(crl));
}

size_t LocalTrustStoreAdapter::cscaCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cscas_.size();
}

size_t LocalTrustStoreAdapter::crlCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return crls_.size();
}

X509Ptr LocalTrustStoreAdapter::findCscaBySubjectDn(const std::string& subjectDn) {
    std::vector<X509Ptr> found = findAllCscasBySubjectDn(subjectDn);
    if (found.empty()) {
        return X509Ptr();
    }
    return std::move(found.front());
}

std::vector<X509Ptr> LocalTrustStoreAdapter::findAllCscasBySubjectDn(const std::string& subjectDn) {
    std::string key = X509Util::normalizeDn(subjectDn);
    std::vector<X509Ptr> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto range = cscas_.equal_range(key);
        for (auto it = range.first; it != range.second; ++it) {
            found.push_back(shared::util::shareCertificate(it->second.get()));
        }
    }
    if (found.empty()) {
        spdlog::debug("Trust store: no CSCA for {}", subjectDn);
        return found;
    }

    auto notBefore = [](const X509Ptr& cert) {
        return X509Util::toTimePoint(X509_get0_notBefore(cert.get()))
            .value_or(std::chrono::system_clock::time_point{});
    };
    std::stable_sort(found.begin(), found.end(), [&notBefore](const X509Ptr& a, const X509Ptr& b) {
        return notBefore(a) > notBefore(b);
    });
    return found;
}

X509CrlPtr LocalTrustStoreAdapter::findCrlByIssuerDn(const std::string& issuerDn) {
    std::string key = X509Util::normalizeDn(issuerDn);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = crls_.find(key);
    if (it == crls_.end()) {
        spdlog::debug("Trust store: no CRL for {}", issuerDn);
        return X509CrlPtr();
    }
    return shared::util::shareCrl(it->second.get());
}

} // namespace epassport::pa::infrastructure::adapter
