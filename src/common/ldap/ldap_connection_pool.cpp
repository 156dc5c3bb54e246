/**
 * @file ldap_connection_pool.cpp
 * @brief Implementation of LDAP Connection Pool
 */

#include "common/ldap/ldap_connection_pool.h"
#include "shared/exception/InfrastructureException.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace epassport::common {

using shared::exception::InfrastructureException;

namespace {

struct timeval toTimeval(std::chrono::milliseconds ms) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

void unbind(LDAP* ld) noexcept {
    ldap_unbind_ext_s(ld, nullptr, nullptr);
}

} // anonymous namespace

// --- LdapConnection ---

LdapConnection::LdapConnection(LdapConnection&& other) noexcept
    : ld_(std::exchange(other.ld_, nullptr)),
      pool_(std::exchange(other.pool_, nullptr)) {}

LdapConnection& LdapConnection::operator=(LdapConnection&& other) noexcept {
    if (this != &other) {
        release();
        ld_ = std::exchange(other.ld_, nullptr);
        pool_ = std::exchange(other.pool_, nullptr);
    }
    return *this;
}

void LdapConnection::discard() noexcept {
    if (ld_ && pool_) {
        pool_->forget(ld_);
    }
    ld_ = nullptr;
    pool_ = nullptr;
}

void LdapConnection::release() noexcept {
    if (ld_ && pool_) {
        pool_->giveBack(ld_);
    }
    ld_ = nullptr;
    pool_ = nullptr;
}

// --- LdapConnectionPool ---

LdapConnectionPool::LdapConnectionPool(LdapPoolSettings settings)
    : settings_(std::move(settings))
{
    if (settings_.uri.empty()) {
        throw std::invalid_argument("LdapConnectionPool: URI cannot be empty");
    }
    if (settings_.maxConnections == 0) {
        throw std::invalid_argument("LdapConnectionPool: maxConnections must be positive");
    }
    idle_.reserve(settings_.maxConnections);
    spdlog::info("LDAP pool for {} (max={}, bind={})", settings_.uri, settings_.maxConnections,
                 settings_.bindDn.empty() ? "anonymous" : settings_.bindDn);
}

LdapConnectionPool::~LdapConnectionPool() {
    close();
}

void LdapConnectionPool::verifyConnectivity() {
    LdapConnection conn = acquire();
    spdlog::info("LDAP server {} reachable", settings_.uri);
}

LdapConnection LdapConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + settings_.acquireTimeout;

    for (;;) {
        if (closed_) {
            throw InfrastructureException("DIRECTORY_UNAVAILABLE", "LDAP pool is closed");
        }

        while (!idle_.empty()) {
            IdleHandle candidate = idle_.back();
            idle_.pop_back();
            if (isAlive(candidate)) {
                return LdapConnection(candidate.ld, this);
            }
            spdlog::warn("Dropping dead LDAP connection to {}", settings_.uri);
            unbind(candidate.ld);
            --open_;
        }

        if (open_ < settings_.maxConnections) {
            ++open_;
            lock.unlock();
            LDAP* ld = connect();
            if (!ld) {
                lock.lock();
                --open_;
                returned_.notify_one();
                throw InfrastructureException("DIRECTORY_UNAVAILABLE",
                    "Cannot bind to LDAP server " + settings_.uri, true);
            }
            return LdapConnection(ld, this);
        }

        spdlog::debug("All {} LDAP connections leased, waiting", open_);
        if (returned_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty()) {
            throw InfrastructureException("DIRECTORY_UNAVAILABLE", "Timeout acquiring LDAP connection", true);
        }
    }
}

size_t LdapConnectionPool::openConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void LdapConnectionPool::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto& idle : idle_) {
        unbind(idle.ld);
        --open_;
    }
    idle_.clear();
    returned_.notify_all();
}

LDAP* LdapConnectionPool::connect() const {
    LDAP* ld = nullptr;
    int rc = ldap_initialize(&ld, settings_.uri.c_str());
    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_initialize({}) failed: {}", settings_.uri, ldap_err2string(rc));
        return nullptr;
    }

    int version = LDAP_VERSION3;
    ldap_set_option(ld, LDAP_OPT_PROTOCOL_VERSION, &version);
    struct timeval networkTimeout = toTimeval(settings_.networkTimeout);
    if (ldap_set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &networkTimeout) != LDAP_OPT_SUCCESS) {
        spdlog::warn("Could not set LDAP network timeout");
    }
    ldap_set_option(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);

    // ber_str2bv with dup=1 so the bind never aliases the settings string
    struct berval* cred = ber_str2bv(settings_.bindPassword.c_str(), 0, 1, nullptr);
    const char* who = settings_.bindDn.empty() ? nullptr : settings_.bindDn.c_str();
    rc = ldap_sasl_bind_s(ld, who, LDAP_SASL_SIMPLE, cred, nullptr, nullptr, nullptr);
    ber_bvfree(cred);

    if (rc != LDAP_SUCCESS) {
        spdlog::error("LDAP bind to {} failed: {}", settings_.uri, ldap_err2string(rc));
        unbind(ld);
        return nullptr;
    }
    return ld;
}

bool LdapConnectionPool::isAlive(const IdleHandle& idle) const {
    if (std::chrono::steady_clock::now() - idle.since < settings_.idleCheckAfter) {
        return true;
    }

    LDAPMessage* result = nullptr;
    struct timeval timeout = toTimeval(settings_.networkTimeout);
    char noAttrs[] = LDAP_NO_ATTRS;
    char* attrs[] = {noAttrs, nullptr};
    int rc = ldap_search_ext_s(idle.ld, "", LDAP_SCOPE_BASE, "(objectClass=*)",
                               attrs, 0, nullptr, nullptr, &timeout, 1, &result);
    ldap_msgfree(result);
    return rc == LDAP_SUCCESS;
}

void LdapConnectionPool::giveBack(LDAP* ld) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        unbind(ld);
        --open_;
    } else {
        idle_.push_back({ld, std::chrono::steady_clock::now()});
    }
    returned_.notify_one();
}

void LdapConnectionPool::forget(LDAP* ld) noexcept {
    unbind(ld);
    std::lock_guard<std::mutex> lock(mutex_);
    --open_;
    returned_.notify_one();
}

} // namespace epassport::common
