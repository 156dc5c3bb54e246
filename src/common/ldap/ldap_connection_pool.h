/**
 * @file ldap_connection_pool.h
 * @brief LDAP Connection Pool
 *
 * Bounded pool of simple-bound OpenLDAP handles, opened on demand.
 * Handles idle longer than idleCheckAfter get a root DSE read before reuse.
 */

#pragma once

#include <ldap.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace epassport::common {

struct LdapPoolSettings {
    std::string uri = "ldap://localhost:389";
    std::string bindDn;             // empty for anonymous bind
    std::string bindPassword;
    size_t maxConnections = 4;
    std::chrono::milliseconds acquireTimeout{5000};
    std::chrono::milliseconds networkTimeout{5000};
    std::chrono::seconds idleCheckAfter{30};
};

class LdapConnectionPool;

/**
 * @brief Leased LDAP handle, handed back to the pool on destruction
 */
class LdapConnection {
private:
    LDAP* ld_ = nullptr;
    LdapConnectionPool* pool_ = nullptr;

public:
    LdapConnection() = default;
    LdapConnection(LDAP* ld, LdapConnectionPool* pool) : ld_(ld), pool_(pool) {}
    ~LdapConnection() { release(); }

    LdapConnection(const LdapConnection&) = delete;
    LdapConnection& operator=(const LdapConnection&) = delete;

    LdapConnection(LdapConnection&& other) noexcept;
    LdapConnection& operator=(LdapConnection&& other) noexcept;

    LDAP* get() const { return ld_; }
    explicit operator bool() const { return ld_ != nullptr; }

    /**
     * @brief Close the handle instead of returning it, after a server-down error
     */
    void discard() noexcept;

    void release() noexcept;
};

class LdapConnectionPool {
private:
    struct IdleHandle {
        LDAP* ld;
        std::chrono::steady_clock::time_point since;
    };

    LdapPoolSettings settings_;
    std::vector<IdleHandle> idle_;
    size_t open_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable returned_;

    friend class LdapConnection;

    LDAP* connect() const;
    bool isAlive(const IdleHandle& idle) const;
    void giveBack(LDAP* ld) noexcept;
    void forget(LDAP* ld) noexcept;

public:
    /**
     * @throws std::invalid_argument on an empty URI or zero capacity
     */
    explicit LdapConnectionPool(LdapPoolSettings settings);
    ~LdapConnectionPool();

    LdapConnectionPool(const LdapConnectionPool&) = delete;
    LdapConnectionPool& operator=(const LdapConnectionPool&) = delete;

    /**
     * @brief Bind once now so a wrong URI or credential shows up at startup
     * @throws InfrastructureException DIRECTORY_UNAVAILABLE
     */
    void verifyConnectivity();

    /**
     * @throws InfrastructureException DIRECTORY_UNAVAILABLE; bind failures
     *         and acquire timeouts are transient
     */
    LdapConnection acquire();

    size_t openConnections() const;

    void close();
};

} // namespace epassport::common
