/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool
 *
 * Bounded pool of libpq connections. Connections are opened on demand;
 * one that sat idle longer than idleCheckAfter is probed before reuse.
 */

#pragma once

#include <libpq-fe.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace epassport::common {

struct DbPoolSettings {
    std::string connInfo;
    size_t maxConnections = 4;
    std::chrono::milliseconds acquireTimeout{5000};
    std::chrono::seconds idleCheckAfter{30};
};

class DbConnectionPool;

/**
 * @brief Leased connection, handed back to the pool on destruction
 */
class DbConnection {
private:
    PGconn* conn_ = nullptr;
    DbConnectionPool* pool_ = nullptr;

public:
    DbConnection() = default;
    DbConnection(PGconn* conn, DbConnectionPool* pool) : conn_(conn), pool_(pool) {}
    ~DbConnection() { release(); }

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept;
    DbConnection& operator=(DbConnection&& other) noexcept;

    PGconn* get() const { return conn_; }
    explicit operator bool() const { return conn_ != nullptr; }

    /**
     * @brief Run a statement that takes no parameters
     * @throws InfrastructureException DATABASE_ERROR on failure
     */
    void execute(const std::string& sql);

    void release() noexcept;
};

class DbConnectionPool {
private:
    struct IdleConnection {
        PGconn* conn;
        std::chrono::steady_clock::time_point since;
    };

    DbPoolSettings settings_;
    std::vector<IdleConnection> idle_;
    size_t open_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable returned_;

    friend class DbConnection;

    PGconn* connect() const;
    bool isAlive(const IdleConnection& idle) const;
    void giveBack(PGconn* conn) noexcept;

public:
    /**
     * @throws std::invalid_argument on an empty conninfo or zero capacity
     */
    explicit DbConnectionPool(DbPoolSettings settings);
    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open one connection now so configuration errors surface at startup
     * @throws InfrastructureException DATABASE_ERROR
     */
    void verifyConnectivity();

    /**
     * @throws InfrastructureException DATABASE_ERROR when closed, on connect
     *         failure, or when no connection frees up within acquireTimeout
     *         (the last two are transient)
     */
    DbConnection acquire();

    size_t openConnections() const;
    size_t idleConnections() const;

    void close();
};

} // namespace epassport::common
