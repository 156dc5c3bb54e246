/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "common/database/db_connection_pool.h"
#include "shared/exception/InfrastructureException.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace epassport::common {

using shared::exception::InfrastructureException;

namespace {

bool runQuietly(PGconn* conn, const char* sql) {
    PGresult* res = PQexec(conn, sql);
    ExecStatusType status = res ? PQresultStatus(res) : PGRES_FATAL_ERROR;
    PQclear(res);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

} // anonymous namespace

// =============================================================================
// DbConnection
// =============================================================================

DbConnection::DbConnection(DbConnection&& other) noexcept
    : conn_(std::exchange(other.conn_, nullptr)),
      pool_(std::exchange(other.pool_, nullptr)) {}

DbConnection& DbConnection::operator=(DbConnection&& other) noexcept {
    if (this != &other) {
        release();
        conn_ = std::exchange(other.conn_, nullptr);
        pool_ = std::exchange(other.pool_, nullptr);
    }
    return *this;
}

void DbConnection::execute(const std::string& sql) {
    if (!conn_) {
        throw InfrastructureException("DATABASE_ERROR", "Connection already returned to the pool");
    }
    if (!runQuietly(conn_, sql.c_str())) {
        throw InfrastructureException("DATABASE_ERROR",
            "Statement failed: " + std::string(PQerrorMessage(conn_)));
    }
}

void DbConnection::release() noexcept {
    if (conn_ && pool_) {
        pool_->giveBack(conn_);
    }
    conn_ = nullptr;
    pool_ = nullptr;
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(DbPoolSettings settings)
    : settings_(std::move(settings))
{
    if (settings_.connInfo.empty()) {
        throw std::invalid_argument("DbConnectionPool: conninfo cannot be empty");
    }
    if (settings_.maxConnections == 0) {
        throw std::invalid_argument("DbConnectionPool: maxConnections must be positive");
    }
    idle_.reserve(settings_.maxConnections);
    spdlog::debug("DbConnectionPool: max={}, acquireTimeout={}ms",
                  settings_.maxConnections, settings_.acquireTimeout.count());
}

DbConnectionPool::~DbConnectionPool() {
    close();
}

void DbConnectionPool::verifyConnectivity() {
    DbConnection conn = acquire();
    spdlog::info("PostgreSQL reachable (server version {})", PQserverVersion(conn.get()));
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + settings_.acquireTimeout;

    for (;;) {
        if (closed_) {
            throw InfrastructureException("DATABASE_ERROR", "Connection pool is closed");
        }

        // Most recently returned first; stale ones are probed
        while (!idle_.empty()) {
            IdleConnection candidate = idle_.back();
            idle_.pop_back();
            if (isAlive(candidate)) {
                return DbConnection(candidate.conn, this);
            }
            spdlog::warn("Dropping dead PostgreSQL connection");
            PQfinish(candidate.conn);
            --open_;
        }

        if (open_ < settings_.maxConnections) {
            ++open_;
            lock.unlock();
            PGconn* conn = connect();
            if (!conn) {
                lock.lock();
                --open_;
                returned_.notify_one();
                throw InfrastructureException("DATABASE_ERROR", "Cannot connect to PostgreSQL", true);
            }
            return DbConnection(conn, this);
        }

        if (returned_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty()) {
            throw InfrastructureException("DATABASE_ERROR",
                "No database connection free after " + std::to_string(settings_.acquireTimeout.count()) + "ms",
                true);
        }
    }
}

size_t DbConnectionPool::openConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t DbConnectionPool::idleConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void DbConnectionPool::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto& idle : idle_) {
        PQfinish(idle.conn);
        --open_;
    }
    idle_.clear();
    returned_.notify_all();
    spdlog::debug("DbConnectionPool closed ({} connection(s) still leased)", open_);
}

PGconn* DbConnectionPool::connect() const {
    PGconn* conn = PQconnectdb(settings_.connInfo.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("PostgreSQL connect failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool DbConnectionPool::isAlive(const IdleConnection& idle) const {
    if (PQstatus(idle.conn) != CONNECTION_OK) {
        return false;
    }
    if (std::chrono::steady_clock::now() - idle.since < settings_.idleCheckAfter) {
        return true;
    }
    return runQuietly(idle.conn, "SELECT 1");
}

void DbConnectionPool::giveBack(PGconn* conn) noexcept {
    // A lease dropped mid-transaction must not leak it to the next user
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        runQuietly(conn, "ROLLBACK");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || PQstatus(conn) != CONNECTION_OK) {
        PQfinish(conn);
        --open_;
    } else {
        idle_.push_back({conn, std::chrono::steady_clock::now()});
    }
    returned_.notify_one();
}

} // namespace epassport::common
