#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <mutex>

namespace sqlpage {

/**
 * @brief The single live connection plus the mutex serializing its use
 *
 * Shared between ConnectionManager and outstanding leases so a disconnect
 * never frees a connection that a statement is still running on.
 */
struct ManagedConnection {
    explicit ManagedConnection(std::unique_ptr<IDbConnection> c)
        : conn(std::move(c)) {}

    std::unique_ptr<IDbConnection> conn;
    std::mutex exec_mutex;
};

/**
 * @brief RAII exclusive access to the managed connection
 *
 * Holds the connection's exec mutex for its lifetime.
 * Move-only to prevent accidental copying.
 */
class ConnectionLease {
public:
    /**
     * @brief Lock the slot (blocks while another statement is running)
     */
    explicit ConnectionLease(std::shared_ptr<ManagedConnection> slot);

    ~ConnectionLease() = default;

    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    IDbConnection* get() const { return slot_ ? slot_->conn.get() : nullptr; }
    IDbConnection* operator->() const { return get(); }

    bool is_valid() const { return get() != nullptr && get()->is_connected(); }

private:
    // Declaration order matters: lock_ is destroyed before slot_
    std::shared_ptr<ManagedConnection> slot_;
    std::unique_lock<std::mutex> lock_;
};

} // namespace sqlpage
