#include "db/connection_lease.hpp"

namespace sqlpage {

ConnectionLease::ConnectionLease(std::shared_ptr<ManagedConnection> slot)
    : slot_(std::move(slot)) {
    if (slot_) {
        lock_ = std::unique_lock<std::mutex>(slot_->exec_mutex);
    }
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : slot_(std::move(other.slot_)), lock_(std::move(other.lock_)) {}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        // Unlock the current slot before its owner may be released
        lock_ = std::move(other.lock_);
        slot_ = std::move(other.slot_);
    }
    return *this;
}

} // namespace sqlpage
