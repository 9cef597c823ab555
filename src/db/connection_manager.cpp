#include "db/connection_manager.hpp"
#include "core/utils.hpp"
#include <format>
#include <thread>

namespace sqlpage {

ConnectionManager::ConnectionManager(
    ConnectionConfig config,
    std::shared_ptr<IConnectionFactory> factory,
    SleepFunc sleep)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      sleep_(std::move(sleep)),
      remaining_retries_(config_.retry_attempts) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

ConnectionManager::~ConnectionManager() {
    release_handle();
}

Status ConnectionManager::validate_config() const {
    if (config_.host.empty()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Missing required config field: host");
    }
    if (config_.port == 0) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Missing required config field: port");
    }
    if (config_.database.empty()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Missing required config field: database");
    }
    return Status::ok();
}

void ConnectionManager::log_connection_params() const {
    utils::log::info(std::format(
        "Attempting to connect to database: host={} port={} database={} user={} pool(min={}, max={})",
        config_.host, config_.port, config_.database, config_.user,
        config_.min_connections, config_.max_connections));
}

Status ConnectionManager::connect() {
    if (is_connected()) {
        return Status::ok();
    }

    // Validation failure is synchronous and does not consume a retry
    if (auto valid = validate_config(); valid.is_error()) {
        utils::log::error(valid.error_message());
        return valid;
    }

    // Single-flight: only one caller drives DISCONNECTED/FAILED → CONNECTING
    auto current = state_.load(std::memory_order_acquire);
    do {
        if (current == ConnectionState::CONNECTED) {
            return Status::ok();
        }
        if (current == ConnectionState::CONNECTING) {
            return Status::error(ErrorKind::NOT_CONNECTED,
                "Database connection attempt already in progress");
        }
    } while (!state_.compare_exchange_weak(current, ConnectionState::CONNECTING,
                                           std::memory_order_acq_rel));

    log_connection_params();

    std::string last_error;
    uint32_t attempts = 0;

    for (;;) {
        ++attempts;
        open_attempts_.fetch_add(1, std::memory_order_relaxed);

        auto created = factory_->create(config_);
        if (created.is_ok() && created.value()) {
            auto conn = std::move(created.value());
            std::string reason = conn->probe(config_.health_check_query);
            if (reason.empty()) {
                {
                    std::lock_guard lock(handle_mutex_);
                    active_ = std::make_shared<ManagedConnection>(std::move(conn));
                }
                remaining_retries_ = config_.retry_attempts;
                state_.store(ConnectionState::CONNECTED, std::memory_order_release);
                successful_connects_.fetch_add(1, std::memory_order_relaxed);
                utils::log::info(std::format("Database connected successfully ({}:{}/{})",
                    config_.host, config_.port, config_.database));
                return Status::ok();
            }
            probe_failures_.fetch_add(1, std::memory_order_relaxed);
            conn->close();
            last_error = std::format("Liveness probe failed: {}", reason);
        } else {
            last_error = created.is_ok() ? "Connection factory returned no connection"
                                         : created.error_message();
        }

        utils::log::error(std::format(
            "Database connection error: {} (host={} port={} database={} user={})",
            last_error, config_.host, config_.port, config_.database, config_.user));

        if (remaining_retries_ == 0) {
            break;
        }

        --remaining_retries_;
        utils::log::warn(std::format("Retrying connection in {}ms... (attempts left: {})",
            config_.retry_delay.count(), remaining_retries_));
        sleep_(config_.retry_delay);
    }

    state_.store(ConnectionState::FAILED, std::memory_order_release);
    exhausted_failures_.fetch_add(1, std::memory_order_relaxed);
    return Status::error(ErrorKind::CONNECTION_EXHAUSTED,
        std::format("Failed to connect to database after {} attempt{} (retry budget exhausted): {}",
            attempts, attempts == 1 ? "" : "s", last_error));
}

Status ConnectionManager::disconnect() {
    const bool had_handle = [this] {
        std::lock_guard lock(handle_mutex_);
        return active_ != nullptr;
    }();

    release_handle();
    state_.store(ConnectionState::DISCONNECTED, std::memory_order_release);

    if (had_handle) {
        utils::log::info("Database disconnected successfully");
    }
    return Status::ok();
}

HealthStatus ConnectionManager::health_check() {
    if (!is_connected()) {
        auto connected = connect();
        if (connected.is_error()) {
            return HealthStatus::error(connected.error_message());
        }
    }

    std::string reason;
    {
        auto lease = active_handle();
        if (lease.is_error()) {
            return HealthStatus::error(lease.error_message());
        }
        reason = lease.value()->probe(config_.health_check_query);
    }

    if (!reason.empty()) {
        probe_failures_.fetch_add(1, std::memory_order_relaxed);
        invalidate(reason);
        return HealthStatus::error(reason);
    }
    return HealthStatus::ok();
}

Result<ConnectionLease> ConnectionManager::active_handle() {
    std::shared_ptr<ManagedConnection> slot;
    {
        std::lock_guard lock(handle_mutex_);
        if (state_.load(std::memory_order_acquire) == ConnectionState::CONNECTED) {
            slot = active_;
        }
    }
    if (!slot) {
        return Result<ConnectionLease>::error(ErrorKind::NOT_CONNECTED, "Database not connected");
    }
    return Result<ConnectionLease>::ok(ConnectionLease(std::move(slot)));
}

void ConnectionManager::invalidate(const std::string& reason) {
    utils::log::warn(std::format("Dropping database connection: {}", reason));
    release_handle();
    auto expected = ConnectionState::CONNECTED;
    state_.compare_exchange_strong(expected, ConnectionState::DISCONNECTED,
                                   std::memory_order_acq_rel);
}

void ConnectionManager::release_handle() {
    std::shared_ptr<ManagedConnection> old;
    {
        std::lock_guard lock(handle_mutex_);
        old = std::move(active_);
        active_.reset();
    }
    if (old) {
        // Wait for an in-flight statement before closing
        std::lock_guard exec_lock(old->exec_mutex);
        if (old->conn) {
            old->conn->close();
        }
    }
}

ConnectionManager::Stats ConnectionManager::get_stats() const {
    return {
        .open_attempts = open_attempts_.load(std::memory_order_relaxed),
        .successful_connects = successful_connects_.load(std::memory_order_relaxed),
        .exhausted_failures = exhausted_failures_.load(std::memory_order_relaxed),
        .probe_failures = probe_failures_.load(std::memory_order_relaxed),
    };
}

} // namespace sqlpage
