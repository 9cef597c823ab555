#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "config/config_types.hpp"
#include "db/connection_lease.hpp"
#include "db/iconnection_factory.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace sqlpage {

/**
 * @brief Owns the lifecycle of the process's single database connection
 *
 * State machine:
 * - DISCONNECTED → CONNECTING → CONNECTED
 * - CONNECTING   → FAILED      (retry budget exhausted)
 * - CONNECTED    → DISCONNECTED (disconnect(), failed probe, broken handle)
 *
 * connect() is single-flight: while one caller is connecting, others fail
 * fast with NOT_CONNECTED. The retry delay is slept without holding any
 * lock, so cache-only operations never wait on a reconnect.
 *
 * Retry policy is a fixed count and a fixed delay: config.retry_attempts
 * retries, config.retry_delay apart, shared across connect() calls. A
 * successful connect refills the budget. Once it is spent, each later
 * connect() makes a single attempt without sleeping.
 */
class ConnectionManager {
public:
    using SleepFunc = std::function<void(std::chrono::milliseconds)>;

    struct Stats {
        uint64_t open_attempts;
        uint64_t successful_connects;
        uint64_t exhausted_failures;
        uint64_t probe_failures;
    };

    /**
     * @param config Connection settings (validated on every connect())
     * @param factory Backend connection factory
     * @param sleep Delay function between attempts (defaults to sleep_for)
     */
    ConnectionManager(ConnectionConfig config,
                      std::shared_ptr<IConnectionFactory> factory,
                      SleepFunc sleep = {});

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Validate config, open the connection and run the liveness probe
     *
     * No-op when already connected.
     * @return CONFIG_INVALID (no attempt made), NOT_CONNECTED (another
     *         connect in progress) or CONNECTION_EXHAUSTED (wraps last error)
     */
    [[nodiscard]] Status connect();

    /**
     * @brief Release the connection; idempotent
     */
    Status disconnect();

    /**
     * @brief Probe the live connection, connecting first if needed
     *
     * Any failure drops the handle so the next operation reconnects.
     */
    [[nodiscard]] HealthStatus health_check();

    /**
     * @brief Lease the live connection
     * @return NOT_CONNECTED unless the state is CONNECTED
     */
    [[nodiscard]] Result<ConnectionLease> active_handle();

    /**
     * @brief Drop a handle the driver reports as broken
     *
     * Called by the executor after a failed statement left the connection
     * unusable. Must not be called while holding a lease.
     */
    void invalidate(const std::string& reason);

    [[nodiscard]] bool is_connected() const {
        return state_.load(std::memory_order_acquire) == ConnectionState::CONNECTED;
    }

    [[nodiscard]] ConnectionState state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ConnectionConfig& config() const { return config_; }

    /**
     * @brief Retries left before connect() stops sleeping between attempts
     */
    [[nodiscard]] uint32_t remaining_retries() const { return remaining_retries_; }

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] Status validate_config() const;
    void log_connection_params() const;

    /**
     * @brief Detach the current handle and close it once no lease holds it
     */
    void release_handle();

    ConnectionConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;
    SleepFunc sleep_;

    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

    // Touched only by the caller that won the CONNECTING transition
    uint32_t remaining_retries_;

    // Guards active_ only; never held across I/O or sleeps
    mutable std::mutex handle_mutex_;
    std::shared_ptr<ManagedConnection> active_;

    std::atomic<uint64_t> open_attempts_{0};
    std::atomic<uint64_t> successful_connects_{0};
    std::atomic<uint64_t> exhausted_failures_{0};
    std::atomic<uint64_t> probe_failures_{0};
};

} // namespace sqlpage
