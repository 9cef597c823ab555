#pragma once

#include "cache/icache_store.hpp"
#include "cache/resp.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace sqlpage {

/**
 * @brief Redis-backed cache store speaking RESP2 over one TCP connection
 *
 * Commands used: SETEX, GET, DEL, PING (plus AUTH/SELECT on connect).
 * The socket is opened lazily and reopened after an I/O failure; a command
 * that failed on a stale socket is retried once on a fresh one (all three
 * commands are idempotent). Calls are serialized by an internal mutex that
 * is independent of the database connection.
 */
class RedisCacheStore : public ICacheStore {
public:
    struct Config {
        std::string host = "localhost";
        uint16_t port = 6379;
        std::string password;
        int db_index = 0;
        std::chrono::milliseconds socket_timeout{5000};
        size_t max_value_bytes = 256 * 1024 * 1024;    // Larger SETEX values and GET replies are refused
    };

    explicit RedisCacheStore(Config config);
    ~RedisCacheStore() override;

    RedisCacheStore(const RedisCacheStore&) = delete;
    RedisCacheStore& operator=(const RedisCacheStore&) = delete;

    Status set(const std::string& key, const std::string& value,
               std::chrono::seconds ttl) override;
    Result<std::optional<std::string>> get(const std::string& key) override;
    Status del(const std::string& key) override;
    const char* backend_name() const override { return "redis"; }

    /**
     * @brief Round-trip PING; used at startup to report reachability
     */
    [[nodiscard]] Status ping();

private:
    /**
     * @brief Send one command and read its reply (retries once on a stale socket)
     */
    Result<resp::Reply> command(const std::vector<std::string>& args);

    Result<resp::Reply> round_trip_locked(const std::vector<std::string>& args);
    Status connect_locked();
    void close_locked();
    bool write_all_locked(const std::string& data);
    Result<resp::Reply> read_reply_locked();

    Config config_;
    std::mutex mutex_;
    int fd_ = -1;
    std::string read_buffer_;
};

} // namespace sqlpage
