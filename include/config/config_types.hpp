#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace sqlpage {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    size_t max_sql_length;    // Max SQL query size in bytes

    ServerConfig()
        : host("0.0.0.0"),
          port(5001),
          thread_pool_size(4),
          max_sql_length(102400) {}  // 100KB
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Settings for the single database connection
 *
 * host, port and database are required before a connection attempt;
 * ConnectionManager validates them on every connect().
 */
struct ConnectionConfig {
    std::string host;
    uint16_t port;
    std::string database;
    std::string user;
    std::string password;                   // Never logged
    size_t min_connections;
    size_t max_connections;
    std::chrono::seconds connect_timeout;
    std::string health_check_query;
    uint32_t retry_attempts;                // Retries after the initial attempt
    std::chrono::milliseconds retry_delay;
    std::string sslmode;                    // Empty = libpq default
    std::string application_name;

    ConnectionConfig()
        : host("localhost"),
          port(5432),
          database("postgres"),
          user("postgres"),
          min_connections(2),
          max_connections(10),
          connect_timeout(10),
          health_check_query("SELECT 1"),
          retry_attempts(3),
          retry_delay(5000),
          application_name("sqlpage") {}
};

struct CacheConfig {
    std::string backend = "redis";          // "redis" | "memory"
    std::string host = "localhost";
    uint16_t port = 6379;
    std::string password;
    int db_index = 0;
    std::chrono::seconds ttl{3600};
    std::chrono::milliseconds socket_timeout{5000};
    size_t max_value_bytes = 256 * 1024 * 1024;   // redis backend only
    size_t max_entries = 1024;              // memory backend only
    size_t num_shards = 16;                 // memory backend only
};

struct QueryConfig {
    size_t large_result_threshold = 1000;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    ConnectionConfig database;
    CacheConfig cache;
    QueryConfig query;
};

} // namespace sqlpage
