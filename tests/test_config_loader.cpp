#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace sqlpage;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 5001);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.database.host == "localhost");
    CHECK(cfg.database.port == 5432);
    CHECK(cfg.database.retry_attempts == 3);
    CHECK(cfg.database.retry_delay == std::chrono::milliseconds(5000));
    CHECK(cfg.database.health_check_query == "SELECT 1");
    CHECK(cfg.cache.backend == "redis");
    CHECK(cfg.cache.port == 6379);
    CHECK(cfg.cache.ttl == std::chrono::seconds(3600));
    CHECK(cfg.query.large_result_threshold == 1000);
}

TEST_CASE("ConfigLoader: all sections are read", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 8080
threads = 8
max_sql_length = 2048

[logging]
level = "debug"

[database]
host = "db.internal"
port = 6543
name = "analytics"
user = "reader"
password = "pw"
min_connections = 1
max_connections = 4
connect_timeout_seconds = 3
retry_attempts = 5
retry_delay_ms = 250
sslmode = "require"

[cache]
backend = "Memory"
ttl_seconds = 120
max_entries = 64
num_shards = 4

[query]
large_result_threshold = 50
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.server.max_sql_length == 2048);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database.host == "db.internal");
    CHECK(cfg.database.port == 6543);
    CHECK(cfg.database.database == "analytics");
    CHECK(cfg.database.user == "reader");
    CHECK(cfg.database.password == "pw");
    CHECK(cfg.database.max_connections == 4);
    CHECK(cfg.database.connect_timeout == std::chrono::seconds(3));
    CHECK(cfg.database.retry_attempts == 5);
    CHECK(cfg.database.retry_delay == std::chrono::milliseconds(250));
    CHECK(cfg.database.sslmode == "require");
    CHECK(cfg.cache.backend == "memory");
    CHECK(cfg.cache.ttl == std::chrono::seconds(120));
    CHECK(cfg.cache.max_entries == 64);
    CHECK(cfg.cache.num_shards == 4);
    CHECK(cfg.query.large_result_threshold == 50);
}

TEST_CASE("ConfigLoader: env vars expand in string values", "[config][env]") {
    ::setenv("SQLPAGE_TEST_DB_PASSWORD", "s3cret", 1);
    ::unsetenv("SQLPAGE_TEST_UNSET_VAR");

    const std::string toml = R"(
[database]
password = "${SQLPAGE_TEST_DB_PASSWORD}"
user = "app${SQLPAGE_TEST_UNSET_VAR}"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.password == "s3cret");
    CHECK(result.config.database.user == "app");

    ::unsetenv("SQLPAGE_TEST_DB_PASSWORD");
}

TEST_CASE("ConfigLoader: unclosed env var reference fails", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
password = "${BROKEN"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: out of range port fails", "[config][validation]") {
    auto zero = ConfigLoader::load_from_string("[server]\nport = 0\n");
    CHECK_FALSE(zero.success);
    CHECK(zero.error_message.find("server.port") != std::string::npos);

    auto big = ConfigLoader::load_from_string("[database]\nport = 70000\n");
    CHECK_FALSE(big.success);
    CHECK(big.error_message.find("database.port") != std::string::npos);
}

TEST_CASE("ConfigLoader: negative count fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[database]\nretry_attempts = -1\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.retry_attempts") != std::string::npos);
}

TEST_CASE("ConfigLoader: min > max connections fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
min_connections = 5
max_connections = 2
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("min_connections") != std::string::npos);
}

TEST_CASE("ConfigLoader: unknown cache backend fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[cache]\nbackend = \"memcached\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("cache.backend") != std::string::npos);
}

TEST_CASE("ConfigLoader: zero threshold and ttl fail together", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[cache]
ttl_seconds = 0

[query]
large_result_threshold = 0
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("cache.ttl_seconds") != std::string::npos);
    CHECK(result.error_message.find("query.large_result_threshold") != std::string::npos);
}

TEST_CASE("ConfigLoader: cache value size limit", "[config][validation]") {
    auto defaults = ConfigLoader::load_from_string("");
    REQUIRE(defaults.success);
    CHECK(defaults.config.cache.max_value_bytes == 256u * 1024 * 1024);

    auto custom = ConfigLoader::load_from_string("[cache]\nmax_value_bytes = 1048576\n");
    REQUIRE(custom.success);
    CHECK(custom.config.cache.max_value_bytes == 1048576u);

    auto zero = ConfigLoader::load_from_string("[cache]\nmax_value_bytes = 0\n");
    CHECK_FALSE(zero.success);
    CHECK(zero.error_message.find("cache.max_value_bytes") != std::string::npos);
}

TEST_CASE("ConfigLoader: bad log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML fails", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file fails", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/sqlpage.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: validate_config accepts defaults", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(AppConfig{}).empty());
}
