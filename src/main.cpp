#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "cache/memory_cache_store.hpp"
#include "cache/redis_cache_store.hpp"
#include "db/connection_manager.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "executor/query_executor.hpp"
#include "executor/result_pager.hpp"
#include "service/query_service.hpp"
#include "server/http_server.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace sqlpage;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<QueryService> g_service;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    if (g_server) {
        g_server->stop();
    }
    if (g_service) {
        g_service->disconnect();
    }
    exit(0);
}

namespace {

std::shared_ptr<ICacheStore> make_cache_store(const CacheConfig& cfg) {
    if (cfg.backend == "memory") {
        MemoryCacheStore::Config mem;
        mem.max_entries = cfg.max_entries;
        mem.num_shards = cfg.num_shards;
        utils::log::info(std::format("Cache backend: memory (max_entries={}, shards={})",
            mem.max_entries, mem.num_shards));
        return std::make_shared<MemoryCacheStore>(mem);
    }

    RedisCacheStore::Config redis;
    redis.host = cfg.host;
    redis.port = cfg.port;
    redis.password = cfg.password;
    redis.db_index = cfg.db_index;
    redis.socket_timeout = cfg.socket_timeout;
    redis.max_value_bytes = cfg.max_value_bytes;
    auto store = std::make_shared<RedisCacheStore>(redis);

    // Unreachable Redis is not fatal: staging reports CACHE_UNAVAILABLE per request
    if (auto pong = store->ping(); pong.is_error()) {
        utils::log::warn(std::format("Redis not reachable at startup: {}", pong.error_message()));
    }
    return store;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("sqlpage starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/sqlpage.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const AppConfig& config = loaded.config;

        if (!utils::log::set_level(config.logging.level)) {
            utils::log::warn(std::format("Unknown log level '{}', keeping info", config.logging.level));
        }

        utils::log::info("[2/4] Creating cache store");
        auto cache = make_cache_store(config.cache);

        utils::log::info("[3/4] Wiring query service");
        auto manager = std::make_shared<ConnectionManager>(
            config.database, std::make_shared<PgConnectionFactory>());

        QueryExecutor::Config exec_config;
        exec_config.large_result_threshold = config.query.large_result_threshold;
        exec_config.staged_ttl = config.cache.ttl;
        auto executor = std::make_shared<QueryExecutor>(manager, cache, exec_config);
        auto pager = std::make_shared<ResultPager>(cache);

        g_service = std::make_shared<QueryService>(manager, executor, pager);

        // Connect eagerly; failure is logged and the first request retries lazily
        if (auto connected = g_service->ensure_connected(); connected.is_error()) {
            utils::log::warn(std::format("Initial database connection failed: {}",
                connected.error_message()));
        }

        utils::log::info("[4/4] Starting HTTP server");
        g_server = std::make_shared<HttpServer>(
            g_service,
            config.server.host,
            config.server.port,
            config.server.thread_pool_size,
            config.server.max_sql_length);
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }

    return 0;
}
