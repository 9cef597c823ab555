#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlpage {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Port numbers are range-checked before narrowing so 70000 is reported, not wrapped
uint16_t toml_port(toml::node_view<const toml::node> node, int64_t fallback,
                   std::string_view name) {
    const int64_t value = node.value_or(fallback);
    if (value < 1 || value > 65535) {
        throw std::runtime_error(std::format("{} must be 1-65535, got {}", name, value));
    }
    return static_cast<uint16_t>(value);
}

template<typename T>
T toml_non_negative(toml::node_view<const toml::node> node, int64_t fallback,
                    std::string_view name) {
    const int64_t value = node.value_or(fallback);
    if (value < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}", name, value));
    }
    return static_cast<T>(value);
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto s = root["server"];
    if (!s) return cfg;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = toml_port(s["port"], cfg.port, "server.port");
    cfg.thread_pool_size = toml_non_negative<size_t>(s["threads"],
        static_cast<int64_t>(cfg.thread_pool_size), "server.threads");
    cfg.max_sql_length = toml_non_negative<size_t>(s["max_sql_length"],
        static_cast<int64_t>(cfg.max_sql_length), "server.max_sql_length");
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto l = root["logging"];
    if (!l) return cfg;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

ConnectionConfig ConfigLoader::extract_database(const toml::table& root) {
    ConnectionConfig cfg;
    const auto db = root["database"];
    if (!db) return cfg;

    cfg.host = db["host"].value_or(cfg.host);
    cfg.port = toml_port(db["port"], cfg.port, "database.port");
    cfg.database = db["name"].value_or(cfg.database);
    cfg.user = db["user"].value_or(cfg.user);
    cfg.password = db["password"].value_or(""s);
    cfg.min_connections = toml_non_negative<size_t>(db["min_connections"],
        static_cast<int64_t>(cfg.min_connections), "database.min_connections");
    cfg.max_connections = toml_non_negative<size_t>(db["max_connections"],
        static_cast<int64_t>(cfg.max_connections), "database.max_connections");
    cfg.connect_timeout = std::chrono::seconds(toml_non_negative<int64_t>(
        db["connect_timeout_seconds"], cfg.connect_timeout.count(), "database.connect_timeout_seconds"));
    cfg.health_check_query = db["health_check_query"].value_or(cfg.health_check_query);
    cfg.retry_attempts = toml_non_negative<uint32_t>(db["retry_attempts"],
        cfg.retry_attempts, "database.retry_attempts");
    cfg.retry_delay = std::chrono::milliseconds(toml_non_negative<int64_t>(
        db["retry_delay_ms"], cfg.retry_delay.count(), "database.retry_delay_ms"));
    cfg.sslmode = db["sslmode"].value_or(""s);
    cfg.application_name = db["application_name"].value_or(cfg.application_name);
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto c = root["cache"];
    if (!c) return cfg;

    cfg.backend = utils::to_lower(c["backend"].value_or(cfg.backend));
    cfg.host = c["host"].value_or(cfg.host);
    cfg.port = toml_port(c["port"], cfg.port, "cache.port");
    cfg.password = c["password"].value_or(""s);
    cfg.db_index = toml_non_negative<int>(c["db_index"], cfg.db_index, "cache.db_index");
    cfg.ttl = std::chrono::seconds(toml_non_negative<int64_t>(
        c["ttl_seconds"], cfg.ttl.count(), "cache.ttl_seconds"));
    cfg.socket_timeout = std::chrono::milliseconds(toml_non_negative<int64_t>(
        c["socket_timeout_ms"], cfg.socket_timeout.count(), "cache.socket_timeout_ms"));
    cfg.max_value_bytes = toml_non_negative<size_t>(c["max_value_bytes"],
        static_cast<int64_t>(cfg.max_value_bytes), "cache.max_value_bytes");
    cfg.max_entries = toml_non_negative<size_t>(c["max_entries"],
        static_cast<int64_t>(cfg.max_entries), "cache.max_entries");
    cfg.num_shards = toml_non_negative<size_t>(c["num_shards"],
        static_cast<int64_t>(cfg.num_shards), "cache.num_shards");
    return cfg;
}

QueryConfig ConfigLoader::extract_query(const toml::table& root) {
    QueryConfig cfg;
    const auto q = root["query"];
    if (!q) return cfg;

    cfg.large_result_threshold = toml_non_negative<size_t>(q["large_result_threshold"],
        static_cast<int64_t>(cfg.large_result_threshold), "query.large_result_threshold");
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.database = extract_database(tbl);
    config.cache = extract_cache(tbl);
    config.query = extract_query(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    static const char* const kLevels[] = {"debug", "info", "warn", "warning", "error"};
    const std::string level = utils::to_lower(config.logging.level);
    if (std::find(std::begin(kLevels), std::end(kLevels), level) == std::end(kLevels)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    const auto& db = config.database;
    if (db.host.empty()) {
        errors.push_back("database.host must not be empty");
    }
    if (db.database.empty()) {
        errors.push_back("database.name must not be empty");
    }
    if (db.max_connections < 1) {
        errors.push_back("database.max_connections must be >= 1");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format("database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.health_check_query.empty()) {
        errors.push_back("database.health_check_query must not be empty");
    }

    const auto& cache = config.cache;
    if (cache.backend != "redis" && cache.backend != "memory") {
        errors.push_back(std::format("cache.backend must be 'redis' or 'memory', got '{}'",
            cache.backend));
    }
    if (cache.backend == "redis" && cache.host.empty()) {
        errors.push_back("cache.host required when backend is redis");
    }
    if (cache.backend == "redis" && cache.max_value_bytes == 0) {
        errors.push_back("cache.max_value_bytes must be > 0 when backend is redis");
    }
    if (cache.ttl.count() <= 0) {
        errors.push_back("cache.ttl_seconds must be > 0");
    }
    if (cache.backend == "memory" && (cache.max_entries == 0 || cache.num_shards == 0)) {
        errors.push_back("cache.max_entries and cache.num_shards must be > 0 for the memory backend");
    }

    if (config.query.large_result_threshold == 0) {
        errors.push_back("query.large_result_threshold must be > 0");
    }

    return errors;
}

} // namespace sqlpage
