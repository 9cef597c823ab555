#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace sqlpage {

/**
 * @brief TOML configuration loader
 *
 * Sections: [server], [logging], [database], [cache], [query]. Every string
 * value may reference environment variables as ${VAR_NAME}; unset variables
 * expand to an empty string. Missing keys keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load configuration from TOML file
     * @param config_path Path to config file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load configuration from TOML string (for testing)
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on a parsed config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ConnectionConfig extract_database(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static QueryConfig extract_query(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace sqlpage
