#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "config/config_types.hpp"
#include <memory>
#include <string>

namespace sqlpage {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (PQconnectdbParams).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new database connection
     * @param config Validated connection settings
     * @return New connection, or the driver's error message
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const ConnectionConfig& config) = 0;
};

} // namespace sqlpage
