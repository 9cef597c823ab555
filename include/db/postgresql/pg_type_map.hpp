#pragma once

#include <cstdint>
#include <string>

namespace sqlpage {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps built-in type OIDs (pg_type.oid) to the type names reported in
 * field descriptors.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to its catalog type name
     * @param oid PostgreSQL type OID
     * @return Type name ("int4", "text", ...), or empty for user-defined types
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);
};

} // namespace sqlpage
