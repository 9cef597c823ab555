#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace sqlpage {

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, std::string> OID_NAMES = {
        {16, "bool"},
        {17, "bytea"},
        {18, "char"},
        {19, "name"},
        {20, "int8"},
        {21, "int2"},
        {23, "int4"},
        {25, "text"},
        {26, "oid"},
        {114, "json"},
        {142, "xml"},
        {600, "point"},
        {650, "cidr"},
        {700, "float4"},
        {701, "float8"},
        {790, "money"},
        {829, "macaddr"},
        {869, "inet"},
        {1000, "_bool"},
        {1007, "_int4"},
        {1009, "_text"},
        {1016, "_int8"},
        {1042, "bpchar"},
        {1043, "varchar"},
        {1082, "date"},
        {1083, "time"},
        {1114, "timestamp"},
        {1184, "timestamptz"},
        {1186, "interval"},
        {1266, "timetz"},
        {1700, "numeric"},
        {2950, "uuid"},
        {3614, "tsvector"},
        {3802, "jsonb"},
    };

    auto it = OID_NAMES.find(oid);
    return it != OID_NAMES.end() ? it->second : std::string{};
}

} // namespace sqlpage
