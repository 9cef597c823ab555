#pragma once

#include <string>
#include <string_view>

namespace sqlpage::http {

inline constexpr const char* kJsonContentType = "application/json";

// Route paths (std::string because cpp-httplib APIs require const std::string&)
inline const std::string kTestConnectionRoute = "/api/db/test-connection";
inline const std::string kTablesRoute = "/api/db/tables";
inline const std::string kSchemaInfoRoute = "/api/db/schema-info";
inline const std::string kExecuteRoute = "/api/db/execute";
inline const std::string kQueryPageRoute = R"(/api/db/query-results/([^/]+)/([^/]+))";
inline const std::string kQueryReleaseRoute = R"(/api/db/query-results/([^/]+))";
inline const std::string kDisconnectRoute = "/api/db/disconnect";
inline const std::string kLivenessRoute = "/health";

} // namespace sqlpage::http
