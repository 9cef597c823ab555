#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlpage {

// ============================================================================
// Policy Constants
// ============================================================================

inline constexpr size_t kDefaultLargeResultThreshold = 1000;
inline constexpr size_t kPageSize = 100;
inline constexpr std::chrono::seconds kStagedResultTtl{3600};
inline constexpr std::string_view kStagedKeyPrefix = "query:";

// ============================================================================
// Query Results
// ============================================================================

/// A cell is the text form of the value, or nullopt for SQL NULL
using CellValue = std::optional<std::string>;

/// Cells are aligned with the result's field descriptors
using Row = std::vector<CellValue>;

struct FieldDescriptor {
    std::string name;
    std::string data_type;      // Backend type name ("int4", "text"); empty if unknown

    FieldDescriptor() = default;
    explicit FieldDescriptor(std::string n, std::string t = {})
        : name(std::move(n)), data_type(std::move(t)) {}

    bool operator==(const FieldDescriptor&) const = default;
};

struct QueryResult {
    std::vector<FieldDescriptor> fields;
    std::vector<Row> rows;

    // For DML / DDL
    uint64_t affected_rows = 0;

    std::chrono::microseconds execution_time{0};
};

/**
 * @brief Outcome of QueryExecutor::execute()
 *
 * Inline: rows populated, identifier empty.
 * Staged: rows empty, identifier names the cache entry query:{identifier}.
 */
struct ExecutionOutcome {
    bool is_large_result = false;
    std::string identifier;
    size_t row_count = 0;
    std::vector<FieldDescriptor> fields;
    std::vector<Row> rows;
    uint64_t affected_rows = 0;
};

// ============================================================================
// Staged Results & Pagination
// ============================================================================

struct StagedResultSet {
    std::vector<FieldDescriptor> fields;
    std::vector<Row> rows;
};

struct PageMetadata {
    size_t total_rows = 0;
    size_t total_pages = 0;
    size_t page_size = kPageSize;
    uint32_t current_page = 0;
    bool has_next_page = false;
    bool has_previous_page = false;
};

struct PageResponse {
    std::vector<Row> rows;
    std::vector<FieldDescriptor> fields;
    PageMetadata metadata;
};

// ============================================================================
// Health & Introspection
// ============================================================================

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

[[nodiscard]] inline const char* connection_state_to_string(ConnectionState s) {
    switch (s) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::FAILED: return "failed";
        default: return "unknown";
    }
}

struct HealthStatus {
    bool connected = false;
    std::string message;

    static HealthStatus ok() { return {true, "Database is connected"}; }
    static HealthStatus error(std::string reason) { return {false, std::move(reason)}; }
};

struct SchemaDetail {
    size_t table_count = 0;
    std::vector<std::string> tables;
    std::string staged_tables_id;       // Set when the table listing was staged
};

struct SchemaInfo {
    std::vector<std::string> schemas;   // Alphabetical, as listed by the database
    std::vector<SchemaDetail> details;  // Parallel to schemas
};

} // namespace sqlpage
