#include "server/response_format.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <string_view>
#include <unordered_map>

namespace sqlpage::response {

namespace {

void append_string_array(std::string& out, const std::vector<std::string>& values) {
    out += '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(values[i]));
    }
    out += ']';
}

enum class CellFormat { STRING, NUMBER, BOOLEAN, RAW_JSON };

CellFormat cell_format(const std::string& data_type) {
    static const std::unordered_map<std::string, CellFormat> FORMATS = {
        {"int2", CellFormat::NUMBER},
        {"int4", CellFormat::NUMBER},
        {"int8", CellFormat::NUMBER},
        {"float4", CellFormat::NUMBER},
        {"float8", CellFormat::NUMBER},
        {"numeric", CellFormat::NUMBER},
        {"bool", CellFormat::BOOLEAN},
        {"json", CellFormat::RAW_JSON},
        {"jsonb", CellFormat::RAW_JSON},
    };
    auto it = FORMATS.find(data_type);
    return it != FORMATS.end() ? it->second : CellFormat::STRING;
}

// NaN and Infinity are valid float8/numeric text but not JSON numbers
bool is_json_number(std::string_view text) {
    if (text.empty()) return false;
    const size_t start = text.front() == '-' ? 1 : 0;
    if (start == text.size() || !std::isdigit(static_cast<unsigned char>(text[start]))) {
        return false;
    }
    return std::all_of(text.begin() + start, text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) ||
               c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
    });
}

void append_cell(std::string& out, const std::string& data_type, const CellValue& cell) {
    if (!cell) {
        out += "null";
        return;
    }
    const std::string& text = *cell;
    switch (cell_format(data_type)) {
        case CellFormat::NUMBER:
            if (is_json_number(text)) {
                out += text;
                return;
            }
            break;
        case CellFormat::BOOLEAN:
            if (text == "t" || text == "f") {
                out += text == "t" ? "true" : "false";
                return;
            }
            break;
        case CellFormat::RAW_JSON:
            if (!text.empty()) {
                out += text;
                return;
            }
            break;
        case CellFormat::STRING:
            break;
    }
    out += std::format("\"{}\"", utils::escape_json(text));
}

void append_row(std::string& out, const std::vector<FieldDescriptor>& fields, const Row& row) {
    out += '{';
    const size_t width = std::min(fields.size(), row.size());
    for (size_t c = 0; c < width; ++c) {
        if (c > 0) out += ',';
        out += std::format("\"{}\":", utils::escape_json(fields[c].name));
        append_cell(out, fields[c].data_type, row[c]);
    }
    out += '}';
}

} // anonymous namespace

int status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_QUERY:
        case ErrorKind::INVALID_PAGE_INDEX:
            return 400;
        case ErrorKind::RESULT_NOT_FOUND:
            return 404;
        case ErrorKind::EXECUTION_FAILED:
            return 422;
        case ErrorKind::CONFIG_INVALID:
        case ErrorKind::CONNECTION_EXHAUSTED:
        case ErrorKind::NOT_CONNECTED:
            return 503;
        case ErrorKind::CACHE_UNAVAILABLE:
        case ErrorKind::STAGED_RESULT_CORRUPT:
            return 502;
        default:
            return 500;
    }
}

std::string render_error(ErrorKind kind, const std::string& message,
                         const std::string& sql_state) {
    std::string out = std::format(R"({{"success":false,"error":{{"kind":"{}","message":"{}")",
        error_kind_to_string(kind), utils::escape_json(message));
    if (!sql_state.empty()) {
        out += std::format(R"(,"sqlState":"{}")", utils::escape_json(sql_state));
    }
    out += "}}";
    return out;
}

std::string render_message(const std::string& message) {
    return std::format(R"({{"success":true,"message":"{}"}})", utils::escape_json(message));
}

std::string render_fields(const std::vector<FieldDescriptor>& fields) {
    std::string out = "[";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format(R"({{"name":"{}","dataType":"{}"}})",
            utils::escape_json(fields[i].name), utils::escape_json(fields[i].data_type));
    }
    out += ']';
    return out;
}

std::string render_rows(const std::vector<FieldDescriptor>& fields,
                        const std::vector<Row>& rows) {
    std::string out;
    // ~32 bytes per cell
    out.reserve(2 + rows.size() * (fields.size() * 32 + 2));
    out += '[';
    for (size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) out += ',';
        append_row(out, fields, rows[r]);
    }
    out += ']';
    return out;
}

std::string render_execution(const ExecutionOutcome& outcome) {
    std::string out = std::format(R"({{"success":true,"result":{{"isLargeResult":{},"rowCount":{},)",
        utils::booltostr(outcome.is_large_result), outcome.row_count);

    if (outcome.is_large_result) {
        out += std::format(R"("queryId":"{}",)", utils::escape_json(outcome.identifier));
    }
    out += R"("fields":)";
    out += render_fields(outcome.fields);

    if (!outcome.is_large_result) {
        out += R"(,"rows":)";
        out += render_rows(outcome.fields, outcome.rows);
        out += std::format(R"(,"affectedRows":{})", outcome.affected_rows);
    }
    out += "}}";
    return out;
}

std::string render_tables(const ExecutionOutcome& outcome) {
    if (outcome.is_large_result) {
        return std::format(
            R"({{"success":true,"tables":[],"isLargeResult":true,"queryId":"{}","rowCount":{}}})",
            utils::escape_json(outcome.identifier), outcome.row_count);
    }

    std::vector<std::string> names;
    names.reserve(outcome.rows.size());
    for (const auto& row : outcome.rows) {
        if (!row.empty() && row.front()) {
            names.push_back(*row.front());
        }
    }

    std::string out = R"({"success":true,"tables":)";
    append_string_array(out, names);
    out += '}';
    return out;
}

std::string render_schema_info(const SchemaInfo& info) {
    std::string out = std::format(R"({{"success":true,"schemaInfo":{{"schemaCount":{},"schemas":)",
        info.schemas.size());
    append_string_array(out, info.schemas);

    out += R"(,"details":{)";
    for (size_t i = 0; i < info.schemas.size() && i < info.details.size(); ++i) {
        if (i > 0) out += ',';
        const auto& detail = info.details[i];
        out += std::format(R"("{}":{{"tableCount":{},"tables":)",
            utils::escape_json(info.schemas[i]), detail.table_count);
        append_string_array(out, detail.tables);
        if (!detail.staged_tables_id.empty()) {
            out += std::format(R"(,"stagedTablesId":"{}")", utils::escape_json(detail.staged_tables_id));
        }
        out += '}';
    }
    out += "}}}";
    return out;
}

std::string render_page(const PageResponse& page) {
    const auto& m = page.metadata;
    std::string out = R"({"success":true,"pageData":{"results":)";
    out += render_rows(page.fields, page.rows);
    out += R"(,"fields":)";
    out += render_fields(page.fields);
    out += std::format(
        R"(,"metadata":{{"totalRows":{},"totalPages":{},"pageSize":{},"currentPage":{},"hasNextPage":{},"hasPreviousPage":{}}}}}}})",
        m.total_rows, m.total_pages, m.page_size, m.current_page,
        utils::booltostr(m.has_next_page), utils::booltostr(m.has_previous_page));
    return out;
}

std::string render_health(const HealthStatus& health) {
    if (health.connected) {
        return std::format(R"({{"success":true,"status":"connected","message":"{}"}})",
            utils::escape_json(health.message));
    }
    return std::format(
        R"({{"success":false,"status":"disconnected","error":{{"kind":"{}","message":"{}"}}}})",
        error_kind_to_string(ErrorKind::NOT_CONNECTED), utils::escape_json(health.message));
}

std::string render_liveness(const std::string& timestamp) {
    return std::format(R"({{"status":"up","timestamp":"{}"}})", utils::escape_json(timestamp));
}

} // namespace sqlpage::response
