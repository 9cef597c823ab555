#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <string>

namespace sqlpage::response {

/**
 * @brief HTTP status for an error kind
 *
 * 400 INVALID_QUERY / INVALID_PAGE_INDEX, 404 RESULT_NOT_FOUND,
 * 422 EXECUTION_FAILED, 503 connection kinds, 502 cache kinds, 500 otherwise.
 */
[[nodiscard]] int status_for(ErrorKind kind);

/**
 * @brief {"success":false,"error":{"kind":...,"message":...[,"sqlState":...]}}
 */
[[nodiscard]] std::string render_error(ErrorKind kind, const std::string& message,
                                       const std::string& sql_state = {});

template<typename T>
[[nodiscard]] std::string render_error(const Result<T>& result) {
    return render_error(result.error_kind(), result.error_message(), result.error_detail());
}

[[nodiscard]] std::string render_message(const std::string& message);

[[nodiscard]] std::string render_execution(const ExecutionOutcome& outcome);

/**
 * @brief Table names from the first column, or the staged handle
 */
[[nodiscard]] std::string render_tables(const ExecutionOutcome& outcome);

[[nodiscard]] std::string render_schema_info(const SchemaInfo& info);

[[nodiscard]] std::string render_page(const PageResponse& page);

[[nodiscard]] std::string render_health(const HealthStatus& health);

/**
 * @brief Process liveness body, no database involved
 */
[[nodiscard]] std::string render_liveness(const std::string& timestamp);

/**
 * Row and field fragments, exposed for tests. Cells are typed by the field's
 * data_type: int2/int4/int8/float4/float8/numeric as JSON numbers, bool as
 * true/false, json/jsonb embedded verbatim, everything else as a string.
 * Text that does not fit the type (NaN, Infinity) falls back to a string.
 */
[[nodiscard]] std::string render_fields(const std::vector<FieldDescriptor>& fields);
[[nodiscard]] std::string render_rows(const std::vector<FieldDescriptor>& fields,
                                      const std::vector<Row>& rows);

} // namespace sqlpage::response
