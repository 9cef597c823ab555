#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>

namespace sqlpage {

/**
 * @brief Cache key for a staged result: "query:{identifier}"
 */
[[nodiscard]] inline std::string staged_result_key(std::string_view identifier) {
    std::string key(kStagedKeyPrefix);
    key.append(identifier);
    return key;
}

/**
 * @brief Serialization of staged results for the cache store
 *
 * Document layout (version 1):
 *   {"version":1,
 *    "fields":[{"name":"id","dataType":"int4"}, ...],
 *    "rows":[["1","alice"],["2",null], ...]}
 *
 * Rows are stored as arrays aligned with "fields" so duplicate column
 * names survive the round trip. decode() validates the whole document and
 * never trusts the blob's shape.
 */
class StagedResultCodec {
public:
    static constexpr int kFormatVersion = 1;

    [[nodiscard]] static std::string encode(const StagedResultSet& staged);

    /**
     * @brief Parse and validate a staged document
     * @return STAGED_RESULT_CORRUPT on malformed JSON, unknown version,
     *         missing members or a row whose width differs from the fields
     */
    [[nodiscard]] static Result<StagedResultSet> decode(const std::string& blob);
};

} // namespace sqlpage
