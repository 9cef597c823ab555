#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "cache/icache_store.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace sqlpage {

/**
 * @brief Serves fixed-size pages of staged results
 *
 * Reads only from the cache store; the database is never re-queried, so
 * pages stay consistent with the snapshot taken at execution time and keep
 * working while the database is unreachable.
 */
class ResultPager {
public:
    explicit ResultPager(std::shared_ptr<ICacheStore> cache);

    /**
     * @brief Slice page `page_index` (zero-based) of a staged result
     *
     * A page past the end is an empty slice with has_next_page = false.
     * @return INVALID_PAGE_INDEX for negative or oversized indices,
     *         RESULT_NOT_FOUND for unknown or expired identifiers,
     *         STAGED_RESULT_CORRUPT when the blob fails validation
     */
    [[nodiscard]] Result<PageResponse> get_page(const std::string& identifier,
                                                int64_t page_index);

    /**
     * @brief Parse a transport page index (decimal digits, fits in 32 bits)
     */
    [[nodiscard]] static Result<uint32_t> parse_page_index(std::string_view text);

    /**
     * @brief Remove a staged result; removing an unknown identifier succeeds
     */
    [[nodiscard]] Status evict(const std::string& identifier);

private:
    std::shared_ptr<ICacheStore> cache_;
};

} // namespace sqlpage
