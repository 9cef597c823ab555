#include "executor/result_pager.hpp"
#include "executor/staged_result_codec.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <iterator>
#include <format>
#include <limits>

namespace sqlpage {

ResultPager::ResultPager(std::shared_ptr<ICacheStore> cache)
    : cache_(std::move(cache)) {}

Result<PageResponse> ResultPager::get_page(const std::string& identifier,
                                           int64_t page_index) {
    using Page = Result<PageResponse>;

    if (page_index < 0 || page_index > std::numeric_limits<uint32_t>::max()) {
        return Page::error(ErrorKind::INVALID_PAGE_INDEX,
            std::format("Invalid page index: {}", page_index));
    }
    if (identifier.empty()) {
        return Page::error(ErrorKind::RESULT_NOT_FOUND, "Query results not found");
    }

    auto blob = cache_->get(staged_result_key(identifier));
    if (blob.is_error()) {
        utils::log::error(std::format("Error fetching query page for {}: {}",
            identifier, blob.error_message()));
        return Page::propagate(blob);
    }
    if (!blob.value()) {
        return Page::error(ErrorKind::RESULT_NOT_FOUND,
            std::format("Query results not found: {}", identifier));
    }

    auto decoded = StagedResultCodec::decode(*blob.value());
    if (decoded.is_error()) {
        utils::log::error(std::format("{} (query:{})", decoded.error_message(), identifier));
        return Page::propagate(decoded);
    }
    auto& staged = decoded.value();

    const size_t total_rows = staged.rows.size();
    const size_t start = static_cast<size_t>(page_index) * kPageSize;
    const size_t end = start + kPageSize;

    PageResponse page;
    page.metadata.total_rows = total_rows;
    page.metadata.total_pages = (total_rows + kPageSize - 1) / kPageSize;
    page.metadata.page_size = kPageSize;
    page.metadata.current_page = static_cast<uint32_t>(page_index);
    page.metadata.has_next_page = end < total_rows;
    page.metadata.has_previous_page = start > 0;

    if (start < total_rows) {
        const auto first = staged.rows.begin() + static_cast<std::ptrdiff_t>(start);
        const auto last = staged.rows.begin() + static_cast<std::ptrdiff_t>(std::min(end, total_rows));
        page.rows.assign(std::make_move_iterator(first), std::make_move_iterator(last));
    }
    page.fields = std::move(staged.fields);

    return Page::ok(std::move(page));
}

Result<uint32_t> ResultPager::parse_page_index(std::string_view text) {
    const bool digits_only = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (digits_only) {
        if (auto parsed = utils::try_parse_int<uint32_t>(text)) {
            return Result<uint32_t>::ok(*parsed);
        }
    }
    return Result<uint32_t>::error(ErrorKind::INVALID_PAGE_INDEX,
        std::format("Invalid page index: '{}'", text));
}

Status ResultPager::evict(const std::string& identifier) {
    if (identifier.empty()) {
        return Status::ok();
    }
    auto removed = cache_->del(staged_result_key(identifier));
    if (removed.is_error()) {
        return removed;
    }
    utils::log::debug(std::format("Evicted staged result query:{}", identifier));
    return Status::ok();
}

} // namespace sqlpage
