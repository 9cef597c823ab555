#include "cache/resp.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlpage::resp {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr int kMaxNestingDepth = 8;

// Reads "<line>\r\n" starting at pos; returns false if the terminator is missing
bool read_line(std::string_view buf, size_t pos, std::string_view& line, size_t& next) {
    const size_t end = buf.find(kCrlf, pos);
    if (end == std::string_view::npos) return false;
    line = buf.substr(pos, end - pos);
    next = end + kCrlf.size();
    return true;
}

ParseStatus parse_at(std::string_view buf, size_t pos, size_t& next, Reply& out,
                     size_t max_bulk, int depth) {
    if (depth > kMaxNestingDepth) return ParseStatus::MALFORMED;
    if (pos >= buf.size()) return ParseStatus::INCOMPLETE;

    const char prefix = buf[pos];
    std::string_view line;
    size_t after_line = 0;
    if (!read_line(buf, pos + 1, line, after_line)) return ParseStatus::INCOMPLETE;

    switch (prefix) {
        case '+':
            out.type = ReplyType::SIMPLE_STRING;
            out.str = std::string(line);
            next = after_line;
            return ParseStatus::COMPLETE;

        case '-':
            out.type = ReplyType::ERROR;
            out.str = std::string(line);
            next = after_line;
            return ParseStatus::COMPLETE;

        case ':': {
            const auto value = utils::try_parse_int<int64_t>(line);
            if (!value) return ParseStatus::MALFORMED;
            out.type = ReplyType::INTEGER;
            out.integer = *value;
            next = after_line;
            return ParseStatus::COMPLETE;
        }

        case '$': {
            const auto len = utils::try_parse_int<int64_t>(line);
            if (!len || *len < -1) return ParseStatus::MALFORMED;
            if (*len == -1) {
                out.type = ReplyType::NIL;
                next = after_line;
                return ParseStatus::COMPLETE;
            }
            const auto n = static_cast<size_t>(*len);
            if (n > max_bulk) return ParseStatus::TOO_LARGE;
            if (buf.size() < after_line + n + kCrlf.size()) return ParseStatus::INCOMPLETE;
            if (buf.substr(after_line + n, kCrlf.size()) != kCrlf) return ParseStatus::MALFORMED;
            out.type = ReplyType::BULK_STRING;
            out.str = std::string(buf.substr(after_line, n));
            next = after_line + n + kCrlf.size();
            return ParseStatus::COMPLETE;
        }

        case '*': {
            const auto count = utils::try_parse_int<int64_t>(line);
            if (!count || *count < -1) return ParseStatus::MALFORMED;
            if (*count == -1) {
                out.type = ReplyType::NIL;
                next = after_line;
                return ParseStatus::COMPLETE;
            }
            out.type = ReplyType::ARRAY;
            out.elements.clear();
            out.elements.reserve(std::min<size_t>(static_cast<size_t>(*count), 1024));
            size_t cursor = after_line;
            for (int64_t i = 0; i < *count; ++i) {
                Reply element;
                const auto status = parse_at(buf, cursor, cursor, element, max_bulk, depth + 1);
                if (status != ParseStatus::COMPLETE) return status;
                out.elements.push_back(std::move(element));
            }
            next = cursor;
            return ParseStatus::COMPLETE;
        }

        default:
            return ParseStatus::MALFORMED;
    }
}

} // anonymous namespace

std::string encode_command(const std::vector<std::string>& args) {
    std::string out = std::format("*{}\r\n", args.size());
    for (const auto& arg : args) {
        out += std::format("${}\r\n", arg.size());
        out += arg;
        out += kCrlf;
    }
    return out;
}

ParseStatus parse_reply(std::string_view buf, size_t& consumed, Reply& out,
                        size_t max_bulk_length) {
    size_t next = 0;
    const auto status = parse_at(buf, 0, next, out, max_bulk_length, 0);
    if (status == ParseStatus::COMPLETE) {
        consumed = next;
    }
    return status;
}

} // namespace sqlpage::resp
