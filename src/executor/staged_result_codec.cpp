#include "executor/staged_result_codec.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlpage {

namespace {

using Decoded = Result<StagedResultSet>;

Decoded corrupt(std::string message) {
    return Decoded::error(ErrorKind::STAGED_RESULT_CORRUPT,
        std::format("Staged result is corrupt: {}", message));
}

const glz::json_t* find_member(const glz::json_t& obj, const char* key) {
    const auto& members = obj.get_object();
    auto it = members.find(key);
    return it != members.end() ? &it->second : nullptr;
}

void append_cell(std::string& out, const CellValue& cell) {
    if (!cell) {
        out += "null";
        return;
    }
    out += '"';
    out += utils::escape_json(*cell);
    out += '"';
}

} // anonymous namespace

std::string StagedResultCodec::encode(const StagedResultSet& staged) {
    std::string out;
    out.reserve(64 + staged.rows.size() * (staged.fields.size() * 8 + 4));

    out += std::format("{{\"version\":{},\"fields\":[", kFormatVersion);
    for (size_t i = 0; i < staged.fields.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("{{\"name\":\"{}\",\"dataType\":\"{}\"}}",
            utils::escape_json(staged.fields[i].name),
            utils::escape_json(staged.fields[i].data_type));
    }

    out += "],\"rows\":[";
    for (size_t r = 0; r < staged.rows.size(); ++r) {
        if (r > 0) out += ',';
        out += '[';
        const auto& row = staged.rows[r];
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) out += ',';
            append_cell(out, row[c]);
        }
        out += ']';
    }
    out += "]}";
    return out;
}

Result<StagedResultSet> StagedResultCodec::decode(const std::string& blob) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(blob);
    } catch (const JsonValue::parse_error& e) {
        return corrupt(e.what());
    }

    if (!doc.is_object()) {
        return corrupt("document is not an object");
    }
    const auto& root = doc.raw();

    const auto* version = find_member(root, "version");
    if (!version || !version->is_number()) {
        return corrupt("missing version");
    }
    if (version->get<double>() != static_cast<double>(kFormatVersion)) {
        return corrupt(std::format("unsupported version {}", version->get<double>()));
    }

    const auto* fields = find_member(root, "fields");
    if (!fields || !fields->is_array()) {
        return corrupt("\"fields\" must be an array");
    }
    const auto* rows = find_member(root, "rows");
    if (!rows || !rows->is_array()) {
        return corrupt("\"rows\" must be an array");
    }

    StagedResultSet staged;
    staged.fields.reserve(fields->get_array().size());
    for (const auto& f : fields->get_array()) {
        if (!f.is_object()) {
            return corrupt("field descriptor is not an object");
        }
        const auto* name = find_member(f, "name");
        if (!name || !name->is_string()) {
            return corrupt("field descriptor without a name");
        }
        std::string data_type;
        if (const auto* type = find_member(f, "dataType")) {
            if (!type->is_string()) {
                return corrupt("field dataType must be a string");
            }
            data_type = type->get<std::string>();
        }
        staged.fields.emplace_back(name->get<std::string>(), std::move(data_type));
    }

    const size_t width = staged.fields.size();
    staged.rows.reserve(rows->get_array().size());
    for (const auto& r : rows->get_array()) {
        if (!r.is_array()) {
            return corrupt(std::format("row {} is not an array", staged.rows.size()));
        }
        const auto& cells = r.get_array();
        if (cells.size() != width) {
            return corrupt(std::format("row {} has {} cells, expected {}",
                staged.rows.size(), cells.size(), width));
        }

        Row row;
        row.reserve(width);
        for (const auto& cell : cells) {
            if (cell.is_null()) {
                row.emplace_back(std::nullopt);
            } else if (cell.is_string()) {
                row.emplace_back(cell.get<std::string>());
            } else {
                return corrupt(std::format("row {} holds a non-text cell", staged.rows.size()));
            }
        }
        staged.rows.push_back(std::move(row));
    }

    return Decoded::ok(std::move(staged));
}

} // namespace sqlpage
