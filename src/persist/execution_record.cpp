#include "persist/execution_record.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <utility>

#include "util/json_cursor.hpp"

namespace persist {

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

bool parse_execution_record_text(std::string_view text,
                                 const std::filesystem::path& base_dir,
                                 ExecutionRecord& out,
                                 std::string& error) noexcept {
    util::JsonCursor cur(text);
    if (!cur.expect('{')) {
        error = "Expected object";
        return false;
    }
    ExecutionRecord rec;
    bool seen_id = false;
    bool seen_cost = false;
    std::optional<std::string> log_path;
    while (true) {
        cur.skip_ws();
        if (cur.consume('}')) {
            break;
        }
        std::string kerr;
        auto key = cur.parse_string(kerr);
        if (!key) { error = kerr; return false; }
        if (!cur.expect(':')) { error = "Expected ':'"; return false; }
        if (*key == "id") {
            auto v = cur.parse_string(kerr);
            if (!v) { error = kerr; return false; }
            rec.id = std::move(*v);
            seen_id = true;
        } else if (*key == "duration_ms") {
            if (!cur.consume_null()) {
                auto v = cur.parse_number(kerr);
                if (!v) { error = kerr; return false; }
                if (*v < 0.0 || std::floor(*v) != *v) {
                    error = "duration_ms must be a non-negative integer";
                    return false;
                }
                if (*v >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
                    error = "duration_ms out of range";
                    return false;
                }
                rec.duration_ms = static_cast<std::int64_t>(*v);
            }
        } else if (*key == "cost_usd") {
            auto v = cur.parse_number(kerr);
            if (!v) { error = kerr; return false; }
            if (*v < 0.0) { error = "cost_usd must be non-negative"; return false; }
            rec.cost_usd = *v;
            seen_cost = true;
        } else if (*key == "tool_steps") {
            if (cur.consume_null()) {
                rec.tool_steps_json.reset();
            } else if (cur.peek() == '"') {
                // Stored as a JSON string holding the step array.
                auto v = cur.parse_string(kerr);
                if (!v) { error = kerr; return false; }
                rec.tool_steps_json = std::move(*v);
            } else {
                auto raw = cur.capture_value(kerr);
                if (!raw) { error = kerr; return false; }
                rec.tool_steps_json = std::string(*raw);
            }
        } else if (*key == "log_path") {
            auto v = cur.parse_string(kerr);
            if (!v) { error = kerr; return false; }
            log_path = std::move(*v);
        } else if (*key == "log") {
            if (!cur.consume_null()) {
                auto v = cur.parse_string(kerr);
                if (!v) { error = kerr; return false; }
                rec.log_content = std::move(*v);
            }
        } else {
            error = "Unknown field: " + *key;
            return false;
        }
        cur.skip_ws();
        if (cur.consume('}')) break;
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
    if (!cur.eof()) {
        error = "Trailing characters after record";
        return false;
    }
    if (!(seen_id && seen_cost)) {
        error = "Missing required fields";
        return false;
    }
    if (log_path && !log_path->empty()) {
        std::filesystem::path p(*log_path);
        if (p.is_relative()) {
            p = base_dir / p;
        }
        std::string contents;
        if (!load_file(p, contents, error)) {
            return false;
        }
        rec.log_content = std::move(contents);
        rec.log_path = std::move(p);
    }
    out = std::move(rec);
    return true;
}

bool parse_execution_record(const std::filesystem::path& path,
                            ExecutionRecord& out,
                            std::string& error) noexcept {
    std::string contents;
    if (!load_file(path, contents, error)) {
        return false;
    }
    return parse_execution_record_text(contents, path.parent_path(), out, error);
}

std::shared_ptr<const core::TimelineData> make_timeline_data(const ExecutionRecord& record) {
    std::optional<std::string_view> steps;
    if (record.tool_steps_json) {
        steps = *record.tool_steps_json;
    }
    std::optional<std::string_view> log;
    if (record.log_content) {
        log = *record.log_content;
    }
    return core::make_timeline_data(steps, log, record.duration_ms, record.cost_usd);
}

} // namespace persist
