#include "core/step_parser.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_set>
#include <utility>

#include "util/json_cursor.hpp"
#include "util/log.hpp"

namespace core {
namespace {

enum class ElementResult { Ok, Skip, Malformed };

// Indices and milliseconds must be non-negative integral values; 12.0 is
// accepted, 12.5 is not.
std::optional<std::int64_t> to_whole(double v) noexcept {
    if (!std::isfinite(v) || v < 0.0 || std::floor(v) != v) {
        return std::nullopt;
    }
    if (v > static_cast<double>(std::numeric_limits<std::int64_t>::max() / 2)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
}

// Reads an optional string field; null and non-string values leave it empty.
bool read_text(util::JsonCursor& cur, std::string& out, std::string& err) noexcept {
    if (cur.peek() == '"') {
        auto v = cur.parse_string(err);
        if (!v) return false;
        out = std::move(*v);
        return true;
    }
    return cur.skip_value(err);
}

// Reads an integral field. `out` stays empty for null; `valid` turns false for
// values of the wrong type or range.
bool read_whole(util::JsonCursor& cur, std::optional<std::int64_t>& out, bool& valid, std::string& err) noexcept {
    out.reset();
    valid = true;
    if (cur.consume_null()) {
        return true;
    }
    const char c = cur.peek();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        auto v = cur.parse_number(err);
        if (!v) return false;
        out = to_whole(*v);
        valid = out.has_value();
        return true;
    }
    valid = false;
    return cur.skip_value(err);
}

ElementResult parse_element(util::JsonCursor& cur, ToolCallStep& out, std::string& err) noexcept {
    if (!cur.consume('{')) {
        return cur.skip_value(err) ? ElementResult::Skip : ElementResult::Malformed;
    }

    std::optional<std::int64_t> index;
    std::optional<std::int64_t> started;
    bool index_ok = false;
    bool started_ok = false;
    bool ended_ok = true;
    bool duration_ok = true;
    ToolCallStep step;

    if (!cur.consume('}')) {
        while (true) {
            auto key = cur.parse_string(err);
            if (!key) return ElementResult::Malformed;
            if (!cur.expect(':')) { err = "Expected ':'"; return ElementResult::Malformed; }

            bool ok = true;
            if (*key == "step_index") {
                ok = read_whole(cur, index, index_ok, err);
            } else if (*key == "started_at_ms") {
                ok = read_whole(cur, started, started_ok, err);
            } else if (*key == "ended_at_ms") {
                ok = read_whole(cur, step.ended_at_ms, ended_ok, err);
            } else if (*key == "duration_ms") {
                ok = read_whole(cur, step.duration_ms, duration_ok, err);
            } else if (*key == "tool_name") {
                ok = read_text(cur, step.tool_name, err);
            } else if (*key == "input_preview") {
                ok = read_text(cur, step.input_preview, err);
            } else if (*key == "output_preview") {
                ok = read_text(cur, step.output_preview, err);
            } else {
                ok = cur.skip_value(err);
            }
            if (!ok) return ElementResult::Malformed;

            if (cur.consume('}')) break;
            if (!cur.consume(',')) { err = "Expected ','"; return ElementResult::Malformed; }
        }
    }

    if (!index || !started || !index_ok || !started_ok || !ended_ok) {
        return ElementResult::Skip;
    }
    // duration_ms is advisory; an unusable value is dropped rather than the step.
    if (!duration_ok) {
        step.duration_ms.reset();
    }
    step.step_index = *index;
    step.started_at_ms = *started;
    out = std::move(step);
    return ElementResult::Ok;
}

bool step_is_valid(const ToolCallStep& s) noexcept {
    if (s.step_index < 0 || s.started_at_ms < 0) {
        return false;
    }
    return !s.ended_at_ms || *s.ended_at_ms >= s.started_at_ms;
}

void report(const StepParseStats& local, StepParseStats* stats) noexcept {
    if (local.skipped > 0) {
        LOG_SLOW_WARN("tool steps: skipped %zu invalid element(s), kept %zu", local.skipped, local.parsed);
    }
    if (stats) {
        *stats = local;
    }
}

} // namespace

std::vector<ToolCallStep> parse_steps(std::optional<std::string_view> raw, StepParseStats* stats) noexcept {
    StepParseStats local{};
    if (!raw || raw->empty()) {
        report(local, stats);
        return {};
    }

    util::JsonCursor cur(*raw);
    std::string err;
    std::vector<ToolCallStep> steps;
    std::unordered_set<StepIndex> seen;

    auto fail = [&](const char* why) {
        LOG_SLOW_WARN("tool steps: malformed document at offset %zu (%s), ignoring step log",
                      cur.position(), why);
        local.malformed = true;
        local.parsed = 0;
        local.skipped = 0;
        if (stats) {
            *stats = local;
        }
        return std::vector<ToolCallStep>{};
    };

    if (!cur.expect('[')) {
        return fail("expected array");
    }
    if (!cur.consume(']')) {
        while (true) {
            ToolCallStep step;
            const ElementResult res = parse_element(cur, step, err);
            if (res == ElementResult::Malformed) {
                return fail(err.c_str());
            }
            if (res == ElementResult::Ok && step_is_valid(step) && seen.insert(step.step_index).second) {
                steps.push_back(std::move(step));
                ++local.parsed;
            } else {
                ++local.skipped;
            }
            if (cur.consume(']')) break;
            if (!cur.consume(',')) {
                return fail("expected ','");
            }
        }
    }
    if (!cur.eof()) {
        return fail("trailing characters");
    }

    report(local, stats);
    return steps;
}

std::vector<ToolCallStep> sanitize_steps(std::vector<ToolCallStep> steps, StepParseStats* stats) noexcept {
    StepParseStats local{};
    std::unordered_set<StepIndex> seen;
    std::vector<ToolCallStep> out;
    out.reserve(steps.size());
    for (auto& s : steps) {
        if (step_is_valid(s) && seen.insert(s.step_index).second) {
            out.push_back(std::move(s));
            ++local.parsed;
        } else {
            ++local.skipped;
        }
    }
    report(local, stats);
    return out;
}

} // namespace core
