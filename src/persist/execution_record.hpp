#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/timeline_data.hpp"

namespace persist {

// A completed execution as exported for offline inspection.
//
// {
//   "id": "exec-42",
//   "duration_ms": 1000,              // integer or null
//   "cost_usd": 0.25,
//   "tool_steps": [ ... ] | "[...]",  // optional, kept verbatim
//   "log_path": "exec-42.log",        // optional, relative to the record file
//   "log": "inline transcript"        // optional, used when log_path is absent
// }
struct ExecutionRecord {
    std::string id;
    std::optional<std::int64_t> duration_ms;
    double cost_usd{0.0};
    // Raw step log handed to the fail-soft step parser; a malformed step log
    // does not make the record invalid.
    std::optional<std::string> tool_steps_json;
    std::optional<std::string> log_content;
    std::filesystem::path log_path;  // resolved; empty when the log was inline or absent
};

// Schema-specific and non-throwing. Unknown fields, missing id/cost_usd,
// a negative cost or an unreadable log_path are errors.
bool parse_execution_record(const std::filesystem::path& path,
                            ExecutionRecord& out,
                            std::string& error) noexcept;

// Same schema, from an in-memory document. Relative log paths resolve
// against `base_dir`.
bool parse_execution_record_text(std::string_view text,
                                 const std::filesystem::path& base_dir,
                                 ExecutionRecord& out,
                                 std::string& error) noexcept;

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept;

std::shared_ptr<const core::TimelineData> make_timeline_data(const ExecutionRecord& record);

} // namespace persist
