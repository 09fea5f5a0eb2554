#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>

namespace api {

enum class ReplayMode {
    Play,     // real-time playback from start_ms to the end
    Step,     // walk every step boundary without waiting
    Inspect   // print one snapshot at start_ms
};

struct ReplayCliOptions {
    std::filesystem::path record_path{};

    ReplayMode mode{ReplayMode::Play};
    double start_ms{0.0};
    double speed{1.0};
    std::optional<std::int64_t> fork_point{};

    bool quiet{false};
    bool verbose{false};
};

// Loads the record and drives a replay session on the terminal. Returns 0 on
// success, non-zero when the record cannot be loaded or the options are
// unusable.
int run_replay(const ReplayCliOptions& opts, std::ostream& out);

} // namespace api
