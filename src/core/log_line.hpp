#pragma once

#include <cstddef>
#include <string>

namespace core {

// Transcript lines carry no timing of their own. Their position on the
// timeline is interpolated from the line index and the execution duration, so
// it is kept in a separate type from the exact step timestamps.
struct EstimatedTimestamp {
    double ms{0.0};

    friend bool operator==(const EstimatedTimestamp&, const EstimatedTimestamp&) = default;
};

struct LogLine {
    std::size_t line_index{0};
    std::string text;
    EstimatedTimestamp timestamp{};

    friend bool operator==(const LogLine&, const LogLine&) = default;
};

} // namespace core
