#include "core/line_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace core {

EstimatedTimestamp estimate_line_timestamp(std::size_t line_index,
                                           std::size_t line_count,
                                           double total_ms) noexcept {
    if (!(total_ms > 0.0) || line_count == 0) {
        return EstimatedTimestamp{0.0};
    }
    const std::size_t last = std::max<std::size_t>(line_count - 1, 1);
    const double fraction = static_cast<double>(std::min(line_index, last)) / static_cast<double>(last);
    return EstimatedTimestamp{fraction * total_ms};
}

std::vector<LogLine> build_lines(std::optional<std::string_view> transcript, double total_ms) {
    if (!transcript || transcript->empty() || !(total_ms > 0.0) || !std::isfinite(total_ms)) {
        return {};
    }
    const std::string_view text = *transcript;
    const std::size_t line_count = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;

    std::vector<LogLine> lines;
    lines.reserve(line_count);
    std::size_t begin = 0;
    for (std::size_t i = 0; i < line_count; ++i) {
        std::size_t end = text.find('\n', begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        LogLine line;
        line.line_index = i;
        line.text = std::string(text.substr(begin, end - begin));
        line.timestamp = estimate_line_timestamp(i, line_count, total_ms);
        lines.push_back(std::move(line));
        begin = end + 1;
    }
    return lines;
}

} // namespace core
