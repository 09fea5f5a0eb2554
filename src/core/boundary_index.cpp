#include "core/boundary_index.hpp"

namespace core {

std::vector<double> build_boundaries(std::span<const ToolCallStep> steps, double total_ms) {
    const double total = total_ms > 0.0 ? total_ms : 0.0;

    std::vector<double> points;
    points.reserve(steps.size() * 2 + 2);
    points.push_back(0.0);
    points.push_back(total);

    auto add = [&](std::int64_t ms) {
        const double v = static_cast<double>(ms);
        if (v >= 0.0 && v <= total) {
            points.push_back(v);
        }
    };
    for (const auto& s : steps) {
        add(s.started_at_ms);
        if (s.ended_at_ms) {
            add(*s.ended_at_ms);
        }
    }

    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    return points;
}

} // namespace core
