#include "core/timeline_projector.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace core {
namespace {

bool has_ended_by(const ToolCallStep& s, double current_ms) noexcept {
    return s.ended_at_ms && static_cast<double>(*s.ended_at_ms) <= current_ms;
}

bool is_active_at(const ToolCallStep& s, double current_ms) noexcept {
    return static_cast<double>(s.started_at_ms) <= current_ms && !has_ended_by(s, current_ms);
}

// Share of one step already behind current_ms: 0 before it starts, 1 once it
// has ended, elapsed / span while running. Non-decreasing in current_ms.
// Every running step contributes, so two overlapping steps cannot make the
// total drop when the first-match active step changes. Without overlap at
// most one step is running and this is exactly the active step's share.
double step_progress(const ToolCallStep& s, double current_ms, double total_ms) noexcept {
    if (has_ended_by(s, current_ms)) {
        return 1.0;
    }
    if (!is_active_at(s, current_ms)) {
        return 0.0;
    }
    const double started = static_cast<double>(s.started_at_ms);
    const double span_end = s.ended_at_ms ? static_cast<double>(*s.ended_at_ms) : total_ms;
    const double span = std::max(span_end - started, 1.0);
    return std::clamp((current_ms - started) / span, 0.0, 1.0);
}

} // namespace

std::vector<LogLine> visible_lines(std::span<const LogLine> lines, double current_ms) {
    std::vector<LogLine> out;
    std::copy_if(lines.begin(), lines.end(), std::back_inserter(out), [current_ms](const LogLine& l) {
        return l.timestamp.ms <= current_ms;
    });
    return out;
}

std::vector<ToolCallStep> completed_steps(std::span<const ToolCallStep> steps, double current_ms) {
    std::vector<ToolCallStep> out;
    for (const auto& s : steps) {
        if (has_ended_by(s, current_ms)) {
            out.push_back(s);
        }
    }
    return out;
}

const ToolCallStep* active_step(std::span<const ToolCallStep> steps, double current_ms) noexcept {
    for (const auto& s : steps) {
        if (is_active_at(s, current_ms)) {
            return &s;
        }
    }
    return nullptr;
}

std::vector<ToolCallStep> pending_steps(std::span<const ToolCallStep> steps, double current_ms) {
    std::vector<ToolCallStep> out;
    for (const auto& s : steps) {
        if (static_cast<double>(s.started_at_ms) > current_ms) {
            out.push_back(s);
        }
    }
    return out;
}

double accumulated_cost(std::span<const ToolCallStep> steps,
                        double current_ms,
                        double total_ms,
                        double total_cost) noexcept {
    if (!(total_ms > 0.0) || !(total_cost > 0.0) || std::isnan(current_ms)) {
        return 0.0;
    }
    const double current = std::clamp(current_ms, 0.0, total_ms);
    if (steps.empty()) {
        return std::clamp(current / total_ms * total_cost, 0.0, total_cost);
    }

    double progress = 0.0;
    for (const auto& s : steps) {
        progress += step_progress(s, current, total_ms);
    }
    const double fraction = progress / static_cast<double>(steps.size());
    return std::clamp(fraction * total_cost, 0.0, total_cost);
}

TimelineProjection project(std::span<const ToolCallStep> steps,
                           std::span<const LogLine> lines,
                           double current_ms,
                           double total_ms,
                           double total_cost) {
    TimelineProjection p;
    p.visible_lines = visible_lines(lines, current_ms);
    p.completed_steps = completed_steps(steps, current_ms);
    p.pending_steps = pending_steps(steps, current_ms);
    p.active_step = active_step(steps, current_ms);
    p.accumulated_cost = accumulated_cost(steps, current_ms, total_ms, total_cost);
    return p;
}

} // namespace core
