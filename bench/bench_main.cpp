#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "core/step_parser.hpp"
#include "core/timeline_data.hpp"
#include "core/timeline_projector.hpp"

namespace {

std::string make_steps_json(std::size_t count) {
    std::string out = "[";
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) out += ',';
        const std::size_t start = i * 100;
        out += "{\"step_index\":" + std::to_string(i) + ",\"tool_name\":\"bash\",\"input_preview\":\"ls\","
               "\"output_preview\":\"ok\",\"started_at_ms\":" + std::to_string(start) +
               ",\"ended_at_ms\":" + std::to_string(start + 80) + ",\"duration_ms\":80}";
    }
    out += "]";
    return out;
}

std::string make_transcript(std::size_t lines) {
    std::string out;
    for (std::size_t i = 0; i < lines; ++i) {
        if (i > 0) out += '\n';
        out += "log line " + std::to_string(i);
    }
    return out;
}

} // namespace

int main() {
    constexpr std::size_t step_count = 500;
    const std::string json = make_steps_json(step_count);
    const std::string transcript = make_transcript(5000);
    const auto total_ms = static_cast<std::int64_t>(step_count * 100);

    constexpr std::size_t parse_iterations = 200;
    auto start = std::chrono::steady_clock::now();
    std::size_t parsed = 0;
    for (std::size_t i = 0; i < parse_iterations; ++i) {
        parsed += core::parse_steps(json).size();
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Parse " << parse_iterations << " step logs (" << parsed / parse_iterations << " steps) took "
              << ns << " ns (" << (ns / parse_iterations) << " ns/iter)\n";

    const auto data = core::make_timeline_data(json, transcript, total_ms, 12.5);

    constexpr std::size_t project_iterations = 2000;
    double checksum = 0.0;
    start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < project_iterations; ++i) {
        const double at = static_cast<double>(i % 1000) * data->total_ms / 1000.0;
        const auto proj = core::project(data->steps, data->lines, at, data->total_ms, data->total_cost);
        checksum += proj.accumulated_cost + static_cast<double>(proj.visible_lines.size());
    }
    end = std::chrono::steady_clock::now();
    ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Project " << project_iterations << " positions took " << ns << " ns ("
              << (ns / project_iterations) << " ns/iter, checksum " << checksum << ")\n";
    return 0;
}
