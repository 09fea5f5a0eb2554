#include <cstdlib>
#include <iostream>
#include <string>

#include "api/replay.hpp"
#include "api/timeline_format.hpp"
#include "core/replay_config.hpp"

namespace {

void print_usage(const char* prog) {
    constexpr auto cfg = core::default_replay_config();
    std::cerr << "Usage: " << prog << " --record <file> [options]\n"
              << "Options:\n"
              << "  --from-ms <ms>          Start position (default 0)\n"
              << "  --speed <double>        Playback speed multiplier (default 1.0; presets "
              << api::format_speed_presets(cfg.speed_presets) << ")\n"
              << "  --step                  Walk step boundaries instead of playing in real time\n"
              << "  --inspect               Print a single snapshot at --from-ms\n"
              << "  --fork <step_index>     Mark a fork point and print the re-run context\n"
              << "  --quiet                 Suppress non-error logs\n"
              << "  --verbose               Enable debug logging\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    api::ReplayCliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--record" && i + 1 < argc) {
            opts.record_path = argv[++i];
        } else if (arg == "--from-ms" && i + 1 < argc) {
            opts.start_ms = std::strtod(argv[++i], nullptr);
        } else if (arg == "--speed" && i + 1 < argc) {
            opts.speed = std::strtod(argv[++i], nullptr);
        } else if (arg == "--step") {
            opts.mode = api::ReplayMode::Step;
        } else if (arg == "--inspect") {
            opts.mode = api::ReplayMode::Inspect;
        } else if (arg == "--fork" && i + 1 < argc) {
            opts.fork_point = std::strtoll(argv[++i], nullptr, 10);
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (opts.record_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    return api::run_replay(opts, std::cout);
}
