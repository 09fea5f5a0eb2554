#include "api/replay.hpp"

#include <cmath>
#include <ostream>
#include <string>
#include <thread>

#include "api/fork_handoff.hpp"
#include "api/replay_controller.hpp"
#include "api/timeline_format.hpp"
#include "core/replay_config.hpp"
#include "persist/execution_record.hpp"
#include "util/clock.hpp"
#include "util/frame_loop.hpp"
#include "util/log.hpp"

namespace api {
namespace {

// Prints the transcript lines and step transitions that appeared since the
// previous call.
class TranscriptPrinter {
public:
    explicit TranscriptPrinter(std::ostream& out) : out_(out) {}

    void update(const ReplayState& st) {
        if (st.visible_lines.size() < printed_lines_) {
            printed_lines_ = 0;  // scrubbed backwards
        }
        for (std::size_t i = printed_lines_; i < st.visible_lines.size(); ++i) {
            const auto& line = st.visible_lines[i];
            out_ << "[" << format_position_ms(line.timestamp.ms) << "~] " << line.text << "\n";
        }
        printed_lines_ = st.visible_lines.size();

        const std::optional<core::StepIndex> active =
            st.active_step ? std::optional<core::StepIndex>(st.active_step->step_index) : std::nullopt;
        if (active != last_active_ && st.active_step) {
            out_ << ">> step " << (st.active_step->step_index + 1) << " " << st.active_step->tool_name
                 << " (" << format_duration(st.active_step->duration_ms) << ")\n";
        }
        last_active_ = active;
    }

private:
    std::ostream& out_;
    std::size_t printed_lines_{0};
    std::optional<core::StepIndex> last_active_{};
};

void print_summary(std::ostream& out, const ReplayState& st) {
    out << "-- " << format_position_ms(st.current_ms) << " / " << format_position_ms(st.total_ms)
        << " | steps done " << st.completed_steps.size() << "/" << st.tool_steps().size()
        << " | pending " << st.pending_steps.size()
        << " | cost " << format_cost(st.accumulated_cost) << " / " << format_cost(st.total_cost) << "\n";
}

void print_fork(std::ostream& out, const ReplayState& st) {
    const auto req = make_fork_request(st.tool_steps(), st.fork_point);
    if (!req) {
        return;
    }
    out << "== fork after step " << (req->fork_step_index + 1) << " (" << req->prior_steps.size()
        << " prior step(s))\n"
        << req->context << "\n";
}

} // namespace

int run_replay(const ReplayCliOptions& opts, std::ostream& out) {
    if (opts.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (opts.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }
    const auto cfg = core::default_replay_config();
    if (!std::isfinite(opts.speed) || opts.speed <= 0.0) {
        util::log(util::LogLevel::Error, "speed must be > 0 (presets: %s)",
                  format_speed_presets(cfg.speed_presets).c_str());
        return 1;
    }

    persist::ExecutionRecord record;
    std::string error;
    if (!persist::parse_execution_record(opts.record_path, record, error)) {
        util::log(util::LogLevel::Error, "failed to load %s: %s", opts.record_path.string().c_str(), error.c_str());
        return 1;
    }

    auto data = persist::make_timeline_data(record);
    if (data->parse_stats.malformed) {
        util::log(util::LogLevel::Warn, "record %s: step log unreadable, replaying transcript only",
                  record.id.c_str());
    }
    if (data->total_ms <= 0.0) {
        util::log(util::LogLevel::Warn, "record %s has no duration; timeline is empty", record.id.c_str());
    }

    util::SteadyClock clock;
    util::FrameLoop frames(clock);
    ReplayController session(data, frames, clock, cfg);
    if (!session.set_speed(opts.speed)) {
        return 1;
    }
    if (opts.fork_point && !session.set_fork_point(opts.fork_point)) {
        return 1;
    }
    session.scrub_to(opts.start_ms);

    out << "replay " << record.id << ": " << data->steps.size() << " step(s), " << data->lines.size()
        << " line(s), " << format_position_ms(data->total_ms) << " at " << format_speed(session.speed()) << "\n";

    TranscriptPrinter printer(out);
    switch (opts.mode) {
    case ReplayMode::Inspect: {
        const ReplayState st = session.state();
        printer.update(st);
        print_summary(out, st);
        break;
    }
    case ReplayMode::Step: {
        do {
            const ReplayState st = session.state();
            printer.update(st);
            print_summary(out, st);
        } while (session.step_forward());
        break;
    }
    case ReplayMode::Play: {
        const auto interval = session.config().frame_interval;
        session.play();
        while (session.is_playing()) {
            std::this_thread::sleep_for(interval);
            frames.run_frame();
            printer.update(session.state());
        }
        print_summary(out, session.state());
        break;
    }
    }

    print_fork(out, session.state());
    return 0;
}

} // namespace api
