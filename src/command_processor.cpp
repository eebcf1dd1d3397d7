#include "cryguard/command_processor.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>

#include <opencv2/core.hpp>

#include "cryguard/clock.hpp"
#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
const char* kInactive = "calibration inactive. Use /cal_start phase1|phase2 [interval_sec].";

std::string format_params(const Thresholds& t) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (Param p : kAllParams) {
        if (!first) oss << ", ";
        first = false;
        oss << param_name(p) << "=" << format_param_value(p, t.get(p));
    }
    oss << "}";
    return oss.str();
}

std::string format_overrides(const Overrides& overrides) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& kv : overrides) {
        if (!first) oss << ", ";
        first = false;
        oss << param_name(kv.first) << "=" << format_param_value(kv.first, kv.second);
    }
    oss << "}";
    return oss.str();
}

std::string allowed_params(Phase phase) {
    std::string out;
    for (Param p : phase_params(phase)) {
        if (!out.empty()) out += ",";
        out += param_name(p);
    }
    return out;
}

CommandReply reply(const char* label, bool ok, const std::string& detail) {
    return CommandReply{ok, std::string(label) + (ok ? ": OK. " : ": ERROR. ") + detail};
}
}  // namespace

// One handler per Command alternative; a missing overload fails to compile.
struct CommandProcessor::Handlers {
    CommandProcessor& self;
    const std::string& origin;

    std::pair<bool, std::string> operator()(const CalHelp&) const {
        return {true, build_help_text()};
    }

    std::pair<bool, std::string> operator()(const CalStart& cmd) const {
        const CalibrationState prior = self.manager_.state();
        const CalibrationSession& s = self.manager_.start(cmd.phase, cmd.interval_sec);
        self.commit(prior);
        self.watches_.cancel_all();
        std::cout << "[INFO] Calibration started (" << phase_name(s.phase) << ", " << s.interval_sec
                  << "s) by " << origin << std::endl;
        std::ostringstream oss;
        oss << "active phase=" << phase_name(s.phase) << " interval=" << s.interval_sec
            << "s alerts=disabled allowed_params=" << allowed_params(s.phase);
        return {true, oss.str()};
    }

    std::pair<bool, std::string> operator()(const CalSet& cmd) const {
        const CalibrationState prior = self.manager_.state();
        const auto applied = self.manager_.set(cmd.param, cmd.value);
        self.commit(prior);
        std::cout << "[INFO] Calibration override " << param_name(applied.first) << "="
                  << format_param_value(applied.first, applied.second) << " by " << origin << std::endl;
        return {true, std::string("phase=") + phase_name(self.manager_.session()->phase) + " set " +
                          param_name(applied.first) + "=" + format_param_value(applied.first, applied.second)};
    }

    std::pair<bool, std::string> operator()(const CalParams&) const {
        const CalibrationStatus st = self.manager_.status();
        if (!st.session) return {false, kInactive};
        std::ostringstream oss;
        oss << "phase=" << phase_name(st.session->phase) << " interval=" << st.session->interval_sec
            << "s overrides=" << format_overrides(st.overrides) << " effective_params=" << format_params(st.effective);
        return {true, oss.str()};
    }

    std::pair<bool, std::string> operator()(const CalStatus&) const {
        return self.status_detail();
    }

    std::pair<bool, std::string> operator()(const CalWatch& cmd) const {
        const CalibrationState prior = self.manager_.state();
        const int interval = self.manager_.watch(cmd.interval_sec);
        self.commit(prior);
        self.watches_.start(origin, std::chrono::seconds(interval));
        return {true, "Calibration watch enabled every " + std::to_string(interval) +
                          "s. Use /cal_watch_stop to stop."};
    }

    std::pair<bool, std::string> operator()(const CalWatchStop&) const {
        const bool existed = self.watches_.cancel(origin);
        if (self.watches_.size() == 0) {
            const CalibrationState prior = self.manager_.state();
            self.manager_.watch_stop();
            if (self.manager_.revision() != prior.revision) self.commit(prior);
        }
        return {true, existed ? "Calibration watch stopped." : "Calibration watch is not active for this origin."};
    }

    std::pair<bool, std::string> operator()(const CalStop&) const {
        const CalibrationState prior = self.manager_.state();
        const StopSummary summary = self.manager_.stop();
        if (summary.ended) self.commit(prior);
        self.watches_.cancel_all();
        if (summary.ended) {
            std::cout << "[INFO] Calibration stopped by " << origin << "; defaults restored" << std::endl;
        }
        return {true, build_stop_summary(summary)};
    }
};

CommandProcessor::CommandProcessor(CalibrationManager& manager,
                                   StateChannel& control,
                                   StateChannel& status,
                                   WatchRegistry::Sink watch_sink,
                                   double stale_after_sec)
    : manager_(manager),
      control_(control),
      status_(status),
      stale_after_sec_(stale_after_sec),
      watches_(std::move(watch_sink), [this]() {
          const CommandReply r = describe_status();
          return std::make_pair(r.ok, r.text);
      }) {}

void CommandProcessor::refresh() {
    try {
        auto snapshot = control_.read();
        if (snapshot && snapshot->calibration.revision > manager_.revision()) {
            manager_.adopt(snapshot->calibration);
        }
    } catch (const Error& e) {
        std::cerr << "[WARN] Control snapshot not adopted: " << e.what() << std::endl;
    }
}

void CommandProcessor::publish_control() {
    Snapshot s;
    s.writer = "command";
    s.updated_at = wall_seconds();
    s.calibration = manager_.state();
    s.effective = manager_.status().effective;
    control_.publish(s);
}

void CommandProcessor::commit(const CalibrationState& prior) {
    try {
        publish_control();
    } catch (const StateChannelUnavailable& e) {
        manager_.adopt(prior);
        throw StateChannelUnavailable(std::string("state channel unavailable, retry: ") + e.what());
    }
}

CommandReply CommandProcessor::handle(const std::string& origin, const Command& command) {
    const char* label = command_label(command);
    std::lock_guard<std::mutex> lock(mu_);
    refresh();
    try {
        const auto result = std::visit(Handlers{*this, origin}, command);
        return reply(label, result.first, result.second);
    } catch (const Error& e) {
        std::cerr << "[WARN] " << label << " rejected for " << origin << ": " << e.what() << std::endl;
        return reply(label, false, e.what());
    }
}

CommandReply CommandProcessor::handle_text(const std::string& origin, const std::string& text) {
    Command command;
    try {
        command = parse_command(text);
    } catch (const ValidationError& e) {
        return CommandReply{false, std::string("Command: ERROR. ") + e.what()};
    }
    return handle(origin, command);
}

std::pair<bool, std::string> CommandProcessor::status_detail() const {
    std::optional<Snapshot> control;
    std::optional<Snapshot> status;
    try {
        control = control_.read();
        status = status_.read();
    } catch (const StateChannelUnavailable& e) {
        return {false, std::string("status unknown, retry (") + e.what() + ")"};
    }

    if (!control) {
        std::error_code ec;
        if (std::filesystem::exists(control_.path(), ec)) return {false, "status unknown, retry"};
    }

    std::ostringstream oss;
    const bool active = control && control->calibration.session;
    if (active) {
        const auto& session = *control->calibration.session;
        oss << "phase=" << phase_name(session.phase) << " interval=" << session.interval_sec << "s";
    } else {
        oss << "phase=idle " << kInactive;
    }
    if (!status) {
        oss << " waiting_for_live_status (status unknown, retry)";
        return {true, oss.str()};
    }

    const double age = wall_seconds() - status->updated_at;
    oss << " updated=" << iso_utc(status->updated_at) << cv::format(" age=%.0fs", age);
    if (age > stale_after_sec_) oss << " stale=true";
    const uint64_t control_revision = control ? control->calibration.revision : 0;
    if (status->calibration.revision != control_revision) oss << " pending_adoption=true";
    if (const auto& o = status->last_outcome) {
        oss << cv::format(" primary=%.2f baby=%.2f cat=%.2f margin=%.2f", o->primary_score, o->baby_score,
                          o->cat_score, o->margin)
            << " outcome=" << outcome_kind_to_string(o->kind) << " reason=" << o->reason
            << " candidates=" << o->candidate_count << " would_alert=" << (o->would_alert ? "true" : "false")
            << " alert_blocked_by=" << o->alert_blocked_by;
    }
    oss << " params=" << format_params(status->effective);
    return {true, oss.str()};
}

CommandReply CommandProcessor::describe_status() const {
    const auto result = status_detail();
    return reply("Calibration", result.first, result.second);
}

}  // namespace cryguard
