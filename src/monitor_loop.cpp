#include "cryguard/monitor_loop.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

#include <opencv2/core.hpp>

#include "cryguard/clock.hpp"
#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
std::string event_stamp(double wall_sec) {
    std::time_t t = static_cast<std::time_t>(wall_sec);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm);
    return std::string(buf);
}
}  // namespace

MonitorLoop::MonitorLoop(const AppConfig& cfg,
                         ParameterStore& params,
                         CalibrationManager& calibration,
                         StateChannel& control,
                         StateChannel& status,
                         ArtifactStore& store,
                         AlertDispatcher& dispatcher)
    : cfg_(cfg),
      params_(params),
      calibration_(calibration),
      control_(control),
      status_(status),
      store_(store),
      dispatcher_(dispatcher),
      engine_(params, cfg.sustain),
      cooldown_(params) {
    // Recover a session that outlived a restart.
    poll_control();
}

bool MonitorLoop::poll_control() {
    std::optional<Snapshot> snapshot;
    try {
        snapshot = control_.read();
    } catch (const StateChannelUnavailable& e) {
        std::cerr << "[WARN] Control channel unavailable, keeping current calibration: " << e.what() << std::endl;
        return false;
    }
    if (!snapshot) return false;

    const uint64_t revision = snapshot->calibration.revision;
    if (adopted_any_ && revision == adopted_revision_) return false;

    try {
        calibration_.adopt(snapshot->calibration);
    } catch (const Error& e) {
        // Remember the revision so a bad document is reported once.
        std::cerr << "[WARN] Rejected calibration revision " << revision << ": " << e.what() << std::endl;
        adopted_any_ = true;
        adopted_revision_ = revision;
        return false;
    }
    adopted_any_ = true;
    adopted_revision_ = revision;

    if (const auto& s = calibration_.session()) {
        std::cout << "[INFO] Calibration " << phase_name(s->phase) << " active (revision " << revision << ", "
                  << params_.overrides().size() << " overrides); alerts suppressed" << std::endl;
    } else {
        std::cout << "[INFO] Calibration inactive (revision " << revision << "); defaults in effect" << std::endl;
    }
    return true;
}

GatingOutcome MonitorLoop::process(const ScoreSet& scores) {
    const GatingOutcome gated = engine_.evaluate(scores);
    const GatingOutcome admitted = cooldown_.admit(gated, scores.timestamp_sec);

    OutcomeSummary summary = summarize(admitted);
    if (gated.kind == OutcomeKind::CONFIRMED && admitted.kind == OutcomeKind::SUPPRESSED) {
        summary.alert_blocked_by = "cooldown";
    } else if (admitted.kind == OutcomeKind::SUPPRESSED) {
        summary.alert_blocked_by = "cat";
    } else if (admitted.kind == OutcomeKind::CONFIRMED && calibration_.active()) {
        summary.alert_blocked_by = "calibration";
        std::cout << cv::format("[INFO] Calibration active (%s): alert suppressed (primary=%.2f baby=%.2f cat=%.2f)",
                                phase_name(calibration_.session()->phase), summary.primary_score,
                                summary.baby_score, summary.cat_score)
                  << std::endl;
    } else if (admitted.kind == OutcomeKind::CONFIRMED) {
        emit(admitted);
    }

    if (cfg_.verbose) {
        std::cout << cv::format("[INFO] window %llu %s (%s) primary=%.2f baby=%.2f cat=%.2f margin=%.2f n=%d",
                                static_cast<unsigned long long>(scores.window_id),
                                outcome_kind_to_string(admitted.kind).c_str(), admitted.reason.c_str(),
                                summary.primary_score, summary.baby_score, summary.cat_score, summary.margin,
                                summary.candidate_count)
                  << std::endl;
    }

    ++windows_;
    last_ = summary;
    has_last_ = true;
    calibration_.record_outcome(summary);
    publish_status();
    return admitted;
}

void MonitorLoop::emit(const GatingOutcome& outcome) {
    const double now = wall_seconds();
    EventRecord event;
    event.event_id = "evt-" + event_stamp(now) + "-" + std::to_string(outcome.scores.window_id);
    event.timestamp_iso = iso_utc(now);
    event.scores = outcome.scores;
    event.clip_reference = "clips/" + event.event_id + ".wav";

    try {
        store_.store(event);
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Event " << event.event_id << " not stored: " << e.what() << std::endl;
    }

    bool delivered = false;
    try {
        delivered = dispatcher_.notify(event);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Alert dispatch threw: " << e.what() << std::endl;
    }
    if (delivered) {
        ++alerts_;
        std::cout << cv::format("[INFO] Alert sent (primary=%.2f baby=%.2f cat=%.2f)", outcome.scores.primary_score,
                                outcome.scores.baby_score.value_or(0.0), outcome.scores.cat_score.value_or(0.0))
                  << std::endl;
    } else {
        std::cerr << "[ERROR] Alert " << event.event_id << " was not delivered" << std::endl;
    }
}

void MonitorLoop::publish_status() {
    Snapshot s;
    s.writer = "monitor";
    s.updated_at = wall_seconds();
    s.calibration = calibration_.state();
    s.effective = params_.effective();
    if (has_last_) s.last_outcome = last_;
    s.last_confirmed_at = cooldown_.last_confirmed_at();
    s.windows_processed = windows_;
    try {
        status_.publish(s);
    } catch (const StateChannelUnavailable& e) {
        std::cerr << "[WARN] Status snapshot not published, retrying next window: " << e.what() << std::endl;
    }
}

void MonitorLoop::run(WindowQueue<ScoreSet>& queue, const std::atomic<bool>& stop) {
    const auto poll = std::chrono::milliseconds(cfg_.channel_poll_ms);
    publish_status();
    while (!stop.load()) {
        ScoreSet scores;
        const PopResult r = queue.pop_for(scores, poll);
        if (r == PopResult::STOPPED) break;
        poll_control();
        if (r == PopResult::TIMEOUT) continue;

        process(scores);
        if (cfg_.max_windows > 0 && windows_ >= static_cast<uint64_t>(cfg_.max_windows)) break;
    }
}

}  // namespace cryguard
