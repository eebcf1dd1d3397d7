#pragma once

#include <atomic>
#include <cstdint>

#include "cryguard/calibration.hpp"
#include "cryguard/config.hpp"
#include "cryguard/cooldown.hpp"
#include "cryguard/event_sinks.hpp"
#include "cryguard/gating_engine.hpp"
#include "cryguard/state_channel.hpp"
#include "cryguard/window_queue.hpp"

namespace cryguard {

// The audio-processing side: one window at a time through gating, cooldown
// and the calibration gate, then event emission and a status snapshot.
class MonitorLoop {
public:
    MonitorLoop(const AppConfig& cfg,
                ParameterStore& params,
                CalibrationManager& calibration,
                StateChannel& control,
                StateChannel& status,
                ArtifactStore& store,
                AlertDispatcher& dispatcher);

    // Evaluates one window to completion. The window timestamp is the
    // cooldown clock. Never throws.
    GatingOutcome process(const ScoreSet& scores);

    // Adopts a control snapshot with a revision not applied yet.
    bool poll_control();

    // Consumes windows until the queue stops, stop is set or max_windows is reached.
    void run(WindowQueue<ScoreSet>& queue, const std::atomic<bool>& stop);

    uint64_t windows_processed() const { return windows_; }
    uint64_t alerts_sent() const { return alerts_; }
    const OutcomeSummary& last_summary() const { return last_; }

private:
    void emit(const GatingOutcome& outcome);
    void publish_status();

    const AppConfig& cfg_;
    ParameterStore& params_;
    CalibrationManager& calibration_;
    StateChannel& control_;
    StateChannel& status_;
    ArtifactStore& store_;
    AlertDispatcher& dispatcher_;
    GatingEngine engine_;
    CooldownController cooldown_;

    bool adopted_any_{false};
    uint64_t adopted_revision_{0};
    uint64_t windows_{0};
    uint64_t alerts_{0};
    OutcomeSummary last_;
    bool has_last_{false};
};

}  // namespace cryguard
