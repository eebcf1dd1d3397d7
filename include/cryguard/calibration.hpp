#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cryguard/parameters.hpp"
#include "cryguard/score_types.hpp"

namespace cryguard {

enum class Phase { PHASE1, PHASE2 };

const char* phase_name(Phase phase);
std::optional<Phase> phase_from_name(const std::string& name);
const std::vector<Param>& phase_params(Phase phase);
bool phase_allows(Phase phase, Param p);

constexpr int kDefaultCalibrationInterval = 15;
constexpr int kMinCalibrationInterval = 2;
constexpr int kMaxCalibrationInterval = 600;
int clamp_interval(int seconds);

struct CalibrationSession {
    Phase phase{Phase::PHASE1};
    double started_at{0.0};        // wall clock seconds
    int interval_sec{kDefaultCalibrationInterval};
    bool watch_active{false};
    int watch_interval_sec{kDefaultCalibrationInterval};
};

// Everything needed to rebuild a manager in another process or after a restart.
struct CalibrationState {
    std::optional<CalibrationSession> session;
    Overrides overrides;
    uint64_t revision{0};
};

struct CalibrationStatus {
    std::optional<CalibrationSession> session;
    Thresholds effective;
    Overrides overrides;
    std::optional<OutcomeSummary> last_outcome;
};

struct StopSummary {
    std::optional<CalibrationSession> ended;   // empty when nothing was active
    Overrides ended_overrides;
    Thresholds restored;
};

// IDLE / ACTIVE(phase1) / ACTIVE(phase2). Owns the override layer of the
// ParameterStore it is given; nothing else may write overrides.
class CalibrationManager {
public:
    using Clock = std::function<double()>;

    explicit CalibrationManager(ParameterStore& params, Clock clock = Clock());

    const CalibrationSession& start(Phase phase, std::optional<int> interval_sec = std::nullopt);
    std::pair<Param, double> set(const std::string& name, const std::string& raw_value);
    CalibrationStatus status() const;
    // Returns the watch interval in effect.
    int watch(std::optional<int> interval_sec = std::nullopt);
    void watch_stop();
    StopSummary stop();

    bool active() const { return session_.has_value(); }
    const std::optional<CalibrationSession>& session() const { return session_; }
    uint64_t revision() const { return revision_; }

    void record_outcome(const OutcomeSummary& outcome) { last_outcome_ = outcome; }

    CalibrationState state() const;
    // Replaces session and overrides with a state published elsewhere.
    // Invalid overrides are rejected and the current state is kept.
    void adopt(const CalibrationState& state);

private:
    ParameterStore& params_;
    Clock clock_;
    std::optional<CalibrationSession> session_;
    std::optional<OutcomeSummary> last_outcome_;
    uint64_t revision_{0};
};

std::string build_help_text();
// Replayable command list that reproduces the ended session.
std::string build_stop_summary(const StopSummary& summary);

}  // namespace cryguard
