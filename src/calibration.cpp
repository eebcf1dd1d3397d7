#include "cryguard/calibration.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

#include "cryguard/clock.hpp"
#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
std::string lower_trim(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string allowed_list(Phase phase) {
    std::string out;
    for (Param p : phase_params(phase)) {
        if (!out.empty()) out += ", ";
        out += param_name(p);
    }
    return out;
}
}  // namespace

const char* phase_name(Phase phase) {
    return phase == Phase::PHASE2 ? "phase2" : "phase1";
}

std::optional<Phase> phase_from_name(const std::string& name) {
    const std::string key = lower_trim(name);
    if (key == "phase1") return Phase::PHASE1;
    if (key == "phase2") return Phase::PHASE2;
    return std::nullopt;
}

const std::vector<Param>& phase_params(Phase phase) {
    static const std::vector<Param> phase1{Param::PRIMARY_CRY_THRESHOLD, Param::CONFIRM_N, Param::CONFIRM_M,
                                           Param::ALERT_COOLDOWN_SECONDS};
    static const std::vector<Param> phase2{Param::CRY_THRESHOLD, Param::CAT_THRESHOLD, Param::CAT_WEIGHT,
                                           Param::MARGIN_THRESHOLD};
    return phase == Phase::PHASE2 ? phase2 : phase1;
}

bool phase_allows(Phase phase, Param p) {
    const auto& allowed = phase_params(phase);
    return std::find(allowed.begin(), allowed.end(), p) != allowed.end();
}

int clamp_interval(int seconds) {
    return std::max(kMinCalibrationInterval, std::min(seconds, kMaxCalibrationInterval));
}

CalibrationManager::CalibrationManager(ParameterStore& params, Clock clock)
    : params_(params), clock_(clock ? std::move(clock) : Clock(wall_seconds)) {}

const CalibrationSession& CalibrationManager::start(Phase phase, std::optional<int> interval_sec) {
    CalibrationSession s;
    s.phase = phase;
    s.started_at = clock_();
    s.interval_sec = clamp_interval(interval_sec.value_or(kDefaultCalibrationInterval));
    s.watch_interval_sec = s.interval_sec;
    params_.clear_overrides();
    session_ = s;
    ++revision_;
    return *session_;
}

std::pair<Param, double> CalibrationManager::set(const std::string& name, const std::string& raw_value) {
    if (!session_) {
        throw ConfigurationError("calibration is not active");
    }
    auto param = param_from_name(name);
    if (!param) {
        throw ConfigurationError("unknown parameter '" + name + "'");
    }
    if (!phase_allows(session_->phase, *param)) {
        throw OutOfScopeParameterError(std::string("parameter not allowed for ") + phase_name(session_->phase) +
                                       ". allowed: " + allowed_list(session_->phase));
    }
    const double value = parse_param_value(*param, raw_value);
    params_.set_override(*param, value);
    ++revision_;
    return {*param, value};
}

CalibrationStatus CalibrationManager::status() const {
    CalibrationStatus st;
    st.session = session_;
    st.effective = params_.effective();
    st.overrides = params_.overrides();
    st.last_outcome = last_outcome_;
    return st;
}

int CalibrationManager::watch(std::optional<int> interval_sec) {
    if (!session_) {
        throw ConfigurationError("calibration is not active");
    }
    const int interval = clamp_interval(interval_sec.value_or(session_->interval_sec));
    if (!session_->watch_active || session_->watch_interval_sec != interval) {
        session_->watch_active = true;
        session_->watch_interval_sec = interval;
        ++revision_;
    }
    return interval;
}

void CalibrationManager::watch_stop() {
    if (!session_ || !session_->watch_active) return;
    session_->watch_active = false;
    ++revision_;
}

StopSummary CalibrationManager::stop() {
    StopSummary summary;
    if (session_) {
        summary.ended = session_;
        summary.ended->watch_active = false;
        summary.ended_overrides = params_.overrides();
        session_.reset();
        params_.clear_overrides();
        ++revision_;
    }
    summary.restored = params_.effective();
    return summary;
}

CalibrationState CalibrationManager::state() const {
    CalibrationState st;
    st.session = session_;
    st.overrides = params_.overrides();
    st.revision = revision_;
    return st;
}

void CalibrationManager::adopt(const CalibrationState& state) {
    Overrides accepted;
    if (state.session) {
        for (const auto& kv : state.overrides) {
            if (!phase_allows(state.session->phase, kv.first)) {
                std::cerr << "[WARN] Ignoring " << param_name(kv.first) << " override outside "
                          << phase_name(state.session->phase) << std::endl;
                continue;
            }
            accepted.insert(kv);
        }
    } else if (!state.overrides.empty()) {
        std::cerr << "[WARN] Ignoring overrides published without an active session" << std::endl;
    }

    params_.replace_overrides(accepted);
    session_ = state.session;
    if (session_) session_->interval_sec = clamp_interval(session_->interval_sec);
    revision_ = state.revision;
}

std::string build_help_text() {
    std::ostringstream oss;
    oss << "Calibration commands:\n"
        << "/cal\n"
        << "/cal_start phase1 [interval_sec]\n"
        << "/cal_start phase2 [interval_sec]\n"
        << "/cal_set <param> <value>\n"
        << "/cal_params\n"
        << "/cal_status\n"
        << "/cal_watch [interval_sec]\n"
        << "/cal_watch_stop\n"
        << "/cal_stop\n"
        << "\n"
        << "phase1 params: " << allowed_list(Phase::PHASE1) << "\n"
        << "phase2 params: " << allowed_list(Phase::PHASE2) << "\n"
        << "default interval: " << kDefaultCalibrationInterval << "s";
    return oss.str();
}

std::string build_stop_summary(const StopSummary& summary) {
    if (!summary.ended) {
        return "Calibration was not active. Parameters unchanged.";
    }
    std::ostringstream oss;
    oss << "Calibration stopped for " << phase_name(summary.ended->phase)
        << ". Alerts re-enabled and defaults restored.\n"
        << "Final command state:\n"
        << "/cal_start " << phase_name(summary.ended->phase) << " " << summary.ended->interval_sec;
    for (const auto& kv : summary.ended_overrides) {
        oss << "\n/cal_set " << param_name(kv.first) << " " << format_param_value(kv.first, kv.second);
    }
    if (summary.ended_overrides.empty()) {
        oss << "\n(no parameter overrides were applied)";
    }
    return oss.str();
}

}  // namespace cryguard
