#include "cryguard/cooldown.hpp"

namespace cryguard {

GatingOutcome CooldownController::admit(const GatingOutcome& outcome, double now_sec) {
    if (outcome.kind != OutcomeKind::CONFIRMED) return outcome;

    const double cooldown = params_.effective().alert_cooldown_seconds;
    if (last_confirmed_at_ && now_sec - *last_confirmed_at_ < cooldown) {
        GatingOutcome held = outcome;
        held.kind = OutcomeKind::SUPPRESSED;
        held.reason = "cooldown";
        return held;
    }
    last_confirmed_at_ = now_sec;
    return outcome;
}

}  // namespace cryguard
