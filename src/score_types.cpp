#include "cryguard/score_types.hpp"

namespace cryguard {

OutcomeKind outcome_kind_from_string(const std::string& text) {
    if (text == "CANDIDATE") return OutcomeKind::CANDIDATE;
    if (text == "CONFIRMED") return OutcomeKind::CONFIRMED;
    if (text == "SUPPRESSED") return OutcomeKind::SUPPRESSED;
    return OutcomeKind::NONE;
}

OutcomeSummary summarize(const GatingOutcome& outcome) {
    OutcomeSummary s;
    s.kind = outcome.kind;
    s.reason = outcome.reason;
    s.window_id = outcome.scores.window_id;
    s.timestamp_sec = outcome.scores.timestamp_sec;
    s.primary_score = outcome.scores.primary_score;
    s.baby_score = outcome.scores.baby_score.value_or(0.0);
    s.cat_score = outcome.scores.cat_score.value_or(0.0);
    s.other_suppress_score = outcome.scores.other_suppress_score;
    s.margin = outcome.margin;
    s.candidate_count = outcome.candidate_count;
    s.would_alert = outcome.kind == OutcomeKind::CONFIRMED;
    return s;
}

}  // namespace cryguard
