#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cryguard {

enum class OutcomeKind { NONE, CANDIDATE, CONFIRMED, SUPPRESSED };

inline std::string outcome_kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::CANDIDATE: return "CANDIDATE";
        case OutcomeKind::CONFIRMED: return "CONFIRMED";
        case OutcomeKind::SUPPRESSED: return "SUPPRESSED";
        default: return "NONE";
    }
}

OutcomeKind outcome_kind_from_string(const std::string& text);

// Scores for one audio window as produced by the inference collaborator.
struct ScoreSet {
    bool primary_decision{false};
    double primary_score{0.0};
    std::optional<double> baby_score;  // missing when the verifier did not report
    std::optional<double> cat_score;
    double other_suppress_score{0.0};
    uint64_t window_id{0};
    double timestamp_sec{0.0};         // monotonic clock seconds
};

struct GatingOutcome {
    OutcomeKind kind{OutcomeKind::NONE};
    ScoreSet scores;
    std::string reason;
    double margin{0.0};
    int candidate_count{0};            // candidates currently in the decision buffer
    bool persisted{false};
};

// Compact form of a GatingOutcome carried in status snapshots.
struct OutcomeSummary {
    OutcomeKind kind{OutcomeKind::NONE};
    std::string reason;
    uint64_t window_id{0};
    double timestamp_sec{0.0};
    double primary_score{0.0};
    double baby_score{0.0};
    double cat_score{0.0};
    double other_suppress_score{0.0};
    double margin{0.0};
    int candidate_count{0};
    bool would_alert{false};
    std::string alert_blocked_by{"none"};
};

OutcomeSummary summarize(const GatingOutcome& outcome);

struct EventRecord {
    std::string event_id;
    std::string timestamp_iso;
    ScoreSet scores;
    std::string clip_reference;
};

}  // namespace cryguard
