#include "cryguard/gating_engine.hpp"

#include <cmath>
#include <iostream>
#include <numeric>
#include <string>

#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
void check_unit(const char* field, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ValidationError(std::string(field) + " out of range: " + std::to_string(value));
    }
}
}  // namespace

GatingEngine::GatingEngine(const ParameterStore& params, const SustainPolicy& sustain)
    : params_(params),
      sustain_(sustain),
      decisions_(static_cast<size_t>(params.get(Param::CONFIRM_M))),
      margins_(static_cast<size_t>(sustain.window)) {
    if (sustain_.window < 1) {
        throw ConfigurationError("SUSTAIN_WINDOW must be >= 1");
    }
}

void GatingEngine::validate(const ScoreSet& scores) {
    if (!scores.baby_score) throw ValidationError("baby_score missing");
    if (!scores.cat_score) throw ValidationError("cat_score missing");
    check_unit("primary_score", scores.primary_score);
    check_unit("baby_score", *scores.baby_score);
    check_unit("cat_score", *scores.cat_score);
    check_unit("other_suppress_score", scores.other_suppress_score);
}

bool GatingEngine::sustained_dominance(double margin_threshold) const {
    if (!margins_.full()) return false;
    if (!margins_.all_of([&](double m) { return m >= margin_threshold; })) return false;
    const double sum = std::accumulate(margins_.begin(), margins_.end(), 0.0);
    const double mean = sum / static_cast<double>(margins_.size());
    return mean >= margin_threshold + sustain_.margin_bonus;
}

GatingOutcome GatingEngine::evaluate(const ScoreSet& scores) {
    GatingOutcome out;
    out.scores = scores;

    try {
        validate(scores);
    } catch (const ValidationError& e) {
        std::cerr << "[WARN] Rejected window " << scores.window_id << ": " << e.what() << std::endl;
        out.kind = OutcomeKind::NONE;
        out.reason = std::string("invalid_scores: ") + e.what();
        out.candidate_count = static_cast<int>(decisions_.count(true));
        return out;
    }

    const Thresholds t = params_.effective();
    // CONFIRM_M can move under calibration; keep the newest flags.
    decisions_.set_capacity(static_cast<size_t>(t.confirm_m));

    const double baby = *scores.baby_score;
    const double cat = *scores.cat_score;

    const bool primary_candidate = scores.primary_decision || scores.primary_score >= t.primary_cry_threshold;
    const double margin = baby - t.cat_weight * cat - t.non_cry_weight * scores.other_suppress_score;
    const bool verifier_candidate = baby >= t.cry_threshold && margin >= t.margin_threshold;
    const bool raw_candidate = primary_candidate && verifier_candidate;

    decisions_.push(raw_candidate);
    margins_.push(margin);

    const int count = static_cast<int>(decisions_.count(true));
    const bool persisted = count >= t.confirm_n;
    const bool cat_dominant = cat >= t.cat_threshold;

    out.margin = margin;
    out.candidate_count = count;
    out.persisted = persisted;

    if (cat_dominant && !(persisted && sustained_dominance(t.margin_threshold))) {
        out.kind = OutcomeKind::SUPPRESSED;
        out.reason = "cat_dominant";
    } else if (persisted) {
        out.kind = OutcomeKind::CONFIRMED;
        out.reason = cat_dominant ? "persisted_over_cat" : "persisted";
    } else if (raw_candidate) {
        out.kind = OutcomeKind::CANDIDATE;
        out.reason = "candidate";
    } else {
        out.kind = OutcomeKind::NONE;
        out.reason = "below_threshold";
    }
    return out;
}

}  // namespace cryguard
