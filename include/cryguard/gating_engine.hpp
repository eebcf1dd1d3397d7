#pragma once

#include "cryguard/parameters.hpp"
#include "cryguard/ring_buffer.hpp"
#include "cryguard/score_types.hpp"

namespace cryguard {

// Trailing-margin window that lets a sustained baby-dominant stretch
// override cat suppression.
struct SustainPolicy {
    int window{3};                 // K most recent margins
    double margin_bonus{0.10};     // mean must reach MARGIN_THRESHOLD + bonus
};

class GatingEngine {
public:
    GatingEngine(const ParameterStore& params, const SustainPolicy& sustain);

    // Called once per window in arrival order. Never throws for bad input:
    // a malformed ScoreSet yields NONE and leaves both histories untouched.
    GatingOutcome evaluate(const ScoreSet& scores);

    size_t buffered() const { return decisions_.size(); }
    size_t buffer_capacity() const { return decisions_.capacity(); }

private:
    static void validate(const ScoreSet& scores);
    bool sustained_dominance(double margin_threshold) const;

    const ParameterStore& params_;
    SustainPolicy sustain_;
    RingBuffer<bool> decisions_;
    RingBuffer<double> margins_;
};

}  // namespace cryguard
