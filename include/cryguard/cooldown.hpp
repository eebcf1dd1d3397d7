#pragma once

#include <optional>

#include "cryguard/parameters.hpp"
#include "cryguard/score_types.hpp"

namespace cryguard {

class CooldownController {
public:
    explicit CooldownController(const ParameterStore& params) : params_(params) {}

    // CONFIRMED inside the cooldown interval becomes SUPPRESSED("cooldown");
    // everything else passes through.
    GatingOutcome admit(const GatingOutcome& outcome, double now_sec);

    std::optional<double> last_confirmed_at() const { return last_confirmed_at_; }

private:
    const ParameterStore& params_;
    std::optional<double> last_confirmed_at_;
};

}  // namespace cryguard
