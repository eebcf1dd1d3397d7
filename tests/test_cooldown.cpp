#include <catch2/catch.hpp>

#include "cryguard/cooldown.hpp"

using namespace cryguard;

namespace {
GatingOutcome confirmed() {
    GatingOutcome o;
    o.kind = OutcomeKind::CONFIRMED;
    o.reason = "persisted";
    o.persisted = true;
    return o;
}
}  // namespace

TEST_CASE("confirmed outcomes inside the cooldown are held back", "[cooldown]") {
    Thresholds base;
    base.alert_cooldown_seconds = 30;
    ParameterStore params{base};
    CooldownController cooldown(params);

    REQUIRE_FALSE(cooldown.last_confirmed_at().has_value());

    CHECK(cooldown.admit(confirmed(), 0.0).kind == OutcomeKind::CONFIRMED);

    auto held = cooldown.admit(confirmed(), 10.0);
    CHECK(held.kind == OutcomeKind::SUPPRESSED);
    CHECK(held.reason == "cooldown");
    REQUIRE(cooldown.last_confirmed_at().has_value());
    CHECK(*cooldown.last_confirmed_at() == Approx(0.0));

    CHECK(cooldown.admit(confirmed(), 31.0).kind == OutcomeKind::CONFIRMED);
    CHECK(*cooldown.last_confirmed_at() == Approx(31.0));
}

TEST_CASE("non-confirmed outcomes pass through untouched", "[cooldown]") {
    ParameterStore params{Thresholds{}};
    CooldownController cooldown(params);

    GatingOutcome cand;
    cand.kind = OutcomeKind::CANDIDATE;
    cand.reason = "candidate";
    auto out = cooldown.admit(cand, 5.0);
    CHECK(out.kind == OutcomeKind::CANDIDATE);
    CHECK_FALSE(cooldown.last_confirmed_at().has_value());
}

TEST_CASE("zero cooldown admits every confirmation", "[cooldown]") {
    Thresholds base;
    base.alert_cooldown_seconds = 0;
    ParameterStore params{base};
    CooldownController cooldown(params);

    CHECK(cooldown.admit(confirmed(), 1.0).kind == OutcomeKind::CONFIRMED);
    CHECK(cooldown.admit(confirmed(), 1.0).kind == OutcomeKind::CONFIRMED);
}

TEST_CASE("cooldown follows the effective override", "[cooldown]") {
    ParameterStore params{Thresholds{}};
    CooldownController cooldown(params);
    params.set_override(Param::ALERT_COOLDOWN_SECONDS, 5);

    CHECK(cooldown.admit(confirmed(), 0.0).kind == OutcomeKind::CONFIRMED);
    CHECK(cooldown.admit(confirmed(), 4.0).kind == OutcomeKind::SUPPRESSED);
    CHECK(cooldown.admit(confirmed(), 5.0).kind == OutcomeKind::CONFIRMED);
    CHECK(params.effective().alert_cooldown_seconds == 5);
}
