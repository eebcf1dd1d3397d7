#include <catch2/catch.hpp>

#include <string>

#include "cryguard/calibration.hpp"
#include "cryguard/errors.hpp"

using namespace cryguard;

namespace {
CalibrationManager::Clock fixed_clock(double t) {
    return [t]() { return t; };
}
}  // namespace

TEST_CASE("a full calibration round trip restores the base parameters", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(1000.0));

    REQUIRE_FALSE(cal.active());

    const auto& session = cal.start(Phase::PHASE1, 20);
    CHECK(session.phase == Phase::PHASE1);
    CHECK(session.interval_sec == 20);
    CHECK(session.started_at == Approx(1000.0));
    CHECK(cal.active());

    const auto applied = cal.set("confirm_n", "4");
    CHECK(applied.first == Param::CONFIRM_N);
    CHECK(params.effective().confirm_n == 4);
    cal.set("ALERT_COOLDOWN_SECONDS", "5");

    const StopSummary summary = cal.stop();
    REQUIRE(summary.ended.has_value());
    CHECK(summary.ended_overrides.size() == 2);
    CHECK(summary.restored.confirm_n == 3);
    CHECK(summary.restored.alert_cooldown_seconds == 60);
    CHECK_FALSE(cal.active());
    CHECK_FALSE(params.has_overrides());

    const std::string text = build_stop_summary(summary);
    CHECK(text.find("Calibration stopped for phase1") != std::string::npos);
    CHECK(text.find("/cal_start phase1 20") != std::string::npos);
    CHECK(text.find("/cal_set CONFIRM_N 4") != std::string::npos);
    CHECK(text.find("/cal_set ALERT_COOLDOWN_SECONDS 5") != std::string::npos);
}

TEST_CASE("parameters outside the active phase are rejected", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(0.0));

    cal.start(Phase::PHASE1);
    REQUIRE_THROWS_AS(cal.set("CAT_WEIGHT", "0.5"), OutOfScopeParameterError);
    REQUIRE_THROWS_AS(cal.set("CRY_THRESHOLD", "0.5"), OutOfScopeParameterError);
    CHECK_FALSE(params.has_overrides());

    cal.start(Phase::PHASE2);
    REQUIRE_NOTHROW(cal.set("CAT_WEIGHT", "0.5"));
    REQUIRE_THROWS_AS(cal.set("CONFIRM_N", "2"), OutOfScopeParameterError);
    REQUIRE_THROWS_AS(cal.set("NO_SUCH_PARAM", "1"), ConfigurationError);
    REQUIRE_THROWS_AS(cal.set("CAT_THRESHOLD", "1.5"), ValidationError);
}

TEST_CASE("primary threshold round trip restores the exact base value", "[calibration]") {
    Thresholds base;
    base.primary_cry_threshold = 0.37;
    ParameterStore params{base};
    CalibrationManager cal(params, fixed_clock(0.0));

    cal.start(Phase::PHASE1);
    cal.set("PRIMARY_CRY_THRESHOLD", "0.9");
    CHECK(params.get(Param::PRIMARY_CRY_THRESHOLD) == 0.9);
    cal.stop();
    CHECK(params.get(Param::PRIMARY_CRY_THRESHOLD) == 0.37);
}

TEST_CASE("starting a phase discards earlier overrides", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(0.0));

    cal.start(Phase::PHASE2);
    cal.set("MARGIN_THRESHOLD", "0.3");
    cal.start(Phase::PHASE1);
    CHECK_FALSE(params.has_overrides());
    CHECK(params.effective().margin_threshold == Approx(0.15));
}

TEST_CASE("idle manager carries no overrides", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(0.0));

    REQUIRE_THROWS_AS(cal.set("CONFIRM_N", "2"), ConfigurationError);
    REQUIRE_THROWS_AS(cal.watch(), ConfigurationError);

    const uint64_t before = cal.revision();
    const StopSummary summary = cal.stop();
    CHECK_FALSE(summary.ended.has_value());
    CHECK(cal.revision() == before);
    CHECK(build_stop_summary(summary) == "Calibration was not active. Parameters unchanged.");

    const auto st = cal.status();
    CHECK_FALSE(st.session.has_value());
    CHECK(st.overrides.empty());
}

TEST_CASE("interval is clamped and watch defaults to it", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(0.0));

    CHECK(cal.start(Phase::PHASE1, 1).interval_sec == kMinCalibrationInterval);
    CHECK(cal.start(Phase::PHASE1, 5000).interval_sec == kMaxCalibrationInterval);
    CHECK(cal.start(Phase::PHASE1).interval_sec == kDefaultCalibrationInterval);

    CHECK(cal.watch() == kDefaultCalibrationInterval);
    CHECK(cal.session()->watch_active);
    CHECK(cal.watch(30) == 30);
}

TEST_CASE("watch_stop is idempotent", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(0.0));

    cal.watch_stop();
    cal.start(Phase::PHASE2, 10);
    cal.watch();
    cal.watch_stop();
    const uint64_t rev = cal.revision();
    cal.watch_stop();
    CHECK(cal.revision() == rev);
    CHECK_FALSE(cal.session()->watch_active);
}

TEST_CASE("adopt replaces state and drops out-of-phase overrides", "[calibration]") {
    ParameterStore params{Thresholds{}};
    CalibrationManager cal(params, fixed_clock(0.0));

    CalibrationState published;
    CalibrationSession s;
    s.phase = Phase::PHASE2;
    s.interval_sec = 12;
    published.session = s;
    published.overrides = {{Param::CAT_WEIGHT, 0.4}, {Param::CONFIRM_N, 2}};
    published.revision = 7;

    cal.adopt(published);
    CHECK(cal.active());
    CHECK(cal.revision() == 7);
    CHECK(params.get(Param::CAT_WEIGHT) == Approx(0.4));
    CHECK(params.get(Param::CONFIRM_N) == 3.0);

    CalibrationState idle;
    idle.revision = 8;
    cal.adopt(idle);
    CHECK_FALSE(cal.active());
    CHECK_FALSE(params.has_overrides());
}

TEST_CASE("help text lists every command and both phases", "[calibration]") {
    const std::string help = build_help_text();
    for (const char* cmd : {"/cal_start", "/cal_set", "/cal_params", "/cal_status", "/cal_watch", "/cal_watch_stop",
                            "/cal_stop"}) {
        CHECK(help.find(cmd) != std::string::npos);
    }
    CHECK(help.find("phase1 params: PRIMARY_CRY_THRESHOLD, CONFIRM_N, CONFIRM_M, ALERT_COOLDOWN_SECONDS") !=
          std::string::npos);
    CHECK(help.find("phase2 params: CRY_THRESHOLD, CAT_THRESHOLD, CAT_WEIGHT, MARGIN_THRESHOLD") != std::string::npos);
}
