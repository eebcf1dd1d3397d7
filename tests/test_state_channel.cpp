#include <catch2/catch.hpp>

#include <fstream>

#include "cryguard/errors.hpp"
#include "cryguard/state_channel.hpp"
#include "temp_dir.hpp"

using namespace cryguard;

namespace {
Snapshot sample() {
    Snapshot s;
    s.writer = "monitor";
    s.updated_at = 1700000000.5;
    CalibrationSession session;
    session.phase = Phase::PHASE2;
    session.started_at = 1699999990.0;
    session.interval_sec = 20;
    session.watch_active = true;
    session.watch_interval_sec = 30;
    s.calibration.session = session;
    s.calibration.overrides = {{Param::CAT_WEIGHT, 0.6}};
    s.calibration.revision = 12;
    s.effective.cat_weight = 0.6;

    OutcomeSummary o;
    o.kind = OutcomeKind::SUPPRESSED;
    o.reason = "cat_dominant";
    o.window_id = 42;
    o.baby_score = 0.7;
    o.cat_score = 0.9;
    o.margin = 0.16;
    o.candidate_count = 2;
    o.alert_blocked_by = "cat";
    s.last_outcome = o;
    s.last_confirmed_at = 88.0;
    s.windows_processed = 42;
    return s;
}
}  // namespace

TEST_CASE("snapshot survives publish and read", "[state_channel]") {
    test::TempDir dir;
    StateChannel channel(dir.file("monitor_status.json"));

    channel.publish(sample());
    const auto read = channel.read();
    REQUIRE(read.has_value());

    CHECK(read->writer == "monitor");
    CHECK(read->updated_at == Approx(1700000000.5));
    CHECK(read->windows_processed == 42);
    REQUIRE(read->calibration.session.has_value());
    CHECK(read->calibration.session->phase == Phase::PHASE2);
    CHECK(read->calibration.session->interval_sec == 20);
    CHECK(read->calibration.session->watch_active);
    CHECK(read->calibration.revision == 12);
    REQUIRE(read->calibration.overrides.count(Param::CAT_WEIGHT) == 1);
    CHECK(read->calibration.overrides.at(Param::CAT_WEIGHT) == Approx(0.6));
    CHECK(read->effective.cat_weight == Approx(0.6));
    REQUIRE(read->last_outcome.has_value());
    CHECK(read->last_outcome->kind == OutcomeKind::SUPPRESSED);
    CHECK(read->last_outcome->reason == "cat_dominant");
    CHECK(read->last_outcome->alert_blocked_by == "cat");
    REQUIRE(read->last_confirmed_at.has_value());
    CHECK(*read->last_confirmed_at == Approx(88.0));
}

TEST_CASE("idle snapshot carries no session", "[state_channel]") {
    Snapshot s;
    s.writer = "command";
    s.calibration.revision = 3;
    const auto decoded = decode_snapshot(encode_snapshot(s));
    REQUIRE(decoded.has_value());
    CHECK_FALSE(decoded->calibration.session.has_value());
    CHECK(decoded->calibration.overrides.empty());
    CHECK_FALSE(decoded->last_outcome.has_value());
    CHECK(decoded->calibration.revision == 3);
}

TEST_CASE("absent and torn documents read as unknown", "[state_channel]") {
    test::TempDir dir;
    StateChannel channel(dir.file("calibration_control.json"));
    CHECK_FALSE(channel.read().has_value());

    std::string document = encode_snapshot(sample());
    {
        std::ofstream f(channel.path());
        f << document.substr(0, document.size() / 2);
    }
    CHECK_FALSE(channel.read().has_value());
    CHECK_FALSE(decode_snapshot("").has_value());
    CHECK_FALSE(decode_snapshot("{ \"revision\": \"1\" }").has_value());
}

TEST_CASE("publishing replaces the whole document", "[state_channel]") {
    test::TempDir dir;
    StateChannel channel(dir.file("nested/calibration_control.json"));

    Snapshot first = sample();
    channel.publish(first);
    Snapshot second;
    second.writer = "command";
    second.calibration.revision = 13;
    channel.publish(second);

    const auto read = channel.read();
    REQUIRE(read.has_value());
    CHECK(read->writer == "command");
    CHECK_FALSE(read->calibration.session.has_value());
    CHECK_FALSE(read->last_outcome.has_value());
}

TEST_CASE("unwritable location reports the channel unavailable", "[state_channel]") {
    test::TempDir dir;
    {
        std::ofstream blocker(dir.file("blocker"));
        blocker << "x";
    }
    StateChannel channel(dir.file("blocker/status.json"));
    REQUIRE_THROWS_AS(channel.publish(sample()), StateChannelUnavailable);
}
