#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cryguard/calibration.hpp"
#include "cryguard/monitor_loop.hpp"
#include "temp_dir.hpp"

using namespace cryguard;

namespace {

class RecordingStore : public ArtifactStore {
public:
    void store(const EventRecord& event) override { events.push_back(event); }
    std::vector<EventRecord> events;
};

class RecordingDispatcher : public AlertDispatcher {
public:
    bool notify(const EventRecord& event) override {
        notified.push_back(event.event_id);
        if (fail) throw std::runtime_error("sink down");
        return true;
    }
    std::vector<std::string> notified;
    bool fail{false};
};

ScoreSet crying(uint64_t id, double t) {
    ScoreSet s;
    s.window_id = id;
    s.timestamp_sec = t;
    s.primary_score = 0.9;
    s.baby_score = 0.8;
    s.cat_score = 0.1;
    return s;
}

struct Fixture {
    test::TempDir dir;
    AppConfig cfg;
    ParameterStore params{Thresholds{}};
    CalibrationManager calibration{params};
    StateChannel control{control_channel_path(dir.path().string())};
    StateChannel status{status_channel_path(dir.path().string())};
    RecordingStore store;
    RecordingDispatcher dispatcher;

    Fixture() {
        cfg.artifact_dir = dir.path().string();
        cfg.channel_poll_ms = 10;
    }
};

}  // namespace

TEST_CASE("persisted cry is stored before it is dispatched", "[monitor]") {
    Fixture f;
    MonitorLoop loop(f.cfg, f.params, f.calibration, f.control, f.status, f.store, f.dispatcher);

    loop.process(crying(1, 0.0));
    loop.process(crying(2, 1.0));
    const auto out = loop.process(crying(3, 2.0));

    CHECK(out.kind == OutcomeKind::CONFIRMED);
    REQUIRE(f.store.events.size() == 1);
    REQUIRE(f.dispatcher.notified.size() == 1);
    CHECK(f.store.events[0].event_id == f.dispatcher.notified[0]);
    CHECK(f.store.events[0].clip_reference == "clips/" + f.store.events[0].event_id + ".wav");
    CHECK(loop.alerts_sent() == 1);
    CHECK(loop.last_summary().would_alert);
    CHECK(loop.last_summary().alert_blocked_by == "none");

    // Still persisted one window later, but inside the cooldown.
    const auto held = loop.process(crying(4, 3.0));
    CHECK(held.kind == OutcomeKind::SUPPRESSED);
    CHECK(held.reason == "cooldown");
    CHECK(loop.last_summary().alert_blocked_by == "cooldown");
    CHECK(loop.alerts_sent() == 1);

    const auto snapshot = f.status.read();
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->writer == "monitor");
    CHECK(snapshot->windows_processed == 4);
    REQUIRE(snapshot->last_confirmed_at.has_value());
    CHECK(*snapshot->last_confirmed_at == Approx(2.0));
}

TEST_CASE("active calibration blocks alerts but still reports", "[monitor]") {
    Fixture f;

    // Command side starts a session.
    {
        ParameterStore cmd_params{Thresholds{}};
        CalibrationManager cmd{cmd_params};
        cmd.start(Phase::PHASE1, 10);
        cmd.set("CONFIRM_N", "2");
        Snapshot s;
        s.writer = "command";
        s.calibration = cmd.state();
        f.control.publish(s);
    }

    MonitorLoop loop(f.cfg, f.params, f.calibration, f.control, f.status, f.store, f.dispatcher);
    REQUIRE(f.calibration.active());
    CHECK(f.params.get(Param::CONFIRM_N) == 2.0);

    loop.process(crying(1, 0.0));
    const auto out = loop.process(crying(2, 1.0));
    CHECK(out.kind == OutcomeKind::CONFIRMED);
    CHECK(f.store.events.empty());
    CHECK(f.dispatcher.notified.empty());
    CHECK(loop.last_summary().would_alert);
    CHECK(loop.last_summary().alert_blocked_by == "calibration");

    const auto snapshot = f.status.read();
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->calibration.revision == f.calibration.revision());
    REQUIRE(snapshot->last_outcome.has_value());
    CHECK(snapshot->last_outcome->alert_blocked_by == "calibration");
}

TEST_CASE("control changes are adopted once per revision", "[monitor]") {
    Fixture f;
    MonitorLoop loop(f.cfg, f.params, f.calibration, f.control, f.status, f.store, f.dispatcher);
    CHECK_FALSE(loop.poll_control());

    ParameterStore cmd_params{Thresholds{}};
    CalibrationManager cmd{cmd_params};
    cmd.start(Phase::PHASE2);
    Snapshot s;
    s.writer = "command";
    s.calibration = cmd.state();
    f.control.publish(s);

    CHECK(loop.poll_control());
    CHECK(f.calibration.active());
    CHECK_FALSE(loop.poll_control());

    cmd.stop();
    s.calibration = cmd.state();
    f.control.publish(s);
    CHECK(loop.poll_control());
    CHECK_FALSE(f.calibration.active());
}

TEST_CASE("dispatch failure is contained", "[monitor]") {
    Fixture f;
    f.dispatcher.fail = true;
    MonitorLoop loop(f.cfg, f.params, f.calibration, f.control, f.status, f.store, f.dispatcher);

    loop.process(crying(1, 0.0));
    loop.process(crying(2, 1.0));
    REQUIRE_NOTHROW(loop.process(crying(3, 2.0)));
    CHECK(f.store.events.size() == 1);
    CHECK(loop.alerts_sent() == 0);
}

TEST_CASE("run drains the queue and honours max_windows", "[monitor]") {
    Fixture f;
    f.cfg.max_windows = 3;
    MonitorLoop loop(f.cfg, f.params, f.calibration, f.control, f.status, f.store, f.dispatcher);

    WindowQueue<ScoreSet> queue(16);
    for (uint64_t i = 1; i <= 5; ++i) queue.push(crying(i, static_cast<double>(i)));

    std::atomic<bool> stop{false};
    loop.run(queue, stop);
    CHECK(loop.windows_processed() == 3);
}

TEST_CASE("run returns when the source closes", "[monitor]") {
    Fixture f;
    MonitorLoop loop(f.cfg, f.params, f.calibration, f.control, f.status, f.store, f.dispatcher);

    WindowQueue<ScoreSet> queue(16);
    queue.push(crying(1, 0.0));
    queue.push(crying(2, 1.0));
    queue.stop();

    std::atomic<bool> stop{false};
    loop.run(queue, stop);
    CHECK(loop.windows_processed() == 2);
}
