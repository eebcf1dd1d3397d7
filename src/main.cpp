#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include "cryguard/calibration.hpp"
#include "cryguard/clock.hpp"
#include "cryguard/config.hpp"
#include "cryguard/errors.hpp"
#include "cryguard/event_sinks.hpp"
#include "cryguard/grpc_alert_dispatcher.hpp"
#include "cryguard/monitor_loop.hpp"
#include "cryguard/score_feed.hpp"
#include "cryguard/state_channel.hpp"
#include "cryguard/window_queue.hpp"

namespace {
std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop = true; }
}  // namespace

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    cryguard::AppConfig cfg;
    try {
        cfg = cryguard::parse_args(argc, argv);
    } catch (const cryguard::Error& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[INFO] Starting cryguard monitor\n";
    std::cout << "       source    : " << (cfg.score_source == "-" ? "stdin" : cfg.score_source) << "\n";
    std::cout << "       artifacts : " << cfg.artifact_dir << "\n";
    std::cout << "       alert sink: " << (cfg.alert_sink_addr.empty() ? "(log only)" : cfg.alert_sink_addr) << "\n";
    std::cout << "       N-of-M    : " << cfg.thresholds.confirm_n << "/" << cfg.thresholds.confirm_m
              << ", cooldown " << cfg.thresholds.alert_cooldown_seconds << "s" << std::endl;

    cryguard::ParameterStore params(cfg.thresholds);
    cryguard::CalibrationManager calibration(params);
    cryguard::StateChannel control(cryguard::control_channel_path(cfg.artifact_dir));
    cryguard::StateChannel status(cryguard::status_channel_path(cfg.artifact_dir));
    cryguard::JsonlArtifactStore store(cfg.artifact_dir + "/events.jsonl");

    std::unique_ptr<cryguard::AlertDispatcher> dispatcher;
    if (cfg.alert_sink_addr.empty()) {
        dispatcher = std::make_unique<cryguard::LogAlertDispatcher>();
    } else {
        dispatcher = std::make_unique<cryguard::GrpcAlertDispatcher>(cfg.alert_sink_addr, cfg.alert_timeout_ms);
    }

    std::unique_ptr<cryguard::MonitorLoop> loop;
    try {
        loop = std::make_unique<cryguard::MonitorLoop>(cfg, params, calibration, control, status, store, *dispatcher);
    } catch (const cryguard::Error& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    cryguard::WindowQueue<cryguard::ScoreSet> windows(8);
    cryguard::ScoreFeed feed(cfg.score_source, windows);
    feed.start();

    if (cfg.dry_run) {
        cryguard::ScoreSet scores;
        const auto r = windows.pop_for(scores, std::chrono::seconds(30));
        feed.stop();
        if (r != cryguard::PopResult::ITEM) {
            std::cerr << "[ERROR] No scored window received" << std::endl;
            return 1;
        }
        loop->process(scores);
        std::cout << (loop->alerts_sent() > 0 ? "alert_sent" : "no_alert") << std::endl;
        return 0;
    }

    loop->run(windows, g_stop);
    feed.stop();

    std::cout << "[INFO] Stopped cryguard monitor after " << loop->windows_processed() << " windows, "
              << loop->alerts_sent() << " alerts" << std::endl;
    return 0;
}
