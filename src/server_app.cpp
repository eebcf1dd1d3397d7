#include "cryguard/server_app.hpp"

#include <iostream>
#include <sstream>

#include <opencv2/core.hpp>

#include "cryguard/clock.hpp"
#include "cryguard/errors.hpp"
#include "cryguard/event_sinks.hpp"

namespace cryguard {

ServerApp::ServerApp(const AppConfig& cfg)
    : cfg_(cfg),
      params_(cfg.thresholds),
      calibration_(params_),
      control_(control_channel_path(cfg.artifact_dir)),
      status_(status_channel_path(cfg.artifact_dir)) {
    if (!cfg_.alert_sink_addr.empty()) {
        sink_ = std::make_unique<GrpcAlertDispatcher>(cfg_.alert_sink_addr, cfg_.alert_timeout_ms);
    }
    processor_ = std::make_unique<CommandProcessor>(
        calibration_, control_, status_,
        [this](const std::string& origin, const std::string& text) { deliver_watch(origin, text); },
        cfg_.status_stale_after_sec);
}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::start() {
    if (http_running_) return;
    http_running_ = true;
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();
    http_thread_ = std::thread(&ServerApp::run_http, this);
}

void ServerApp::stop() {
    if (!http_running_.exchange(false)) return;
    if (http_srv_) http_srv_->stop();
    if (http_thread_.joinable()) http_thread_.join();
    // Watch tasks belong to the processor and end with it.
    processor_.reset();
}

void ServerApp::run_http() {
    if (!http_srv_->listen(cfg_.http_host, cfg_.http_port)) {
        std::cerr << "[ERROR] Unable to listen on " << cfg_.http_host << ":" << cfg_.http_port << std::endl;
        http_running_ = false;
    }
}

void ServerApp::deliver_watch(const std::string& origin, const std::string& text) {
    if (sink_ && sink_->send_text(origin, text)) return;
    std::cout << "[INFO] [watch " << origin << "] " << text << std::endl;
}

std::string ServerApp::status_json() const {
    std::optional<Snapshot> snapshot;
    try {
        snapshot = status_.read();
    } catch (const StateChannelUnavailable& e) {
        return "{ \"state\": \"unknown\", \"detail\": \"" + json_escape(e.what()) + "\" }";
    }
    if (!snapshot) return "{ \"state\": \"unknown\", \"detail\": \"retry\" }";

    const double age = wall_seconds() - snapshot->updated_at;
    std::ostringstream oss;
    oss << "{ \"state\": \"" << (age > cfg_.status_stale_after_sec ? "stale" : "ok") << "\""
        << ", \"age_sec\": " << cv::format("%.1f", age)
        << ", \"snapshot\": " << encode_snapshot(*snapshot)
        << " }";
    return oss.str();
}

void ServerApp::setup_routes() {
    http_srv_->Post("/command", [this](const httplib::Request& req, httplib::Response& res) {
        std::string origin = req.get_header_value("X-Origin");
        if (origin.empty()) origin = "http";
        const CommandReply reply = processor_->handle_text(origin, req.body);
        res.status = reply.ok ? 200 : 400;
        res.set_content(reply.text + "\n", "text/plain");
    });

    http_srv_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(status_json(), "application/json");
    });

    http_srv_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{ \"status\": \"ok\" }", "application/json");
    });
}

}  // namespace cryguard
