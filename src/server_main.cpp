#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "cryguard/config.hpp"
#include "cryguard/errors.hpp"
#include "cryguard/server_app.hpp"

namespace {
std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop = true; }
}  // namespace

int main(int argc, char** argv) {
    cryguard::AppConfig cfg;
    try {
        cfg = cryguard::parse_args(argc, argv);
    } catch (const cryguard::Error& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[INFO] Starting cryguard command server\n";
    std::cout << "       artifacts : " << cfg.artifact_dir << "\n";
    std::cout << "       alert sink: " << (cfg.alert_sink_addr.empty() ? "(log only)" : cfg.alert_sink_addr) << "\n";

    cryguard::ServerApp app(cfg);
    app.start();
    std::cout << "[INFO] Listening on http://" << cfg.http_host << ":" << cfg.http_port << std::endl;

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    app.stop();
    std::cout << "[INFO] Stopped cryguard command server" << std::endl;
    return 0;
}
