#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "cryguard/calibration.hpp"
#include "cryguard/command_processor.hpp"
#include "cryguard/config.hpp"
#include "cryguard/grpc_alert_dispatcher.hpp"
#include "cryguard/parameters.hpp"
#include "cryguard/state_channel.hpp"

namespace cryguard {

// Command/API process: HTTP surface over CommandProcessor.
class ServerApp {
public:
    explicit ServerApp(const AppConfig& cfg);
    ~ServerApp();

    void start();
    void stop();

private:
    void run_http();
    void setup_routes();
    void deliver_watch(const std::string& origin, const std::string& text);
    std::string status_json() const;

    AppConfig cfg_;
    ParameterStore params_;
    CalibrationManager calibration_;
    StateChannel control_;
    StateChannel status_;
    std::unique_ptr<GrpcAlertDispatcher> sink_;
    std::unique_ptr<CommandProcessor> processor_;

    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
};

}  // namespace cryguard
