#pragma once

#include <string>

#include "cryguard/gating_engine.hpp"
#include "cryguard/parameters.hpp"

namespace cryguard {

struct AppConfig {
    std::string artifact_dir{"artifacts"};
    std::string score_source{"-"};        // "-" reads stdin, otherwise a file or FIFO path
    Thresholds thresholds{};              // base parameter layer
    SustainPolicy sustain{};
    int channel_poll_ms{250};             // control snapshot poll period while idle
    double status_stale_after_sec{10.0};
    std::string alert_sink_addr{};        // gRPC AlertSink; empty logs alerts only
    int alert_timeout_ms{5000};
    std::string http_host{"0.0.0.0"};
    int http_port{8080};
    int max_windows{0};                   // 0 runs until the source closes
    bool dry_run{false};
    bool verbose{false};
};

// Defaults, then environment, then flags. Throws ConfigurationError or
// ValidationError for an unusable configuration.
AppConfig parse_args(int argc, char** argv);
void validate_config(const AppConfig& cfg);

}  // namespace cryguard
