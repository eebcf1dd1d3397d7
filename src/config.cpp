#include "cryguard/config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

double to_double(const char* name, const char* text) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (text[used] == '\0') return v;
    } catch (const std::exception&) {
    }
    throw ConfigurationError(std::string(name) + ": '" + text + "' is not a number");
}

int to_int(const char* name, const char* text) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (text[used] == '\0') return v;
    } catch (const std::exception&) {
    }
    throw ConfigurationError(std::string(name) + ": '" + text + "' is not an integer");
}

bool to_bool(const char* text) {
    std::string v(text);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

void env_param(Thresholds& t, Param p, const char* fallback = nullptr) {
    const char* value = std::getenv(param_name(p));
    if (!value && fallback) value = std::getenv(fallback);
    if (!value) return;
    const double v = to_double(param_name(p), value);
    validate_value(p, v);
    t.set(p, v);
}

void print_usage() {
    std::cout << "Usage: cryguard_monitor|cryguard_server [options]\n"
              << "  --artifacts <dir>        shared artifact directory (state channel files, events)\n"
              << "  --source <path|->        scored windows, one CSV line per window (monitor)\n"
              << "  --max-windows <n>        stop after n windows (monitor)\n"
              << "  --dry-run                evaluate one window and print alert_sent/no_alert (monitor)\n"
              << "  --alert-sink <host:port> gRPC AlertSink address\n"
              << "  --host <addr> --port <n> HTTP command surface (server)\n"
              << "  --poll-ms <n>            control snapshot poll period\n"
              << "  --stale-after <sec>      status age reported as stale\n"
              << "  --sustain-window <k>     trailing margins for sustained dominance\n"
              << "  --sustain-bonus <x>      mean margin above MARGIN_THRESHOLD required\n"
              << "  --set <PARAM>=<value>    base value for a gating parameter\n"
              << "  --verbose                log every window\n";
}
}  // namespace

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;
    Thresholds& t = cfg.thresholds;

    // Environment names match the deployment .env file.
    env_param(t, Param::PRIMARY_CRY_THRESHOLD);
    env_param(t, Param::CRY_THRESHOLD, "BABY_THRESHOLD");
    env_param(t, Param::CAT_THRESHOLD, "CAT_SUPPRESS_THRESHOLD");
    env_param(t, Param::CAT_WEIGHT);
    env_param(t, Param::NON_CRY_WEIGHT);
    env_param(t, Param::MARGIN_THRESHOLD);
    env_param(t, Param::CONFIRM_N);
    env_param(t, Param::CONFIRM_M);
    env_param(t, Param::ALERT_COOLDOWN_SECONDS);
    if (const char* v = std::getenv("ARTIFACT_DIR")) cfg.artifact_dir = v;
    if (const char* v = std::getenv("SCORE_SOURCE")) cfg.score_source = v;
    if (const char* v = std::getenv("SUSTAIN_WINDOW")) cfg.sustain.window = to_int("SUSTAIN_WINDOW", v);
    if (const char* v = std::getenv("SUSTAIN_MARGIN_BONUS")) cfg.sustain.margin_bonus = to_double("SUSTAIN_MARGIN_BONUS", v);
    if (const char* v = std::getenv("CHANNEL_POLL_MS")) cfg.channel_poll_ms = to_int("CHANNEL_POLL_MS", v);
    if (const char* v = std::getenv("STATUS_STALE_AFTER_SECONDS")) cfg.status_stale_after_sec = to_double("STATUS_STALE_AFTER_SECONDS", v);
    if (const char* v = std::getenv("ALERT_SINK_ADDR")) cfg.alert_sink_addr = v;
    if (const char* v = std::getenv("ALERT_TIMEOUT_MS")) cfg.alert_timeout_ms = to_int("ALERT_TIMEOUT_MS", v);
    if (const char* v = std::getenv("HTTP_HOST")) cfg.http_host = v;
    if (const char* v = std::getenv("HTTP_PORT")) cfg.http_port = to_int("HTTP_PORT", v);
    if (const char* v = std::getenv("LOG_VERBOSE")) cfg.verbose = to_bool(v);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--artifacts") && next()) {
            cfg.artifact_dir = next();
            i++;
        } else if (arg_eq(arg, "--source") && next()) {
            cfg.score_source = next();
            i++;
        } else if (arg_eq(arg, "--max-windows") && next()) {
            cfg.max_windows = to_int("--max-windows", next());
            i++;
        } else if (arg_eq(arg, "--dry-run")) {
            cfg.dry_run = true;
        } else if (arg_eq(arg, "--alert-sink") && next()) {
            cfg.alert_sink_addr = next();
            i++;
        } else if (arg_eq(arg, "--host") && next()) {
            cfg.http_host = next();
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.http_port = to_int("--port", next());
            i++;
        } else if (arg_eq(arg, "--poll-ms") && next()) {
            cfg.channel_poll_ms = to_int("--poll-ms", next());
            i++;
        } else if (arg_eq(arg, "--stale-after") && next()) {
            cfg.status_stale_after_sec = to_double("--stale-after", next());
            i++;
        } else if (arg_eq(arg, "--sustain-window") && next()) {
            cfg.sustain.window = to_int("--sustain-window", next());
            i++;
        } else if (arg_eq(arg, "--sustain-bonus") && next()) {
            cfg.sustain.margin_bonus = to_double("--sustain-bonus", next());
            i++;
        } else if (arg_eq(arg, "--set") && next()) {
            const std::string kv = next();
            const auto eq = kv.find('=');
            auto param = param_from_name(kv.substr(0, eq));
            if (eq == std::string::npos || !param) {
                throw ConfigurationError("--set expects <PARAM>=<value>, got '" + kv + "'");
            }
            const double v = to_double(param_name(*param), kv.c_str() + eq + 1);
            validate_value(*param, v);
            t.set(*param, v);
            i++;
        } else if (arg_eq(arg, "--verbose")) {
            cfg.verbose = true;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    validate_config(cfg);
    return cfg;
}

void validate_config(const AppConfig& cfg) {
    validate_thresholds(cfg.thresholds);
    if (cfg.sustain.window < 1) throw ConfigurationError("SUSTAIN_WINDOW must be >= 1");
    if (cfg.channel_poll_ms < 1) throw ConfigurationError("CHANNEL_POLL_MS must be >= 1");
    if (cfg.status_stale_after_sec <= 0.0) throw ConfigurationError("STATUS_STALE_AFTER_SECONDS must be > 0");
    if (cfg.max_windows < 0) throw ConfigurationError("--max-windows must be >= 0");
    if (cfg.artifact_dir.empty()) throw ConfigurationError("ARTIFACT_DIR must not be empty");
}

}  // namespace cryguard
