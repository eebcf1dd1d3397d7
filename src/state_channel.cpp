#include "cryguard/state_channel.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <unistd.h>

#include <opencv2/core.hpp>

#include "cryguard/errors.hpp"

namespace cryguard {

namespace fs = std::filesystem;

namespace {
uint64_t to_u64(const std::string& s) {
    if (s.empty()) return 0;
    try {
        return static_cast<uint64_t>(std::stoull(s));
    } catch (const std::exception&) {
        return 0;
    }
}

void write_thresholds(cv::FileStorage& out, const Thresholds& t) {
    out << "{";
    for (Param p : kAllParams) out << param_name(p) << t.get(p);
    out << "}";
}

Thresholds read_thresholds(const cv::FileNode& node) {
    Thresholds t;
    if (!node.isMap()) return t;
    for (Param p : kAllParams) {
        double v = t.get(p);
        cv::read(node[param_name(p)], v, v);
        t.set(p, v);
    }
    return t;
}

void write_outcome(cv::FileStorage& out, const OutcomeSummary& o) {
    out << "{";
    out << "kind" << outcome_kind_to_string(o.kind);
    out << "reason" << o.reason;
    out << "window_id" << std::to_string(o.window_id);
    out << "timestamp" << o.timestamp_sec;
    out << "primary_score" << o.primary_score;
    out << "baby_score" << o.baby_score;
    out << "cat_score" << o.cat_score;
    out << "other_suppress_score" << o.other_suppress_score;
    out << "margin" << o.margin;
    out << "candidate_count" << o.candidate_count;
    out << "would_alert" << (o.would_alert ? 1 : 0);
    out << "alert_blocked_by" << o.alert_blocked_by;
    out << "}";
}

OutcomeSummary read_outcome(const cv::FileNode& node) {
    OutcomeSummary o;
    std::string kind, window_id;
    int would_alert = 0;
    cv::read(node["kind"], kind, std::string("NONE"));
    cv::read(node["reason"], o.reason, std::string());
    cv::read(node["window_id"], window_id, std::string("0"));
    cv::read(node["timestamp"], o.timestamp_sec, 0.0);
    cv::read(node["primary_score"], o.primary_score, 0.0);
    cv::read(node["baby_score"], o.baby_score, 0.0);
    cv::read(node["cat_score"], o.cat_score, 0.0);
    cv::read(node["other_suppress_score"], o.other_suppress_score, 0.0);
    cv::read(node["margin"], o.margin, 0.0);
    cv::read(node["candidate_count"], o.candidate_count, 0);
    cv::read(node["would_alert"], would_alert, 0);
    cv::read(node["alert_blocked_by"], o.alert_blocked_by, std::string("none"));
    o.kind = outcome_kind_from_string(kind);
    o.window_id = to_u64(window_id);
    o.would_alert = would_alert != 0;
    return o;
}

std::optional<CalibrationSession> read_session(const cv::FileNode& node) {
    if (!node.isMap()) return std::nullopt;
    std::string phase;
    cv::read(node["phase"], phase, std::string());
    auto parsed = phase_from_name(phase);
    if (!parsed) return std::nullopt;
    CalibrationSession s;
    int watch_active = 0;
    s.phase = *parsed;
    cv::read(node["started_at"], s.started_at, 0.0);
    cv::read(node["interval_sec"], s.interval_sec, kDefaultCalibrationInterval);
    cv::read(node["watch_active"], watch_active, 0);
    cv::read(node["watch_interval_sec"], s.watch_interval_sec, s.interval_sec);
    s.watch_active = watch_active != 0;
    return s;
}
}  // namespace

std::string encode_snapshot(const Snapshot& snapshot) {
    cv::FileStorage out(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
    out << "writer" << snapshot.writer;
    out << "updated_at" << snapshot.updated_at;
    out << "revision" << std::to_string(snapshot.calibration.revision);
    out << "windows_processed" << std::to_string(snapshot.windows_processed);

    out << "calibration" << "{";
    out << "active" << (snapshot.calibration.session ? 1 : 0);
    if (const auto& s = snapshot.calibration.session) {
        out << "session" << "{";
        out << "phase" << std::string(phase_name(s->phase));
        out << "started_at" << s->started_at;
        out << "interval_sec" << s->interval_sec;
        out << "watch_active" << (s->watch_active ? 1 : 0);
        out << "watch_interval_sec" << s->watch_interval_sec;
        out << "}";
    }
    out << "overrides" << "{";
    for (const auto& kv : snapshot.calibration.overrides) out << param_name(kv.first) << kv.second;
    out << "}";
    out << "}";

    out << "effective_params";
    write_thresholds(out, snapshot.effective);

    if (snapshot.last_outcome) {
        out << "last_outcome";
        write_outcome(out, *snapshot.last_outcome);
    }
    if (snapshot.last_confirmed_at) {
        out << "last_confirmed_at" << *snapshot.last_confirmed_at;
    }
    return out.releaseAndGetString();
}

std::optional<Snapshot> decode_snapshot(const std::string& document) {
    if (document.empty()) return std::nullopt;
    try {
        cv::FileStorage in(document, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
        if (!in.isOpened()) return std::nullopt;
        cv::FileNode root = in.root();
        if (!root.isMap() || root["writer"].empty()) return std::nullopt;

        Snapshot s;
        std::string revision, windows;
        cv::read(root["writer"], s.writer, std::string());
        cv::read(root["updated_at"], s.updated_at, 0.0);
        cv::read(root["revision"], revision, std::string("0"));
        cv::read(root["windows_processed"], windows, std::string("0"));
        s.calibration.revision = to_u64(revision);
        s.windows_processed = to_u64(windows);

        cv::FileNode cal = root["calibration"];
        if (cal.isMap()) {
            int active = 0;
            cv::read(cal["active"], active, 0);
            if (active != 0) s.calibration.session = read_session(cal["session"]);
            cv::FileNode overrides = cal["overrides"];
            if (overrides.isMap()) {
                for (auto it = overrides.begin(); it != overrides.end(); ++it) {
                    cv::FileNode entry = *it;
                    auto param = param_from_name(entry.name());
                    if (!param || (!entry.isReal() && !entry.isInt())) continue;
                    s.calibration.overrides[*param] = static_cast<double>(entry);
                }
            }
        }

        s.effective = read_thresholds(root["effective_params"]);
        if (root["last_outcome"].isMap()) s.last_outcome = read_outcome(root["last_outcome"]);
        if (!root["last_confirmed_at"].empty()) {
            double t = 0.0;
            cv::read(root["last_confirmed_at"], t, 0.0);
            s.last_confirmed_at = t;
        }
        return s;
    } catch (const cv::Exception&) {
        return std::nullopt;
    }
}

std::string control_channel_path(const std::string& artifact_dir) {
    return (fs::path(artifact_dir) / kControlFile).string();
}

std::string status_channel_path(const std::string& artifact_dir) {
    return (fs::path(artifact_dir) / kStatusFile).string();
}

StateChannel::StateChannel(const std::string& path) : path_(path) {}

void StateChannel::publish(const Snapshot& snapshot) {
    const std::string document = encode_snapshot(snapshot);
    const fs::path target(path_);

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw StateChannelUnavailable("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    const fs::path tmp = target.string() + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw StateChannelUnavailable("cannot open " + tmp.string());
        f << document;
        f.flush();
        if (!f) throw StateChannelUnavailable("short write to " + tmp.string());
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StateChannelUnavailable("cannot replace " + path_);
    }
}

std::optional<Snapshot> StateChannel::read() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) throw StateChannelUnavailable("cannot stat " + path_ + ": " + ec.message());
        return std::nullopt;
    }
    std::ifstream f(path_);
    if (!f) throw StateChannelUnavailable("cannot open " + path_);
    std::string document((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return decode_snapshot(document);
}

}  // namespace cryguard
