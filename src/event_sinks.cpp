#include "cryguard/event_sinks.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace cryguard {

std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string event_to_json(const EventRecord& event) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"baby_cry_event\",";
    oss << "\"event_id\":\"" << json_escape(event.event_id) << "\",";
    oss << "\"timestamp\":\"" << event.timestamp_iso << "\",";
    oss << "\"window_id\":" << event.scores.window_id << ",";
    oss << std::fixed << std::setprecision(4);
    oss << "\"primary_score\":" << event.scores.primary_score << ",";
    oss << "\"baby_score\":" << event.scores.baby_score.value_or(0.0) << ",";
    oss << "\"cat_score\":" << event.scores.cat_score.value_or(0.0) << ",";
    oss << "\"other_suppress_score\":" << event.scores.other_suppress_score << ",";
    oss << "\"clip\":\"" << json_escape(event.clip_reference) << "\"";
    oss << "}";
    return oss.str();
}

JsonlArtifactStore::JsonlArtifactStore(const std::string& path) : path_(path) {}

void JsonlArtifactStore::store(const EventRecord& event) {
    const std::string line = event_to_json(event);

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) std::cerr << "[WARN] Unable to create " << parent << ": " << ec.message() << std::endl;
    }
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[WARN] Unable to open events file: " << path_ << std::endl;
        return;
    }
    f << line << "\n";
}

bool LogAlertDispatcher::notify(const EventRecord& event) {
    std::cout << "[INFO] ALERT " << event_to_json(event) << std::endl;
    return true;
}

}  // namespace cryguard
