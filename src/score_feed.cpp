#include "cryguard/score_feed.hpp"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "cryguard/clock.hpp"
#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void split(const std::string& s, char d, std::vector<std::string>& out) {
    out.clear();
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, d)) out.push_back(trim(tok));
    if (!s.empty() && s.back() == d) out.emplace_back();
}

std::optional<double> to_score(const std::string& field) {
    if (field.empty()) return std::nullopt;
    try {
        size_t used = 0;
        double v = std::stod(field, &used);
        if (used == field.size()) return v;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}
}  // namespace

ScoreSet parse_score_line(const std::string& line, uint64_t next_id, double now_sec) {
    std::vector<std::string> tok;
    split(line, ',', tok);
    if (tok.size() < 6) {
        throw ValidationError("expected at least 6 fields, got " + std::to_string(tok.size()));
    }

    ScoreSet s;
    s.window_id = next_id;
    if (!tok[0].empty()) {
        try {
            s.window_id = std::stoull(tok[0]);
        } catch (const std::exception&) {
            throw ValidationError("bad window_id '" + tok[0] + "'");
        }
    }
    s.timestamp_sec = now_sec;
    if (!tok[1].empty()) {
        try {
            s.timestamp_sec = std::stod(tok[1]);
        } catch (const std::exception&) {
            throw ValidationError("bad timestamp '" + tok[1] + "'");
        }
    }

    const std::string& decision = tok[2];
    s.primary_decision = decision == "1" || decision == "true" || decision == "True";
    s.primary_score = to_score(tok[3]).value_or(std::numeric_limits<double>::quiet_NaN());
    s.baby_score = to_score(tok[4]);
    s.cat_score = to_score(tok[5]);
    if (tok.size() > 6 && !tok[6].empty()) {
        s.other_suppress_score = to_score(tok[6]).value_or(std::numeric_limits<double>::quiet_NaN());
    }
    return s;
}

ScoreFeed::ScoreFeed(const std::string& source, WindowQueue<ScoreSet>& queue)
    : source_(source), queue_(queue) {}

ScoreFeed::~ScoreFeed() {
    stop();
}

void ScoreFeed::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&ScoreFeed::run, this);
}

void ScoreFeed::stop() {
    running_ = false;
    queue_.stop();
    if (worker_.joinable()) worker_.join();
}

bool ScoreFeed::wait_readable(std::istream& in) const {
    if (&in != &std::cin) return true;
    // Poll stdin so stop() is honoured while the producer is quiet.
    while (running_) {
        if (std::cin.rdbuf()->in_avail() > 0) return true;
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, 200);
        if (rc > 0) return true;
        if (rc < 0 && errno != EINTR) return true;  // let getline report the failure
    }
    return false;
}

void ScoreFeed::run() {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (source_ != "-") {
        file.open(source_);
        if (!file) {
            std::cerr << "[ERROR] Unable to open score source: " << source_ << std::endl;
            running_ = false;
            queue_.stop();
            return;
        }
        in = &file;
    }

    uint64_t next_id = 1;
    std::string line;
    while (running_ && wait_readable(*in) && std::getline(*in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("window_id", 0) == 0) continue;  // header
        try {
            ScoreSet s = parse_score_line(line, next_id, monotonic_seconds());
            next_id = s.window_id + 1;
            if (!queue_.push(s)) break;
        } catch (const ValidationError& e) {
            std::cerr << "[WARN] Skipping score line '" << line << "': " << e.what() << std::endl;
        }
    }
    running_ = false;
    queue_.stop();
}

}  // namespace cryguard
