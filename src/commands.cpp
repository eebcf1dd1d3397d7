#include "cryguard/commands.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<int> parse_seconds(const std::string& raw, const char* usage) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &used);
    } catch (const std::exception&) {
        throw ValidationError(usage);
    }
    if (used != raw.size()) throw ValidationError(usage);
    return value;
}

// Telegram-style commands may carry a bot suffix: /cal_status@my_bot
std::string command_word(const std::string& token) {
    std::string word = lower(token);
    auto at = word.find('@');
    if (at != std::string::npos) word.erase(at);
    return word;
}
}  // namespace

Command parse_command(const std::string& text) {
    const auto parts = split_ws(text);
    if (parts.empty()) throw ValidationError("empty command. Use /cal for help.");

    const std::string word = command_word(parts[0]);
    if (word == "/cal") return CalHelp{};
    if (word == "/cal_params") return CalParams{};
    if (word == "/cal_status") return CalStatus{};
    if (word == "/cal_watch_stop") return CalWatchStop{};
    if (word == "/cal_stop") return CalStop{};

    if (word == "/cal_start") {
        static const char* usage = "Usage: /cal_start phase1|phase2 [interval_sec]";
        if (parts.size() < 2 || parts.size() > 3) throw ValidationError(usage);
        auto phase = phase_from_name(parts[1]);
        if (!phase) throw ValidationError("phase must be phase1 or phase2");
        CalStart cmd;
        cmd.phase = *phase;
        if (parts.size() == 3) cmd.interval_sec = parse_seconds(parts[2], "Interval must be an integer number of seconds.");
        return cmd;
    }

    if (word == "/cal_set") {
        if (parts.size() != 3) throw ValidationError("Usage: /cal_set <param> <value>");
        return CalSet{parts[1], parts[2]};
    }

    if (word == "/cal_watch") {
        static const char* usage = "Usage: /cal_watch [interval_sec]";
        if (parts.size() > 2) throw ValidationError(usage);
        CalWatch cmd;
        if (parts.size() == 2) cmd.interval_sec = parse_seconds(parts[1], usage);
        return cmd;
    }

    throw ValidationError("unknown command '" + parts[0] + "'. Use /cal for help.");
}

const char* command_label(const Command& command) {
    struct Labels {
        const char* operator()(const CalHelp&) const { return "Calibration help"; }
        const char* operator()(const CalStart&) const { return "Calibration start"; }
        const char* operator()(const CalSet&) const { return "Calibration set"; }
        const char* operator()(const CalParams&) const { return "Calibration params"; }
        const char* operator()(const CalStatus&) const { return "Calibration"; }
        const char* operator()(const CalWatch&) const { return "Calibration watch"; }
        const char* operator()(const CalWatchStop&) const { return "Calibration watch stop"; }
        const char* operator()(const CalStop&) const { return "Calibration stop"; }
    };
    return std::visit(Labels{}, command);
}

}  // namespace cryguard
