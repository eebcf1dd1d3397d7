#pragma once

#include <optional>
#include <string>
#include <variant>

#include "cryguard/calibration.hpp"

namespace cryguard {

struct CalHelp {};
struct CalStart {
    Phase phase{Phase::PHASE1};
    std::optional<int> interval_sec;
};
struct CalSet {
    std::string param;
    std::string value;
};
struct CalParams {};
struct CalStatus {};
struct CalWatch {
    std::optional<int> interval_sec;
};
struct CalWatchStop {};
struct CalStop {};

// Closed set of operator commands. Every alternative needs a handler in
// CommandProcessor, so adding one without a handler does not compile.
using Command = std::variant<CalHelp, CalStart, CalSet, CalParams, CalStatus, CalWatch, CalWatchStop, CalStop>;

// Parses "/cal_start phase1 20" style text. Throws ValidationError with the
// usage line for malformed input and for unknown commands.
Command parse_command(const std::string& text);

// Reply prefix used for a command, e.g. "Calibration start".
const char* command_label(const Command& command);

}  // namespace cryguard
