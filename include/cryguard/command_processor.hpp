#pragma once

#include <mutex>
#include <string>
#include <utility>

#include "cryguard/calibration.hpp"
#include "cryguard/commands.hpp"
#include "cryguard/state_channel.hpp"
#include "cryguard/watch_registry.hpp"

namespace cryguard {

struct CommandReply {
    bool ok{false};
    std::string text;   // "<label>: OK. <detail>" / "<label>: ERROR. <detail>"
};

// Command side of calibration: applies operator commands to its
// CalibrationManager, publishes the control snapshot the monitor adopts and
// answers status queries from the monitor's snapshot.
class CommandProcessor {
public:
    CommandProcessor(CalibrationManager& manager,
                     StateChannel& control,
                     StateChannel& status,
                     WatchRegistry::Sink watch_sink,
                     double stale_after_sec);

    CommandReply handle(const std::string& origin, const Command& command);
    // Parse errors come back as an ERROR reply.
    CommandReply handle_text(const std::string& origin, const std::string& text);

    // Status text built only from the channel documents.
    CommandReply describe_status() const;

    bool watching(const std::string& origin) const { return watches_.active(origin); }

private:
    struct Handlers;

    // Picks up a newer control document (other instance, restart).
    void refresh();
    void publish_control();
    // Publishes the control snapshot; on failure restores prior and rethrows.
    void commit(const CalibrationState& prior);
    std::pair<bool, std::string> status_detail() const;

    CalibrationManager& manager_;
    StateChannel& control_;
    StateChannel& status_;
    double stale_after_sec_;
    std::mutex mu_;
    WatchRegistry watches_;
};

}  // namespace cryguard
